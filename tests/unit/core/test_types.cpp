/**
 * @file test_types.cpp
 * @brief Unit tests for Core/Types.h and Core/PixelTraits.h
 */

#include <gtest/gtest.h>
#include <PixAug/Core/Types.h>
#include <PixAug/Core/Constants.h>
#include <PixAug/Core/PixelTraits.h>

#include <cmath>
#include <limits>
#include <string>

using namespace Pix::Aug;

// =============================================================================
// PixelType Tests
// =============================================================================

TEST(PixelTypeTest, Names) {
    EXPECT_STREQ(PixelTypeName(PixelType::UInt8), "UInt8");
    EXPECT_STREQ(PixelTypeName(PixelType::Int32), "Int32");
    EXPECT_STREQ(PixelTypeName(PixelType::Float32), "Float32");
    EXPECT_STREQ(PixelTypeName(PixelType::Float64), "Float64");
}

TEST(PixelTypeTest, Sizes) {
    EXPECT_EQ(PixelTypeSize(PixelType::UInt8), 1u);
    EXPECT_EQ(PixelTypeSize(PixelType::Int32), 4u);
    EXPECT_EQ(PixelTypeSize(PixelType::Float32), 4u);
    EXPECT_EQ(PixelTypeSize(PixelType::Float64), 8u);
}

TEST(PixelTypeTest, IsFloatType) {
    EXPECT_FALSE(IsFloatType(PixelType::UInt8));
    EXPECT_FALSE(IsFloatType(PixelType::Int32));
    EXPECT_TRUE(IsFloatType(PixelType::Float32));
    EXPECT_TRUE(IsFloatType(PixelType::Float64));
}

TEST(PixelTypeTest, PixelTypeOf) {
    EXPECT_EQ(PixelTypeOf<uint8_t>::value, PixelType::UInt8);
    EXPECT_EQ(PixelTypeOf<int32_t>::value, PixelType::Int32);
    EXPECT_EQ(PixelTypeOf<float>::value, PixelType::Float32);
    EXPECT_EQ(PixelTypeOf<double>::value, PixelType::Float64);
}

TEST(PixelTypeTest, DispatchSelectsStorageType) {
    for (PixelType type : {PixelType::UInt8, PixelType::Int32,
                           PixelType::Float32, PixelType::Float64}) {
        size_t size = DispatchPixelType(type, [](auto tag) {
            using T = typename decltype(tag)::Type;
            return sizeof(T);
        });
        EXPECT_EQ(size, PixelTypeSize(type)) << PixelTypeName(type);
    }
}

TEST(PixelTypeTest, DispatchRejectsOutOfEnumValue) {
    const auto bogus = static_cast<PixelType>(42);
    EXPECT_THROW(DispatchPixelType(bogus, [](auto) { return 0; }),
                 UnknownPixelTypeException);
}

// =============================================================================
// PixelCast Tests
// =============================================================================

TEST(PixelCastTest, TruncatesTowardZero) {
    EXPECT_EQ(PixelCast<uint8_t>(2.9), 2);
    EXPECT_EQ(PixelCast<int32_t>(-2.9), -2);
    EXPECT_EQ(PixelCast<int32_t>(2.9f), 2);
}

TEST(PixelCastTest, SaturatesIntegers) {
    EXPECT_EQ(PixelCast<uint8_t>(300.7), 255);
    EXPECT_EQ(PixelCast<uint8_t>(-5.0), 0);
    EXPECT_EQ(PixelCast<uint8_t>(int32_t{-1}), 0);
    EXPECT_EQ(PixelCast<uint8_t>(int32_t{1000}), 255);
    EXPECT_EQ(PixelCast<int32_t>(1e12), std::numeric_limits<int32_t>::max());
    EXPECT_EQ(PixelCast<int32_t>(-1e12), std::numeric_limits<int32_t>::lowest());
}

TEST(PixelCastTest, NanBecomesZero) {
    EXPECT_EQ(PixelCast<uint8_t>(std::numeric_limits<double>::quiet_NaN()), 0);
    EXPECT_EQ(PixelCast<int32_t>(std::numeric_limits<float>::quiet_NaN()), 0);
}

TEST(PixelCastTest, FloatTargetsAreExact) {
    EXPECT_FLOAT_EQ(PixelCast<float>(0.25), 0.25f);
    EXPECT_DOUBLE_EQ(PixelCast<double>(uint8_t{200}), 200.0);
}

// =============================================================================
// Hole Tests
// =============================================================================

TEST(HoleTest, BasicProperties) {
    Hole h(2, 3, 6, 8);
    EXPECT_EQ(h.Width(), 4);
    EXPECT_EQ(h.Height(), 5);
    EXPECT_FALSE(h.IsEmpty());
}

TEST(HoleTest, HalfOpenContains) {
    Hole h(0, 0, 2, 2);
    EXPECT_TRUE(h.Contains(0, 0));
    EXPECT_TRUE(h.Contains(1, 1));
    EXPECT_FALSE(h.Contains(2, 1));
    EXPECT_FALSE(h.Contains(1, 2));
}

TEST(HoleTest, Empty) {
    EXPECT_TRUE(Hole(3, 3, 3, 5).IsEmpty());
    EXPECT_TRUE(Hole().IsEmpty());
}

// =============================================================================
// Constants Tests
// =============================================================================

TEST(ConstantsTest, MathConstants) {
    EXPECT_NEAR(PI, 3.14159265358979, 1e-10);
    EXPECT_NEAR(TWO_PI, 2.0 * PI, 1e-10);
}

TEST(ConstantsTest, Clamp) {
    EXPECT_EQ(Clamp(5, 0, 10), 5);
    EXPECT_EQ(Clamp(-1, 0, 10), 0);
    EXPECT_EQ(Clamp(15, 0, 10), 10);
}
