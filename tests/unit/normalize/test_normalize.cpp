/**
 * @file test_normalize.cpp
 * @brief Unit tests for Normalize/Normalize.h
 */

#include <gtest/gtest.h>
#include <PixAug/Normalize/Normalize.h>

#include <cmath>
#include <limits>
#include <vector>

using namespace Pix::Aug;
using namespace Pix::Aug::Normalize;

// =============================================================================
// Per-channel statistics
// =============================================================================

TEST(NormalizeTest, PerChannel) {
    // 3 channels, 1x2
    std::vector<uint8_t> data = {10, 20, 30, 40, 50, 60};
    PImage img = PImage::FromData(data.data(), 3, 1, 2);

    PImage out;
    NormalizeImage(img, out, {10.0, 20.0, 30.0}, {2.0, 4.0, 5.0});

    ASSERT_EQ(out.Type(), PixelType::Float32);
    ASSERT_TRUE(out.SameShape(img));
    EXPECT_FLOAT_EQ(out.At<float>(0, 0, 0), 0.0f);
    EXPECT_FLOAT_EQ(out.At<float>(0, 0, 1), 5.0f);
    EXPECT_FLOAT_EQ(out.At<float>(1, 0, 0), 2.5f);
    EXPECT_FLOAT_EQ(out.At<float>(1, 0, 1), 5.0f);
    EXPECT_FLOAT_EQ(out.At<float>(2, 0, 0), 4.0f);
    EXPECT_FLOAT_EQ(out.At<float>(2, 0, 1), 6.0f);
}

TEST(NormalizeTest, ScalarBroadcast) {
    std::vector<float> data = {0.0f, 0.5f, 1.0f, 0.25f};
    PImage img = PImage::FromData(data.data(), 2, 1, 2, PixelType::Float32);

    PImage out;
    NormalizeImage(img, out, 0.5, 0.25);

    EXPECT_FLOAT_EQ(out.At<float>(0, 0, 0), -2.0f);
    EXPECT_FLOAT_EQ(out.At<float>(0, 0, 1), 0.0f);
    EXPECT_FLOAT_EQ(out.At<float>(1, 0, 0), 2.0f);
    EXPECT_FLOAT_EQ(out.At<float>(1, 0, 1), -1.0f);
}

TEST(NormalizeTest, ZeroMeanUnitStdIsFloatCast) {
    PImage img(3, 16, 16, PixelType::UInt8);
    for (int32_t c = 0; c < 3; ++c) {
        for (int32_t y = 0; y < 16; ++y) {
            for (int32_t x = 0; x < 16; ++x) {
                img.SetAt<uint8_t>(c, y, x, static_cast<uint8_t>((c * 85 + y * 16 + x) % 256));
            }
        }
    }

    PImage out;
    NormalizeImage(img, out, 0.0, 1.0);

    ASSERT_EQ(out.Type(), PixelType::Float32);
    ASSERT_TRUE(out.SameShape(img));
    for (int32_t c = 0; c < 3; ++c) {
        for (int32_t y = 0; y < 16; ++y) {
            for (int32_t x = 0; x < 16; ++x) {
                EXPECT_EQ(out.At<float>(c, y, x), static_cast<float>(img.At<uint8_t>(c, y, x)))
                    << "c=" << c << " y=" << y << " x=" << x;
            }
        }
    }
}

TEST(NormalizeTest, Float64InputBecomesFloat32) {
    std::vector<double> data = {3.0};
    PImage img = PImage::FromData(data.data(), 1, 1, 1, PixelType::Float64);

    PImage out;
    NormalizeImage(img, out, std::vector<double>{1.0}, std::vector<double>{2.0});
    ASSERT_EQ(out.Type(), PixelType::Float32);
    EXPECT_FLOAT_EQ(out.At<float>(0, 0, 0), 1.0f);
}

TEST(NormalizeTest, InputUntouched) {
    PImage img(1, 2, 2, PixelType::Float32);
    img.Fill(4.0);

    PImage out;
    NormalizeImage(img, out, 1.0, 1.0);
    EXPECT_FLOAT_EQ(img.At<float>(0, 1, 1), 4.0f);
    EXPECT_FLOAT_EQ(out.At<float>(0, 1, 1), 3.0f);
}

// =============================================================================
// Parameter presets
// =============================================================================

TEST(NormalizeTest, ImageNetPreset) {
    NormalizeParams params = NormalizeParams::ImageNet();
    ASSERT_EQ(params.mean.size(), 3u);
    ASSERT_EQ(params.stddev.size(), 3u);
    EXPECT_DOUBLE_EQ(params.maxPixelValue, 255.0);

    PImage img(3, 1, 1, PixelType::UInt8);
    img.Fill(128);

    PImage out;
    NormalizeImage(img, out, params);
    EXPECT_NEAR(out.At<float>(0, 0, 0), (128.0 - 0.485 * 255.0) / (0.229 * 255.0), 1e-5);
    EXPECT_NEAR(out.At<float>(1, 0, 0), (128.0 - 0.456 * 255.0) / (0.224 * 255.0), 1e-5);
    EXPECT_NEAR(out.At<float>(2, 0, 0), (128.0 - 0.406 * 255.0) / (0.225 * 255.0), 1e-5);
}

// =============================================================================
// Validation
// =============================================================================

TEST(NormalizeTest, ZeroStddevThrows) {
    PImage img(3, 1, 1);
    PImage out;
    EXPECT_THROW(NormalizeImage(img, out, {0.0}, {1.0, 0.0, 1.0}), InvalidArgumentException);
    EXPECT_THROW(NormalizeImage(img, out, 0.0,
                                std::numeric_limits<double>::quiet_NaN()),
                 InvalidArgumentException);
}

TEST(NormalizeTest, ChannelCountMismatchThrows) {
    PImage img(3, 1, 1);
    PImage out;
    EXPECT_THROW(NormalizeImage(img, out, {0.0, 0.0}, {1.0}), InvalidArgumentException);
    EXPECT_THROW(NormalizeImage(img, out, {0.0}, {1.0, 1.0, 1.0, 1.0}),
                 InvalidArgumentException);
}

TEST(NormalizeTest, EmptyThrows) {
    PImage out;
    EXPECT_THROW(NormalizeImage(PImage(), out, 0.0, 1.0), InvalidArgumentException);
}
