/**
 * @file test_color_convert.cpp
 * @brief Unit tests for Color/ColorConvert.h
 */

#include <gtest/gtest.h>
#include <PixAug/Color/ColorConvert.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <vector>

using namespace Pix::Aug;
using namespace Pix::Aug::Color;

namespace {

using Triple = std::array<int, 3>;

// One pixel per triple, laid out as a 3 x 1 x N image
template<typename T>
PImage MakeRow(const std::vector<std::array<T, 3>>& pixels, PixelType type) {
    const int32_t n = static_cast<int32_t>(pixels.size());
    PImage img(3, 1, n, type);
    for (int32_t x = 0; x < n; ++x) {
        for (int32_t c = 0; c < 3; ++c) {
            img.SetAt<T>(c, 0, x, pixels[x][c]);
        }
    }
    return img;
}

PImage MakeU8Row(const std::vector<Triple>& pixels) {
    std::vector<std::array<uint8_t, 3>> bytes;
    for (const Triple& p : pixels) {
        bytes.push_back({static_cast<uint8_t>(p[0]), static_cast<uint8_t>(p[1]),
                         static_cast<uint8_t>(p[2])});
    }
    return MakeRow(bytes, PixelType::UInt8);
}

Triple PixelAt(const PImage& img, int32_t x) {
    return {img.At<uint8_t>(0, 0, x), img.At<uint8_t>(1, 0, x), img.At<uint8_t>(2, 0, x)};
}

} // anonymous namespace

// =============================================================================
// UInt8 RGB -> HLS
// =============================================================================

TEST(RgbToHlsU8Test, KnownColors) {
    const std::vector<Triple> rgb = {
        {255, 0, 0}, {0, 255, 0}, {0, 0, 255},
        {255, 255, 0}, {0, 255, 255}, {255, 0, 255},
        {128, 128, 128}, {0, 0, 0}, {255, 255, 255},
        {200, 100, 50}, {10, 20, 30}, {100, 100, 100}
    };
    const std::vector<Triple> hls = {
        {0, 128, 255}, {60, 128, 255}, {120, 128, 255},
        {30, 128, 255}, {90, 128, 255}, {150, 128, 255},
        {0, 128, 0}, {0, 0, 0}, {0, 255, 0},
        {10, 125, 153}, {105, 20, 128}, {0, 100, 0}
    };

    PImage out;
    RgbToHls(MakeU8Row(rgb), out);

    ASSERT_EQ(out.Type(), PixelType::UInt8);
    ASSERT_EQ(out.Channels(), 3);
    for (size_t i = 0; i < rgb.size(); ++i) {
        EXPECT_EQ(PixelAt(out, static_cast<int32_t>(i)), hls[i]) << "pixel " << i;
    }
}

TEST(RgbToHlsU8Test, HueStaysBelow180) {
    std::vector<Triple> rgb;
    for (int r = 0; r < 256; r += 17) {
        for (int g = 0; g < 256; g += 51) {
            for (int b = 0; b < 256; b += 85) {
                rgb.push_back({r, g, b});
            }
        }
    }

    PImage out;
    RgbToHls(MakeU8Row(rgb), out);
    for (size_t i = 0; i < rgb.size(); ++i) {
        EXPECT_LE(out.At<uint8_t>(0, 0, static_cast<int32_t>(i)), 180);
    }
}

// =============================================================================
// UInt8 HLS -> RGB
// =============================================================================

TEST(HlsToRgbU8Test, PrimaryHues) {
    PImage out;
    HlsToRgb(MakeU8Row({{0, 128, 255}, {60, 128, 255}, {120, 128, 255}}), out);

    ASSERT_EQ(out.Type(), PixelType::UInt8);
    // L = 128 sits just above one half, so the off channels land on 1
    EXPECT_EQ(PixelAt(out, 0), (Triple{255, 1, 1}));
    EXPECT_EQ(PixelAt(out, 1), (Triple{1, 255, 1}));
    EXPECT_EQ(PixelAt(out, 2), (Triple{1, 1, 255}));
}

TEST(HlsToRgbU8Test, ZeroSaturationIsGray) {
    PImage out;
    HlsToRgb(MakeU8Row({{0, 0, 0}, {90, 77, 0}, {0, 255, 0}}), out);
    EXPECT_EQ(PixelAt(out, 0), (Triple{0, 0, 0}));
    EXPECT_EQ(PixelAt(out, 1), (Triple{77, 77, 77}));
    EXPECT_EQ(PixelAt(out, 2), (Triple{255, 255, 255}));
}

TEST(HlsToRgbU8Test, RoundTripWithinOneLevel) {
    // Primaries, grays and low-saturation greens
    std::vector<Triple> rgb = {
        {255, 0, 0}, {0, 255, 0}, {0, 0, 255},
        {255, 255, 0}, {0, 255, 255}, {255, 0, 255},
        {128, 128, 128}, {0, 0, 0}, {255, 255, 255},
        {200, 100, 50}, {10, 20, 30}, {100, 100, 100}
    };
    for (int y = 0; y <= 255; y += 5) {
        for (int d = 0; d <= 3; ++d) {
            rgb.push_back({y, std::min(255, y + d), y});
        }
    }

    PImage hls, back;
    RgbToHls(MakeU8Row(rgb), hls);
    HlsToRgb(hls, back);

    ASSERT_TRUE(back.SameShape(hls));
    for (size_t i = 0; i < rgb.size(); ++i) {
        const Triple got = PixelAt(back, static_cast<int32_t>(i));
        for (int c = 0; c < 3; ++c) {
            EXPECT_LE(std::abs(got[c] - rgb[i][c]), 1) << "pixel " << i << " channel " << c;
        }
    }
}

// =============================================================================
// Floating Paths
// =============================================================================

TEST(RgbToHlsFloatTest, HueInDegrees) {
    PImage img = MakeRow<double>({{1, 0, 0}, {0, 1, 0}, {0, 0, 1}, {0.5, 0.5, 0.5}},
                                 PixelType::Float64);
    PImage out;
    RgbToHls(img, out);

    ASSERT_EQ(out.Type(), PixelType::Float64);
    EXPECT_NEAR(out.At<double>(0, 0, 0), 0.0, 1e-9);
    EXPECT_NEAR(out.At<double>(0, 0, 1), 120.0, 1e-9);
    EXPECT_NEAR(out.At<double>(0, 0, 2), 240.0, 1e-9);
    EXPECT_NEAR(out.At<double>(1, 0, 0), 0.5, 1e-12);
    EXPECT_NEAR(out.At<double>(2, 0, 0), 1.0, 1e-12);
    EXPECT_EQ(out.At<double>(2, 0, 3), 0.0);
}

TEST(HlsToRgbFloatTest, Float32RoundTrip) {
    PImage img = MakeRow<float>({{0.9f, 0.3f, 0.1f}, {0.2f, 0.4f, 0.6f}, {0.0f, 0.0f, 0.0f},
                                 {1.0f, 1.0f, 1.0f}, {0.25f, 0.75f, 0.5f}},
                                PixelType::Float32);
    PImage hls, back;
    RgbToHls(img, hls);
    HlsToRgb(hls, back);

    ASSERT_EQ(back.Type(), PixelType::Float32);
    for (size_t i = 0; i < img.ElementCount(); ++i) {
        EXPECT_NEAR(back.Ptr<float>()[i], img.Ptr<float>()[i], 1e-5f) << "element " << i;
    }
}

TEST(HlsToRgbFloatTest, DoesNotModifyInput) {
    PImage hls = MakeRow<double>({{120.0, 0.5, 1.0}}, PixelType::Float64);
    PImage rgb;
    HlsToRgb(hls, rgb);

    EXPECT_DOUBLE_EQ(hls.At<double>(0, 0, 0), 120.0);
    EXPECT_NEAR(rgb.At<double>(0, 0, 0), 0.0, 1e-9);
    EXPECT_NEAR(rgb.At<double>(1, 0, 0), 1.0, 1e-9);
    EXPECT_NEAR(rgb.At<double>(2, 0, 0), 0.0, 1e-9);
}

// =============================================================================
// Validation
// =============================================================================

TEST(ColorConvertTest, RejectsInt32) {
    PImage img(3, 2, 2, PixelType::Int32);
    PImage out;
    EXPECT_THROW(RgbToHls(img, out), UnsupportedPixelTypeException);
    EXPECT_THROW(HlsToRgb(img, out), UnsupportedPixelTypeException);
}

TEST(ColorConvertTest, RequiresThreeChannels) {
    PImage img(1, 2, 2, PixelType::UInt8);
    PImage out;
    EXPECT_THROW(RgbToHls(img, out), InvalidArgumentException);
    EXPECT_THROW(HlsToRgb(img, out), InvalidArgumentException);
}

TEST(ColorConvertTest, RejectsEmpty) {
    PImage out;
    EXPECT_THROW(RgbToHls(PImage(), out), InvalidArgumentException);
}
