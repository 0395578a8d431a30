/**
 * @file Snow.cpp
 * @brief Snow effect implementation
 */

#include <PixAug/Weather/Snow.h>
#include <PixAug/Color/ColorConvert.h>
#include <PixAug/Core/PixelTraits.h>
#include <PixAug/Core/Validate.h>
#include <PixAug/Range/Range.h>

#include <algorithm>
#include <cstddef>
#include <utility>

namespace Pix::Aug::Weather {

namespace {

constexpr double SNOW_POINT_SCALE = 127.5;   // 255 / 2
constexpr double SNOW_POINT_OFFSET = 85.0;   // 255 / 3

// L *= coeff where L < threshold, then clip to the UInt8 range
void BleachLightness(PImage& hls, float threshold, float coeff) {
    float* lightness = hls.PlanePtr<float>(1);
    const std::ptrdiff_t count = static_cast<std::ptrdiff_t>(hls.PlaneSize());

    #pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < count; ++i) {
        float v = lightness[i];
        if (v < threshold) {
            v *= coeff;
        }
        lightness[i] = static_cast<float>(PixelCast<uint8_t>(std::clamp(v, 0.0f, 255.0f)));
    }
}

} // anonymous namespace

void AddSnow(const PImage& image, PImage& output, double snowPoint, double brightnessCoeff) {
    Validate::RequireColorImage(image, {PixelType::UInt8, PixelType::Float32}, "AddSnow");

    const bool needsFloat = IsFloatType(image.Type());

    PImage rgb = image;
    if (needsFloat) {
        Range::FromFloat(image, rgb, PixelType::UInt8);
    }

    const double threshold = snowPoint * SNOW_POINT_SCALE + SNOW_POINT_OFFSET;

    PImage hls;
    Color::RgbToHls(rgb, hls);
    hls = hls.ConvertTo(PixelType::Float32);

    BleachLightness(hls, static_cast<float>(threshold), static_cast<float>(brightnessCoeff));

    hls = hls.ConvertTo(PixelType::UInt8);
    PImage result;
    Color::HlsToRgb(hls, result);

    if (needsFloat) {
        Range::ToFloat(result, result, PixelType::Float32);
    }
    output = std::move(result);
}

double SampleSnowPoint(const SnowParams& params, Platform::Random& rng) {
    Validate::RequireRange(params.snowPointLower, 0.0, 1.0, "snowPointLower", "SampleSnowPoint");
    Validate::RequireRange(params.snowPointUpper, params.snowPointLower, 1.0,
                           "snowPointUpper", "SampleSnowPoint");
    Validate::RequireNonNegative(params.brightnessCoeff, "brightnessCoeff", "SampleSnowPoint");

    return rng.Double(params.snowPointLower, params.snowPointUpper);
}

void RandomSnow(const PImage& image, PImage& output,
                const SnowParams& params, Platform::Random& rng) {
    const double snowPoint = SampleSnowPoint(params, rng);
    AddSnow(image, output, snowPoint, params.brightnessCoeff);
}

} // namespace Pix::Aug::Weather
