/**
 * @file ColorConvert.cpp
 * @brief RGB <-> HLS conversion implementation
 */

#include <PixAug/Color/ColorConvert.h>
#include <PixAug/Core/Constants.h>
#include <PixAug/Core/Exception.h>
#include <PixAug/Core/Validate.h>
#include <PixAug/Internal/HlsKernel.h>
#include <PixAug/Internal/Rounding.h>
#include <PixAug/Range/Range.h>

#include <cstddef>
#include <string>

namespace Pix::Aug::Color {

namespace {

constexpr double U8_HUE_MAX = 180.0;
constexpr double FLOAT_HUE_MAX = 360.0;

// Multiply every element of a plane by a factor in the plane's precision
template<typename T>
void ScalePlane(T* plane, size_t n, T factor) {
    const std::ptrdiff_t count = static_cast<std::ptrdiff_t>(n);
    #pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < count; ++i) {
        plane[i] *= factor;
    }
}

template<typename T>
void DividePlane(T* plane, size_t n, T divisor) {
    const std::ptrdiff_t count = static_cast<std::ptrdiff_t>(n);
    #pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < count; ++i) {
        plane[i] /= divisor;
    }
}

// =============================================================================
// Floating path
// =============================================================================

template<typename T>
PImage RgbToHlsFloat(const PImage& image) {
    const size_t n = image.PlaneSize();
    PImage hls(3, image.Height(), image.Width(), image.Type());

    Internal::RgbToHlsRadians(image.PlanePtr<T>(0), image.PlanePtr<T>(1), image.PlanePtr<T>(2),
                              hls.PlanePtr<T>(0), hls.PlanePtr<T>(1), hls.PlanePtr<T>(2), n);
    ScalePlane(hls.PlanePtr<T>(0), n, static_cast<T>(FLOAT_HUE_MAX / TWO_PI));
    return hls;
}

template<typename T>
PImage HlsToRgbFloat(const PImage& image) {
    const size_t n = image.PlaneSize();
    PImage hls = image.Clone();
    ScalePlane(hls.PlanePtr<T>(0), n, static_cast<T>(TWO_PI / FLOAT_HUE_MAX));

    PImage rgb(3, image.Height(), image.Width(), image.Type());
    Internal::HlsRadiansToRgb(hls.PlanePtr<T>(0), hls.PlanePtr<T>(1), hls.PlanePtr<T>(2),
                              rgb.PlanePtr<T>(0), rgb.PlanePtr<T>(1), rgb.PlanePtr<T>(2), n);
    return rgb;
}

// =============================================================================
// UInt8 path (float32 arithmetic, CvRound, clipped back to UInt8 by caller)
// =============================================================================

PImage RgbToHlsU8Rounded(const PImage& image) {
    const size_t n = image.PlaneSize();

    PImage rgb = image.ConvertTo(PixelType::Float32);
    ScalePlane(rgb.Ptr<float>(), rgb.ElementCount(), static_cast<float>(1.0 / 255.0));

    PImage hls(3, image.Height(), image.Width(), PixelType::Float32);
    Internal::RgbToHlsRadians(rgb.PlanePtr<float>(0), rgb.PlanePtr<float>(1),
                              rgb.PlanePtr<float>(2), hls.PlanePtr<float>(0),
                              hls.PlanePtr<float>(1), hls.PlanePtr<float>(2), n);

    ScalePlane(hls.PlanePtr<float>(0), n, static_cast<float>(U8_HUE_MAX / TWO_PI));
    ScalePlane(hls.PlanePtr<float>(1), 2 * n, 255.0f);

    PImage rounded;
    Internal::CvRoundImage(hls, rounded);
    return rounded;
}

PImage HlsToRgbU8Rounded(const PImage& image) {
    const size_t n = image.PlaneSize();

    PImage hls = image.ConvertTo(PixelType::Float32);
    ScalePlane(hls.PlanePtr<float>(0), n, static_cast<float>(TWO_PI / U8_HUE_MAX));
    DividePlane(hls.PlanePtr<float>(1), 2 * n, 255.0f);

    PImage rgb(3, image.Height(), image.Width(), PixelType::Float32);
    Internal::HlsRadiansToRgb(hls.PlanePtr<float>(0), hls.PlanePtr<float>(1),
                              hls.PlanePtr<float>(2), rgb.PlanePtr<float>(0),
                              rgb.PlanePtr<float>(1), rgb.PlanePtr<float>(2), n);
    ScalePlane(rgb.Ptr<float>(), rgb.ElementCount(), 255.0f);

    PImage rounded;
    Internal::CvRoundImage(rgb, rounded);
    return rounded;
}

const Range::ImageTransform& RgbToHlsU8() {
    static const Range::ImageTransform transform = Range::Clipped(RgbToHlsU8Rounded);
    return transform;
}

const Range::ImageTransform& HlsToRgbU8() {
    static const Range::ImageTransform transform = Range::Clipped(HlsToRgbU8Rounded);
    return transform;
}

} // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

void RgbToHls(const PImage& image, PImage& output) {
    Validate::RequireColorImage(image,
        {PixelType::UInt8, PixelType::Float32, PixelType::Float64}, "RgbToHls");

    switch (image.Type()) {
        case PixelType::UInt8:   output = RgbToHlsU8()(image); return;
        case PixelType::Float32: output = RgbToHlsFloat<float>(image); return;
        case PixelType::Float64: output = RgbToHlsFloat<double>(image); return;
        case PixelType::Int32:   break;
    }
    throw UnsupportedPixelTypeException(
        std::string("RgbToHls: ") + PixelTypeName(image.Type()));
}

void HlsToRgb(const PImage& image, PImage& output) {
    Validate::RequireColorImage(image,
        {PixelType::UInt8, PixelType::Float32, PixelType::Float64}, "HlsToRgb");

    switch (image.Type()) {
        case PixelType::UInt8:   output = HlsToRgbU8()(image); return;
        case PixelType::Float32: output = HlsToRgbFloat<float>(image); return;
        case PixelType::Float64: output = HlsToRgbFloat<double>(image); return;
        case PixelType::Int32:   break;
    }
    throw UnsupportedPixelTypeException(
        std::string("HlsToRgb: ") + PixelTypeName(image.Type()));
}

} // namespace Pix::Aug::Color
