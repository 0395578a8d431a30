/**
 * @file Rounding.cpp
 * @brief Image-level OpenCV-compatible rounding
 */

#include <PixAug/Internal/Rounding.h>
#include <PixAug/Core/Validate.h>

#include <cstddef>
#include <utility>

namespace Pix::Aug::Internal {

namespace {

template<typename T>
void RoundBuffer(const T* src, int32_t* dst, size_t n) {
    const std::ptrdiff_t count = static_cast<std::ptrdiff_t>(n);
    #pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < count; ++i) {
        dst[i] = CvRound(src[i]);
    }
}

} // anonymous namespace

void CvRoundImage(const PImage& image, PImage& output) {
    PIXAUG_REQUIRE_IMAGE(image);
    Validate::RequireImageTypeOneOf(image, {PixelType::Float32, PixelType::Float64},
                                    "CvRoundImage");

    PImage result(image.Channels(), image.Height(), image.Width(), PixelType::Int32);
    if (image.Type() == PixelType::Float32) {
        RoundBuffer(image.Ptr<float>(), result.Ptr<int32_t>(), image.ElementCount());
    } else {
        RoundBuffer(image.Ptr<double>(), result.Ptr<int32_t>(), image.ElementCount());
    }
    output = std::move(result);
}

} // namespace Pix::Aug::Internal
