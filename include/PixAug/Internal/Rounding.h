#pragma once

/**
 * @file Rounding.h
 * @brief Float -> Int32 rounding that reproduces OpenCV's integer results
 *
 * For x with int part i = trunc(x) and fraction f = x - i:
 * - f == +-0.5 and i even: result is i (half to even at the tie only)
 * - otherwise:             result is trunc(x + copysign(0.5, x))
 *
 * The add happens in the element's own precision, so Float32 input rounds
 * exactly like the float32 reference pipeline does.
 */

#include <PixAug/Core/Export.h>
#include <PixAug/Core/PImage.h>
#include <PixAug/Core/PixelTraits.h>

#include <cstdint>
#include <type_traits>

namespace Pix::Aug::Internal {

/**
 * @brief Round one value with the rule above
 */
template<typename T>
inline int32_t CvRound(T x) {
    static_assert(std::is_floating_point_v<T>, "CvRound expects a floating type");

    const int32_t truncated = PixelCast<int32_t>(x);
    const T intPart = static_cast<T>(truncated);
    const T fractPart = x - intPart;

    const bool tie = fractPart == T(0.5) || fractPart == T(-0.5);
    if (tie && (truncated % 2) == 0) {
        return truncated;
    }
    return PixelCast<int32_t>(x + (x >= T(0) ? T(0.5) : T(-0.5)));
}

/**
 * @brief Round every element of a Float32/Float64 image into an Int32 image
 *
 * @param image Float32 or Float64 image
 * @param output Int32 image of the same shape
 * @throws UnsupportedPixelTypeException for integer input
 */
PIXAUG_API void CvRoundImage(const PImage& image, PImage& output);

} // namespace Pix::Aug::Internal
