#pragma once

/**
 * @file Snow.h
 * @brief Snow effect: bleaches low-lightness pixels
 *
 * Pipeline (UInt8 arithmetic, matching the 8-bit reference):
 * 1. Float32 input is scaled to UInt8 with Range::FromFloat
 * 2. threshold = snowPoint * 127.5 + 85
 * 3. RGB -> HLS (UInt8 path)
 * 4. L < threshold: L *= brightnessCoeff, then clipped to [0, 255]
 * 5. HLS -> RGB (UInt8 path), back to Float32 if the input was Float32
 */

#include <PixAug/Core/Export.h>
#include <PixAug/Core/PImage.h>
#include <PixAug/Platform/Random.h>

namespace Pix::Aug::Weather {

/**
 * @brief Parameters of a random snow effect
 */
struct PIXAUG_API SnowParams {
    double snowPointLower = 0.1;    ///< Lower bound of snowPoint, in [0, 1]
    double snowPointUpper = 0.3;    ///< Upper bound of snowPoint, in [0, 1]
    double brightnessCoeff = 2.5;   ///< Lightness multiplier, >= 0
};

/**
 * @brief Apply the snow effect
 *
 * @param image 3-channel RGB image, UInt8 or Float32
 * @param output Result, same type and shape as @p image
 * @param snowPoint Snow amount; 0 gives a lightness threshold of 85,
 *        1 gives 212.5
 * @param brightnessCoeff Multiplier applied to lightness below the threshold
 * @throws UnsupportedPixelTypeException for Int32 or Float64 input
 * @throws InvalidArgumentException if image is empty or not 3-channel
 */
PIXAUG_API void AddSnow(const PImage& image, PImage& output,
                        double snowPoint, double brightnessCoeff);

/**
 * @brief Draw snowPoint uniformly from [snowPointLower, snowPointUpper]
 * @throws InvalidArgumentException for bounds outside [0, 1], lower > upper
 *         or a negative brightnessCoeff
 */
PIXAUG_API double SampleSnowPoint(const SnowParams& params, Platform::Random& rng);

/**
 * @brief SampleSnowPoint() followed by AddSnow()
 */
PIXAUG_API void RandomSnow(const PImage& image, PImage& output,
                           const SnowParams& params, Platform::Random& rng);

} // namespace Pix::Aug::Weather
