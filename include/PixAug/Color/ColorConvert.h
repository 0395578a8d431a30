#pragma once

/**
 * @file ColorConvert.h
 * @brief RGB <-> HLS conversion for UInt8 and floating images
 *
 * Channel layout of an HLS image: plane 0 = hue, 1 = lightness,
 * 2 = saturation.
 *
 * | Input type       | Hue range      | L / S range | Result rounding          |
 * |------------------|----------------|-------------|--------------------------|
 * | UInt8            | [0, 180]       | [0, 255]    | CvRound, clip, UInt8     |
 * | Float32, Float64 | [0, 360) deg   | [0, 1]      | none (same float type)   |
 *
 * The UInt8 path reproduces OpenCV's 8-bit cvtColor results, so values can be
 * compared pixel-for-pixel against an integer reference implementation.
 */

#include <PixAug/Core/Export.h>
#include <PixAug/Core/PImage.h>

namespace Pix::Aug::Color {

/**
 * @brief Convert a 3-channel RGB image to HLS
 *
 * @param image RGB image (UInt8, Float32 or Float64)
 * @param output HLS image of the same pixel type (may alias @p image)
 * @throws UnsupportedPixelTypeException for Int32 input
 * @throws InvalidArgumentException if image is empty or not 3-channel
 */
PIXAUG_API void RgbToHls(const PImage& image, PImage& output);

/**
 * @brief Convert a 3-channel HLS image back to RGB
 *
 * @param image HLS image (UInt8, Float32 or Float64)
 * @param output RGB image of the same pixel type (may alias @p image)
 * @throws UnsupportedPixelTypeException for Int32 input
 * @throws InvalidArgumentException if image is empty or not 3-channel
 */
PIXAUG_API void HlsToRgb(const PImage& image, PImage& output);

} // namespace Pix::Aug::Color
