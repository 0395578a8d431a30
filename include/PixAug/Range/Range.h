#pragma once

/**
 * @file Range.h
 * @brief Value clipping and integer <-> float range conversion
 *
 * Integer images hold [0, 255]; float images conventionally hold [0, 1].
 * Max values come from a PixelRangeTable (PixelRangeTable::Default() unless
 * the caller supplies another).
 *
 * Example:
 * @code
 * PImage f32;
 * Range::ToFloat(u8Image, f32, PixelType::Float32);   // u8 / 255
 * PImage back;
 * Range::FromFloat(f32, back, PixelType::UInt8);      // trunc(f * 255)
 * @endcode
 */

#include <PixAug/Core/Export.h>
#include <PixAug/Core/PImage.h>
#include <PixAug/Core/PixelRange.h>

#include <functional>
#include <optional>

namespace Pix::Aug::Range {

/// Image -> image transform, the unit Clipped() composes over
using ImageTransform = std::function<PImage(const PImage&)>;

// =============================================================================
// Clipping
// =============================================================================

/**
 * @brief Clamp every element to [0, maxValue], then cast to @p targetType
 *
 * Accepts any pixel type. Integer targets truncate toward zero.
 *
 * @param image Input image
 * @param output Output image of @p targetType (may alias @p image)
 * @param targetType Storage type of the result
 * @param maxValue Upper clamp bound
 */
PIXAUG_API void Clip(const PImage& image, PImage& output,
                     PixelType targetType, double maxValue);

/**
 * @brief Wrap a transform so its result is clipped back to the input's range
 *
 * The returned transform records the input's pixel type, looks up its max
 * value in @p table (1.0 if the type has no entry), runs @p transform and
 * clips the result to [0, max] in the input's pixel type.
 */
PIXAUG_API ImageTransform Clipped(ImageTransform transform,
                                  PixelRangeTable table = PixelRangeTable::Default());

// =============================================================================
// Range conversion
// =============================================================================

/**
 * @brief Divide by the max value and cast to @p targetType
 *
 * @param image Input image
 * @param output Output image (may alias @p image)
 * @param targetType Result type, normally Float32 or Float64
 * @param maxValue Divisor; looked up from the INPUT type when omitted
 * @param table Max-value table used for the lookup
 * @throws UnknownPixelTypeException if maxValue is omitted and the input
 *         type has no entry in @p table
 */
PIXAUG_API void ToFloat(const PImage& image, PImage& output, PixelType targetType,
                        std::optional<double> maxValue = std::nullopt,
                        const PixelRangeTable& table = PixelRangeTable::Default());

/**
 * @brief Multiply by the max value and cast to @p targetType
 *
 * The product is formed in the input's precision and then truncated toward
 * zero for integer targets.
 *
 * @param maxValue Factor; looked up from @p targetType when omitted
 * @throws UnknownPixelTypeException if maxValue is omitted and
 *         @p targetType has no entry in @p table
 */
PIXAUG_API void FromFloat(const PImage& image, PImage& output, PixelType targetType,
                          std::optional<double> maxValue = std::nullopt,
                          const PixelRangeTable& table = PixelRangeTable::Default());

} // namespace Pix::Aug::Range
