#pragma once

/**
 * @file Cutout.h
 * @brief Rectangular region masking ("cutout")
 */

#include <PixAug/Core/Export.h>
#include <PixAug/Core/PImage.h>
#include <PixAug/Core/Types.h>
#include <PixAug/Platform/Random.h>

#include <cstdint>
#include <vector>

namespace Pix::Aug::Dropout {

/**
 * @brief Parameters of a random cutout
 */
struct PIXAUG_API CutoutParams {
    int32_t numHoles = 8;           ///< Holes per image
    int32_t maxHoleHeight = 8;      ///< Hole height before border clamping
    int32_t maxHoleWidth = 8;       ///< Hole width before border clamping
    double fillValue = 0.0;         ///< Value written into holes
};

/**
 * @brief Overwrite every channel inside each hole with @p fillValue
 *
 * Works on a copy; @p image is never modified (unless it is also
 * @p output). Overlapping holes are allowed. @p fillValue is cast to the
 * image's pixel type (truncated and saturated for integer types).
 *
 * @param image Input image (any pixel type)
 * @param output Result image, same type and shape
 * @param holes Half-open rectangles [x1, x2) x [y1, y2)
 * @param fillValue Fill value
 * @throws OutOfRangeException if a hole is not inside the image
 *         (0 <= x1 <= x2 <= width, 0 <= y1 <= y2 <= height)
 */
PIXAUG_API void Cutout(const PImage& image, PImage& output,
                       const std::vector<Hole>& holes, double fillValue = 0.0);

/**
 * @brief Draw hole rectangles for an image of the given size
 *
 * For each hole a centre (x, y) is drawn with x in [0, width] and
 * y in [0, height]; the rectangle starts maxHole/2 before the centre and
 * is clamped to the image, so every hole is valid for Cutout().
 *
 * @throws InvalidArgumentException if a count or size is negative
 */
PIXAUG_API std::vector<Hole> GenerateCutoutHoles(int32_t height, int32_t width,
                                                 const CutoutParams& params,
                                                 Platform::Random& rng);

/**
 * @brief GenerateCutoutHoles() followed by Cutout()
 */
PIXAUG_API void RandomCutout(const PImage& image, PImage& output,
                             const CutoutParams& params, Platform::Random& rng);

} // namespace Pix::Aug::Dropout
