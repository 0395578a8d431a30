#pragma once

/**
 * @file Normalize.h
 * @brief Per-channel affine normalization: (x - mean) / stddev
 */

#include <PixAug/Core/Export.h>
#include <PixAug/Core/PImage.h>

#include <vector>

namespace Pix::Aug::Normalize {

/**
 * @brief Mean/std in [0, 1] units plus the pixel scale they apply to
 *
 * The effective statistics are mean * maxPixelValue and
 * stddev * maxPixelValue.
 */
struct PIXAUG_API NormalizeParams {
    std::vector<double> mean;
    std::vector<double> stddev;
    double maxPixelValue = 255.0;

    /// ImageNet statistics for UInt8 input
    static NormalizeParams ImageNet();
};

/**
 * @brief Normalize every channel with its own mean and std
 *
 * output = (float(image) - mean[c]) * (1 / stddev[c]), Float32, same shape.
 * The result is not clipped.
 *
 * @param image Input image, any pixel type (values are NOT rescaled first)
 * @param output Float32 result
 * @param mean One value for all channels or one per channel
 * @param stddev One value for all channels or one per channel
 * @throws InvalidArgumentException for an empty image, a mean/stddev size
 *         that is neither 1 nor the channel count, or a stddev entry that is
 *         zero or not finite
 */
PIXAUG_API void NormalizeImage(const PImage& image, PImage& output,
                               const std::vector<double>& mean,
                               const std::vector<double>& stddev);

/// Scalar mean/stddev applied to all channels
PIXAUG_API void NormalizeImage(const PImage& image, PImage& output,
                               double mean, double stddev);

/// Normalize with statistics scaled by params.maxPixelValue
PIXAUG_API void NormalizeImage(const PImage& image, PImage& output,
                               const NormalizeParams& params);

} // namespace Pix::Aug::Normalize
