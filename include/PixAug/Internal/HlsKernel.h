#pragma once

/**
 * @file HlsKernel.h
 * @brief RGB <-> HLS conversion on floating planes
 *
 * Input RGB is [0, 1]. HLS planes hold hue in radians [0, 2*pi),
 * lightness and saturation in [0, 1]. Planes may not alias each other
 * across the input/output boundary except element-for-element.
 *
 * Only float and double are instantiated.
 */

#include <PixAug/Core/Export.h>

#include <cstddef>

namespace Pix::Aug::Internal {

/**
 * @brief Convert @p n RGB pixels to HLS (hue in radians)
 *
 * Achromatic pixels (max == min) get hue 0 and saturation 0.
 */
template<typename T>
void RgbToHlsRadians(const T* r, const T* g, const T* b,
                     T* h, T* l, T* s, size_t n);

/**
 * @brief Convert @p n HLS pixels (hue in radians) to RGB
 */
template<typename T>
void HlsRadiansToRgb(const T* h, const T* l, const T* s,
                     T* r, T* g, T* b, size_t n);

extern template PIXAUG_API void RgbToHlsRadians<float>(
    const float*, const float*, const float*, float*, float*, float*, size_t);
extern template PIXAUG_API void RgbToHlsRadians<double>(
    const double*, const double*, const double*, double*, double*, double*, size_t);
extern template PIXAUG_API void HlsRadiansToRgb<float>(
    const float*, const float*, const float*, float*, float*, float*, size_t);
extern template PIXAUG_API void HlsRadiansToRgb<double>(
    const double*, const double*, const double*, double*, double*, double*, size_t);

} // namespace Pix::Aug::Internal
