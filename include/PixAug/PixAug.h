#pragma once

/**
 * @file PixAug.h
 * @brief Main header file for PixAug
 *
 * PixAug provides pixel-level augmentation primitives that behave the same
 * on UInt8 [0, 255] and floating [0, 1] images, with 8-bit results that
 * match OpenCV rounding.
 */

// Configuration and export macros
#include <PixAug/PixAugConfig.h>
#include <PixAug/Core/Export.h>

// Core types and utilities
#include <PixAug/Core/Types.h>
#include <PixAug/Core/Constants.h>
#include <PixAug/Core/Exception.h>
#include <PixAug/Core/PixelTraits.h>
#include <PixAug/Core/PixelRange.h>
#include <PixAug/Core/PImage.h>

// Platform abstraction
#include <PixAug/Platform/Memory.h>
#include <PixAug/Platform/Random.h>
#include <PixAug/Platform/Timer.h>

// Feature modules
#include <PixAug/Range/Range.h>
#include <PixAug/Color/ColorConvert.h>
#include <PixAug/Dropout/Cutout.h>
#include <PixAug/Weather/Snow.h>
#include <PixAug/Normalize/Normalize.h>

namespace Pix::Aug {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return PIXAUG_VERSION_STRING;
}

/**
 * @brief Whether the library was built with OpenMP kernels
 */
inline bool HasOpenMP() {
    return PIXAUG_HAS_OPENMP != 0;
}

} // namespace Pix::Aug
