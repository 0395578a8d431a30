#pragma once

/**
 * @file Constants.h
 * @brief Mathematical and memory constants
 */

#include <cstddef>

namespace Pix::Aug {

// =============================================================================
// Mathematical Constants
// =============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;

// =============================================================================
// Memory Constants
// =============================================================================

/// Buffer alignment in bytes (AVX-512 friendly)
constexpr size_t MEMORY_ALIGNMENT = 64;

// =============================================================================
// Utility Functions
// =============================================================================

template<typename T>
constexpr T Clamp(T value, T minVal, T maxVal) {
    return value < minVal ? minVal : (value > maxVal ? maxVal : value);
}

} // namespace Pix::Aug
