#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for PixAug
 */

#include <cstddef>
#include <cstdint>
#include <PixAug/Core/Export.h>

namespace Pix::Aug {

// =============================================================================
// Pixel Types
// =============================================================================

/**
 * @brief Supported pixel storage kinds
 *
 * The set is closed: every dispatch over PixelType is exhaustive.
 */
enum class PixelType {
    UInt8,      ///< 8-bit unsigned [0, 255]
    Int32,      ///< 32-bit signed, result kind of rounding
    Float32,    ///< 32-bit float, conventionally [0, 1]
    Float64     ///< 64-bit float, conventionally [0, 1]
};

/// Number of PixelType enumerators
constexpr int PIXEL_TYPE_COUNT = 4;

/**
 * @brief Name of a pixel type, for error messages
 */
inline const char* PixelTypeName(PixelType type) {
    switch (type) {
        case PixelType::UInt8:   return "UInt8";
        case PixelType::Int32:   return "Int32";
        case PixelType::Float32: return "Float32";
        case PixelType::Float64: return "Float64";
    }
    return "Unknown";
}

/**
 * @brief Size of one element of the given pixel type in bytes
 */
inline size_t PixelTypeSize(PixelType type) {
    switch (type) {
        case PixelType::UInt8:   return 1;
        case PixelType::Int32:   return 4;
        case PixelType::Float32: return 4;
        case PixelType::Float64: return 8;
    }
    return 1;
}

inline bool IsFloatType(PixelType type) {
    return type == PixelType::Float32 || type == PixelType::Float64;
}

// =============================================================================
// Hole (cutout rectangle)
// =============================================================================

/**
 * @brief Half-open pixel rectangle [x1, x2) x [y1, y2)
 */
struct PIXAUG_API Hole {
    int32_t x1 = 0;     ///< Left (inclusive)
    int32_t y1 = 0;     ///< Top (inclusive)
    int32_t x2 = 0;     ///< Right (exclusive)
    int32_t y2 = 0;     ///< Bottom (exclusive)

    Hole() = default;
    Hole(int32_t x1_, int32_t y1_, int32_t x2_, int32_t y2_)
        : x1(x1_), y1(y1_), x2(x2_), y2(y2_) {}

    int32_t Width() const { return x2 - x1; }
    int32_t Height() const { return y2 - y1; }
    bool IsEmpty() const { return x2 <= x1 || y2 <= y1; }

    bool Contains(int32_t px, int32_t py) const {
        return px >= x1 && px < x2 && py >= y1 && py < y2;
    }

    bool operator==(const Hole& other) const {
        return x1 == other.x1 && y1 == other.y1 && x2 == other.x2 && y2 == other.y2;
    }
};

} // namespace Pix::Aug
