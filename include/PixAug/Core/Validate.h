#pragma once

/**
 * @file Validate.h
 * @brief Argument validation shared by all PixAug operations
 *
 * - Empty input images are errors (every transform has a defined output shape)
 * - Pixel type restriction raises UnsupportedPixelTypeException
 * - Channel and value restrictions raise InvalidArgumentException
 * - Message format: "<FuncName>: <what> ..."
 */

#include <PixAug/Core/Exception.h>
#include <PixAug/Core/PImage.h>

#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <string>

namespace Pix::Aug::Validate {

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(float val) {
    return FormatValue(static_cast<double>(val));
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatValue(int64_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

} // namespace Detail

// =============================================================================
// Image validation
// =============================================================================

/**
 * @brief Check image is non-empty and allocated
 * @throws InvalidArgumentException if image is empty or invalid
 */
inline void RequireImageNonEmpty(const PImage& image, const char* funcName) {
    if (image.Empty()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is empty");
    }
    if (!image.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is invalid");
    }
}

/**
 * @brief Check image type is one of allowed types
 * @throws UnsupportedPixelTypeException if type not in list
 */
inline void RequireImageTypeOneOf(const PImage& image, std::initializer_list<PixelType> types,
                                  const char* funcName) {
    const PixelType actual = image.Type();
    for (PixelType t : types) {
        if (actual == t) return;
    }

    std::string allowed;
    for (PixelType t : types) {
        if (!allowed.empty()) allowed += ", ";
        allowed += PixelTypeName(t);
    }
    throw UnsupportedPixelTypeException(
        std::string(funcName) + " supports only " + allowed +
        " images, got " + PixelTypeName(actual));
}

/**
 * @brief Check image has exactly @p expected channels
 */
inline void RequireChannelCountExact(const PImage& image, int expected, const char* funcName) {
    const int actual = image.Channels();
    if (actual != expected) {
        throw InvalidArgumentException(
            std::string(funcName) + ": expected " + std::to_string(expected) +
            " channel(s), got " + std::to_string(actual));
    }
}

/**
 * @brief Non-empty 3-channel image of one of the given types
 */
inline void RequireColorImage(const PImage& image, std::initializer_list<PixelType> types,
                              const char* funcName) {
    RequireImageNonEmpty(image, funcName);
    RequireImageTypeOneOf(image, types, funcName);
    RequireChannelCountExact(image, 3, funcName);
}

// =============================================================================
// Value Range Validation
// =============================================================================

template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (!(value >= minVal && value <= maxVal)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (!(value >= T(0))) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Finite and not zero (divisors)
 */
inline void RequireFiniteNonZero(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value) || value == 0.0) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite and non-zero, got " +
            Detail::FormatValue(value));
    }
}

// =============================================================================
// Convenience Macros
// =============================================================================

#define PIXAUG_REQUIRE_IMAGE(img) \
    ::Pix::Aug::Validate::RequireImageNonEmpty(img, __func__)

#define PIXAUG_REQUIRE_NON_NEGATIVE(val) \
    ::Pix::Aug::Validate::RequireNonNegative(val, #val, __func__)

} // namespace Pix::Aug::Validate
