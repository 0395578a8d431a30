#pragma once

#include <PixAug/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for PixAug
 */

#include <stdexcept>
#include <string>

namespace Pix::Aug {

/**
 * @brief Base exception class for PixAug
 */
class PIXAUG_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class PIXAUG_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Out of range exception
 */
class PIXAUG_API OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message) {}
};

/**
 * @brief File I/O exception
 */
class PIXAUG_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

/**
 * @brief Unsupported operation or format
 */
class PIXAUG_API UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception("Unsupported: " + message) {}
};

/**
 * @brief Pixel type has no entry in the max-value table
 *
 * Raised when a conversion needs the maximum value of a pixel type and
 * neither the table nor the caller provides one.
 */
class PIXAUG_API UnknownPixelTypeException : public Exception {
public:
    explicit UnknownPixelTypeException(const std::string& message)
        : Exception("Unknown pixel type: " + message) {}
};

/**
 * @brief Pixel type outside the set an operation accepts
 */
class PIXAUG_API UnsupportedPixelTypeException : public UnsupportedException {
public:
    explicit UnsupportedPixelTypeException(const std::string& message)
        : UnsupportedException(message) {}
};

} // namespace Pix::Aug
