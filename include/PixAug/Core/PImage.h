#pragma once

/**
 * @file PImage.h
 * @brief Planar (channel, height, width) image buffer
 */

#include <PixAug/Core/Export.h>
#include <PixAug/Core/Types.h>
#include <PixAug/Core/PixelTraits.h>
#include <PixAug/Core/Exception.h>

#include <cstddef>
#include <memory>
#include <string>

namespace Pix::Aug {

/**
 * @brief Multi-kind image stored as contiguous channel planes
 *
 * Key features:
 * - Axes (channel, height, width), planes stored one after another
 * - Pixel kinds UInt8, Int32, Float32, Float64
 * - 64-byte aligned buffer
 * - Shallow copy by default, Clone() for deep copy
 */
class PIXAUG_API PImage {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty image)
    PImage();

    /// Create zero-filled image with specified shape and type
    PImage(int32_t channels, int32_t height, int32_t width,
           PixelType type = PixelType::UInt8);

    /// Copy constructor (shallow copy)
    PImage(const PImage& other);

    /// Move constructor
    PImage(PImage&& other) noexcept;

    ~PImage();

    /// Copy assignment (shallow copy)
    PImage& operator=(const PImage& other);

    /// Move assignment
    PImage& operator=(PImage&& other) noexcept;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Load 8-bit image from file, channels become planes
    static PImage FromFile(const std::string& path);

    /// Create from contiguous CHW data (copies data)
    static PImage FromData(const void* data, int32_t channels,
                           int32_t height, int32_t width,
                           PixelType type = PixelType::UInt8);

    // =========================================================================
    // Basic Properties
    // =========================================================================

    int32_t Channels() const;
    int32_t Height() const;
    int32_t Width() const;
    PixelType Type() const;

    /// Elements per channel plane (height * width)
    size_t PlaneSize() const;

    /// Total element count (channels * height * width)
    size_t ElementCount() const;

    /// Size of one element in bytes
    size_t BytesPerElement() const;

    /// Check if image is empty
    bool Empty() const;

    /// Check if image is valid (allocated)
    bool IsValid() const;

    /// Same channel, height and width as @p other
    bool SameShape(const PImage& other) const;

    // =========================================================================
    // Data Access
    // =========================================================================

    void* Data();
    const void* Data() const;

    /// Typed pointer to the first element; T must match Type()
    template<typename T> T* Ptr();
    template<typename T> const T* Ptr() const;

    /// Typed pointer to the first element of channel plane @p c
    template<typename T> T* PlanePtr(int32_t c);
    template<typename T> const T* PlanePtr(int32_t c) const;

    /// Element at (c, y, x); no bounds check
    template<typename T> T At(int32_t c, int32_t y, int32_t x) const;
    template<typename T> void SetAt(int32_t c, int32_t y, int32_t x, T value);

    // =========================================================================
    // Image Operations
    // =========================================================================

    /// Deep copy
    PImage Clone() const;

    /// Convert to different pixel type (truncating, saturating for integers)
    PImage ConvertTo(PixelType targetType) const;

    /// Set every element to @p value (cast to the pixel type)
    void Fill(double value);

    /// Save UInt8 image with 1, 3 or 4 channels (.png, .jpg, .bmp)
    bool SaveToFile(const std::string& path) const;

private:
    void RequireElementType(PixelType requested) const;

    class Impl;
    std::shared_ptr<Impl> impl_;
};

// =============================================================================
// Template Implementations
// =============================================================================

template<typename T>
T* PImage::Ptr() {
    RequireElementType(PixelTypeOf<T>::value);
    return static_cast<T*>(Data());
}

template<typename T>
const T* PImage::Ptr() const {
    RequireElementType(PixelTypeOf<T>::value);
    return static_cast<const T*>(Data());
}

template<typename T>
T* PImage::PlanePtr(int32_t c) {
    return Ptr<T>() + static_cast<size_t>(c) * PlaneSize();
}

template<typename T>
const T* PImage::PlanePtr(int32_t c) const {
    return Ptr<T>() + static_cast<size_t>(c) * PlaneSize();
}

template<typename T>
T PImage::At(int32_t c, int32_t y, int32_t x) const {
    return PlanePtr<T>(c)[static_cast<size_t>(y) * Width() + x];
}

template<typename T>
void PImage::SetAt(int32_t c, int32_t y, int32_t x, T value) {
    PlanePtr<T>(c)[static_cast<size_t>(y) * Width() + x] = value;
}

} // namespace Pix::Aug
