#include <PixAug/Core/PImage.h>
#include <PixAug/Core/Exception.h>
#include <PixAug/Platform/Memory.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

// stb_image for file I/O
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image.h>
#include <stb/stb_image_write.h>

namespace Pix::Aug {

// =============================================================================
// Implementation class
// =============================================================================

class PImage::Impl {
public:
    int32_t channels_ = 0;
    int32_t height_ = 0;
    int32_t width_ = 0;
    PixelType type_ = PixelType::UInt8;
    std::shared_ptr<uint8_t> data_;

    size_t PlaneSize() const {
        return static_cast<size_t>(height_) * static_cast<size_t>(width_);
    }

    size_t ElementCount() const {
        return static_cast<size_t>(channels_) * PlaneSize();
    }

    size_t ByteCount() const {
        return ElementCount() * PixelTypeSize(type_);
    }

    void Allocate(int32_t c, int32_t h, int32_t w, PixelType type) {
        channels_ = c;
        height_ = h;
        width_ = w;
        type_ = type;

        data_ = Platform::AllocatePixelBuffer(ByteCount());
    }
};

// =============================================================================
// Constructors
// =============================================================================

PImage::PImage() : impl_(std::make_shared<Impl>()) {}

PImage::PImage(int32_t channels, int32_t height, int32_t width, PixelType type)
    : impl_(std::make_shared<Impl>())
{
    if (channels <= 0 || height <= 0 || width <= 0) {
        throw InvalidArgumentException(
            "Image shape must be positive, got (" + std::to_string(channels) + ", " +
            std::to_string(height) + ", " + std::to_string(width) + ")");
    }
    impl_->Allocate(channels, height, width, type);
}

PImage::PImage(const PImage& other) = default;
PImage::PImage(PImage&& other) noexcept = default;
PImage::~PImage() = default;
PImage& PImage::operator=(const PImage& other) = default;
PImage& PImage::operator=(PImage&& other) noexcept = default;

// =============================================================================
// Factory Methods
// =============================================================================

PImage PImage::FromFile(const std::string& path) {
    int w, h, channels;
    std::unique_ptr<uint8_t, void (*)(void*)> data(
        stbi_load(path.c_str(), &w, &h, &channels, 0), stbi_image_free);

    if (!data) {
        throw IOException("Failed to load image: " + path);
    }

    PImage img(channels, h, w, PixelType::UInt8);

    // Interleaved HWC -> planar CHW
    const size_t plane = img.PlaneSize();
    const uint8_t* src = data.get();
    uint8_t* dst = img.Ptr<uint8_t>();
    for (int32_t c = 0; c < channels; ++c) {
        uint8_t* out = dst + c * plane;
        for (size_t i = 0; i < plane; ++i) {
            out[i] = src[i * channels + c];
        }
    }

    return img;
}

PImage PImage::FromData(const void* data, int32_t channels, int32_t height,
                        int32_t width, PixelType type) {
    if (data == nullptr) {
        throw InvalidArgumentException("FromData: data is null");
    }
    PImage img(channels, height, width, type);
    std::memcpy(img.Data(), data, img.impl_->ByteCount());
    return img;
}

// =============================================================================
// Basic Properties
// =============================================================================

int32_t PImage::Channels() const { return impl_->channels_; }
int32_t PImage::Height() const { return impl_->height_; }
int32_t PImage::Width() const { return impl_->width_; }
PixelType PImage::Type() const { return impl_->type_; }
size_t PImage::PlaneSize() const { return impl_->PlaneSize(); }
size_t PImage::ElementCount() const { return impl_->ElementCount(); }
size_t PImage::BytesPerElement() const { return PixelTypeSize(impl_->type_); }
bool PImage::Empty() const { return impl_->ElementCount() == 0; }
bool PImage::IsValid() const { return impl_->data_ != nullptr && !Empty(); }

bool PImage::SameShape(const PImage& other) const {
    return Channels() == other.Channels() &&
           Height() == other.Height() &&
           Width() == other.Width();
}

// =============================================================================
// Data Access
// =============================================================================

void* PImage::Data() { return impl_->data_.get(); }
const void* PImage::Data() const { return impl_->data_.get(); }

void PImage::RequireElementType(PixelType requested) const {
    if (requested != impl_->type_) {
        throw UnsupportedPixelTypeException(
            std::string("element access as ") + PixelTypeName(requested) +
            " on " + PixelTypeName(impl_->type_) + " image");
    }
}

// =============================================================================
// Image Operations
// =============================================================================

PImage PImage::Clone() const {
    if (Empty()) {
        return PImage();
    }
    PImage copy(impl_->channels_, impl_->height_, impl_->width_, impl_->type_);
    std::memcpy(copy.Data(), Data(), ElementCount() * BytesPerElement());
    return copy;
}

PImage PImage::ConvertTo(PixelType targetType) const {
    if (Empty()) {
        return PImage();
    }
    if (targetType == impl_->type_) {
        return Clone();
    }

    PImage result(impl_->channels_, impl_->height_, impl_->width_, targetType);
    const size_t n = ElementCount();

    DispatchPixelType(impl_->type_, [&](auto srcTag) {
        using S = typename decltype(srcTag)::Type;
        const S* src = Ptr<S>();
        DispatchPixelType(targetType, [&](auto dstTag) {
            using D = typename decltype(dstTag)::Type;
            D* dst = result.Ptr<D>();
            for (size_t i = 0; i < n; ++i) {
                dst[i] = PixelCast<D>(src[i]);
            }
        });
    });

    return result;
}

void PImage::Fill(double value) {
    if (Empty()) return;

    const size_t n = ElementCount();
    DispatchPixelType(impl_->type_, [&](auto tag) {
        using T = typename decltype(tag)::Type;
        T* dst = Ptr<T>();
        std::fill(dst, dst + n, PixelCast<T>(value));
    });
}

bool PImage::SaveToFile(const std::string& path) const {
    if (Empty()) return false;

    // Only support UInt8 for now
    if (impl_->type_ != PixelType::UInt8) {
        return false;
    }

    const int channels = impl_->channels_;
    if (channels != 1 && channels != 3 && channels != 4) {
        return false;
    }

    // Planar CHW -> interleaved HWC
    const size_t plane = PlaneSize();
    const uint8_t* src = Ptr<uint8_t>();
    std::vector<uint8_t> buffer(plane * channels);
    for (int c = 0; c < channels; ++c) {
        const uint8_t* in = src + c * plane;
        for (size_t i = 0; i < plane; ++i) {
            buffer[i * channels + c] = in[i];
        }
    }

    const int w = impl_->width_;
    const int h = impl_->height_;
    const int rowBytes = w * channels;

    // Determine format from extension
    if (path.size() >= 4) {
        std::string ext = path.substr(path.size() - 4);
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });

        if (ext == ".png") {
            return stbi_write_png(path.c_str(), w, h, channels, buffer.data(), rowBytes) != 0;
        } else if (ext == ".jpg" || ext == "jpeg") {
            return stbi_write_jpg(path.c_str(), w, h, channels, buffer.data(), 95) != 0;
        } else if (ext == ".bmp") {
            return stbi_write_bmp(path.c_str(), w, h, channels, buffer.data()) != 0;
        }
    }

    // Default to PNG
    return stbi_write_png(path.c_str(), w, h, channels, buffer.data(), rowBytes) != 0;
}

} // namespace Pix::Aug
