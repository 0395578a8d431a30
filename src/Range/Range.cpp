/**
 * @file Range.cpp
 * @brief Clipping and range conversion implementation
 */

#include <PixAug/Range/Range.h>
#include <PixAug/Core/PixelTraits.h>
#include <PixAug/Core/Validate.h>

#include <algorithm>
#include <cstddef>
#include <type_traits>
#include <utility>

namespace Pix::Aug::Range {

namespace {

// Apply op(src[i]) -> D for every element, with S/D resolved at runtime
template<typename Op>
PImage MapElements(const PImage& image, PixelType targetType, Op&& op) {
    PImage result(image.Channels(), image.Height(), image.Width(), targetType);
    const std::ptrdiff_t count = static_cast<std::ptrdiff_t>(image.ElementCount());

    DispatchPixelType(image.Type(), [&](auto srcTag) {
        using S = typename decltype(srcTag)::Type;
        const S* src = image.Ptr<S>();
        DispatchPixelType(targetType, [&](auto dstTag) {
            using D = typename decltype(dstTag)::Type;
            D* dst = result.Ptr<D>();
            #pragma omp parallel for schedule(static)
            for (std::ptrdiff_t i = 0; i < count; ++i) {
                dst[i] = op(src[i], dstTag);
            }
        });
    });

    return result;
}

} // anonymous namespace

// =============================================================================
// Clipping
// =============================================================================

void Clip(const PImage& image, PImage& output, PixelType targetType, double maxValue) {
    PIXAUG_REQUIRE_IMAGE(image);
    PIXAUG_REQUIRE_NON_NEGATIVE(maxValue);

    output = MapElements(image, targetType, [maxValue](auto v, auto dstTag) {
        using D = typename decltype(dstTag)::Type;
        const double clamped = std::clamp(static_cast<double>(v), 0.0, maxValue);
        return PixelCast<D>(clamped);
    });
}

ImageTransform Clipped(ImageTransform transform, PixelRangeTable table) {
    return [transform = std::move(transform), table](const PImage& image) {
        const PixelType type = image.Type();
        const double maxValue = table.MaxValueOr(type, 1.0);

        PImage clipped;
        Clip(transform(image), clipped, type, maxValue);
        return clipped;
    };
}

// =============================================================================
// Range conversion
// =============================================================================

void ToFloat(const PImage& image, PImage& output, PixelType targetType,
             std::optional<double> maxValue, const PixelRangeTable& table) {
    PIXAUG_REQUIRE_IMAGE(image);
    const double divisor = maxValue ? *maxValue : table.MaxValue(image.Type());

    output = MapElements(image, targetType, [divisor](auto v, auto dstTag) {
        using D = typename decltype(dstTag)::Type;
        if constexpr (std::is_floating_point_v<D>) {
            return static_cast<D>(static_cast<D>(v) / static_cast<D>(divisor));
        } else {
            return PixelCast<D>(static_cast<double>(v) / divisor);
        }
    });
}

void FromFloat(const PImage& image, PImage& output, PixelType targetType,
               std::optional<double> maxValue, const PixelRangeTable& table) {
    PIXAUG_REQUIRE_IMAGE(image);
    const double factor = maxValue ? *maxValue : table.MaxValue(targetType);

    output = MapElements(image, targetType, [factor](auto v, auto dstTag) {
        using S = decltype(v);
        using D = typename decltype(dstTag)::Type;
        if constexpr (std::is_floating_point_v<S>) {
            return PixelCast<D>(static_cast<S>(v * static_cast<S>(factor)));
        } else {
            return PixelCast<D>(static_cast<double>(v) * factor);
        }
    });
}

} // namespace Pix::Aug::Range
