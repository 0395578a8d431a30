#pragma once

/**
 * @file PixelTraits.h
 * @brief Compile-time mapping between storage types and PixelType
 *
 * DispatchPixelType() is the single exhaustive match over PixelType. Kernels
 * are written as templates over the storage type and reached only through
 * this dispatch, so a kind an operation rejects never instantiates its core.
 *
 * @code
 * DispatchPixelType(image.Type(), [&](auto tag) {
 *     using T = typename decltype(tag)::Type;
 *     const T* src = image.Ptr<T>();
 *     // ...
 * });
 * @endcode
 */

#include <PixAug/Core/Types.h>
#include <PixAug/Core/Exception.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

namespace Pix::Aug {

/**
 * @brief Storage type -> PixelType
 */
template<typename T>
struct PixelTypeOf;

template<> struct PixelTypeOf<uint8_t> { static constexpr PixelType value = PixelType::UInt8; };
template<> struct PixelTypeOf<int32_t> { static constexpr PixelType value = PixelType::Int32; };
template<> struct PixelTypeOf<float>   { static constexpr PixelType value = PixelType::Float32; };
template<> struct PixelTypeOf<double>  { static constexpr PixelType value = PixelType::Float64; };

/**
 * @brief Empty tag carrying a storage type through a generic lambda
 */
template<typename T>
struct PixelTag {
    using Type = T;
};

/**
 * @brief Invoke func(PixelTag<T>{}) for the storage type of @p type
 * @throws UnknownPixelTypeException for a value outside the enumeration
 */
template<typename Func>
decltype(auto) DispatchPixelType(PixelType type, Func&& func) {
    switch (type) {
        case PixelType::UInt8:   return func(PixelTag<uint8_t>{});
        case PixelType::Int32:   return func(PixelTag<int32_t>{});
        case PixelType::Float32: return func(PixelTag<float>{});
        case PixelType::Float64: return func(PixelTag<double>{});
    }
    throw UnknownPixelTypeException(
        "pixel type value " + std::to_string(static_cast<int>(type)));
}

/**
 * @brief Convert a value to storage type T
 *
 * Integral targets truncate toward zero and saturate to the type's range
 * (NaN maps to 0). Floating targets are a plain cast.
 */
template<typename T, typename S>
inline T PixelCast(S value) {
    if constexpr (std::is_floating_point_v<T>) {
        return static_cast<T>(value);
    } else if constexpr (std::is_floating_point_v<S>) {
        if (std::isnan(value)) return T(0);
        const S t = std::trunc(value);
        if (t <= static_cast<S>(std::numeric_limits<T>::lowest())) {
            return std::numeric_limits<T>::lowest();
        }
        if (t >= static_cast<S>(std::numeric_limits<T>::max())) {
            return std::numeric_limits<T>::max();
        }
        return static_cast<T>(t);
    } else {
        using Wide = int64_t;
        const Wide v = static_cast<Wide>(value);
        if (v < static_cast<Wide>(std::numeric_limits<T>::lowest())) {
            return std::numeric_limits<T>::lowest();
        }
        if (v > static_cast<Wide>(std::numeric_limits<T>::max())) {
            return std::numeric_limits<T>::max();
        }
        return static_cast<T>(v);
    }
}

} // namespace Pix::Aug
