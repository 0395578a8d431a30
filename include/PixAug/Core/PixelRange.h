#pragma once

/**
 * @file PixelRange.h
 * @brief Maximum representable value per pixel type
 *
 * The default table is {UInt8: 255, Float32: 1.0, Float64: 1.0}. Int32 is
 * intentionally absent; a lookup for it needs an explicit max value.
 */

#include <PixAug/Core/Export.h>
#include <PixAug/Core/Types.h>

#include <array>
#include <initializer_list>
#include <optional>
#include <utility>

namespace Pix::Aug {

/**
 * @brief Immutable (pixel type -> max value) table
 */
class PIXAUG_API PixelRangeTable {
public:
    using Entry = std::pair<PixelType, double>;

    /// Empty table
    PixelRangeTable() = default;

    /// Table with the given entries; a repeated type keeps the last value
    PixelRangeTable(std::initializer_list<Entry> entries);

    /// Process-wide default table
    static const PixelRangeTable& Default();

    bool Contains(PixelType type) const;

    /**
     * @brief Max value of @p type
     * @throws UnknownPixelTypeException if the table has no entry
     */
    double MaxValue(PixelType type) const;

    /// Max value of @p type, or @p fallback when absent
    double MaxValueOr(PixelType type, double fallback) const;

private:
    std::array<std::optional<double>, PIXEL_TYPE_COUNT> entries_{};
};

} // namespace Pix::Aug
