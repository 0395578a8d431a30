#include <PixAug/Core/PixelRange.h>
#include <PixAug/Core/Exception.h>

#include <string>

namespace Pix::Aug {

PixelRangeTable::PixelRangeTable(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        entries_[static_cast<size_t>(entry.first)] = entry.second;
    }
}

const PixelRangeTable& PixelRangeTable::Default() {
    static const PixelRangeTable table{
        {PixelType::UInt8, 255.0},
        {PixelType::Float32, 1.0},
        {PixelType::Float64, 1.0}
    };
    return table;
}

bool PixelRangeTable::Contains(PixelType type) const {
    return entries_[static_cast<size_t>(type)].has_value();
}

double PixelRangeTable::MaxValue(PixelType type) const {
    const auto& entry = entries_[static_cast<size_t>(type)];
    if (!entry) {
        throw UnknownPixelTypeException(
            std::string("can't infer the maximum value for ") + PixelTypeName(type) +
            ", pass the max value explicitly");
    }
    return *entry;
}

double PixelRangeTable::MaxValueOr(PixelType type, double fallback) const {
    return entries_[static_cast<size_t>(type)].value_or(fallback);
}

} // namespace Pix::Aug
