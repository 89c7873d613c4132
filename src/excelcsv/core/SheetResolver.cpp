#include "excelcsv/core/SheetResolver.hpp"
#include "excelcsv/core/Exception.hpp"
#include "excelcsv/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <limits>

namespace excelcsv {
namespace core {

std::string SheetResolver::resolve(const std::string& identifier, const std::vector<std::string>& names) {
    if (names.empty()) {
        EXCELCSV_THROW(WorksheetException, "Workbook contains no sheets", identifier, ErrorCode::EmptyWorkbook);
    }

    auto it = std::find(names.begin(), names.end(), identifier);
    if (it != names.end()) {
        return *it;
    }

    int32_t index = 0;
    if (parseIndex(identifier, index)) {
        if (index >= 0) {
            if (static_cast<size_t>(index) >= names.size()) {
                EXCELCSV_THROW(WorksheetException,
                               fmt::format("Sheet index {} is out of range, workbook has {} sheet(s)", index, names.size()),
                               identifier, ErrorCode::SheetIndexOutOfRange);
            }
            CORE_DEBUG("Sheet index {} resolved to \"{}\"", index, names[static_cast<size_t>(index)]);
            return names[static_cast<size_t>(index)];
        }

        size_t position = negativeIndexPosition(index, names.size());
        CORE_DEBUG("Negative sheet index {} resolved to position {} (\"{}\")", index, position, names[position]);
        return names[position];
    }

    CORE_DEBUG("Invalid sheet \"{}\". Using the first sheet \"{}\" instead.", identifier, names.front());
    return names.front();
}

bool SheetResolver::parseIndex(const std::string& text, int32_t& out) noexcept {
    if (text.empty()) {
        return false;
    }

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '+' || text[0] == '-') {
        negative = text[0] == '-';
        pos = 1;
    }
    if (pos >= text.size()) {
        return false;
    }

    // 在 int64 中累加，超过 int32 范围即失败
    const int64_t limit = negative ? -static_cast<int64_t>(std::numeric_limits<int32_t>::min())
                                   : static_cast<int64_t>(std::numeric_limits<int32_t>::max());
    int64_t value = 0;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
        if (value > limit) {
            return false;
        }
    }

    out = static_cast<int32_t>(negative ? -value : value);
    return true;
}

size_t SheetResolver::negativeIndexPosition(int32_t index, size_t count) noexcept {
    const int64_t distance = -static_cast<int64_t>(index);
    const int64_t target = static_cast<int64_t>(count) - distance;
    return static_cast<size_t>(std::clamp<int64_t>(target, 0, static_cast<int64_t>(count) - 1));
}

}} // namespace excelcsv::core
