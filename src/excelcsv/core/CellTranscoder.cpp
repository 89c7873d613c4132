#include "excelcsv/core/CellTranscoder.hpp"
#include "excelcsv/utils/TimeUtils.hpp"

#include <cmath>
#include <cstdlib>
#include <type_traits>
#include <fmt/format.h>

namespace excelcsv {
namespace core {

namespace {

// 将 "d.ddddde±x" 形式的最短表示展开为定点形式
std::string expandExponent(const std::string& text) {
    size_t e_pos = text.find_first_of("eE");
    std::string mantissa = text.substr(0, e_pos);
    int exponent = std::atoi(text.c_str() + e_pos + 1);

    std::string sign;
    if (!mantissa.empty() && mantissa[0] == '-') {
        sign = "-";
        mantissa.erase(0, 1);
    }

    std::string digits;
    int int_digits = 0;
    size_t dot = mantissa.find('.');
    if (dot == std::string::npos) {
        digits = mantissa;
        int_digits = static_cast<int>(mantissa.size());
    } else {
        digits = mantissa.substr(0, dot) + mantissa.substr(dot + 1);
        int_digits = static_cast<int>(dot);
    }

    int point = int_digits + exponent;
    std::string result;
    if (point <= 0) {
        result = "0." + std::string(static_cast<size_t>(-point), '0') + digits;
    } else if (point >= static_cast<int>(digits.size())) {
        result = digits + std::string(static_cast<size_t>(point) - digits.size(), '0');
    } else {
        result = digits.substr(0, static_cast<size_t>(point)) + "." + digits.substr(static_cast<size_t>(point));
    }
    return sign + result;
}

} // namespace

std::string CellTranscoder::formatFloat(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }

    std::string text = fmt::format("{}", value);
    if (text.find_first_of("eE") != std::string::npos) {
        return expandExponent(text);
    }
    return text;
}

std::string CellTranscoder::formatSerial(double serial) {
    const double fract = serial - std::trunc(serial);

    if (fract > 0.0) {
        auto dt = utils::TimeUtils::serialToDateTime(serial);
        if (!dt) {
            return fmt::format("ERROR: Cannot convert {} to datetime", formatFloat(serial));
        }
        return utils::TimeUtils::formatDateTime(dt.value());
    }

    auto date = utils::TimeUtils::serialToDate(serial);
    if (!date) {
        return fmt::format("ERROR: Cannot convert {} to date", formatFloat(serial));
    }
    return utils::TimeUtils::formatDate(date.value());
}

std::string CellTranscoder::transcode(const TypedCell& cell, bool is_date_column) {
    return std::visit([is_date_column](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, EmptyCell>) {
            return std::string();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return value;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return fmt::format("{}", value);
        } else if constexpr (std::is_same_v<T, bool>) {
            return value ? "true" : "false";
        } else if constexpr (std::is_same_v<T, CellError>) {
            return cellErrorName(value);
        } else if constexpr (std::is_same_v<T, double>) {
            return is_date_column ? formatSerial(value) : formatFloat(value);
        } else if constexpr (std::is_same_v<T, DateTimeSerial>) {
            return is_date_column ? formatSerial(value.serial) : formatFloat(value.serial);
        } else {
            static_assert(std::is_same_v<T, void>, "unhandled TypedCell alternative");
        }
    }, cell);
}

}} // namespace excelcsv::core
