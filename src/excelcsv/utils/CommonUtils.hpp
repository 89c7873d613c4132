#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace excelcsv {
namespace utils {

/**
 * @brief 通用工具类（单元格引用）
 */
class CommonUtils {
public:
    static constexpr uint32_t kMaxRows = 1048576;   // Excel 2007+ 行数上限
    static constexpr uint32_t kMaxColumns = 16384;  // XFD

    /**
     * @brief 列号转换为列字母（0 -> "A"，26 -> "AA"）
     */
    static std::string columnLetters(uint32_t col) {
        std::string result;
        uint32_t n = col + 1;
        while (n > 0) {
            uint32_t rem = (n - 1) % 26;
            result.insert(result.begin(), static_cast<char>('A' + rem));
            n = (n - 1) / 26;
        }
        return result;
    }

    /**
     * @brief 生成单元格引用（如 (0, 0) -> A1）
     */
    static std::string cellReference(uint32_t row, uint32_t col) {
        return columnLetters(col) + std::to_string(row + 1);
    }

    /**
     * @brief 解析单元格引用（如 A1 -> (0, 0)），允许 '$' 绝对引用标记
     * @return 格式错误或超出工作表范围时返回 false
     */
    static bool parseReference(std::string_view reference, uint32_t& row, uint32_t& col) noexcept {
        size_t i = 0;
        if (i < reference.size() && reference[i] == '$') ++i;

        uint32_t c = 0;
        size_t letters = 0;
        while (i < reference.size()) {
            char ch = reference[i];
            if (ch >= 'a' && ch <= 'z') ch = static_cast<char>(ch - 'a' + 'A');
            if (ch < 'A' || ch > 'Z') break;
            c = c * 26 + static_cast<uint32_t>(ch - 'A' + 1);
            if (++letters > 3) return false;
            ++i;
        }
        if (letters == 0 || c > kMaxColumns) {
            return false;
        }

        if (i < reference.size() && reference[i] == '$') ++i;

        uint32_t r = 0;
        size_t digits = 0;
        while (i < reference.size() && reference[i] >= '0' && reference[i] <= '9') {
            r = r * 10 + static_cast<uint32_t>(reference[i] - '0');
            if (++digits > 7) return false;
            ++i;
        }
        if (digits == 0 || i != reference.size() || r == 0 || r > kMaxRows) {
            return false;
        }

        row = r - 1;
        col = c - 1;
        return true;
    }

    /**
     * @brief 解析范围引用（如 A1:C10），单个单元格视为 1x1 范围
     */
    static bool parseRange(std::string_view range, uint32_t& first_row, uint32_t& first_col,
                           uint32_t& last_row, uint32_t& last_col) noexcept {
        size_t colon = range.find(':');
        if (colon == std::string_view::npos) {
            if (!parseReference(range, first_row, first_col)) return false;
            last_row = first_row;
            last_col = first_col;
            return true;
        }
        return parseReference(range.substr(0, colon), first_row, first_col) &&
               parseReference(range.substr(colon + 1), last_row, last_col);
    }
};

}} // namespace excelcsv::utils
