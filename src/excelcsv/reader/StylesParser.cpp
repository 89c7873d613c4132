#include "excelcsv/reader/StylesParser.hpp"
#include "excelcsv/utils/ModuleLoggers.hpp"
#include <cctype>

namespace excelcsv {
namespace reader {

void StylesParser::onParseBegin() {
    custom_formats_.clear();
    xf_num_fmt_ids_.clear();
    date_flags_.clear();
    in_num_fmts_ = false;
    in_cell_xfs_ = false;
}

void StylesParser::onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (name == "numFmts") {
        in_num_fmts_ = true;
    } else if (name == "cellXfs") {
        in_cell_xfs_ = true;
        auto count = findUIntAttribute(attributes, "count");
        if (count) {
            xf_num_fmt_ids_.reserve(*count);
        }
    } else if (name == "numFmt" && in_num_fmts_) {
        auto id = findUIntAttribute(attributes, "numFmtId");
        auto code = findAttribute(attributes, "formatCode");
        if (id && code) {
            custom_formats_[static_cast<int>(*id)] = std::string(*code);
        } else {
            READER_WARN("numFmt without numFmtId/formatCode ignored");
        }
    } else if (name == "xf" && in_cell_xfs_) {
        // cellStyleXfs 中也有 xf，只取 cellXfs 下的
        auto id = findUIntAttribute(attributes, "numFmtId");
        xf_num_fmt_ids_.push_back(id ? static_cast<int>(*id) : 0);
    }
}

void StylesParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "numFmts") {
        in_num_fmts_ = false;
    } else if (name == "cellXfs") {
        in_cell_xfs_ = false;
    } else if (name == "styleSheet") {
        date_flags_.clear();
        date_flags_.reserve(xf_num_fmt_ids_.size());
        size_t date_count = 0;
        for (int id : xf_num_fmt_ids_) {
            bool is_date = isDateFormatId(id);
            date_flags_.push_back(is_date);
            if (is_date) {
                ++date_count;
            }
        }
        READER_DEBUG("Parsed {} cell formats ({} date), {} custom number formats",
                     xf_num_fmt_ids_.size(), date_count, custom_formats_.size());
    }
}

bool StylesParser::isDateFormatId(int num_fmt_id) const {
    auto it = custom_formats_.find(num_fmt_id);
    if (it != custom_formats_.end()) {
        return isDateFormatCode(it->second);
    }
    return isBuiltinDateFormat(num_fmt_id);
}

std::string StylesParser::getFormatCode(int num_fmt_id) const {
    auto it = custom_formats_.find(num_fmt_id);
    return it != custom_formats_.end() ? it->second : getBuiltinNumberFormat(num_fmt_id);
}

bool StylesParser::isBuiltinDateFormat(int num_fmt_id) {
    return (num_fmt_id >= 14 && num_fmt_id <= 22) || (num_fmt_id >= 45 && num_fmt_id <= 47);
}

bool StylesParser::isDateFormatCode(std::string_view format_code) {
    bool in_quotes = false;
    for (size_t i = 0; i < format_code.size(); ++i) {
        char c = format_code[i];
        if (in_quotes) {
            if (c == '"') {
                in_quotes = false;
            }
            continue;
        }
        switch (c) {
            case '"':
                in_quotes = true;
                break;
            case '\\':
            case '_':
            case '*':
                ++i;  // 跳过被转义/占位的下一个字符
                break;
            case '[': {
                size_t close = format_code.find(']', i + 1);
                if (close == std::string_view::npos) {
                    return false;
                }
                std::string_view section = format_code.substr(i + 1, close - i - 1);
                if (!section.empty()) {
                    char first = static_cast<char>(std::tolower(static_cast<unsigned char>(section[0])));
                    bool elapsed = (first == 'h' || first == 'm' || first == 's');
                    for (char ch : section) {
                        if (std::tolower(static_cast<unsigned char>(ch)) != first) {
                            elapsed = false;
                            break;
                        }
                    }
                    if (elapsed) {
                        return true;
                    }
                }
                i = close;
                break;
            }
            default: {
                char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                if (lower == 'd' || lower == 'm' || lower == 'y' || lower == 'h' || lower == 's') {
                    return true;
                }
                break;
            }
        }
    }
    return false;
}

std::string StylesParser::getBuiltinNumberFormat(int format_id) {
    static const std::unordered_map<int, std::string> builtin_formats = {
        {0, "General"},
        {1, "0"},
        {2, "0.00"},
        {3, "#,##0"},
        {4, "#,##0.00"},
        {9, "0%"},
        {10, "0.00%"},
        {11, "0.00E+00"},
        {12, "# ?/?"},
        {13, "# ??/??"},
        {14, "mm-dd-yy"},
        {15, "d-mmm-yy"},
        {16, "d-mmm"},
        {17, "mmm-yy"},
        {18, "h:mm AM/PM"},
        {19, "h:mm:ss AM/PM"},
        {20, "h:mm"},
        {21, "h:mm:ss"},
        {22, "m/d/yy h:mm"},
        {37, "#,##0 ;(#,##0)"},
        {38, "#,##0 ;[Red](#,##0)"},
        {39, "#,##0.00;(#,##0.00)"},
        {40, "#,##0.00;[Red](#,##0.00)"},
        {45, "mm:ss"},
        {46, "[h]:mm:ss"},
        {47, "mmss.0"},
        {48, "##0.0E+0"},
        {49, "@"}
    };

    auto it = builtin_formats.find(format_id);
    return (it != builtin_formats.end()) ? it->second : "General";
}

}} // namespace excelcsv::reader
