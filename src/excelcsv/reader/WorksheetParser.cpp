/**
 * @file WorksheetParser.cpp
 * @brief 工作表 XML 流式行解析器实现
 */

#include "excelcsv/reader/WorksheetParser.hpp"
#include "excelcsv/utils/ModuleLoggers.hpp"
#include <fast_float/fast_float.h>

namespace excelcsv {
namespace reader {

void WorksheetParser::onParseBegin() {
    origin_row_ = 0;
    origin_col_ = 0;
    width_ = 0;
    row_width_ = 0;
    pending_empty_rows_ = 0;
    in_sheet_data_ = false;
    in_row_ = false;
    in_cell_ = false;
    in_inline_string_ = false;
    phonetic_depth_ = 0;
    next_row_ = 0;
    current_row_ = 0;
    next_col_ = 0;
    row_cells_.clear();
    rows_emitted_ = 0;
    cells_processed_ = 0;
}

void WorksheetParser::onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (!in_sheet_data_) {
        if (name == "dimension") {
            auto ref = findAttribute(attributes, "ref");
            uint32_t first_row = 0, first_col = 0, last_row = 0, last_col = 0;
            if (ref && utils::CommonUtils::parseRange(*ref, first_row, first_col, last_row, last_col) &&
                last_col >= first_col) {
                origin_row_ = first_row;
                origin_col_ = first_col;
                width_ = last_col - first_col + 1;
                row_width_ = width_;
                READER_DEBUG("Worksheet dimension {} (origin row {}, col {}, width {})",
                             *ref, origin_row_, origin_col_, width_);
            } else if (ref) {
                READER_WARN("Ignoring malformed dimension '{}'", *ref);
            }
        } else if (name == "sheetData") {
            in_sheet_data_ = true;
            next_row_ = origin_row_;
        }
        return;
    }

    if (name == "row") {
        beginRow(attributes);
    } else if (name == "c" && in_row_) {
        beginCell(attributes);
    } else if (!in_cell_) {
        return;
    } else if (name == "v") {
        startCollectingText();
    } else if (name == "is") {
        in_inline_string_ = true;
        inline_text_.clear();
    } else if (name == "rPh") {
        ++phonetic_depth_;
    } else if (name == "t" && in_inline_string_ && phonetic_depth_ == 0) {
        startCollectingText();
    }
}

void WorksheetParser::onEndElement(std::string_view name, int /*depth*/) {
    if (!in_sheet_data_) {
        return;
    }

    if (name == "v") {
        if (state_.collecting_text) {
            cell_value_ = getCurrentText();
            has_value_ = true;
            stopCollectingText();
        }
    } else if (name == "t") {
        if (state_.collecting_text) {
            inline_text_ += getCurrentText();
            stopCollectingText();
        }
    } else if (name == "rPh") {
        if (phonetic_depth_ > 0) {
            --phonetic_depth_;
        }
    } else if (name == "is") {
        in_inline_string_ = false;
        has_value_ = true;
    } else if (name == "c") {
        if (in_cell_) {
            finishCell();
        }
    } else if (name == "row") {
        if (in_row_) {
            finishRow();
        }
    } else if (name == "sheetData") {
        in_sheet_data_ = false;
        flushPendingRows();
        READER_DEBUG("Worksheet streamed: {} rows, {} cells", rows_emitted_, cells_processed_);
    }
}

void WorksheetParser::beginRow(core::span<const xml::XMLAttribute> attributes) {
    auto r = findUIntAttribute(attributes, "r");
    if (r && *r >= 1) {
        current_row_ = *r - 1;
    } else {
        current_row_ = next_row_;
    }

    // 补出中间缺失的行；宽度未定时先计数，等第一条有内容的行确定宽度
    while (next_row_ < current_row_) {
        if (row_width_ == 0) {
            ++pending_empty_rows_;
        } else {
            emitRow(core::CellRow{});
        }
        ++next_row_;
    }

    in_row_ = true;
    next_col_ = origin_col_;
    row_cells_.clear();
}

void WorksheetParser::beginCell(core::span<const xml::XMLAttribute> attributes) {
    in_cell_ = true;
    has_value_ = false;
    cell_value_.clear();
    inline_text_.clear();
    in_inline_string_ = false;
    phonetic_depth_ = 0;

    cell_col_ = next_col_;
    auto ref = findAttribute(attributes, "r");
    if (ref) {
        uint32_t row = 0, col = 0;
        if (parseCellReference(*ref, row, col)) {
            cell_col_ = col;
        } else {
            READER_WARN("Malformed cell reference '{}' in row {}", *ref, current_row_ + 1);
        }
    }
    next_col_ = cell_col_ + 1;

    cell_type_ = getAttributeOr(attributes, "t", "n");
    auto style = findUIntAttribute(attributes, "s");
    cell_style_ = style ? *style : 0;
}

void WorksheetParser::finishCell() {
    in_cell_ = false;
    ++cells_processed_;

    if (cell_col_ < origin_col_) {
        READER_DEBUG("Cell at column {} lies left of the dimension origin, skipped", cell_col_);
        return;
    }

    size_t position = cell_col_ - origin_col_;
    if (position >= utils::CommonUtils::kMaxColumns) {
        READER_WARN("Cell column {} exceeds the sheet limit, skipped", cell_col_);
        return;
    }
    if (row_cells_.size() <= position) {
        row_cells_.resize(position + 1, core::EmptyCell{});
    }
    row_cells_[position] = decodeCell();
}

void WorksheetParser::finishRow() {
    in_row_ = false;
    if (current_row_ < next_row_) {
        // 行号乱序或位于维度原点之上：照常输出，不再补行
        READER_DEBUG("Row {} is out of order", current_row_ + 1);
    }
    if (row_width_ == 0) {
        if (row_cells_.empty()) {
            ++pending_empty_rows_;
        } else {
            // 没有 <dimension> 时以第一条有内容的行作为输出宽度
            row_width_ = static_cast<uint32_t>(row_cells_.size());
            flushPendingRows();
            emitRow(row_cells_);
        }
    } else {
        emitRow(row_cells_);
    }
    if (current_row_ + 1 > next_row_) {
        next_row_ = current_row_ + 1;
    }
}

void WorksheetParser::flushPendingRows() {
    for (; pending_empty_rows_ > 0; --pending_empty_rows_) {
        emitRow(core::CellRow{});
    }
}

void WorksheetParser::emitRow(const core::CellRow& row) {
    ++rows_emitted_;
    if (!row_callback_) {
        return;
    }
    if (row.size() < row_width_) {
        core::CellRow padded(row);
        padded.resize(row_width_, core::EmptyCell{});
        row_callback_(padded);
    } else {
        row_callback_(row);
    }
}

core::TypedCell WorksheetParser::decodeCell() const {
    if (cell_type_ == "inlineStr") {
        return has_value_ ? core::TypedCell(inline_text_) : core::TypedCell(core::EmptyCell{});
    }
    if (!has_value_) {
        return core::EmptyCell{};
    }

    if (cell_type_ == "s") {
        uint32_t index = 0;
        auto result = fast_float::from_chars(cell_value_.data(), cell_value_.data() + cell_value_.size(), index);
        const std::string* text = nullptr;
        if (result.ec == std::errc{} && result.ptr == cell_value_.data() + cell_value_.size() && shared_strings_) {
            text = shared_strings_->getString(index);
        }
        if (!text) {
            READER_WARN("Shared string index '{}' out of range in row {}", cell_value_, current_row_ + 1);
            return core::EmptyCell{};
        }
        return *text;
    }
    if (cell_type_ == "str" || cell_type_ == "d") {
        return cell_value_;
    }
    if (cell_type_ == "b") {
        return cell_value_ == "1" || cell_value_ == "true";
    }
    if (cell_type_ == "e") {
        core::CellError error = core::CellError::Value;
        if (core::parseCellError(cell_value_, error)) {
            return error;
        }
        READER_WARN("Unknown error value '{}' in row {}", cell_value_, current_row_ + 1);
        return cell_value_;
    }
    if (cell_type_ != "n") {
        READER_WARN("Unknown cell type '{}' in row {}, kept as text", cell_type_, current_row_ + 1);
        return cell_value_;
    }
    return decodeNumber();
}

core::TypedCell WorksheetParser::decodeNumber() const {
    if (cell_value_.empty()) {
        return core::EmptyCell{};
    }
    double number = 0.0;
    const char* first = cell_value_.data();
    const char* last = first + cell_value_.size();
    auto result = fast_float::from_chars(first, last, number);
    if (result.ec != std::errc{} || result.ptr != last) {
        READER_WARN("Unparseable numeric value '{}' in row {}, kept as text", cell_value_, current_row_ + 1);
        return cell_value_;
    }
    if (styles_ && styles_->isDateStyle(cell_style_)) {
        return core::DateTimeSerial{number};
    }
    return number;
}

}} // namespace excelcsv::reader
