/**
 * @file WorksheetParser.hpp
 * @brief 工作表 XML 流式行解析器
 */

#pragma once

#include "excelcsv/core/IWorkbookSource.hpp"
#include "excelcsv/core/TypedCell.hpp"
#include "excelcsv/reader/BaseSAXParser.hpp"
#include "excelcsv/reader/SharedStringsParser.hpp"
#include "excelcsv/reader/StylesParser.hpp"
#include <string>

namespace excelcsv {
namespace reader {

/**
 * @brief 工作表 XML 流式行解析器
 *
 * 逐个 <row> 组装 CellRow 并立即回调，整张表不驻留内存。
 * 输出范围从 <dimension> 左上角开始（缺省为 A1）：
 * - 行内缺失的单元格补 EmptyCell
 * - 两个已有行之间缺失的行以空行输出
 * - 每行补齐到输出宽度：有维度时取维度宽度，否则取第一条有内容的行宽，
 *   位于该行之前的空行延后到宽度确定后再输出
 */
class WorksheetParser : public BaseSAXParser {
public:
    using RowCallback = core::IWorkbookSource::RowCallback;

    /**
     * @param shared_strings 共享字符串表，可为空
     * @param styles 样式表，可为空（此时不识别日期）
     */
    WorksheetParser(const SharedStringsParser* shared_strings, const StylesParser* styles)
        : shared_strings_(shared_strings), styles_(styles) {
        setTrimText(false);
    }
    ~WorksheetParser() override = default;

    void setRowCallback(RowCallback callback) { row_callback_ = std::move(callback); }

    size_t getRowsEmitted() const { return rows_emitted_; }
    size_t getCellsProcessed() const { return cells_processed_; }

protected:
    void onParseBegin() override;
    void onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    void beginRow(core::span<const xml::XMLAttribute> attributes);
    void beginCell(core::span<const xml::XMLAttribute> attributes);
    void finishCell();
    void finishRow();
    void emitRow(const core::CellRow& row);
    void flushPendingRows();
    core::TypedCell decodeCell() const;
    core::TypedCell decodeNumber() const;

    const SharedStringsParser* shared_strings_;
    const StylesParser* styles_;
    RowCallback row_callback_;

    // 输出范围
    uint32_t origin_row_ = 0;
    uint32_t origin_col_ = 0;
    uint32_t width_ = 0;
    uint32_t row_width_ = 0;         // 输出行宽：维度宽度或第一条有内容的行宽
    size_t pending_empty_rows_ = 0;  // 行宽确定前遇到的空行

    bool in_sheet_data_ = false;
    bool in_row_ = false;
    bool in_cell_ = false;
    bool in_inline_string_ = false;
    int phonetic_depth_ = 0;

    uint32_t next_row_ = 0;          // 下一个期望输出的行号（0 基）
    uint32_t current_row_ = 0;
    uint32_t next_col_ = 0;
    core::CellRow row_cells_;

    // 当前单元格
    uint32_t cell_col_ = 0;
    std::string cell_type_;
    uint32_t cell_style_ = 0;
    std::string cell_value_;
    std::string inline_text_;
    bool has_value_ = false;

    size_t rows_emitted_ = 0;
    size_t cells_processed_ = 0;
};

}} // namespace excelcsv::reader
