#pragma once

#include "excelcsv/core/CSVWriter.hpp"
#include "excelcsv/core/DateWhitelist.hpp"
#include "excelcsv/core/IWorkbookSource.hpp"

#include <cstdint>
#include <string>

namespace excelcsv {
namespace core {

/**
 * @brief 导出选项（与输入输出位置无关的部分）
 */
struct ExportOptions {
    std::string sheet = "0";
    bool list_sheets = false;
    bool trim = false;
    std::string dates_whitelist = DateWhitelist::kDefaultSpec;
};

/**
 * @brief 导出统计
 */
struct ExportStats {
    std::string sheet_name;
    uint64_t data_rows = 0;     // 不含表头
    size_t columns = 0;         // 最后一条记录的字段数
    size_t date_columns = 0;
    bool listed_sheets = false;
};

/**
 * @brief 单工作表导出流程
 *
 * 选表 -> 表头分类 -> 逐行转码、组装、写出。
 * 行处理完即丢弃，峰值内存与列数成正比。
 */
class SheetExporter {
public:
    explicit SheetExporter(const ExportOptions& options);

    /**
     * @brief 执行导出
     * @throws WorksheetException / SourceException / WriteException
     */
    ExportStats run(IWorkbookSource& source, CSVWriter& writer);

    /**
     * @brief 导出结束提示："<n> <w>-column rows exported from \"<sheet>\""
     */
    static std::string summaryMessage(const ExportStats& stats);

    /**
     * @brief 千位分隔：1234567 -> "1,234,567"
     */
    static std::string separateWithCommas(uint64_t value);

private:
    ExportStats listSheets(const std::vector<std::string>& names, CSVWriter& writer);

    ExportOptions options_;
    DateWhitelist whitelist_;
};

}} // namespace excelcsv::core
