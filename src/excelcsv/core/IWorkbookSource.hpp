#pragma once

#include "excelcsv/core/TypedCell.hpp"
#include <functional>
#include <string>
#include <vector>

namespace excelcsv {
namespace core {

/**
 * @brief 工作簿数据源接口
 *
 * 提供有序的工作表名称列表，并按行流式回调指定工作表的单元格。
 * 第 0 行为表头。回调中的行引用只在本次回调内有效。
 */
class IWorkbookSource {
public:
    using RowCallback = std::function<void(const CellRow& row)>;

    virtual ~IWorkbookSource() = default;

    virtual std::vector<std::string> sheetNames() = 0;

    /**
     * @brief 逐行读取工作表
     * @throws WorksheetException 工作表不存在或无法读取
     * @throws SourceException 底层文件读取失败
     */
    virtual void forEachRow(const std::string& sheet_name, const RowCallback& callback) = 0;
};

}} // namespace excelcsv::core
