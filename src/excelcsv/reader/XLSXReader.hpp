/**
 * @file XLSXReader.hpp
 * @brief xlsx 工作簿数据源
 */

#pragma once

#include "excelcsv/archive/ZipReader.hpp"
#include "excelcsv/core/ErrorCode.hpp"
#include "excelcsv/core/IWorkbookSource.hpp"
#include "excelcsv/reader/RelationshipsParser.hpp"
#include "excelcsv/reader/SharedStringsParser.hpp"
#include "excelcsv/reader/StylesParser.hpp"
#include "excelcsv/reader/WorkbookParser.hpp"
#include <memory>
#include <string>
#include <vector>

namespace excelcsv {
namespace reader {

/**
 * @brief xlsx 工作簿数据源
 *
 * open() 读取包关系、工作簿、共享字符串和样式；
 * forEachRow() 从 ZIP 条目分块流式解析工作表。
 * 打开或读取失败抛 SourceException，工作表名未知抛 WorksheetException。
 */
class XLSXReader : public core::IWorkbookSource {
public:
    explicit XLSXReader(const std::string& filename);
    ~XLSXReader() override;

    XLSXReader(const XLSXReader&) = delete;
    XLSXReader& operator=(const XLSXReader&) = delete;

    /**
     * @brief 打开工作簿并加载元数据，重复调用无副作用
     * @throws SourceException
     */
    void open();
    void close();

    bool isOpen() const { return is_open_; }
    const std::string& getFilename() const { return filename_; }

    std::vector<std::string> sheetNames() override;
    void forEachRow(const std::string& sheet_name, const RowCallback& callback) override;

    const std::vector<WorksheetInfo>& getWorksheets();

    bool isDate1904() const { return date1904_; }
    size_t getSharedStringCount() const { return shared_strings_.getStringCount(); }

private:
    void ensureOpen();
    std::string locateWorkbookPart();
    void loadWorkbook(const std::string& workbook_path);
    void loadSharedStrings(const std::string& workbook_dir);
    void loadStyles(const std::string& workbook_dir);
    std::string partPathFor(const std::string& type_name, const std::string& workbook_dir,
                            const std::string& fallback) const;

    [[noreturn]] void failOpen(const std::string& cause, core::ErrorCode code);

    std::string filename_;
    std::unique_ptr<archive::ZipReader> zip_reader_;
    bool is_open_ = false;
    bool date1904_ = false;

    RelationshipsParser workbook_relationships_;
    WorkbookParser workbook_parser_;
    SharedStringsParser shared_strings_;
    StylesParser styles_;
};

}} // namespace excelcsv::reader
