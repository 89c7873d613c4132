/**
 * @file WorkbookParser.hpp
 * @brief 工作簿 XML 解析器
 */

#pragma once

#include "excelcsv/reader/BaseSAXParser.hpp"
#include "excelcsv/reader/RelationshipsParser.hpp"
#include <string>
#include <vector>

namespace excelcsv {
namespace reader {

/**
 * @brief 工作表信息
 */
struct WorksheetInfo {
    std::string name;
    std::string sheet_id;
    std::string rel_id;
    std::string worksheet_path;   // 包内路径，如 "xl/worksheets/sheet1.xml"
    std::string state;            // visible / hidden / veryHidden

    WorksheetInfo(std::string n, std::string sid, std::string rid)
        : name(std::move(n)), sheet_id(std::move(sid)), rel_id(std::move(rid)), state("visible") {}
};

/**
 * @brief 工作簿 XML 解析器
 *
 * 按文档顺序收集 <sheets> 中的工作表，并借助工作簿关系把 r:id 解析为部件路径。
 * 关系缺失时回退到 xl/worksheets/sheet<sheetId>.xml。
 */
class WorkbookParser : public BaseSAXParser {
public:
    WorkbookParser() = default;
    ~WorkbookParser() override = default;

    /**
     * @brief 设置工作簿关系与工作簿部件所在目录（解析前调用）
     */
    void setRelationships(const RelationshipsParser* relationships, std::string base_dir) {
        relationships_ = relationships;
        base_dir_ = std::move(base_dir);
    }

    const std::vector<WorksheetInfo>& getWorksheets() const { return worksheets_; }

    /**
     * @brief 是否使用 1904 日期系统（workbookPr/@date1904）
     */
    bool isDate1904() const { return date1904_; }

protected:
    void onParseBegin() override;
    void onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    // 关系 id 属性带命名空间前缀，前缀名不固定
    std::optional<std::string_view> findRelationshipId(core::span<const xml::XMLAttribute> attributes) const;

    const RelationshipsParser* relationships_ = nullptr;
    std::string base_dir_ = "xl";
    std::vector<WorksheetInfo> worksheets_;
    bool in_sheets_section_ = false;
    bool date1904_ = false;
};

}} // namespace excelcsv::reader
