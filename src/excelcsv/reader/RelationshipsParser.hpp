#pragma once

#include "excelcsv/reader/BaseSAXParser.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace excelcsv {
namespace reader {

/**
 * @brief .rels 关系文件解析器
 *
 * 解析 _rels/.rels 与 xl/_rels/workbook.xml.rels，按 Id 建立索引。
 */
class RelationshipsParser : public BaseSAXParser {
public:
    struct Relationship {
        std::string id;          // 如 "rId1"
        std::string type;        // 如 ".../relationships/worksheet"
        std::string target;      // 如 "worksheets/sheet1.xml"
        std::string target_mode; // 默认 "Internal"

        Relationship() : target_mode("Internal") {}

        /**
         * @brief 关系类型的最后一段（"worksheet"、"sharedStrings" ...）
         */
        std::string typeName() const;
    };

    RelationshipsParser() = default;
    ~RelationshipsParser() override = default;

    const std::vector<Relationship>& getRelationships() const { return relationships_; }

    const Relationship* findById(const std::string& id) const;

    /**
     * @brief 按类型名查找第一个关系（如 "sharedStrings"）
     */
    const Relationship* findFirstByType(const std::string& type_name) const;

    size_t getRelationshipCount() const { return relationships_.size(); }

    /**
     * @brief 将关系目标解析为包内路径
     * @param base_dir 源部件所在目录（如 "xl"），包根目录为空串
     * @param target 关系目标，'/' 开头时为包内绝对路径
     */
    static std::string resolveTarget(const std::string& base_dir, const std::string& target);

    /**
     * @brief 部件对应的 .rels 路径（"xl/workbook.xml" -> "xl/_rels/workbook.xml.rels"）
     */
    static std::string relsPathFor(const std::string& part_path);

protected:
    void onParseBegin() override;
    void onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    std::vector<Relationship> relationships_;
    std::unordered_map<std::string, size_t> id_index_;
};

}} // namespace excelcsv::reader
