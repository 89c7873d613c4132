/**
 * @file WorkbookParser.cpp
 * @brief 工作簿 XML 解析器实现
 */

#include "excelcsv/reader/WorkbookParser.hpp"
#include "excelcsv/utils/ModuleLoggers.hpp"

namespace excelcsv {
namespace reader {

void WorkbookParser::onParseBegin() {
    worksheets_.clear();
    in_sheets_section_ = false;
    date1904_ = false;
}

std::optional<std::string_view> WorkbookParser::findRelationshipId(core::span<const xml::XMLAttribute> attributes) const {
    auto id = findAttribute(attributes, "r:id");
    if (id) {
        return id;
    }
    for (const auto& attr : attributes) {
        const std::string_view suffix = ":id";
        if (attr.name.size() > suffix.size() &&
            attr.name.substr(attr.name.size() - suffix.size()) == suffix) {
            return attr.value;
        }
    }
    return std::nullopt;
}

void WorkbookParser::onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (name == "workbookPr") {
        auto value = findAttribute(attributes, "date1904");
        date1904_ = value && (*value == "1" || *value == "true");
    } else if (name == "sheets") {
        in_sheets_section_ = true;
    } else if (name == "sheet" && in_sheets_section_) {
        auto sheet_name = findAttribute(attributes, "name");
        auto sheet_id = findAttribute(attributes, "sheetId");
        auto rel_id = findRelationshipId(attributes);

        if (!sheet_name || sheet_name->empty()) {
            READER_WARN("Sheet element without name attribute ignored");
            return;
        }

        WorksheetInfo info(std::string(*sheet_name),
                           sheet_id ? std::string(*sheet_id) : std::string(),
                           rel_id ? std::string(*rel_id) : std::string());
        info.state = getAttributeOr(attributes, "state", "visible");

        const RelationshipsParser::Relationship* rel =
            (relationships_ && !info.rel_id.empty()) ? relationships_->findById(info.rel_id) : nullptr;
        if (rel) {
            info.worksheet_path = RelationshipsParser::resolveTarget(base_dir_, rel->target);
        } else {
            info.worksheet_path = base_dir_ + "/worksheets/sheet" + info.sheet_id + ".xml";
            READER_WARN("Relationship {} not found for sheet \"{}\", using default path {}",
                        info.rel_id, info.name, info.worksheet_path);
        }

        READER_DEBUG("Found sheet: {} (ID: {}) -> {}", info.name, info.sheet_id, info.worksheet_path);
        worksheets_.push_back(std::move(info));
    }
}

void WorkbookParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "sheets") {
        in_sheets_section_ = false;
        READER_DEBUG("Sheet list parsed, {} sheet(s)", worksheets_.size());
    }
}

}} // namespace excelcsv::reader
