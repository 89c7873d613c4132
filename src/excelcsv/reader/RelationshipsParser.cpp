#include "excelcsv/reader/RelationshipsParser.hpp"
#include "excelcsv/utils/ModuleLoggers.hpp"

namespace excelcsv {
namespace reader {

std::string RelationshipsParser::Relationship::typeName() const {
    size_t slash = type.find_last_of('/');
    return slash == std::string::npos ? type : type.substr(slash + 1);
}

void RelationshipsParser::onParseBegin() {
    relationships_.clear();
    id_index_.clear();
}

void RelationshipsParser::onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (name != "Relationship") {
        return;
    }

    auto id = findAttribute(attributes, "Id");
    auto type = findAttribute(attributes, "Type");
    auto target = findAttribute(attributes, "Target");
    auto target_mode = findAttribute(attributes, "TargetMode");

    if (id && type && target && !id->empty() && !type->empty() && !target->empty()) {
        Relationship rel;
        rel.id = std::string(*id);
        rel.type = std::string(*type);
        rel.target = std::string(*target);
        if (target_mode) {
            rel.target_mode = std::string(*target_mode);
        }

        id_index_[rel.id] = relationships_.size();
        READER_DEBUG("Parsed relationship: {} -> {} ({})", rel.id, rel.target, rel.typeName());
        relationships_.push_back(std::move(rel));
    } else {
        READER_WARN("Skipping incomplete relationship: id='{}', target='{}'",
                    id ? *id : std::string_view{}, target ? *target : std::string_view{});
    }
}

void RelationshipsParser::onEndElement(std::string_view /*name*/, int /*depth*/) {
}

const RelationshipsParser::Relationship* RelationshipsParser::findById(const std::string& id) const {
    auto it = id_index_.find(id);
    if (it != id_index_.end() && it->second < relationships_.size()) {
        return &relationships_[it->second];
    }
    return nullptr;
}

const RelationshipsParser::Relationship* RelationshipsParser::findFirstByType(const std::string& type_name) const {
    for (const auto& rel : relationships_) {
        if (rel.typeName() == type_name) {
            return &rel;
        }
    }
    return nullptr;
}

std::string RelationshipsParser::resolveTarget(const std::string& base_dir, const std::string& target) {
    std::string joined;
    if (!target.empty() && target[0] == '/') {
        joined = target.substr(1);
    } else if (base_dir.empty()) {
        joined = target;
    } else {
        joined = base_dir + "/" + target;
    }

    // 归一化 "." 与 ".." 段
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= joined.size()) {
        size_t slash = joined.find('/', start);
        std::string segment = joined.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
        } else if (!segment.empty() && segment != ".") {
            segments.push_back(std::move(segment));
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }

    std::string result;
    for (const auto& segment : segments) {
        if (!result.empty()) {
            result += '/';
        }
        result += segment;
    }
    return result;
}

std::string RelationshipsParser::relsPathFor(const std::string& part_path) {
    size_t slash = part_path.find_last_of('/');
    if (slash == std::string::npos) {
        return "_rels/" + part_path + ".rels";
    }
    return part_path.substr(0, slash) + "/_rels/" + part_path.substr(slash + 1) + ".rels";
}

}} // namespace excelcsv::reader
