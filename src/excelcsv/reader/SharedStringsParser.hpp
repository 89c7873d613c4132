#pragma once

#include "excelcsv/reader/BaseSAXParser.hpp"
#include <string>
#include <vector>

namespace excelcsv {
namespace reader {

/**
 * @brief 共享字符串表解析器
 *
 * 解析 xl/sharedStrings.xml。每个 <si> 的文本为其下所有 <t> 的拼接（富文本按顺序连接），
 * <rPh> 注音内容不计入。文本保留原有空白，实体由 expat 解码一次。
 */
class SharedStringsParser : public BaseSAXParser {
public:
    SharedStringsParser() { setTrimText(false); }
    ~SharedStringsParser() override = default;

    /**
     * @brief 按索引取字符串
     * @return 索引越界时返回 nullptr
     */
    const std::string* getString(size_t index) const {
        return index < strings_.size() ? &strings_[index] : nullptr;
    }

    size_t getStringCount() const { return strings_.size(); }

    const std::vector<std::string>& getStrings() const { return strings_; }

    void clear();

protected:
    void onParseBegin() override { clear(); }
    void onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    std::vector<std::string> strings_;
    std::string current_item_;
    bool in_si_ = false;
    int phonetic_depth_ = 0;   // <rPh> 嵌套层数
};

}} // namespace excelcsv::reader
