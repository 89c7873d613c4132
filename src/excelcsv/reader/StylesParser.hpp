#pragma once

#include "excelcsv/reader/BaseSAXParser.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace excelcsv {
namespace reader {

/**
 * @brief 样式解析器
 *
 * 只解析判断日期所需的部分：<numFmts> 自定义数字格式与 <cellXfs> 中每个 xf 的 numFmtId。
 * 单元格的 s 属性即 cellXfs 的下标。
 */
class StylesParser : public BaseSAXParser {
public:
    StylesParser() = default;
    ~StylesParser() override = default;

    /**
     * @brief 样式下标对应的单元格是否为日期/时间格式
     * @param xf_index 单元格 s 属性；越界视为非日期
     */
    bool isDateStyle(uint32_t xf_index) const {
        return xf_index < date_flags_.size() && date_flags_[xf_index];
    }

    /**
     * @brief 样式下标对应的数字格式 id，越界时返回 0（General）
     */
    int getNumberFormatId(uint32_t xf_index) const {
        return xf_index < xf_num_fmt_ids_.size() ? xf_num_fmt_ids_[xf_index] : 0;
    }

    /**
     * @brief 数字格式代码（自定义优先，其次内置）
     */
    std::string getFormatCode(int num_fmt_id) const;

    size_t getCellXfCount() const { return xf_num_fmt_ids_.size(); }

    /**
     * @brief 内置格式 id 是否为日期/时间（14-22、45-47）
     */
    static bool isBuiltinDateFormat(int num_fmt_id);

    /**
     * @brief 格式代码是否为日期/时间格式
     *
     * 去掉引号文本、转义字符、方括号段（颜色、条件、区域）后，含 d/m/y/h/s 即为日期。
     * [h]、[mm]、[ss] 这类经过时长段也算。
     */
    static bool isDateFormatCode(std::string_view format_code);

    static std::string getBuiltinNumberFormat(int format_id);

protected:
    void onParseBegin() override;
    void onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    bool isDateFormatId(int num_fmt_id) const;

    std::unordered_map<int, std::string> custom_formats_;
    std::vector<int> xf_num_fmt_ids_;
    std::vector<bool> date_flags_;
    bool in_num_fmts_ = false;
    bool in_cell_xfs_ = false;
};

}} // namespace excelcsv::reader
