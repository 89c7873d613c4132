#pragma once

#include <string>
#include <vector>

namespace excelcsv {
namespace core {

using Record = std::vector<std::string>;

/**
 * @brief 记录组装器
 *
 * trim 为 true 时去除每个字段首尾的 ASCII 空白，并把字段内的每个 '\n' 替换为一个空格。
 * 字段数是否与表头一致由 CSVWriter 的 flexible 选项负责。
 */
class RecordAssembler {
public:
    explicit RecordAssembler(bool trim = false) : trim_(trim) {}

    /**
     * @brief 组装记录（原地处理并返回）
     */
    Record assemble(Record fields) const;

    static std::string trimField(const std::string& field);

private:
    bool trim_;
};

}} // namespace excelcsv::core
