#include "excelcsv/core/RecordAssembler.hpp"

#include <algorithm>

namespace excelcsv {
namespace core {

Record RecordAssembler::assemble(Record fields) const {
    if (!trim_) {
        return fields;
    }
    for (auto& field : fields) {
        field = trimField(field);
    }
    return fields;
}

std::string RecordAssembler::trimField(const std::string& field) {
    size_t start = field.find_first_not_of(" \t\r\n\v\f");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = field.find_last_not_of(" \t\r\n\v\f");
    std::string result = field.substr(start, end - start + 1);
    // 换行折叠为空格，避免单词粘连
    std::replace(result.begin(), result.end(), '\n', ' ');
    return result;
}

}} // namespace excelcsv::core
