#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace excelcsv {
namespace core {

/**
 * @brief 单元格错误值（#DIV/0!、#N/A 等）
 */
enum class CellError : uint8_t {
    Div0,
    NA,
    Name,
    Null,
    Num,
    Ref,
    Value,
    GettingData
};

/**
 * @brief 错误值的调试名称（Div0、NA ...）
 */
const char* cellErrorName(CellError error) noexcept;

/**
 * @brief 解析工作表中的错误文本（"#DIV/0!" 等），无法识别时返回 false
 */
bool parseCellError(const std::string& text, CellError& out) noexcept;

// 变体成员类型
struct EmptyCell {};

struct DateTimeSerial {
    double serial = 0.0;
};

/**
 * @brief 带类型的单元格值
 *
 * 封闭的和类型，CellTranscoder 对其做穷尽匹配。
 * Float 与 DateTimeSerial 都携带日序列号，是否解码为日期由列标志决定。
 */
using TypedCell = std::variant<
    EmptyCell,          // Empty
    std::string,        // Text
    int64_t,            // Integer
    double,             // Float
    bool,               // Boolean
    CellError,          // Error
    DateTimeSerial      // DateTime
>;

using CellRow = std::vector<TypedCell>;

/**
 * @brief 单元格类型名称，用于日志
 */
const char* cellTypeName(const TypedCell& cell) noexcept;

}} // namespace excelcsv::core
