#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace excelcsv {
namespace core {

/**
 * @brief excelcsv 统一错误码
 *
 * 按来源分段：配置、源文件、工作表、输出。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用/配置错误 (1-19)
    InvalidArgument = 1,
    InternalError = 2,
    UnsupportedFileType = 3,

    // 源文件错误 (20-39)
    FileNotFound = 20,
    FileReadError = 21,
    ZipError = 22,
    XmlParseError = 23,

    // 工作簿/工作表错误 (40-59)
    InvalidWorkbook = 40,
    InvalidWorksheet = 41,
    SheetIndexOutOfRange = 42,
    EmptyWorkbook = 43,

    // 输出错误 (60-79)
    FileWriteError = 60,
    FieldCountMismatch = 61
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转可读描述
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码转枚举名
 */
const char* toName(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

}} // namespace excelcsv::core
