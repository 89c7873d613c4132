/**
 * @file Exception.hpp
 * @brief excelcsv 异常类定义
 */

#ifndef EXCELCSV_EXCEPTION_HPP
#define EXCELCSV_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include "ErrorCode.hpp"

namespace excelcsv {
namespace core {

/**
 * @brief 基础异常类
 */
class ExcelCsvException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    ExcelCsvException(const std::string& message,
                      ErrorCode code = ErrorCode::InternalError,
                      const char* file = nullptr,
                      int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const { return toName(error_code_); }

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
};

/**
 * @brief 配置错误：不支持的文件类型、无效参数
 */
class ConfigurationException : public ExcelCsvException {
public:
    ConfigurationException(const std::string& message,
                           ErrorCode code = ErrorCode::InvalidArgument,
                           const char* file = nullptr, int line = 0);
};

/**
 * @brief 源文件错误：工作簿无法打开或读取
 */
class SourceException : public ExcelCsvException {
public:
    SourceException(const std::string& message, const std::string& filename,
                    ErrorCode code = ErrorCode::FileReadError,
                    const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 工作表错误：工作表无法解析或读取
 */
class WorksheetException : public ExcelCsvException {
public:
    WorksheetException(const std::string& message,
                       const std::string& worksheet_name = "",
                       ErrorCode code = ErrorCode::InvalidWorksheet,
                       const char* file = nullptr, int line = 0);

    const std::string& getWorksheetName() const { return worksheet_name_; }

private:
    std::string worksheet_name_;
};

/**
 * @brief 输出错误
 */
class WriteException : public ExcelCsvException {
public:
    WriteException(const std::string& message,
                   ErrorCode code = ErrorCode::FileWriteError,
                   const char* file = nullptr, int line = 0);
};

} // namespace core
} // namespace excelcsv

// 便捷宏定义
#define EXCELCSV_THROW(ExceptionType, ...) \
    throw ExceptionType(__VA_ARGS__, __FILE__, __LINE__)

#define EXCELCSV_THROW_IF(condition, ExceptionType, ...) \
    do { if (condition) { EXCELCSV_THROW(ExceptionType, __VA_ARGS__); } } while(0)

#endif // EXCELCSV_EXCEPTION_HPP
