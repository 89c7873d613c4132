/**
 * @file Exception.cpp
 * @brief excelcsv 异常类实现
 */

#include "Exception.hpp"

namespace excelcsv {
namespace core {

ExcelCsvException::ExcelCsvException(const std::string& message,
                                     ErrorCode code,
                                     const char* file,
                                     int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

ConfigurationException::ConfigurationException(const std::string& message,
                                               ErrorCode code, const char* file, int line)
    : ExcelCsvException(message, code, file, line) {
}

// 消息原样保留，调用方会直接打印给用户
SourceException::SourceException(const std::string& message, const std::string& filename,
                                 ErrorCode code, const char* file, int line)
    : ExcelCsvException(message, code, file, line)
    , filename_(filename) {
}

WorksheetException::WorksheetException(const std::string& message,
                                       const std::string& worksheet_name,
                                       ErrorCode code, const char* file, int line)
    : ExcelCsvException(message, code, file, line)
    , worksheet_name_(worksheet_name) {
}

WriteException::WriteException(const std::string& message,
                               ErrorCode code, const char* file, int line)
    : ExcelCsvException(message, code, file, line) {
}

}} // namespace excelcsv::core
