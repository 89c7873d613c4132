#include "excelcsv/core/ErrorCode.hpp"

namespace excelcsv {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用/配置错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InternalError:
            return "Internal error";
        case ErrorCode::UnsupportedFileType:
            return "Unsupported file type";

        // 源文件错误
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileReadError:
            return "File read error";
        case ErrorCode::ZipError:
            return "ZIP error";
        case ErrorCode::XmlParseError:
            return "XML parse error";

        // 工作簿/工作表错误
        case ErrorCode::InvalidWorkbook:
            return "Invalid workbook";
        case ErrorCode::InvalidWorksheet:
            return "Invalid worksheet";
        case ErrorCode::SheetIndexOutOfRange:
            return "Sheet index out of range";
        case ErrorCode::EmptyWorkbook:
            return "Workbook has no sheets";

        // 输出错误
        case ErrorCode::FileWriteError:
            return "File write error";
        case ErrorCode::FieldCountMismatch:
            return "Field count mismatch";
    }
    return "Unknown error";
}

const char* toName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::UnsupportedFileType: return "UnsupportedFileType";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileReadError: return "FileReadError";
        case ErrorCode::ZipError: return "ZipError";
        case ErrorCode::XmlParseError: return "XmlParseError";
        case ErrorCode::InvalidWorkbook: return "InvalidWorkbook";
        case ErrorCode::InvalidWorksheet: return "InvalidWorksheet";
        case ErrorCode::SheetIndexOutOfRange: return "SheetIndexOutOfRange";
        case ErrorCode::EmptyWorkbook: return "EmptyWorkbook";
        case ErrorCode::FileWriteError: return "FileWriteError";
        case ErrorCode::FieldCountMismatch: return "FieldCountMismatch";
    }
    return "Unknown";
}

}} // namespace excelcsv::core
