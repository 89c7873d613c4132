#include "excelcsv/core/CSVWriter.hpp"
#include "excelcsv/core/Exception.hpp"
#include "excelcsv/utils/ModuleLoggers.hpp"

#include <sstream>

namespace excelcsv {
namespace core {

CSVWriter::CSVWriter(std::ostream& out, const CSVOptions& options)
    : out_(out), options_(options) {
}

void CSVWriter::writeRecord(const std::vector<std::string>& record) {
    if (!has_field_count_) {
        field_count_ = record.size();
        has_field_count_ = true;
    } else if (!options_.flexible && record.size() != field_count_) {
        EXCELCSV_THROW(WriteException,
                       fmt::format("found record with {} fields, but the previous record has {} fields",
                                   record.size(), field_count_),
                       ErrorCode::FieldCountMismatch);
    }

    out_ << formatRow(record) << options_.line_terminator;
    if (!out_) {
        EXCELCSV_THROW(WriteException, "Failed to write CSV record", ErrorCode::FileWriteError);
    }
    ++records_written_;
}

void CSVWriter::flush() {
    out_.flush();
    if (!out_) {
        EXCELCSV_THROW(WriteException, "Failed to flush CSV output", ErrorCode::FileWriteError);
    }
    CORE_DEBUG("CSV output flushed after {} records", records_written_);
}

std::string CSVWriter::formatRow(const std::vector<std::string>& row) const {
    // 单个空字段必须加引号，否则输出为空行
    if (row.size() == 1 && row[0].empty()) {
        return std::string(2, options_.quote_char);
    }

    std::ostringstream oss;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            oss << options_.delimiter;
        }
        oss << escapeField(row[i]);
    }
    return oss.str();
}

bool CSVWriter::needsQuoting(const std::string& field) const {
    return field.find(options_.delimiter) != std::string::npos ||
           field.find(options_.quote_char) != std::string::npos ||
           field.find('\n') != std::string::npos ||
           field.find('\r') != std::string::npos;
}

std::string CSVWriter::escapeField(const std::string& field) const {
    if (!needsQuoting(field)) {
        return field;
    }

    std::string escaped(1, options_.quote_char);
    escaped.reserve(field.size() + 4);
    for (char c : field) {
        if (c == options_.quote_char) {
            escaped += options_.escape_char;
        }
        escaped += c;
    }
    escaped += options_.quote_char;
    return escaped;
}

}} // namespace excelcsv::core
