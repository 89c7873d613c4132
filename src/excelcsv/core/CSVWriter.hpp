#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace excelcsv {
namespace core {

struct CSVOptions {
    char delimiter = ',';
    char quote_char = '"';
    char escape_char = '"';
    std::string line_terminator = "\n";
    bool flexible = false;   // 允许记录字段数不一致

    static CSVOptions standard() {
        return CSVOptions{};
    }

    CSVOptions() = default;
};

/**
 * @brief 流式 CSV 写入器
 *
 * 写入目标为外部持有的 std::ostream，每次写入一条记录，不缓存整表。
 * 非 flexible 模式下，字段数与第一条记录不同的记录会抛出 WriteException。
 */
class CSVWriter {
public:
    explicit CSVWriter(std::ostream& out, const CSVOptions& options = CSVOptions{});
    ~CSVWriter() = default;

    CSVWriter(const CSVWriter&) = delete;
    CSVWriter& operator=(const CSVWriter&) = delete;

    /**
     * @brief 写入一条记录
     * @throws WriteException 字段数不一致（FieldCountMismatch）或流写入失败（FileWriteError）
     */
    void writeRecord(const std::vector<std::string>& record);

    void flush();

    std::string formatRow(const std::vector<std::string>& row) const;
    bool needsQuoting(const std::string& field) const;
    std::string escapeField(const std::string& field) const;

    const CSVOptions& getOptions() const { return options_; }
    uint64_t getRecordsWritten() const { return records_written_; }

private:
    std::ostream& out_;
    CSVOptions options_;
    uint64_t records_written_ = 0;
    bool has_field_count_ = false;
    size_t field_count_ = 0;
};

}} // namespace excelcsv::core
