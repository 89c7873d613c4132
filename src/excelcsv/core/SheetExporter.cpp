#include "excelcsv/core/SheetExporter.hpp"
#include "excelcsv/core/CellTranscoder.hpp"
#include "excelcsv/core/RecordAssembler.hpp"
#include "excelcsv/core/SheetResolver.hpp"
#include "excelcsv/utils/ModuleLoggers.hpp"
#include "excelcsv/utils/TimeUtils.hpp"

#include <algorithm>
#include <fmt/ranges.h>

namespace excelcsv {
namespace core {

SheetExporter::SheetExporter(const ExportOptions& options)
    : options_(options)
    , whitelist_(DateWhitelist::parse(options.dates_whitelist)) {
    CORE_INFO("using date-whitelist: {} (mode {})", options_.dates_whitelist,
              DateWhitelist::modeName(whitelist_.getMode()));
}

ExportStats SheetExporter::run(IWorkbookSource& source, CSVWriter& writer) {
    utils::TimeUtils::PerformanceTimer timer;
    const std::vector<std::string> names = source.sheetNames();

    if (options_.list_sheets) {
        return listSheets(names, writer);
    }

    ExportStats stats;
    stats.sheet_name = SheetResolver::resolve(options_.sheet, names);
    CORE_DEBUG("Exporting sheet \"{}\"", stats.sheet_name);

    RecordAssembler assembler(options_.trim);
    std::vector<bool> date_flags;
    bool header_seen = false;
    Record fields;

    source.forEachRow(stats.sheet_name, [&](const CellRow& row) {
        fields.clear();
        fields.reserve(row.size());

        if (!header_seen) {
            for (const auto& cell : row) {
                fields.push_back(CellTranscoder::transcode(cell, false));
            }
            date_flags = whitelist_.classify(fields);
            stats.date_columns = static_cast<size_t>(std::count(date_flags.begin(), date_flags.end(), true));
            header_seen = true;
        } else {
            for (size_t col = 0; col < row.size(); ++col) {
                // 超出表头宽度的列（仅 flexible 时出现）不做日期解码
                const bool is_date = col < date_flags.size() && date_flags[col];
                fields.push_back(CellTranscoder::transcode(row[col], is_date));
            }
            ++stats.data_rows;
        }

        Record record = assembler.assemble(std::move(fields));
        writer.writeRecord(record);
        stats.columns = record.size();
        fields = std::move(record);
    });

    writer.flush();

    CORE_INFO("{}", summaryMessage(stats));
    CORE_DEBUG("Sheet \"{}\" exported in {} ms ({} date column(s))",
               stats.sheet_name, timer.elapsedMs(), stats.date_columns);
    return stats;
}

ExportStats SheetExporter::listSheets(const std::vector<std::string>& names, CSVWriter& writer) {
    writer.writeRecord({"index", "sheet_name"});
    for (size_t i = 0; i < names.size(); ++i) {
        writer.writeRecord({std::to_string(i), names[i]});
    }
    writer.flush();

    CORE_INFO("listed sheet names: {}", fmt::join(names, ", "));

    ExportStats stats;
    stats.listed_sheets = true;
    stats.data_rows = names.size();
    stats.columns = 2;
    return stats;
}

std::string SheetExporter::summaryMessage(const ExportStats& stats) {
    return fmt::format("{} {}-column rows exported from \"{}\"",
                       separateWithCommas(stats.data_rows),
                       separateWithCommas(stats.columns),
                       stats.sheet_name);
}

std::string SheetExporter::separateWithCommas(uint64_t value) {
    std::string digits = std::to_string(value);
    std::string result;
    result.reserve(digits.size() + digits.size() / 3);

    size_t lead = digits.size() % 3;
    if (lead == 0) {
        lead = 3;
    }
    result.append(digits, 0, lead);
    for (size_t i = lead; i < digits.size(); i += 3) {
        result += ',';
        result.append(digits, i, 3);
    }
    return result;
}

}} // namespace excelcsv::core
