/**
 * @file Application.cpp
 * @brief 命令行程序主流程实现
 */

#include "excelcsv/cli/Application.hpp"
#include "excelcsv/core/SheetExporter.hpp"
#include "excelcsv/core/SheetResolver.hpp"
#include "excelcsv/reader/XLSXReader.hpp"
#include "excelcsv/utils/Logger.hpp"
#include "excelcsv/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <ostream>

namespace excelcsv {
namespace cli {

int Application::run(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return run(args);
}

int Application::run(const std::vector<std::string>& args) {
    CommandLineOptions options;
    try {
        options = CommandLine::parse(args);
        if (options.show_help) {
            out_ << CommandLine::usage();
            return static_cast<int>(ExitCode::Success);
        }
        configureLogging(options);
    } catch (const UsageException& e) {
        err_ << "error: " << e.what() << "\n\n" << CommandLine::usage();
        return static_cast<int>(ExitCode::Usage);
    } catch (const core::ConfigurationException& e) {
        err_ << "error: " << e.what() << '\n';
        return static_cast<int>(ExitCode::Failure);
    }

    return execute(options);
}

void Application::configureLogging(const CommandLineOptions& options) {
    Logger::Level level = Logger::Level::WARN;
    if (!Logger::parseLevel(options.log_level, level)) {
        EXCELCSV_THROW(UsageException, fmt::format("Invalid log level '{}'", options.log_level),
                       core::ErrorCode::InvalidArgument);
    }
    Logger::getInstance().initialize(options.log_file, level, true);
    CLI_DEBUG("Log level set to {}", options.log_level);
}

int Application::execute(const CommandLineOptions& options) {
    try {
        exportWorkbook(options);
        return static_cast<int>(ExitCode::Success);
    } catch (const core::ExcelCsvException& e) {
        CLI_ERROR("{} ({})", e.what(), e.getErrorCodeString());
        err_ << e.what() << '\n';
    } catch (const std::exception& e) {
        CLI_ERROR("Unexpected failure: {}", e.what());
        err_ << e.what() << '\n';
    }
    return static_cast<int>(ExitCode::Failure);
}

void Application::checkInputType(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".xlsx" || ext == ".xlsm") {
        return;
    }
    if (ext == ".xls" || ext == ".xlsb" || ext == ".ods" || ext == ".xla" || ext == ".xlam") {
        EXCELCSV_THROW(core::ConfigurationException,
                       fmt::format("Unsupported workbook type '{}': only .xlsx and .xlsm files can be read.", ext),
                       core::ErrorCode::UnsupportedFileType);
    }
    EXCELCSV_THROW(core::ConfigurationException, "Expecting an Excel/ODS file.",
                   core::ErrorCode::UnsupportedFileType);
}

void Application::exportWorkbook(const CommandLineOptions& options) {
    checkInputType(options.input);

    // 工作簿、选表与白名单都确认无误后才创建输出文件，失败时保留原有内容
    core::SheetExporter exporter(options.export_options);
    reader::XLSXReader workbook(options.input);
    workbook.open();
    if (!options.export_options.list_sheets) {
        std::string sheet = core::SheetResolver::resolve(options.export_options.sheet, workbook.sheetNames());
        CLI_DEBUG("Sheet '{}' resolves to \"{}\"", options.export_options.sheet, sheet);
    }

    std::ofstream file;
    std::ostream* sink = &out_;
    if (!options.output.empty()) {
        file.open(options.output, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file) {
            EXCELCSV_THROW(core::WriteException, fmt::format("Cannot create output file {}", options.output),
                           core::ErrorCode::FileWriteError);
        }
        sink = &file;
    }

    CLI_INFO("Exporting {} -> {}", options.input, options.output.empty() ? "<stdout>" : options.output);

    core::CSVWriter writer(*sink, options.csv_options);
    core::ExportStats stats = exporter.run(workbook, writer);

    if (file.is_open()) {
        file.close();
        if (file.fail()) {
            EXCELCSV_THROW(core::WriteException, fmt::format("Cannot write output file {}", options.output),
                           core::ErrorCode::FileWriteError);
        }
    }

    if (!stats.listed_sheets) {
        err_ << core::SheetExporter::summaryMessage(stats) << '\n';
    }
}

}} // namespace excelcsv::cli
