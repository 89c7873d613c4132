/**
 * @file CommandLine.hpp
 * @brief 命令行参数解析
 */

#pragma once

#include "excelcsv/core/CSVWriter.hpp"
#include "excelcsv/core/Exception.hpp"
#include "excelcsv/core/SheetExporter.hpp"
#include <string>
#include <vector>

namespace excelcsv {
namespace cli {

/**
 * @brief 命令行用法错误（未知选项、缺少参数值、缺少输入文件），退出码 2
 */
class UsageException : public core::ExcelCsvException {
public:
    UsageException(const std::string& message,
                   core::ErrorCode code = core::ErrorCode::InvalidArgument,
                   const char* file = nullptr, int line = 0)
        : core::ExcelCsvException(message, code, file, line) {}
};

struct CommandLineOptions {
    std::string input;
    std::string output;          // 为空时写到标准输出
    std::string log_level = "warn";
    std::string log_file;
    bool show_help = false;

    core::ExportOptions export_options;
    core::CSVOptions csv_options;
};

class CommandLine {
public:
    /**
     * @brief 解析 argv（argv[0] 为程序名）
     * @throws UsageException 用法错误
     * @throws ConfigurationException 选项值无效（如分隔符）
     */
    static CommandLineOptions parse(int argc, const char* const* argv);
    static CommandLineOptions parse(const std::vector<std::string>& args);

    static std::string usage(const std::string& program = "excelcsv");

    /**
     * @brief 解析 --delimiter 的值："," "\t" "tab" 等单字符
     */
    static char parseDelimiter(const std::string& value);
};

}} // namespace excelcsv::cli
