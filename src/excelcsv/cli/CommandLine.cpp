/**
 * @file CommandLine.cpp
 * @brief 命令行参数解析实现
 */

#include "excelcsv/cli/CommandLine.hpp"
#include "excelcsv/core/DateWhitelist.hpp"
#include <fmt/format.h>

namespace excelcsv {
namespace cli {

namespace {

// 取出选项值：支持 "--opt value" 与 "--opt=value"
std::string takeValue(const std::vector<std::string>& args, size_t& i, const std::string& option,
                      const std::string& inline_value, bool has_inline) {
    if (has_inline) {
        return inline_value;
    }
    if (i + 1 >= args.size()) {
        EXCELCSV_THROW(UsageException, fmt::format("Option {} requires a value", option),
                       core::ErrorCode::InvalidArgument);
    }
    return args[++i];
}

} // namespace

CommandLineOptions CommandLine::parse(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

CommandLineOptions CommandLine::parse(const std::vector<std::string>& args) {
    CommandLineOptions opt;
    bool positional_only = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (positional_only || arg.empty() || arg[0] != '-' || arg == "-") {
            if (!opt.input.empty()) {
                EXCELCSV_THROW(UsageException, fmt::format("Unexpected argument '{}'", arg),
                               core::ErrorCode::InvalidArgument);
            }
            opt.input = arg;
            continue;
        }
        if (arg == "--") {
            positional_only = true;
            continue;
        }

        std::string name = arg;
        std::string inline_value;
        bool has_inline = false;
        size_t eq = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
            has_inline = true;
        }

        if (name == "-h" || name == "--help") {
            opt.show_help = true;
        } else if (name == "--list-sheets") {
            opt.export_options.list_sheets = true;
        } else if (name == "--flexible") {
            opt.csv_options.flexible = true;
        } else if (name == "--trim") {
            opt.export_options.trim = true;
        } else if (name == "-s" || name == "--sheet") {
            opt.export_options.sheet = takeValue(args, i, name, inline_value, has_inline);
        } else if (name == "--dates-whitelist") {
            opt.export_options.dates_whitelist = takeValue(args, i, name, inline_value, has_inline);
        } else if (name == "-o" || name == "--output") {
            opt.output = takeValue(args, i, name, inline_value, has_inline);
        } else if (name == "-d" || name == "--delimiter") {
            opt.csv_options.delimiter = parseDelimiter(takeValue(args, i, name, inline_value, has_inline));
        } else if (name == "--log-level") {
            opt.log_level = takeValue(args, i, name, inline_value, has_inline);
        } else if (name == "--log-file") {
            opt.log_file = takeValue(args, i, name, inline_value, has_inline);
        } else {
            EXCELCSV_THROW(UsageException, fmt::format("Unknown option '{}'", arg),
                           core::ErrorCode::InvalidArgument);
        }
    }

    if (!opt.show_help && opt.input.empty()) {
        EXCELCSV_THROW(UsageException, "Missing input file", core::ErrorCode::InvalidArgument);
    }
    return opt;
}

char CommandLine::parseDelimiter(const std::string& value) {
    if (value == "\\t" || value == "tab") {
        return '\t';
    }
    if (value.size() != 1 || value[0] == '"' || value[0] == '\n' || value[0] == '\r') {
        EXCELCSV_THROW(core::ConfigurationException,
                       fmt::format("Invalid delimiter '{}': expected a single character other than a quote or line break", value),
                       core::ErrorCode::InvalidArgument);
    }
    return value[0];
}

std::string CommandLine::usage(const std::string& program) {
    return fmt::format(
        "Usage: {0} [options] <input>\n"
        "\n"
        "Export one worksheet of an .xlsx/.xlsm workbook as CSV.\n"
        "\n"
        "Options:\n"
        "  -s, --sheet <name/index>    sheet name or zero-based index, negative counts from\n"
        "                              the end [default: 0]\n"
        "  --list-sheets               write index,sheet_name table and exit\n"
        "  --flexible                  allow records with differing field counts\n"
        "  --trim                      trim fields and flatten embedded line breaks\n"
        "  --dates-whitelist <list>    all, none, column indexes or header substrings\n"
        "                              [default: {1}]\n"
        "  -o, --output <file>         write to <file> instead of stdout\n"
        "  -d, --delimiter <char>      output field delimiter [default: ,]\n"
        "  --log-level <level>         trace|debug|info|warn|error|off [default: warn]\n"
        "  --log-file <file>           also write log lines to <file>\n"
        "  -h, --help                  print this help\n",
        program, core::DateWhitelist::kDefaultSpec);
}

}} // namespace excelcsv::cli
