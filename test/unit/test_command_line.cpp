#include "excelcsv/cli/Application.hpp"
#include "excelcsv/cli/CommandLine.hpp"
#include "excelcsv/utils/Logger.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace excelcsv {
namespace cli {

TEST(CommandLineTest, Defaults) {
    CommandLineOptions opt = CommandLine::parse({"book.xlsx"});

    EXPECT_EQ(opt.input, "book.xlsx");
    EXPECT_TRUE(opt.output.empty());
    EXPECT_EQ(opt.log_level, "warn");
    EXPECT_FALSE(opt.show_help);
    EXPECT_EQ(opt.export_options.sheet, "0");
    EXPECT_FALSE(opt.export_options.list_sheets);
    EXPECT_FALSE(opt.export_options.trim);
    EXPECT_STREQ(opt.export_options.dates_whitelist.c_str(), core::DateWhitelist::kDefaultSpec);
    EXPECT_EQ(opt.csv_options.delimiter, ',');
    EXPECT_FALSE(opt.csv_options.flexible);
}

TEST(CommandLineTest, AllOptions) {
    CommandLineOptions opt = CommandLine::parse({
        "-s", "Orders", "--list-sheets", "--flexible", "--trim",
        "--dates-whitelist", "0,2", "-o", "out.csv", "-d", ";",
        "--log-level", "debug", "--log-file", "run.log", "book.xlsm"});

    EXPECT_EQ(opt.input, "book.xlsm");
    EXPECT_EQ(opt.output, "out.csv");
    EXPECT_EQ(opt.export_options.sheet, "Orders");
    EXPECT_TRUE(opt.export_options.list_sheets);
    EXPECT_TRUE(opt.export_options.trim);
    EXPECT_EQ(opt.export_options.dates_whitelist, "0,2");
    EXPECT_TRUE(opt.csv_options.flexible);
    EXPECT_EQ(opt.csv_options.delimiter, ';');
    EXPECT_EQ(opt.log_level, "debug");
    EXPECT_EQ(opt.log_file, "run.log");
}

TEST(CommandLineTest, InlineValuesAndNegativeIndex) {
    CommandLineOptions opt = CommandLine::parse({"--sheet=-1", "--output=x.csv", "--delimiter=tab", "a.xlsx"});
    EXPECT_EQ(opt.export_options.sheet, "-1");
    EXPECT_EQ(opt.output, "x.csv");
    EXPECT_EQ(opt.csv_options.delimiter, '\t');

    // "-s" 后面的值可以以 '-' 开头
    opt = CommandLine::parse({"-s", "-2", "a.xlsx"});
    EXPECT_EQ(opt.export_options.sheet, "-2");
}

TEST(CommandLineTest, DoubleDashEndsOptions) {
    CommandLineOptions opt = CommandLine::parse({"--trim", "--", "-odd name.xlsx"});
    EXPECT_EQ(opt.input, "-odd name.xlsx");
    EXPECT_TRUE(opt.export_options.trim);
}

TEST(CommandLineTest, HelpNeedsNoInput) {
    CommandLineOptions opt = CommandLine::parse({"--help"});
    EXPECT_TRUE(opt.show_help);
    EXPECT_TRUE(CommandLine::parse({"-h"}).show_help);
}

TEST(CommandLineTest, UsageErrors) {
    EXPECT_THROW(CommandLine::parse({}), UsageException);
    EXPECT_THROW(CommandLine::parse({"--trim"}), UsageException);
    EXPECT_THROW(CommandLine::parse({"--bogus", "a.xlsx"}), UsageException);
    EXPECT_THROW(CommandLine::parse({"a.xlsx", "b.xlsx"}), UsageException);
    EXPECT_THROW(CommandLine::parse({"a.xlsx", "--sheet"}), UsageException);

    try {
        CommandLine::parse({"a.xlsx", "-o"});
        FAIL() << "expected UsageException";
    } catch (const UsageException& e) {
        EXPECT_STREQ(e.what(), "Option -o requires a value");
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::InvalidArgument);
    }
}

TEST(CommandLineTest, ParseDelimiter) {
    EXPECT_EQ(CommandLine::parseDelimiter(","), ',');
    EXPECT_EQ(CommandLine::parseDelimiter("|"), '|');
    EXPECT_EQ(CommandLine::parseDelimiter("\\t"), '\t');
    EXPECT_EQ(CommandLine::parseDelimiter("tab"), '\t');
    EXPECT_EQ(CommandLine::parseDelimiter("\t"), '\t');

    EXPECT_THROW(CommandLine::parseDelimiter(""), core::ConfigurationException);
    EXPECT_THROW(CommandLine::parseDelimiter(";;"), core::ConfigurationException);
    EXPECT_THROW(CommandLine::parseDelimiter("\""), core::ConfigurationException);
    EXPECT_THROW(CommandLine::parseDelimiter("\n"), core::ConfigurationException);
}

TEST(CommandLineTest, UsageTextListsOptions) {
    std::string text = CommandLine::usage("excelcsv");
    EXPECT_NE(text.find("Usage: excelcsv [options] <input>"), std::string::npos);
    EXPECT_NE(text.find("--dates-whitelist"), std::string::npos);
    EXPECT_NE(text.find("--list-sheets"), std::string::npos);
}

class ApplicationTest : public ::testing::Test {
protected:
    void TearDown() override {
        // Application 会按命令行重新配置日志，这里恢复测试默认值
        Logger::getInstance().initialize("", Logger::Level::ERROR, true);
    }

    int run(const std::vector<std::string>& args) {
        Application app(out_, err_);
        return app.run(args);
    }

    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(ApplicationTest, HelpGoesToStdout) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_NE(out_.str().find("Usage:"), std::string::npos);
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(ApplicationTest, UsageErrorExitsWithTwo) {
    EXPECT_EQ(run({"--bogus", "a.xlsx"}), 2);
    EXPECT_EQ(err_.str().rfind("error: Unknown option '--bogus'", 0), 0u);
    EXPECT_NE(err_.str().find("Usage:"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(ApplicationTest, InvalidLogLevelIsUsageError) {
    EXPECT_EQ(run({"--log-level", "loud", "a.xlsx"}), 2);
    EXPECT_NE(err_.str().find("Invalid log level 'loud'"), std::string::npos);
}

TEST_F(ApplicationTest, InvalidDelimiterFails) {
    EXPECT_EQ(run({"-d", "ab", "a.xlsx"}), 1);
    EXPECT_EQ(err_.str().rfind("error: Invalid delimiter 'ab'", 0), 0u);
}

TEST_F(ApplicationTest, RejectsNonWorkbookExtension) {
    EXPECT_EQ(run({"--log-level", "off", "notes.txt"}), 1);
    EXPECT_EQ(err_.str(), "Expecting an Excel/ODS file.\n");
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(ApplicationTest, RejectsLegacyWorkbookFormats) {
    EXPECT_EQ(run({"--log-level", "off", "Legacy.XLS"}), 1);
    EXPECT_NE(err_.str().find("Unsupported workbook type '.xls'"), std::string::npos);
}

TEST_F(ApplicationTest, MissingWorkbookFails) {
    EXPECT_EQ(run({"--log-level", "off", "definitely_missing_workbook.xlsx"}), 1);
    EXPECT_EQ(err_.str().rfind("Cannot open workbook: file not found: definitely_missing_workbook.xlsx", 0), 0u);
    EXPECT_TRUE(out_.str().empty());
}

TEST(CheckInputTypeTest, AcceptsXlsxFamily) {
    EXPECT_NO_THROW(Application::checkInputType("a.xlsx"));
    EXPECT_NO_THROW(Application::checkInputType("dir/B.XLSM"));

    try {
        Application::checkInputType("book.ods");
        FAIL() << "expected ConfigurationException";
    } catch (const core::ConfigurationException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::UnsupportedFileType);
    }
    EXPECT_THROW(Application::checkInputType("noextension"), core::ConfigurationException);
}

}} // namespace excelcsv::cli
