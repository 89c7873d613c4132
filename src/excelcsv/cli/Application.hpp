/**
 * @file Application.hpp
 * @brief 命令行程序主流程
 */

#pragma once

#include "excelcsv/cli/CommandLine.hpp"
#include <iosfwd>
#include <string>

namespace excelcsv {
namespace cli {

/**
 * @brief 退出码
 */
enum class ExitCode : int {
    Success = 0,
    Failure = 1,    // 配置、源文件或写出错误
    Usage = 2       // 命令行用法错误
};

class Application {
public:
    /**
     * @param out CSV 输出（未指定 --output 时）与帮助文本
     * @param err 错误信息与导出摘要
     */
    Application(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

    int run(int argc, const char* const* argv);
    int run(const std::vector<std::string>& args);

    /**
     * @brief 按扩展名检查输入类型
     * @throws ConfigurationException 非工作簿文件或不支持的容器格式
     */
    static void checkInputType(const std::string& path);

private:
    int execute(const CommandLineOptions& options);
    void configureLogging(const CommandLineOptions& options);
    void exportWorkbook(const CommandLineOptions& options);

    std::ostream& out_;
    std::ostream& err_;
};

}} // namespace excelcsv::cli
