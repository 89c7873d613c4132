#include "excelcsv/cli/Application.hpp"
#include "excelcsv/utils/Logger.hpp"
#include <iostream>

int main(int argc, char* argv[])
{
    std::ios::sync_with_stdio(false);

    excelcsv::cli::Application app(std::cout, std::cerr);
    int code = app.run(argc, argv);

    std::cout.flush();
    // 显式关闭日志系统，避免静态析构顺序问题
    excelcsv::Logger::getInstance().shutdown();
    return code;
}
