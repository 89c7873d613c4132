#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace excelcsv {
namespace core {

/**
 * @brief 工作表选择器
 *
 * 将用户输入的工作表标识（名称、非负索引、负索引或其他文本）映射为具体的工作表名称：
 * - 与某个工作表名称完全相同（区分大小写）时直接返回该名称
 * - 可解析为有符号整数 k 时：k >= 0 取 names[k]，越界抛出异常；
 *   k < 0 从末尾计数（-1 为最后一个），取 clamp(N - |k|, 0, N - 1)
 * - 其余情况回退到第一个工作表，并输出一条 debug 诊断
 */
class SheetResolver {
public:
    /**
     * @brief 解析工作表标识
     * @param identifier 用户输入
     * @param names 工作簿中的工作表名称（有序）
     * @return 选中的工作表名称
     * @throws WorksheetException 工作簿为空（EmptyWorkbook）或非负索引越界（SheetIndexOutOfRange）
     */
    static std::string resolve(const std::string& identifier, const std::vector<std::string>& names);

    /**
     * @brief 解析为 32 位有符号整数：可选 '+' / '-' 前缀加十进制数字，溢出视为失败
     */
    static bool parseIndex(const std::string& text, int32_t& out) noexcept;

    /**
     * @brief 负索引换算为位置，结果总在 [0, count) 内（count > 0）
     */
    static size_t negativeIndexPosition(int32_t index, size_t count) noexcept;
};

}} // namespace excelcsv::core
