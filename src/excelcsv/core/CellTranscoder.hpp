#pragma once

#include "excelcsv/core/TypedCell.hpp"
#include <string>

namespace excelcsv {
namespace core {

/**
 * @brief 单元格转码器：TypedCell + 列日期标志 -> 输出字段
 *
 * 纯函数，不读取也不修改日期标志向量。
 * 日期列中的数值按 1900 日期系统解码：
 * - 有正的小数部分：YYYY-MM-DD HH:MM:SS
 * - 否则：YYYY-MM-DD
 * 解码失败时字段内嵌 "ERROR: Cannot convert <f> to datetime|date"，不影响整行。
 */
class CellTranscoder {
public:
    static std::string transcode(const TypedCell& cell, bool is_date_column);

    /**
     * @brief 浮点数的最短往返十进制表示，不使用指数形式
     *
     * 40729.0 -> "40729"，0.1 -> "0.1"，1e20 -> "100000000000000000000"
     */
    static std::string formatFloat(double value);

    // 按日期列规则解码一个序列号
    static std::string formatSerial(double serial);
};

}} // namespace excelcsv::core
