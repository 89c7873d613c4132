#pragma once

#include "excelcsv/core/Expected.hpp"
#include <string>
#include <chrono>
#include <cstdint>

namespace excelcsv {
namespace utils {

/**
 * @brief 日历日期时间（无时区）
 */
struct CalendarDateTime {
    int year = 1970;
    int month = 1;   // 1-12
    int day = 1;     // 1-31
    int hour = 0;
    int minute = 0;
    int second = 0;
};

/**
 * @brief 公历日期转换为距 1970-01-01 的天数
 */
constexpr int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

/**
 * @brief 时间工具类
 *
 * Excel 1900 日期系统的序列号以 1899-12-30 为第 0 天，
 * 整数部分为日期，小数部分为一天中的时间。
 */
class TimeUtils {
public:
    static constexpr int64_t kSecondsPerDay = 86400;

    /**
     * @brief 距 1970-01-01 的天数转换为公历日期
     */
    static CalendarDateTime civilFromDays(int64_t z) noexcept;

    /**
     * @brief 序列号 0 对应的 Unix 天数（1899-12-30）
     */
    static constexpr int64_t kSerialEpochDays = daysFromCivil(1899, 12, 30);

    /**
     * @brief 序列号转换为日期（截断小数部分）
     *
     * 非有限值或超出 0001-01-01..9999-12-31 的结果返回错误。
     */
    static core::Result<CalendarDateTime> serialToDate(double serial);

    /**
     * @brief 序列号转换为日期时间，小数部分 × 86400 四舍五入到整秒
     */
    static core::Result<CalendarDateTime> serialToDateTime(double serial);

    // YYYY-MM-DD
    static std::string formatDate(const CalendarDateTime& dt);

    // YYYY-MM-DD HH:MM:SS
    static std::string formatDateTime(const CalendarDateTime& dt);

    /**
     * @brief RAII 计时器
     */
    class PerformanceTimer {
    private:
        std::chrono::steady_clock::time_point start_;

    public:
        PerformanceTimer() : start_(std::chrono::steady_clock::now()) {}

        int64_t elapsedMs() const {
            auto now = std::chrono::steady_clock::now();
            return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_).count();
        }
    };

private:
    static core::Result<CalendarDateTime> fromEpochDays(int64_t serial_days, int64_t seconds_of_day, double serial);
};

}} // namespace excelcsv::utils
