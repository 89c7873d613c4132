#include "excelcsv/utils/TimeUtils.hpp"
#include <cmath>
#include <fmt/format.h>

namespace excelcsv {
namespace utils {

namespace {

constexpr int64_t kMinDays = daysFromCivil(1, 1, 1);
constexpr int64_t kMaxDays = daysFromCivil(9999, 12, 31);

static_assert(TimeUtils::kSerialEpochDays == -25569, "1899-12-30 must be 25569 days before 1970-01-01");

} // namespace

CalendarDateTime TimeUtils::civilFromDays(int64_t z) noexcept {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;

    CalendarDateTime result;
    result.year = static_cast<int>(y + (m <= 2 ? 1 : 0));
    result.month = static_cast<int>(m);
    result.day = static_cast<int>(d);
    return result;
}

core::Result<CalendarDateTime> TimeUtils::fromEpochDays(int64_t serial_days, int64_t seconds_of_day, double serial) {
    const int64_t unix_days = serial_days + kSerialEpochDays;
    if (unix_days < kMinDays || unix_days > kMaxDays) {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               fmt::format("serial {} is outside the supported calendar range", serial));
    }

    CalendarDateTime dt = civilFromDays(unix_days);
    dt.hour = static_cast<int>(seconds_of_day / 3600);
    dt.minute = static_cast<int>((seconds_of_day % 3600) / 60);
    dt.second = static_cast<int>(seconds_of_day % 60);
    return dt;
}

core::Result<CalendarDateTime> TimeUtils::serialToDate(double serial) {
    if (!std::isfinite(serial)) {
        return core::makeError(core::ErrorCode::InvalidArgument, "serial is not a finite number");
    }
    // 先在浮点域检查范围，避免转换为整数时溢出
    const double days = std::trunc(serial);
    if (days < static_cast<double>(kMinDays - kSerialEpochDays) ||
        days > static_cast<double>(kMaxDays - kSerialEpochDays)) {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               fmt::format("serial {} is outside the supported calendar range", serial));
    }
    return fromEpochDays(static_cast<int64_t>(days), 0, serial);
}

core::Result<CalendarDateTime> TimeUtils::serialToDateTime(double serial) {
    if (!std::isfinite(serial)) {
        return core::makeError(core::ErrorCode::InvalidArgument, "serial is not a finite number");
    }
    double days = std::floor(serial);
    if (days < static_cast<double>(kMinDays - kSerialEpochDays) ||
        days > static_cast<double>(kMaxDays - kSerialEpochDays)) {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               fmt::format("serial {} is outside the supported calendar range", serial));
    }

    int64_t seconds = std::llround((serial - days) * static_cast<double>(kSecondsPerDay));
    int64_t whole_days = static_cast<int64_t>(days);
    if (seconds >= kSecondsPerDay) {
        // 四舍五入进位到次日零点
        seconds -= kSecondsPerDay;
        ++whole_days;
    }
    return fromEpochDays(whole_days, seconds, serial);
}

std::string TimeUtils::formatDate(const CalendarDateTime& dt) {
    return fmt::format("{:04}-{:02}-{:02}", dt.year, dt.month, dt.day);
}

std::string TimeUtils::formatDateTime(const CalendarDateTime& dt) {
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
                       dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second);
}

}} // namespace excelcsv::utils
