#include "excelcsv/utils/TimeUtils.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>

namespace excelcsv {
namespace utils {

class TimeUtilsTest : public ::testing::Test {
protected:
    static std::string date(double serial) {
        auto result = TimeUtils::serialToDate(serial);
        return result ? TimeUtils::formatDate(result.value()) : "<error>";
    }

    static std::string dateTime(double serial) {
        auto result = TimeUtils::serialToDateTime(serial);
        return result ? TimeUtils::formatDateTime(result.value()) : "<error>";
    }
};

static_assert(TimeUtils::kSerialEpochDays == -25569, "1899-12-30 is 25569 days before 1970-01-01");
static_assert(daysFromCivil(1900, 3, 1) - TimeUtils::kSerialEpochDays == 61, "serial 61 is 1900-03-01");

TEST_F(TimeUtilsTest, CivilConversionsAgree) {
    EXPECT_EQ(daysFromCivil(1970, 1, 1), 0);
    EXPECT_EQ(TimeUtils::kSerialEpochDays, -25569);

    CalendarDateTime dt = TimeUtils::civilFromDays(daysFromCivil(2024, 2, 29));
    EXPECT_EQ(dt.year, 2024);
    EXPECT_EQ(dt.month, 2);
    EXPECT_EQ(dt.day, 29);
}

TEST_F(TimeUtilsTest, SerialToDate) {
    EXPECT_EQ(date(0.0), "1899-12-30");
    EXPECT_EQ(date(1.0), "1899-12-31");
    EXPECT_EQ(date(60.0), "1900-02-28");
    EXPECT_EQ(date(40729.0), "2011-07-05");
    EXPECT_EQ(date(2958465.0), "9999-12-31");
}

TEST_F(TimeUtilsTest, SerialToDateTruncatesTowardZero) {
    EXPECT_EQ(date(40729.75), "2011-07-05");
    EXPECT_EQ(date(-1.5), "1899-12-29");
}

TEST_F(TimeUtilsTest, SerialToDateTime) {
    EXPECT_EQ(dateTime(37145.354166666664), "2001-09-11 08:30:00");
    EXPECT_EQ(dateTime(40729.5), "2011-07-05 12:00:00");
    EXPECT_EQ(dateTime(0.25), "1899-12-30 06:00:00");
}

TEST_F(TimeUtilsTest, SecondsRoundUpIntoNextDay) {
    // 0.9999999 天 ≈ 86399.99 秒，四舍五入后进位到次日
    EXPECT_EQ(dateTime(0.9999999), "1899-12-31 00:00:00");
}

TEST_F(TimeUtilsTest, OutOfRangeSerialsFail) {
    EXPECT_FALSE(TimeUtils::serialToDate(1e10));
    EXPECT_FALSE(TimeUtils::serialToDate(-1e8));
    EXPECT_FALSE(TimeUtils::serialToDateTime(1e10 + 0.5));
    EXPECT_FALSE(TimeUtils::serialToDate(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_FALSE(TimeUtils::serialToDateTime(std::numeric_limits<double>::infinity()));

    auto result = TimeUtils::serialToDate(1e10);
    ASSERT_TRUE(result.hasError());
    EXPECT_NE(result.error().code, core::ErrorCode::Ok);
}

TEST_F(TimeUtilsTest, FormattingPadsFields) {
    CalendarDateTime dt;
    dt.year = 7;
    dt.month = 3;
    dt.day = 9;
    dt.hour = 4;
    dt.minute = 5;
    dt.second = 6;
    EXPECT_EQ(TimeUtils::formatDate(dt), "0007-03-09");
    EXPECT_EQ(TimeUtils::formatDateTime(dt), "0007-03-09 04:05:06");
}

TEST_F(TimeUtilsTest, PerformanceTimerIsMonotonic) {
    TimeUtils::PerformanceTimer timer;
    EXPECT_GE(timer.elapsedMs(), 0);
}

}} // namespace excelcsv::utils
