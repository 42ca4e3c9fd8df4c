#include <gtest/gtest.h>

#include <chrono>
#include <ctime>

#include "util/TimeFormat.hpp"

namespace {

std::chrono::system_clock::time_point local_time(int year, int mon, int day,
                                                 int hour, int min, int sec) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

}  // namespace

TEST(TimeFormatTest, FileStampUsesLocalSeconds) {
    const auto tp = local_time(2025, 8, 16, 14, 32, 10);
    EXPECT_EQ(format_file_stamp(tp), "20250816_143210");
    // 不足一秒的部分不进位
    EXPECT_EQ(format_file_stamp(tp + std::chrono::milliseconds(999)),
              "20250816_143210");
}

TEST(TimeFormatTest, IsoTimestampHasSixFractionDigits) {
    const auto tp = local_time(2025, 1, 2, 3, 4, 5);
    EXPECT_EQ(format_iso_timestamp(tp), "2025-01-02T03:04:05.000000");
    EXPECT_EQ(format_iso_timestamp(tp + std::chrono::microseconds(12345)),
              "2025-01-02T03:04:05.012345");
    EXPECT_EQ(format_iso_timestamp(tp + std::chrono::microseconds(999999)),
              "2025-01-02T03:04:05.999999");
}

TEST(TimeFormatTest, IsoTimestampsSortChronologically) {
    const auto base = local_time(2025, 12, 31, 23, 59, 59);
    const auto a = format_iso_timestamp(base + std::chrono::microseconds(999990));
    const auto b = format_iso_timestamp(base + std::chrono::seconds(1));
    const auto c = format_iso_timestamp(base + std::chrono::seconds(1) +
                                        std::chrono::microseconds(7));
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_EQ(b, "2026-01-01T00:00:00.000000");
}
