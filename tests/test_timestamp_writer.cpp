#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>

#include "TestSupport.hpp"
#include "recorder/TimestampWriter.hpp"
#include "util/TimeFormat.hpp"

namespace fs = std::filesystem;

class TimestampWriterTest : public ::testing::Test {
   protected:
    void SetUp() override { dir_ = testsupport::make_temp_dir("timestamps"); }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    fs::path dir_;
};

TEST_F(TimestampWriterTest, WritesHeaderOnOpen) {
    const fs::path file = dir_ / "ts.csv";
    {
        TimestampWriter writer(file.string());
        EXPECT_TRUE(writer.is_open());
        EXPECT_EQ(writer.rows_written(), 0u);
    }
    const auto lines = testsupport::read_lines(file);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "frame_number,timestamp");
}

TEST_F(TimestampWriterTest, RowsAreVisibleBeforeClose) {
    const fs::path file = dir_ / "ts.csv";
    TimestampWriter writer(file.string());
    const auto t0 = std::chrono::system_clock::now();
    ASSERT_TRUE(writer.append(0, t0));
    ASSERT_TRUE(writer.append(1, t0 + std::chrono::milliseconds(33)));

    // 每行立即落盘
    const auto lines = testsupport::read_lines(file);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "0," + format_iso_timestamp(t0));
    EXPECT_EQ(lines[2],
              "1," + format_iso_timestamp(t0 + std::chrono::milliseconds(33)));
    EXPECT_EQ(writer.rows_written(), 2u);
}

TEST_F(TimestampWriterTest, AppendAfterCloseFails) {
    TimestampWriter writer((dir_ / "ts.csv").string());
    writer.close();
    EXPECT_FALSE(writer.is_open());
    EXPECT_FALSE(writer.append(0, std::chrono::system_clock::now()));
    writer.close();
}

TEST_F(TimestampWriterTest, ThrowsWhenDirectoryMissing) {
    EXPECT_THROW(TimestampWriter((dir_ / "nope" / "ts.csv").string()),
                 std::runtime_error);
}
