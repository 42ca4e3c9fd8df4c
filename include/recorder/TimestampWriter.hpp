#pragma once
#include <chrono>
#include <cstdint>
#include <fstream>
#include <string>

// 每帧一行的时间戳索引：frame_number,timestamp
// 每写一行就 flush，不在内存里攒数据
class TimestampWriter {
public:
    // 打不开文件时抛出 std::runtime_error
    explicit TimestampWriter(const std::string& filename);
    ~TimestampWriter();

    TimestampWriter(const TimestampWriter&) = delete;
    TimestampWriter& operator=(const TimestampWriter&) = delete;

    bool append(uint64_t frame_number,
                std::chrono::system_clock::time_point timestamp);
    void close();

    bool is_open() const { return out_.is_open(); }
    uint64_t rows_written() const { return rows_; }

private:
    std::string filename_;
    std::ofstream out_;
    uint64_t rows_ = 0;
};
