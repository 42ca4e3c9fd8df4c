#include "recorder/TimestampWriter.hpp"

#include <iostream>
#include <stdexcept>

#include "util/TimeFormat.hpp"

TimestampWriter::TimestampWriter(const std::string& filename)
    : filename_(filename) {
    out_.open(filename_, std::ios::out | std::ios::trunc);
    if (!out_.is_open()) {
        throw std::runtime_error("Failed to open timestamp file: " + filename_);
    }
    out_ << "frame_number,timestamp\n";
    out_.flush();
    if (!out_) {
        throw std::runtime_error("Failed to write timestamp header: " +
                                 filename_);
    }
}

TimestampWriter::~TimestampWriter() {
    close();
}

bool TimestampWriter::append(uint64_t frame_number,
                             std::chrono::system_clock::time_point timestamp) {
    if (!out_.is_open()) return false;
    out_ << frame_number << ',' << format_iso_timestamp(timestamp) << '\n';
    out_.flush();
    if (!out_) {
        std::cerr << "[TimestampWriter] 写入失败: " << filename_ << std::endl;
        return false;
    }
    ++rows_;
    return true;
}

void TimestampWriter::close() {
    if (out_.is_open()) {
        out_.close();
    }
}
