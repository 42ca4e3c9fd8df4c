#include "util/TimeFormat.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

std::tm to_local_tm(std::time_t t) {
    std::tm tm{};
    // std::localtime 不可重入，控制线程和 UI 线程都会调用
    localtime_r(&t, &tm);
    return tm;
}

}  // namespace

std::string format_file_stamp(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    const std::tm tm = to_local_tm(t);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::string format_iso_timestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    // to_time_t 可能四舍五入，先截断到整秒
    const auto secs = time_point_cast<seconds>(tp);
    auto micros = duration_cast<microseconds>(tp - secs).count();
    std::time_t t = system_clock::to_time_t(secs);
    if (micros < 0) {  // 1970 年以前的时间点
        micros += 1000000;
        --t;
    }
    const std::tm tm = to_local_tm(t);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(6) << micros;
    return oss.str();
}
