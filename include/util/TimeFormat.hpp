#pragma once
#include <chrono>
#include <string>

// 本地时间，精确到秒，用作文件名，例如 20250816_143210
std::string format_file_stamp(std::chrono::system_clock::time_point tp);

// 本地时间 ISO-8601，固定 6 位微秒，例如 2025-08-16T14:32:10.012345
// 位数固定，所以按字符串排序即按时间排序
std::string format_iso_timestamp(std::chrono::system_clock::time_point tp);
