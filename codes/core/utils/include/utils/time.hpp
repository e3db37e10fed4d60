#pragma once

#include <cstdint>
#include <string>

namespace traffic_probe {
namespace utils {

// ========== 时间获取函数 ==========

// 获取当前时间戳（毫秒）
// return: 自Unix纪元以来的毫秒数
uint64_t get_current_time_ms();

// 获取单调时间戳（毫秒，不受系统时间修改影响）
// return: 单调递增的毫秒数
uint64_t get_monotonic_time_ms();

// ========== 时间格式化 ==========

// 格式化当前本地时间为字符串
// format: strftime格式字符串，默认 "%Y-%m-%d %H:%M:%S"
std::string format_current_time(const char* format = "%Y-%m-%d %H:%M:%S");

// 毫秒时间戳格式化为ISO-8601 UTC字符串，如 "2026-01-02T03:04:05.678Z"
std::string format_iso8601_utc(uint64_t timestamp_ms);

// 解析ISO-8601时间字符串为毫秒时间戳
// 支持 "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]"
// return: 解析成功返回true
bool parse_iso8601(const std::string& text, uint64_t* timestamp_ms);

} // namespace utils
} // namespace traffic_probe
