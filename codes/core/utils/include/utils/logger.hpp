#pragma once

#include <cstdint>
#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstdarg>

namespace traffic_probe {
namespace utils {

// 日志级别枚举
enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// 控制台输出通道
// STDOUT_SPLIT: DEBUG/INFO写stdout，WARN/ERROR写stderr
// STDERR_ONLY: 全部写stderr（stdout承载协议数据时使用）
enum class ConsoleStream : uint8_t {
    STDOUT_SPLIT = 0,
    STDERR_ONLY = 1
};

// 日志级别转字符串
const char* log_level_to_string(LogLevel level);

// 字符串转日志级别，无法识别时返回false
bool parse_log_level(const std::string& str, LogLevel* level);

class Logger {
public:
    // 获取单例
    static Logger& instance();

    // ========== 初始化与配置 ==========

    // 初始化日志系统
    // level: 日志级别字符串（DEBUG/INFO/WARN/ERROR），无法识别时按INFO处理
    // file: 日志文件路径，为空则只输出到控制台
    // return: 0-成功，-1-打开文件失败
    int init(const std::string& level, const std::string& file = "");

    int init(LogLevel level, const std::string& file = "");

    void set_level(LogLevel level);
    LogLevel get_level() const;

    // 设置日志文件
    // file: 文件路径，为空关闭文件输出
    // return: 0-成功
    int set_file(const std::string& file);

    // 启用/禁用控制台输出
    void set_console_output(bool enabled);

    // 设置控制台输出通道
    void set_console_stream(ConsoleStream stream);

    // 设置日志格式
    // format: 格式字符串，支持以下占位符:
    //   %time - 时间
    //   %level - 日志级别
    //   %module - 模块名
    //   %message - 日志消息
    //   %thread - 线程ID
    //   %pid - 进程ID
    // 默认格式: "[%time] [%level] [%module] %message"
    void set_format(const std::string& format);

    // ========== 日志输出 ==========

    void log(LogLevel level, const char* module, const char* fmt, ...);

    void debug(const char* module, const char* fmt, ...);
    void info(const char* module, const char* fmt, ...);
    void warn(const char* module, const char* fmt, ...);
    void error(const char* module, const char* fmt, ...);

    bool is_level_enabled(LogLevel level) const;

    // ========== 刷新与关闭 ==========

    void flush();
    void shutdown();

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void logv(LogLevel level, const char* module, const char* fmt, va_list args);
    void format_and_write(LogLevel level, const char* module, const char* message);
    void close_file_locked();

    std::atomic<LogLevel> level_;
    std::mutex mutex_;
    std::ofstream file_;
    bool console_enabled_;
    ConsoleStream console_stream_;
    std::string format_;
};

} // namespace utils
} // namespace traffic_probe

// ========== 便捷宏 ==========

#define LOG_DEBUG(module, fmt, ...) \
    do { \
        auto& logger = ::traffic_probe::utils::Logger::instance(); \
        if (logger.is_level_enabled(::traffic_probe::utils::LogLevel::DEBUG)) { \
            logger.debug(module, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(module, fmt, ...) \
    do { \
        auto& logger = ::traffic_probe::utils::Logger::instance(); \
        if (logger.is_level_enabled(::traffic_probe::utils::LogLevel::INFO)) { \
            logger.info(module, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_WARN(module, fmt, ...) \
    do { \
        auto& logger = ::traffic_probe::utils::Logger::instance(); \
        if (logger.is_level_enabled(::traffic_probe::utils::LogLevel::WARN)) { \
            logger.warn(module, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(module, fmt, ...) \
    do { \
        auto& logger = ::traffic_probe::utils::Logger::instance(); \
        if (logger.is_level_enabled(::traffic_probe::utils::LogLevel::ERROR)) { \
            logger.error(module, fmt, ##__VA_ARGS__); \
        } \
    } while(0)
