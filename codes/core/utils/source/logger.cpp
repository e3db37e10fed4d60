#include "utils/logger.hpp"
#include "utils/text.hpp"
#include "utils/time.hpp"
#include <cstdio>
#include <iostream>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace traffic_probe {
namespace utils {

namespace {

// 替换首个占位符
void replace_token(std::string* text, const char* token, const std::string& value) {
    std::string key(token);
    size_t pos = text->find(key);
    if (pos != std::string::npos) {
        text->replace(pos, key.size(), value);
    }
}

} // namespace

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

bool parse_log_level(const std::string& str, LogLevel* level) {
    if (level == nullptr) {
        return false;
    }
    const std::string name = to_upper(str);
    if (name == "DEBUG") { *level = LogLevel::DEBUG; return true; }
    if (name == "INFO")  { *level = LogLevel::INFO;  return true; }
    if (name == "WARN")  { *level = LogLevel::WARN;  return true; }
    if (name == "ERROR") { *level = LogLevel::ERROR; return true; }
    return false;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , console_enabled_(true)
    , console_stream_(ConsoleStream::STDOUT_SPLIT)
    , format_("[%time] [%level] [%module] %message")
{
}

Logger::~Logger() {
    shutdown();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

int Logger::init(const std::string& level, const std::string& file) {
    LogLevel parsed = LogLevel::INFO;
    parse_log_level(level, &parsed);
    return init(parsed, file);
}

int Logger::init(LogLevel level, const std::string& file) {
    std::lock_guard<std::mutex> lock(mutex_);

    close_file_locked();
    level_ = level;

    if (!file.empty()) {
        file_.open(file, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            return -1;
        }
    }
    return 0;
}

void Logger::set_level(LogLevel level) {
    level_ = level;
}

LogLevel Logger::get_level() const {
    return level_.load();
}

int Logger::set_file(const std::string& file) {
    std::lock_guard<std::mutex> lock(mutex_);

    close_file_locked();
    if (file.empty()) {
        return 0;
    }

    file_.open(file, std::ios::out | std::ios::app);
    return file_.is_open() ? 0 : -1;
}

void Logger::set_console_output(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

void Logger::set_console_stream(ConsoleStream stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_stream_ = stream;
}

void Logger::set_format(const std::string& format) {
    std::lock_guard<std::mutex> lock(mutex_);
    format_ = format;
}

bool Logger::is_level_enabled(LogLevel level) const {
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(level_.load());
}

void Logger::log(LogLevel level, const char* module, const char* fmt, ...) {
    if (!is_level_enabled(level)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    logv(level, module, fmt, args);
    va_end(args);
}

void Logger::debug(const char* module, const char* fmt, ...) {
    if (!is_level_enabled(LogLevel::DEBUG)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    logv(LogLevel::DEBUG, module, fmt, args);
    va_end(args);
}

void Logger::info(const char* module, const char* fmt, ...) {
    if (!is_level_enabled(LogLevel::INFO)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    logv(LogLevel::INFO, module, fmt, args);
    va_end(args);
}

void Logger::warn(const char* module, const char* fmt, ...) {
    if (!is_level_enabled(LogLevel::WARN)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    logv(LogLevel::WARN, module, fmt, args);
    va_end(args);
}

void Logger::error(const char* module, const char* fmt, ...) {
    if (!is_level_enabled(LogLevel::ERROR)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    logv(LogLevel::ERROR, module, fmt, args);
    va_end(args);
}

void Logger::logv(LogLevel level, const char* module, const char* fmt, va_list args) {
    char buffer[4096];
    vsnprintf(buffer, sizeof(buffer), fmt, args);

    std::lock_guard<std::mutex> lock(mutex_);
    format_and_write(level, module, buffer);
}

void Logger::format_and_write(LogLevel level, const char* module, const char* message) {
    std::string result = format_;

    replace_token(&result, "%time", format_current_time("%Y-%m-%d %H:%M:%S"));
    replace_token(&result, "%level", log_level_to_string(level));
    replace_token(&result, "%module", module ? module : "unknown");

    if (result.find("%thread") != std::string::npos) {
        std::ostringstream oss;
        oss << std::this_thread::get_id();
        replace_token(&result, "%thread", oss.str());
    }
    replace_token(&result, "%pid", std::to_string(static_cast<long>(::getpid())));

    // %message最后替换，避免消息内容中的占位符被误替换
    replace_token(&result, "%message", message);
    result += "\n";

    if (console_enabled_) {
        bool to_stderr = console_stream_ == ConsoleStream::STDERR_ONLY || level >= LogLevel::WARN;
        if (to_stderr) {
            std::cerr << result;
        } else {
            std::cout << result;
        }
    }

    if (file_.is_open()) {
        file_ << result;
        if (level >= LogLevel::WARN) {
            file_.flush();
        }
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
    std::cerr.flush();
    if (console_stream_ == ConsoleStream::STDOUT_SPLIT) {
        std::cout.flush();
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_file_locked();
}

void Logger::close_file_locked() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

} // namespace utils
} // namespace traffic_probe
