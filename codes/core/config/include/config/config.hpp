#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "utils/error.hpp"

namespace traffic_probe {
namespace config {

// 存储配置
struct StoreConfig {
    std::string directory;
    bool sync_writes;

    StoreConfig();
};

// 抓包配置
struct CaptureConfig {
    uint32_t max_pending;
    uint64_t pending_timeout_ms;
    uint64_t max_body_bytes;
    std::vector<std::string> binary_content_types;

    CaptureConfig();
};

// 工具服务配置
struct ServerConfig {
    std::string name;
    std::string version;
    std::string protocol_version;
    uint32_t default_list_limit;
    uint32_t read_body_limit;

    ServerConfig();
};

// 日志配置
struct LoggingConfig {
    std::string level;
    std::string file;
    bool console_output;

    LoggingConfig();
};

// 主配置类
// 注意：头文件不包含nlohmann/json.hpp，JSON解析只在config.cpp中完成
class Config {
public:
    Config();
    ~Config();

    // 从JSON文件加载配置，未出现的字段保持默认值
    utils::Result<void> load_from_file(const std::string& config_path);

    // 从JSON字符串加载配置
    utils::Result<void> load_from_string(const std::string& json_str);

    // 验证配置
    utils::Result<void> validate() const;

    // 导出为JSON字符串
    utils::Result<std::string> to_json_string() const;

    const StoreConfig& get_store() const { return store_; }
    const CaptureConfig& get_capture() const { return capture_; }
    const ServerConfig& get_server() const { return server_; }
    const LoggingConfig& get_logging() const { return logging_; }

    void set_store(const StoreConfig& store) { store_ = store; }
    void set_capture(const CaptureConfig& capture) { capture_ = capture; }
    void set_server(const ServerConfig& server) { server_ = server; }
    void set_logging(const LoggingConfig& logging) { logging_ = logging; }

    // 重置为默认配置
    void reset();

private:
    StoreConfig store_;
    CaptureConfig capture_;
    ServerConfig server_;
    LoggingConfig logging_;
};

} // namespace config
} // namespace traffic_probe
