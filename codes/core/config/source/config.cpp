#include "config/config.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <sstream>

// 仅在cpp文件中包含nlohmann/json，头文件不暴露
#include <nlohmann/json.hpp>

namespace traffic_probe {
namespace config {

using Json = nlohmann::json;
using utils::ErrorCode;
using utils::Result;
using utils::make_err;
using utils::make_ok;

namespace details {

// 字段存在但类型不对时抛出type_error，由调用方统一转换为错误码
template<typename T>
void read_field(const Json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

// 解析StoreConfig
void ParseStoreConfig(const Json& j, StoreConfig& cfg) {
    read_field(j, "directory", cfg.directory);
    read_field(j, "sync_writes", cfg.sync_writes);
}

// 解析CaptureConfig
void ParseCaptureConfig(const Json& j, CaptureConfig& cfg) {
    read_field(j, "max_pending", cfg.max_pending);
    read_field(j, "pending_timeout_ms", cfg.pending_timeout_ms);
    read_field(j, "max_body_bytes", cfg.max_body_bytes);
    read_field(j, "binary_content_types", cfg.binary_content_types);
}

// 解析ServerConfig
void ParseServerConfig(const Json& j, ServerConfig& cfg) {
    read_field(j, "name", cfg.name);
    read_field(j, "version", cfg.version);
    read_field(j, "protocol_version", cfg.protocol_version);
    read_field(j, "default_list_limit", cfg.default_list_limit);
    read_field(j, "read_body_limit", cfg.read_body_limit);
}

// 解析LoggingConfig
void ParseLoggingConfig(const Json& j, LoggingConfig& cfg) {
    read_field(j, "level", cfg.level);
    read_field(j, "file", cfg.file);
    read_field(j, "console_output", cfg.console_output);
}

} // namespace details

StoreConfig::StoreConfig()
    : directory("/var/mitmproxy/traffic")
    , sync_writes(true)
{
}

CaptureConfig::CaptureConfig()
    : max_pending(4096)
    , pending_timeout_ms(300000)
    , max_body_bytes(10 * 1024 * 1024)
    , binary_content_types({"image/", "audio/", "video/", "application/octet-stream",
                            "application/pdf", "application/zip", "application/gzip"})
{
}

ServerConfig::ServerConfig()
    : name("mitmproxy-mcp")
    , version("1.0.0")
    , protocol_version("2024-11-05")
    , default_list_limit(0)
    , read_body_limit(50000)
{
}

LoggingConfig::LoggingConfig()
    : level("INFO")
    , console_output(true)
{
}

Config::Config() {
    reset();
}

Config::~Config() {
}

Result<void> Config::load_from_file(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return make_err(ErrorCode::FILE_NOT_FOUND, "Cannot open config file: " + config_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

Result<void> Config::load_from_string(const std::string& json_str) {
    try {
        Json j = Json::parse(json_str);
        if (!j.is_object()) {
            return make_err(ErrorCode::CONFIG_PARSE_ERROR, "Config root must be a JSON object");
        }

        // 先解析到副本，全部成功后再提交，避免半更新
        StoreConfig store = store_;
        CaptureConfig capture = capture_;
        ServerConfig server = server_;
        LoggingConfig logging = logging_;

        if (j.contains("store") && j["store"].is_object()) {
            details::ParseStoreConfig(j["store"], store);
        }
        if (j.contains("capture") && j["capture"].is_object()) {
            details::ParseCaptureConfig(j["capture"], capture);
        }
        if (j.contains("server") && j["server"].is_object()) {
            details::ParseServerConfig(j["server"], server);
        }
        if (j.contains("logging") && j["logging"].is_object()) {
            details::ParseLoggingConfig(j["logging"], logging);
        }

        store_ = store;
        capture_ = capture;
        server_ = server;
        logging_ = logging;
        return make_ok();
    } catch (const Json::parse_error& e) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, std::string("JSON parse error: ") + e.what());
    } catch (const Json::type_error& e) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, std::string("JSON type error: ") + e.what());
    } catch (const Json::out_of_range& e) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, std::string("JSON value out of range: ") + e.what());
    }
}

Result<void> Config::validate() const {
    if (store_.directory.empty()) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "store.directory must not be empty");
    }

    if (capture_.max_pending == 0) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "capture.max_pending must be positive");
    }

    utils::LogLevel level;
    if (!utils::parse_log_level(logging_.level, &level)) {
        return make_err(ErrorCode::CONFIG_INVALID_LOG_LEVEL, "Invalid log level: " + logging_.level);
    }

    return make_ok();
}

Result<std::string> Config::to_json_string() const {
    Json j;
    j["store"]["directory"] = store_.directory;
    j["store"]["sync_writes"] = store_.sync_writes;

    j["capture"]["max_pending"] = capture_.max_pending;
    j["capture"]["pending_timeout_ms"] = capture_.pending_timeout_ms;
    j["capture"]["max_body_bytes"] = capture_.max_body_bytes;
    j["capture"]["binary_content_types"] = capture_.binary_content_types;

    j["server"]["name"] = server_.name;
    j["server"]["version"] = server_.version;
    j["server"]["protocol_version"] = server_.protocol_version;
    j["server"]["default_list_limit"] = server_.default_list_limit;
    j["server"]["read_body_limit"] = server_.read_body_limit;

    j["logging"]["level"] = logging_.level;
    j["logging"]["file"] = logging_.file;
    j["logging"]["console_output"] = logging_.console_output;

    try {
        return make_ok(j.dump(4));
    } catch (const Json::type_error& e) {
        return make_err<std::string>(ErrorCode::OPERATION_FAILED,
                                     std::string("Failed to serialize config: ") + e.what());
    }
}

void Config::reset() {
    store_ = StoreConfig();
    capture_ = CaptureConfig();
    server_ = ServerConfig();
    logging_ = LoggingConfig();
}

} // namespace config
} // namespace traffic_probe
