// Config模块单元测试

#include <gtest/gtest.h>
#include "config/config.hpp"
#include <fstream>
#include <cstdio>
#include <unistd.h>

namespace traffic_probe {
namespace config {

using utils::ErrorCode;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.reset();
    }

    void TearDown() override {
        if (!temp_file_.empty()) {
            std::remove(temp_file_.c_str());
        }
    }

    std::string write_temp_file(const std::string& content) {
        char path[] = "/tmp/traffic_probe_config_XXXXXX";
        int fd = ::mkstemp(path);
        if (fd < 0) {
            return std::string();
        }
        ::close(fd);
        temp_file_ = path;
        std::ofstream out(temp_file_);
        out << content;
        return temp_file_;
    }

    Config config_;
    std::string temp_file_;
};

// 测试用例: 默认值
TEST_F(ConfigTest, Defaults) {
    EXPECT_EQ(config_.get_store().directory, "/var/mitmproxy/traffic");
    EXPECT_TRUE(config_.get_store().sync_writes);

    EXPECT_EQ(config_.get_capture().max_pending, 4096u);
    EXPECT_EQ(config_.get_capture().pending_timeout_ms, 300000u);
    EXPECT_EQ(config_.get_capture().max_body_bytes, 10u * 1024u * 1024u);
    EXPECT_FALSE(config_.get_capture().binary_content_types.empty());

    EXPECT_EQ(config_.get_server().name, "mitmproxy-mcp");
    EXPECT_EQ(config_.get_server().version, "1.0.0");
    EXPECT_EQ(config_.get_server().protocol_version, "2024-11-05");
    EXPECT_EQ(config_.get_server().default_list_limit, 0u);
    EXPECT_EQ(config_.get_server().read_body_limit, 50000u);

    EXPECT_EQ(config_.get_logging().level, "INFO");
    EXPECT_TRUE(config_.get_logging().console_output);

    EXPECT_TRUE(config_.validate().is_ok());
}

// 测试用例: 加载完整JSON配置字符串
TEST_F(ConfigTest, LoadFromFullJsonString) {
    const std::string json_str = R"({
        "store": {"directory": "/tmp/capture", "sync_writes": false},
        "capture": {
            "max_pending": 16,
            "pending_timeout_ms": 1000,
            "max_body_bytes": 2048,
            "binary_content_types": ["image/", "font/"]
        },
        "server": {
            "name": "probe",
            "version": "2.0.0",
            "protocol_version": "2025-03-26",
            "default_list_limit": 50,
            "read_body_limit": 100
        },
        "logging": {"level": "DEBUG", "file": "probe.log", "console_output": false}
    })";

    ASSERT_TRUE(config_.load_from_string(json_str).is_ok());

    EXPECT_EQ(config_.get_store().directory, "/tmp/capture");
    EXPECT_FALSE(config_.get_store().sync_writes);

    const auto& capture = config_.get_capture();
    EXPECT_EQ(capture.max_pending, 16u);
    EXPECT_EQ(capture.pending_timeout_ms, 1000u);
    EXPECT_EQ(capture.max_body_bytes, 2048u);
    ASSERT_EQ(capture.binary_content_types.size(), 2u);
    EXPECT_EQ(capture.binary_content_types[1], "font/");

    const auto& server = config_.get_server();
    EXPECT_EQ(server.name, "probe");
    EXPECT_EQ(server.version, "2.0.0");
    EXPECT_EQ(server.protocol_version, "2025-03-26");
    EXPECT_EQ(server.default_list_limit, 50u);
    EXPECT_EQ(server.read_body_limit, 100u);

    EXPECT_EQ(config_.get_logging().level, "DEBUG");
    EXPECT_EQ(config_.get_logging().file, "probe.log");
    EXPECT_FALSE(config_.get_logging().console_output);
}

// 测试用例: 部分配置，其余保持默认
TEST_F(ConfigTest, PartialConfigKeepsDefaults) {
    ASSERT_TRUE(config_.load_from_string(R"({"store": {"directory": "/data/traffic"}})").is_ok());
    EXPECT_EQ(config_.get_store().directory, "/data/traffic");
    EXPECT_TRUE(config_.get_store().sync_writes);
    EXPECT_EQ(config_.get_capture().max_pending, 4096u);
    EXPECT_EQ(config_.get_server().name, "mitmproxy-mcp");
}

// 测试用例: 非法JSON
TEST_F(ConfigTest, InvalidJson) {
    auto ret = config_.load_from_string("{ not json");
    EXPECT_TRUE(ret.is_err());
    EXPECT_EQ(ret.error_code(), ErrorCode::CONFIG_PARSE_ERROR);

    auto array_root = config_.load_from_string("[1, 2, 3]");
    EXPECT_EQ(array_root.error_code(), ErrorCode::CONFIG_PARSE_ERROR);
}

// 测试用例: 类型错误不修改已有配置
TEST_F(ConfigTest, TypeErrorLeavesConfigUntouched) {
    auto ret = config_.load_from_string(R"({
        "store": {"directory": "/changed"},
        "capture": {"max_pending": "many"}
    })");
    EXPECT_TRUE(ret.is_err());
    EXPECT_EQ(ret.error_code(), ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_EQ(config_.get_store().directory, "/var/mitmproxy/traffic");
}

// 测试用例: 校验
TEST_F(ConfigTest, ValidateRejectsBadValues) {
    StoreConfig store;
    store.directory = "";
    config_.set_store(store);
    EXPECT_EQ(config_.validate().error_code(), ErrorCode::CONFIG_INVALID_VALUE);

    config_.reset();
    CaptureConfig capture;
    capture.max_pending = 0;
    config_.set_capture(capture);
    EXPECT_EQ(config_.validate().error_code(), ErrorCode::CONFIG_INVALID_VALUE);

    config_.reset();
    LoggingConfig logging;
    logging.level = "VERBOSE";
    config_.set_logging(logging);
    EXPECT_EQ(config_.validate().error_code(), ErrorCode::CONFIG_INVALID_LOG_LEVEL);
}

// 测试用例: 文件加载
TEST_F(ConfigTest, LoadFromFile) {
    std::string path = write_temp_file(R"({"server": {"read_body_limit": 10}})");
    ASSERT_FALSE(path.empty());
    ASSERT_TRUE(config_.load_from_file(path).is_ok());
    EXPECT_EQ(config_.get_server().read_body_limit, 10u);
}

TEST_F(ConfigTest, LoadFromMissingFile) {
    auto ret = config_.load_from_file("/nonexistent/traffic_probe.json");
    EXPECT_TRUE(ret.is_err());
    EXPECT_EQ(ret.error_code(), ErrorCode::FILE_NOT_FOUND);
}

// 测试用例: 导出后重新加载
TEST_F(ConfigTest, ToJsonStringReloads) {
    CaptureConfig capture;
    capture.max_pending = 7;
    config_.set_capture(capture);

    auto json = config_.to_json_string();
    ASSERT_TRUE(json.is_ok());

    Config reloaded;
    ASSERT_TRUE(reloaded.load_from_string(json.value()).is_ok());
    EXPECT_EQ(reloaded.get_capture().max_pending, 7u);
    EXPECT_EQ(reloaded.get_store().directory, config_.get_store().directory);
}

} // namespace config
} // namespace traffic_probe
