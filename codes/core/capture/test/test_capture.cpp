// =============================================================================
//  Traffic Probe - Capture Module
//  文件: test_capture.cpp
//  描述: 抓包钩子单元测试
//  版权: Copyright (c) 2026
// =============================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include <unistd.h>
#include "capture/capture_hook.h"
#include "capture/capture_hook.hpp"
#include "store/capture_store.hpp"
#include "utils/logger.hpp"
#include "utils/text.hpp"
#include "utils/time.hpp"
#include "test/test_helpers.hpp"

namespace traffic_probe {
namespace capture {

using record::BodyEncoding;
using record::HttpHeaders;
using record::Record;
using utils::ErrorCode;

// 内存中的写入端，便于检查钩子产出的记录
class MemorySink : public store::RecordSink {
public:
    MemorySink() : fail_(false), throw_(false), next_id_(0) {}

    utils::Result<uint64_t> append(const Record& rec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (throw_) {
            throw std::runtime_error("disk on fire");
        }
        if (fail_) {
            return utils::make_err<uint64_t>(ErrorCode::STORE_UNAVAILABLE, "disk full");
        }
        records_.push_back(rec);
        records_.back().id = ++next_id_;
        return utils::make_ok(next_id_);
    }

    std::vector<Record> records() {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    void set_fail(bool fail) { fail_ = fail; }
    void set_throw(bool value) { throw_ = value; }

private:
    std::mutex mutex_;
    std::vector<Record> records_;
    bool fail_;
    bool throw_;
    uint64_t next_id_;
};

class CaptureHookTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().set_level(utils::LogLevel::ERROR);
        config_.max_pending = 8;
        config_.pending_timeout_ms = 1000;
        config_.max_body_bytes = 64;
        hook_ = std::make_unique<CaptureHook>(sink_, config_);
    }

    void TearDown() override {
        hook_.reset();
        utils::Logger::instance().set_level(utils::LogLevel::INFO);
    }

    HttpHeaders headers(const std::string& content_type) {
        HttpHeaders h;
        h["Content-Type"] = content_type;
        return h;
    }

    MemorySink sink_;
    config::CaptureConfig config_;
    std::unique_ptr<CaptureHook> hook_;
};

TEST_F(CaptureHookTest, RequestResponseProducesRecord) {
    hook_->on_request("flow-1", "post", "https://API.example.com/login?x=1",
                      headers("application/json"), "{\"user\":\"alice\"}");
    EXPECT_EQ(hook_->pending_count(), 1u);
    EXPECT_TRUE(sink_.records().empty());

    hook_->on_response("flow-1", 200, "OK", headers("text/plain"), "welcome", 42);
    EXPECT_EQ(hook_->pending_count(), 0u);

    auto records = sink_.records();
    ASSERT_EQ(records.size(), 1u);
    const Record& rec = records[0];
    EXPECT_EQ(rec.method, "POST");
    EXPECT_EQ(rec.url, "https://API.example.com/login?x=1");
    EXPECT_EQ(rec.scheme, "https");
    EXPECT_EQ(rec.host, "api.example.com");
    EXPECT_EQ(rec.port, 443);
    EXPECT_EQ(rec.path, "/login?x=1");
    EXPECT_EQ(rec.request_body.data, "{\"user\":\"alice\"}");
    EXPECT_EQ(rec.request_body.encoding, BodyEncoding::TEXT);
    EXPECT_TRUE(rec.has_status);
    EXPECT_EQ(rec.status, 200);
    EXPECT_EQ(rec.reason, "OK");
    EXPECT_EQ(rec.response_body.data, "welcome");
    EXPECT_TRUE(rec.has_duration);
    EXPECT_EQ(rec.duration_ms, 42u);
    EXPECT_GT(rec.timestamp_ms, 0u);

    EXPECT_EQ(hook_->stats().captured, 1u);
}

TEST_F(CaptureHookTest, DurationMeasuredWhenEngineOmitsIt) {
    hook_->on_request("flow-1", "GET", "http://example.com/", HttpHeaders(), "");
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    hook_->on_response("flow-1", 204, "No Content", HttpHeaders(), "", -1);

    auto records = sink_.records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0].has_duration);
    EXPECT_GE(records[0].duration_ms, 19u);
}

TEST_F(CaptureHookTest, InterleavedFlowsAreCorrelated) {
    hook_->on_request("a", "GET", "http://example.com/a", HttpHeaders(), "");
    hook_->on_request("b", "GET", "http://example.com/b", HttpHeaders(), "");
    hook_->on_response("b", 404, "Not Found", HttpHeaders(), "", 1);
    hook_->on_response("a", 200, "OK", HttpHeaders(), "", 2);

    auto records = sink_.records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].path, "/b");
    EXPECT_EQ(records[0].status, 404);
    EXPECT_EQ(records[1].path, "/a");
    EXPECT_EQ(records[1].status, 200);
}

TEST_F(CaptureHookTest, ErrorProducesPartialRecord) {
    hook_->on_request("flow-1", "GET", "http://down.example.com/", HttpHeaders(), "");
    hook_->on_error("flow-1", "connection refused");

    auto records = sink_.records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0].is_partial());
    EXPECT_FALSE(records[0].has_duration);
    EXPECT_EQ(records[0].error, "connection refused");
    EXPECT_EQ(hook_->stats().partial, 1u);
    EXPECT_EQ(hook_->pending_count(), 0u);
}

TEST_F(CaptureHookTest, OrphanResponseIsIgnored) {
    hook_->on_response("ghost", 200, "OK", HttpHeaders(), "", 5);
    hook_->on_error("ghost", "reset");

    EXPECT_TRUE(sink_.records().empty());
    EXPECT_EQ(hook_->stats().orphan_responses, 2u);
}

TEST_F(CaptureHookTest, DuplicateRequestReplacesStash) {
    hook_->on_request("flow-1", "GET", "http://example.com/old", HttpHeaders(), "");
    hook_->on_request("flow-1", "GET", "http://example.com/new", HttpHeaders(), "");
    EXPECT_EQ(hook_->pending_count(), 1u);

    hook_->on_response("flow-1", 200, "OK", HttpHeaders(), "", 1);
    auto records = sink_.records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].path, "/new");
}

TEST_F(CaptureHookTest, BinaryBodiesAreBase64) {
    std::string png("\x89PNG\r\n\x1a\n", 8);
    hook_->on_request("flow-1", "GET", "http://example.com/logo.png", HttpHeaders(), "");
    hook_->on_response("flow-1", 200, "OK", headers("image/png"), png, 1);

    auto records = sink_.records();
    ASSERT_EQ(records.size(), 1u);
    const record::Body& body = records[0].response_body;
    EXPECT_EQ(body.encoding, BodyEncoding::BASE64);
    EXPECT_EQ(body.size, 8u);
    auto decoded = utils::base64_decode(body.data);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), png);
}

TEST_F(CaptureHookTest, NonUtf8BodyWithoutContentTypeIsBase64) {
    std::string raw("\xFF\xFE\x00\x01", 4);
    hook_->on_request("flow-1", "PUT", "http://example.com/blob", HttpHeaders(), raw);
    hook_->on_response("flow-1", 200, "OK", HttpHeaders(), "", 1);

    auto records = sink_.records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].request_body.encoding, BodyEncoding::BASE64);
}

TEST_F(CaptureHookTest, LargeBodiesAreTruncated) {
    std::string big(200, 'x');
    hook_->on_request("flow-1", "POST", "http://example.com/upload", headers("text/plain"), big);
    hook_->on_response("flow-1", 200, "OK", HttpHeaders(), "", 1);

    auto records = sink_.records();
    ASSERT_EQ(records.size(), 1u);
    const record::Body& body = records[0].request_body;
    EXPECT_TRUE(body.truncated);
    EXPECT_EQ(body.size, 200u);
    EXPECT_EQ(body.data.size(), 64u);
    EXPECT_EQ(body.encoding, BodyEncoding::TEXT);
}

TEST_F(CaptureHookTest, SweepExpiredFlushesPartialRecords) {
    hook_->on_request("flow-1", "GET", "http://example.com/slow", HttpHeaders(), "");
    uint64_t now = utils::get_monotonic_time_ms();

    EXPECT_EQ(hook_->sweep_expired(now), 0u);
    EXPECT_EQ(hook_->sweep_expired(now + 5000), 1u);

    auto records = sink_.records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0].is_partial());
    EXPECT_EQ(records[0].error, "capture timeout");
    EXPECT_EQ(hook_->stats().evicted, 1u);

    // 超时后到达的响应视为孤立响应
    hook_->on_response("flow-1", 200, "OK", HttpHeaders(), "", 1);
    EXPECT_EQ(sink_.records().size(), 1u);
    EXPECT_EQ(hook_->stats().orphan_responses, 1u);
}

TEST_F(CaptureHookTest, OverflowEvictsOldest) {
    for (int i = 0; i < 8; ++i) {
        hook_->on_request("flow-" + std::to_string(i), "GET",
                          "http://example.com/" + std::to_string(i), HttpHeaders(), "");
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    hook_->on_request("flow-8", "GET", "http://example.com/8", HttpHeaders(), "");

    EXPECT_EQ(hook_->pending_count(), 8u);
    auto records = sink_.records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].path, "/0");
    EXPECT_TRUE(records[0].is_partial());
}

TEST_F(CaptureHookTest, FlushPendingOnShutdown) {
    hook_->on_request("a", "GET", "http://example.com/a", HttpHeaders(), "");
    hook_->on_request("b", "GET", "http://example.com/b", HttpHeaders(), "");

    EXPECT_EQ(hook_->flush_pending("proxy shutdown"), 2u);
    EXPECT_EQ(hook_->pending_count(), 0u);

    auto records = sink_.records();
    ASSERT_EQ(records.size(), 2u);
    for (const Record& rec : records) {
        EXPECT_TRUE(rec.is_partial());
        EXPECT_EQ(rec.error, "proxy shutdown");
    }
}

TEST_F(CaptureHookTest, StoreFailureIsSwallowed) {
    sink_.set_fail(true);
    hook_->on_request("flow-1", "GET", "http://example.com/", HttpHeaders(), "");
    EXPECT_NO_THROW(hook_->on_response("flow-1", 200, "OK", HttpHeaders(), "", 1));
    EXPECT_EQ(hook_->stats().store_failures, 1u);
    EXPECT_EQ(hook_->stats().captured, 0u);

    sink_.set_fail(false);
    sink_.set_throw(true);
    hook_->on_request("flow-2", "GET", "http://example.com/", HttpHeaders(), "");
    EXPECT_NO_THROW(hook_->on_response("flow-2", 200, "OK", HttpHeaders(), "", 1));
    EXPECT_EQ(hook_->stats().store_failures, 2u);
}

TEST_F(CaptureHookTest, ConcurrentFlows) {
    const int kThreads = 4;
    const int kFlows = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < kFlows; ++i) {
                std::string key = std::to_string(t) + "-" + std::to_string(i);
                hook_->on_request(key, "GET", "http://example.com/" + key, HttpHeaders(), "");
                hook_->on_response(key, 200, "OK", HttpHeaders(), "", 1);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(sink_.records().size(), static_cast<size_t>(kThreads * kFlows));
    EXPECT_EQ(hook_->pending_count(), 0u);
}

// =============================================================================
// C接口
// =============================================================================

class CaptureApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().set_level(utils::LogLevel::ERROR);
        dir_ = test::make_temp_dir("traffic_capture_api");
        ASSERT_FALSE(dir_.empty());
    }

    void TearDown() override {
        test::remove_dir(dir_);
        utils::Logger::instance().set_level(utils::LogLevel::INFO);
    }

    std::string dir_;
};

TEST_F(CaptureApiTest, InvalidParams) {
    EXPECT_EQ(traffic_capture_create(nullptr, nullptr), nullptr);
    EXPECT_EQ(traffic_capture_create("", nullptr), nullptr);
    EXPECT_EQ(traffic_capture_create(dir_.c_str(), "/nonexistent/config.json"), nullptr);

    EXPECT_EQ(traffic_capture_on_request(nullptr, "k", "GET", "http://x/", nullptr, 0, nullptr, 0),
              CAPTURE_ERR_INVALID_PARAM);
    EXPECT_EQ(traffic_capture_on_error(nullptr, "k", "x"), CAPTURE_ERR_INVALID_PARAM);
    EXPECT_EQ(traffic_capture_sweep(nullptr), CAPTURE_ERR_INVALID_PARAM);
    traffic_capture_destroy(nullptr);
}

TEST_F(CaptureApiTest, CapturesIntoStore) {
    TrafficCapture* capture = traffic_capture_create(dir_.c_str(), nullptr);
    ASSERT_NE(capture, nullptr);

    CaptureHeader req_headers[] = {{"Host", "example.com"}, {"Accept", nullptr}};
    const char* body = "ping";
    ASSERT_EQ(traffic_capture_on_request(capture, "f1", "GET", "http://example.com/ping",
                                         req_headers, 2,
                                         reinterpret_cast<const uint8_t*>(body), 4),
              CAPTURE_SUCCESS);
    // headers为NULL但数量非0
    EXPECT_EQ(traffic_capture_on_request(capture, "f2", "GET", "http://example.com/",
                                         nullptr, 1, nullptr, 0),
              CAPTURE_ERR_INVALID_PARAM);

    CaptureHeader resp_headers[] = {{"Content-Type", "text/plain"}};
    const char* reply = "pong";
    ASSERT_EQ(traffic_capture_on_response(capture, "f1", 200, "OK", resp_headers, 1,
                                          reinterpret_cast<const uint8_t*>(reply), 4, 3),
              CAPTURE_SUCCESS);

    ASSERT_EQ(traffic_capture_on_request(capture, "f3", "GET", "http://example.com/pending",
                                         nullptr, 0, nullptr, 0),
              CAPTURE_SUCCESS);
    EXPECT_EQ(traffic_capture_sweep(capture), 0);
    traffic_capture_destroy(capture);

    store::CaptureStore store(dir_, false);
    auto snapshot = store.snapshot();
    ASSERT_TRUE(snapshot.is_ok());
    ASSERT_EQ(snapshot.value().size(), 2u);

    const Record& done = snapshot.value()[0];
    EXPECT_EQ(done.status, 200);
    EXPECT_EQ(done.request_body.data, "ping");
    EXPECT_EQ(done.response_body.data, "pong");
    EXPECT_EQ(done.request_headers.at("Accept"), "");
    EXPECT_EQ(done.duration_ms, 3u);

    // 关闭时未完成的请求写为不完整记录
    const Record& pending = snapshot.value()[1];
    EXPECT_TRUE(pending.is_partial());
    EXPECT_EQ(pending.path, "/pending");
    EXPECT_EQ(pending.error, "proxy shutdown");
}

TEST_F(CaptureApiTest, ConfigFileDrivesLoggingAndSweep) {
    std::string config_path = dir_ + "/capture.json";
    std::string log_path = dir_ + "/capture.log";
    {
        std::ofstream out(config_path);
        out << "{\"capture\": {\"pending_timeout_ms\": 1},"
            << " \"logging\": {\"level\": \"warn\", \"file\": \"" << log_path << "\","
            << " \"console_output\": false}}";
    }
    std::string store_dir = dir_ + "/traffic";

    TrafficCapture* capture = traffic_capture_create(store_dir.c_str(), config_path.c_str());
    ASSERT_NE(capture, nullptr);
    EXPECT_EQ(utils::Logger::instance().get_level(), utils::LogLevel::WARN);
    EXPECT_EQ(::access(log_path.c_str(), F_OK), 0);

    ASSERT_EQ(traffic_capture_on_request(capture, "slow", "GET", "http://example.com/slow",
                                         nullptr, 0, nullptr, 0),
              CAPTURE_SUCCESS);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_EQ(traffic_capture_sweep(capture), 1);
    traffic_capture_destroy(capture);

    store::CaptureStore store(store_dir, false);
    auto snapshot = store.snapshot();
    ASSERT_TRUE(snapshot.is_ok());
    ASSERT_EQ(snapshot.value().size(), 1u);
    EXPECT_EQ(snapshot.value()[0].error, "capture timeout");

    // 超时请求以WARN记录到配置的日志文件
    std::ifstream log_in(log_path);
    std::string log_text((std::istreambuf_iterator<char>(log_in)), std::istreambuf_iterator<char>());
    EXPECT_NE(log_text.find("timed out"), std::string::npos);

    utils::Logger::instance().init(utils::LogLevel::ERROR);
    utils::Logger::instance().set_console_output(true);
}

TEST_F(CaptureApiTest, InvalidConfigIsRejected) {
    std::string config_path = dir_ + "/bad.json";
    {
        std::ofstream out(config_path);
        out << "{\"logging\": {\"level\": \"LOUD\"}}";
    }
    EXPECT_EQ(traffic_capture_create(dir_.c_str(), config_path.c_str()), nullptr);
}

} // namespace capture
} // namespace traffic_probe
