// =============================================================================
//  Traffic Probe - Capture Module
//  文件: capture_hook_c.cpp
//  描述: 抓包钩子C接口Wrapper
//  版权: Copyright (c) 2026
// =============================================================================
#include "capture/capture_hook.h"
#include "capture/capture_hook.hpp"
#include "config/config.hpp"
#include "store/capture_store.hpp"
#include "utils/logger.hpp"
#include <exception>
#include <memory>
#include <new>

using traffic_probe::capture::CaptureHook;
using traffic_probe::config::Config;
using traffic_probe::config::LoggingConfig;
using traffic_probe::record::HttpHeaders;
using traffic_probe::store::CaptureStore;
using traffic_probe::utils::Logger;

// 钩子实例：存储与钩子同生命周期
struct TrafficCapture {
    std::unique_ptr<CaptureStore> store;
    std::unique_ptr<CaptureHook> hook;
};

namespace {

const char* const MODULE = "CaptureAPI";

HttpHeaders to_headers(const CaptureHeader* headers, uint32_t count) {
    HttpHeaders result;
    for (uint32_t i = 0; i < count; ++i) {
        if (headers[i].name == nullptr) {
            continue;
        }
        result[headers[i].name] = headers[i].value != nullptr ? headers[i].value : "";
    }
    return result;
}

bool validate_payload(const CaptureHeader* headers, uint32_t header_count,
                      const uint8_t* body, uint32_t body_len) {
    if (header_count > 0 && headers == nullptr) {
        return false;
    }
    if (body_len > 0 && body == nullptr) {
        return false;
    }
    return true;
}

std::string to_body(const uint8_t* body, uint32_t body_len) {
    if (body_len == 0) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(body), body_len);
}

} // namespace

extern "C" {

TrafficCapture* traffic_capture_create(const char* store_dir, const char* config_path) {
    if (store_dir == nullptr || store_dir[0] == '\0') {
        return nullptr;
    }

    try {
        Config config;
        if (config_path != nullptr && config_path[0] != '\0') {
            auto load_ret = config.load_from_file(config_path);
            if (load_ret.is_err()) {
                LOG_ERROR(MODULE, "cannot load config %s: %s", config_path,
                          load_ret.error_message().c_str());
                return nullptr;
            }
            auto validate_ret = config.validate();
            if (validate_ret.is_err()) {
                LOG_ERROR(MODULE, "invalid config %s: %s", config_path,
                          validate_ret.error_message().c_str());
                return nullptr;
            }

            // 显式给出配置文件时，日志按配置初始化
            const LoggingConfig& logging = config.get_logging();
            Logger& logger = Logger::instance();
            if (logger.init(logging.level, logging.file) != 0) {
                LOG_ERROR(MODULE, "cannot open log file %s", logging.file.c_str());
                return nullptr;
            }
            logger.set_console_output(logging.console_output);
        }

        auto capture = std::make_unique<TrafficCapture>();
        capture->store = std::make_unique<CaptureStore>(store_dir, config.get_store().sync_writes);
        auto open_ret = capture->store->open();
        if (open_ret.is_err()) {
            LOG_ERROR(MODULE, "cannot open store %s: %s", store_dir,
                      open_ret.error_message().c_str());
            return nullptr;
        }
        capture->hook = std::make_unique<CaptureHook>(*capture->store, config.get_capture());
        return capture.release();
    } catch (const std::exception& e) {
        LOG_ERROR(MODULE, "traffic_capture_create failed: %s", e.what());
        return nullptr;
    }
}

void traffic_capture_destroy(TrafficCapture* capture) {
    if (capture == nullptr) {
        return;
    }
    if (capture->hook) {
        capture->hook->flush_pending("proxy shutdown");
    }
    delete capture;
}

int traffic_capture_on_request(TrafficCapture* capture,
                               const char* flow_key,
                               const char* method,
                               const char* url,
                               const CaptureHeader* headers,
                               uint32_t header_count,
                               const uint8_t* body,
                               uint32_t body_len) {
    if (capture == nullptr || flow_key == nullptr || method == nullptr || url == nullptr ||
        !validate_payload(headers, header_count, body, body_len)) {
        return CAPTURE_ERR_INVALID_PARAM;
    }

    try {
        capture->hook->on_request(flow_key, method, url,
                                  to_headers(headers, header_count),
                                  to_body(body, body_len));
        return CAPTURE_SUCCESS;
    } catch (const std::exception& e) {
        LOG_ERROR(MODULE, "on_request failed: %s", e.what());
        return CAPTURE_ERR_INTERNAL;
    }
}

int traffic_capture_on_response(TrafficCapture* capture,
                                const char* flow_key,
                                int status,
                                const char* reason,
                                const CaptureHeader* headers,
                                uint32_t header_count,
                                const uint8_t* body,
                                uint32_t body_len,
                                int64_t elapsed_ms) {
    if (capture == nullptr || flow_key == nullptr ||
        !validate_payload(headers, header_count, body, body_len)) {
        return CAPTURE_ERR_INVALID_PARAM;
    }

    try {
        capture->hook->on_response(flow_key, status, reason != nullptr ? reason : "",
                                   to_headers(headers, header_count),
                                   to_body(body, body_len), elapsed_ms);
        return CAPTURE_SUCCESS;
    } catch (const std::exception& e) {
        LOG_ERROR(MODULE, "on_response failed: %s", e.what());
        return CAPTURE_ERR_INTERNAL;
    }
}

int traffic_capture_on_error(TrafficCapture* capture,
                             const char* flow_key,
                             const char* reason) {
    if (capture == nullptr || flow_key == nullptr) {
        return CAPTURE_ERR_INVALID_PARAM;
    }

    try {
        capture->hook->on_error(flow_key, reason != nullptr ? reason : "");
        return CAPTURE_SUCCESS;
    } catch (const std::exception& e) {
        LOG_ERROR(MODULE, "on_error failed: %s", e.what());
        return CAPTURE_ERR_INTERNAL;
    }
}

int traffic_capture_sweep(TrafficCapture* capture) {
    if (capture == nullptr) {
        return CAPTURE_ERR_INVALID_PARAM;
    }
    try {
        return static_cast<int>(capture->hook->sweep_expired());
    } catch (const std::exception& e) {
        LOG_ERROR(MODULE, "sweep failed: %s", e.what());
        return CAPTURE_ERR_INTERNAL;
    }
}

} // extern "C"

// 文件结束
