// =============================================================================
//  Traffic Probe - Capture Module
//  文件: capture_hook.hpp
//  描述: 代理引擎抓包钩子（请求/响应关联与记录生成）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "config/config.hpp"
#include "record/record.hpp"
#include "store/record_sink.hpp"

namespace traffic_probe {
namespace capture {

// 钩子运行计数
struct HookStats {
    uint64_t captured;           // 成功写入的完整记录
    uint64_t partial;            // 成功写入的不完整记录
    uint64_t orphan_responses;   // 找不到对应请求的响应/错误事件
    uint64_t evicted;            // 因超时或容量被强制落盘的请求
    uint64_t store_failures;     // 写入存储失败次数

    HookStats()
        : captured(0)
        , partial(0)
        , orphan_responses(0)
        , evicted(0)
        , store_failures(0)
    {
    }
};

/**
 * @brief 抓包钩子
 *
 * 代理引擎在看到请求时调用on_request，看到响应时调用on_response，
 * 交换失败时调用on_error。请求在响应到达前暂存于内存，以flow_key关联。
 *
 * 所有入口都不会抛出异常：存储失败只记录日志与计数，
 * 不影响代理对流量本身的处理。线程安全。
 */
class CaptureHook {
public:
    CaptureHook(store::RecordSink& sink, const config::CaptureConfig& config);
    ~CaptureHook();

    // 禁止拷贝
    CaptureHook(const CaptureHook&) = delete;
    CaptureHook& operator=(const CaptureHook&) = delete;

    /**
     * @brief 请求事件，暂存请求字段与开始时间
     * @note 同一flow_key重复出现时覆盖旧请求
     */
    void on_request(const std::string& flow_key,
                    const std::string& method,
                    const std::string& url,
                    const record::HttpHeaders& headers,
                    const std::string& body);

    /**
     * @brief 响应事件，合并请求并写入存储
     * @param elapsed_ms 引擎测得的耗时，负数表示由钩子按暂存时间计算
     */
    void on_response(const std::string& flow_key,
                     int status,
                     const std::string& reason,
                     const record::HttpHeaders& headers,
                     const std::string& body,
                     int64_t elapsed_ms = -1);

    /**
     * @brief 交换失败事件，写入不完整记录
     */
    void on_error(const std::string& flow_key, const std::string& reason);

    /**
     * @brief 将超过pending_timeout_ms仍未响应的请求写为不完整记录
     * @param now_ms 单调时钟当前值
     * @return 处理的请求数
     */
    size_t sweep_expired(uint64_t now_ms);
    size_t sweep_expired();

    /**
     * @brief 将全部暂存请求写为不完整记录（关闭时调用）
     * @return 处理的请求数
     */
    size_t flush_pending(const std::string& reason);

    size_t pending_count() const;
    HookStats stats() const;

private:
    struct PendingRequest {
        record::Record record;
        uint64_t started_ms;
    };

    /**
     * @brief 按抓取配置构造消息体（二进制转base64，超长截断）
     */
    record::Body make_body(const std::string& raw, const record::HttpHeaders& headers) const;
    bool is_binary_content(const std::string& raw, const record::HttpHeaders& headers,
                           bool truncated) const;

    // 调用方需持有mutex_
    void evict_oldest_locked(std::vector<record::Record>* out);

    // 不持锁调用，内部捕获全部异常
    void store_record(const record::Record& rec);

    store::RecordSink& sink_;
    config::CaptureConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, PendingRequest> pending_;
    HookStats stats_;
};

} // namespace capture
} // namespace traffic_probe
