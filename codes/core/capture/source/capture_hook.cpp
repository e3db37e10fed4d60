// =============================================================================
//  Traffic Probe - Capture Module
//  文件: capture_hook.cpp
//  描述: 抓包钩子实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "capture/capture_hook.hpp"
#include "utils/logger.hpp"
#include "utils/text.hpp"
#include "utils/time.hpp"
#include <exception>

namespace traffic_probe {
namespace capture {

using record::Body;
using record::BodyEncoding;
using record::HttpHeaders;
using record::Record;

namespace {

const char* const MODULE = "Capture";
const char* const TIMEOUT_REASON = "capture timeout";
const char* const EVICTED_REASON = "evicted: too many pending requests";

// 把暂存请求转换为不完整记录
Record to_partial(const Record& request, const std::string& reason) {
    Record rec = request;
    rec.timestamp_ms = utils::get_current_time_ms();
    rec.has_status = false;
    rec.has_duration = false;
    rec.error = reason;
    return rec;
}

} // namespace

CaptureHook::CaptureHook(store::RecordSink& sink, const config::CaptureConfig& config)
    : sink_(sink)
    , config_(config)
{
    if (config_.max_pending == 0) {
        config_.max_pending = 1;
    }
}

CaptureHook::~CaptureHook() = default;

void CaptureHook::on_request(const std::string& flow_key,
                             const std::string& method,
                             const std::string& url,
                             const HttpHeaders& headers,
                             const std::string& body) {
    std::vector<Record> evicted;
    try {
        PendingRequest pending;
        Record& rec = pending.record;
        rec.method = utils::to_upper(method);
        rec.url = url;
        record::UrlParts parts = record::parse_url(url);
        rec.scheme = parts.scheme;
        rec.host = parts.host;
        rec.port = parts.port;
        rec.path = parts.path;
        rec.request_headers = headers;
        rec.request_body = make_body(body, headers);
        pending.started_ms = utils::get_monotonic_time_ms();

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(flow_key);
        if (it != pending_.end()) {
            LOG_WARN(MODULE, "flow %s: request observed twice, replacing stashed request",
                     flow_key.c_str());
            it->second = std::move(pending);
        } else {
            while (pending_.size() >= config_.max_pending) {
                evict_oldest_locked(&evicted);
            }
            pending_.emplace(flow_key, std::move(pending));
        }
    } catch (const std::exception& e) {
        LOG_ERROR(MODULE, "flow %s: failed to stash request: %s", flow_key.c_str(), e.what());
    }

    for (const Record& rec : evicted) {
        store_record(rec);
    }
}

void CaptureHook::on_response(const std::string& flow_key,
                              int status,
                              const std::string& reason,
                              const HttpHeaders& headers,
                              const std::string& body,
                              int64_t elapsed_ms) {
    Record rec;
    try {
        PendingRequest pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(flow_key);
            if (it == pending_.end()) {
                ++stats_.orphan_responses;
                LOG_WARN(MODULE, "flow %s: response %d without a matching request, ignored",
                         flow_key.c_str(), status);
                return;
            }
            pending = std::move(it->second);
            pending_.erase(it);
        }

        rec = std::move(pending.record);
        rec.timestamp_ms = utils::get_current_time_ms();
        rec.has_status = true;
        rec.status = status;
        rec.reason = reason;
        rec.response_headers = headers;
        rec.response_body = make_body(body, headers);
        rec.has_duration = true;
        if (elapsed_ms >= 0) {
            rec.duration_ms = static_cast<uint64_t>(elapsed_ms);
        } else {
            uint64_t now = utils::get_monotonic_time_ms();
            rec.duration_ms = now >= pending.started_ms ? now - pending.started_ms : 0;
        }
    } catch (const std::exception& e) {
        LOG_ERROR(MODULE, "flow %s: failed to build record: %s", flow_key.c_str(), e.what());
        return;
    }

    store_record(rec);
}

void CaptureHook::on_error(const std::string& flow_key, const std::string& reason) {
    Record rec;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(flow_key);
        if (it == pending_.end()) {
            ++stats_.orphan_responses;
            LOG_WARN(MODULE, "flow %s: error '%s' without a matching request, ignored",
                     flow_key.c_str(), reason.c_str());
            return;
        }
        rec = to_partial(it->second.record, reason.empty() ? "unknown error" : reason);
        pending_.erase(it);
    } catch (const std::exception& e) {
        LOG_ERROR(MODULE, "flow %s: failed to build partial record: %s", flow_key.c_str(), e.what());
        return;
    }

    store_record(rec);
}

size_t CaptureHook::sweep_expired() {
    return sweep_expired(utils::get_monotonic_time_ms());
}

size_t CaptureHook::sweep_expired(uint64_t now_ms) {
    std::vector<Record> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (now_ms >= it->second.started_ms &&
                now_ms - it->second.started_ms >= config_.pending_timeout_ms) {
                expired.push_back(to_partial(it->second.record, TIMEOUT_REASON));
                ++stats_.evicted;
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (!expired.empty()) {
        LOG_WARN(MODULE, "%zu pending requests timed out", expired.size());
    }
    for (const Record& rec : expired) {
        store_record(rec);
    }
    return expired.size();
}

size_t CaptureHook::flush_pending(const std::string& reason) {
    std::vector<Record> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.reserve(pending_.size());
        for (const auto& kv : pending_) {
            remaining.push_back(to_partial(kv.second.record, reason));
        }
        pending_.clear();
    }

    if (!remaining.empty()) {
        LOG_INFO(MODULE, "flushing %zu pending requests: %s", remaining.size(), reason.c_str());
    }
    for (const Record& rec : remaining) {
        store_record(rec);
    }
    return remaining.size();
}

size_t CaptureHook::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

HookStats CaptureHook::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

Body CaptureHook::make_body(const std::string& raw, const HttpHeaders& headers) const {
    Body body;
    body.size = raw.size();
    if (raw.empty()) {
        return body;
    }

    std::string clipped;
    const std::string* content = &raw;
    if (config_.max_body_bytes > 0 && raw.size() > config_.max_body_bytes) {
        clipped = raw.substr(0, static_cast<size_t>(config_.max_body_bytes));
        content = &clipped;
        body.truncated = true;
    }

    if (is_binary_content(*content, headers, body.truncated)) {
        body.encoding = BodyEncoding::BASE64;
        body.data = utils::base64_encode(*content);
    } else {
        body.encoding = BodyEncoding::TEXT;
        body.data = *content;
    }
    return body;
}

bool CaptureHook::is_binary_content(const std::string& raw, const HttpHeaders& headers,
                                    bool truncated) const {
    std::string content_type = utils::to_lower(record::content_type_of(headers));
    if (!content_type.empty()) {
        for (const std::string& prefix : config_.binary_content_types) {
            if (content_type.compare(0, prefix.size(), utils::to_lower(prefix)) == 0) {
                return true;
            }
        }
    }
    if (utils::is_valid_utf8(raw)) {
        return false;
    }
    // 截断可能切断末尾的多字节字符
    if (truncated) {
        for (size_t cut = 1; cut <= 3 && cut < raw.size(); ++cut) {
            if (utils::is_valid_utf8(raw.substr(0, raw.size() - cut))) {
                return false;
            }
        }
    }
    return true;
}

void CaptureHook::evict_oldest_locked(std::vector<Record>* out) {
    auto oldest = pending_.begin();
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        if (it->second.started_ms < oldest->second.started_ms) {
            oldest = it;
        }
    }
    if (oldest == pending_.end()) {
        return;
    }
    LOG_WARN(MODULE, "pending stash full (%u), evicting flow %s",
             config_.max_pending, oldest->first.c_str());
    out->push_back(to_partial(oldest->second.record, EVICTED_REASON));
    ++stats_.evicted;
    pending_.erase(oldest);
}

void CaptureHook::store_record(const Record& rec) {
    utils::Result<uint64_t> ret(utils::ErrorCode::UNKNOWN_ERROR);
    try {
        ret = sink_.append(rec);
    } catch (const std::exception& e) {
        ret = utils::make_err<uint64_t>(utils::ErrorCode::INTERNAL_ERROR, e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (ret.is_err()) {
        ++stats_.store_failures;
        LOG_ERROR(MODULE, "failed to store %s %s: %s", rec.method.c_str(), rec.url.c_str(),
                  ret.error_message().c_str());
        return;
    }
    if (rec.is_partial()) {
        ++stats_.partial;
    } else {
        ++stats_.captured;
    }
}

} // namespace capture
} // namespace traffic_probe
