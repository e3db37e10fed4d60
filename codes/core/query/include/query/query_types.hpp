// =============================================================================
//  Traffic Probe - Query Module
//  文件: query_types.hpp
//  描述: 查询条件、分页与结果类型
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "record/record.hpp"
#include "utils/error.hpp"

namespace traffic_probe {
namespace query {

// 状态码闭区间，low == high 表示精确匹配
struct StatusRange {
    int low;
    int high;

    StatusRange() : low(0), high(0) {}
    StatusRange(int lo, int hi) : low(lo), high(hi) {}

    bool contains(int status) const { return status >= low && status <= high; }
};

/**
 * @brief 解析状态码条件
 * 支持 "404"、"4xx"（大小写不敏感）、"400-499"
 * @return INVALID_ARGUMENT 格式错误或区间颠倒
 */
utils::Result<StatusRange> parse_status_filter(const std::string& text);

// 过滤条件，未设置的字段不参与过滤
struct RecordFilter {
    bool has_host;
    std::string host;             // 精确匹配或子域名后缀匹配
    bool has_method;
    std::string method;
    bool has_status;
    StatusRange status;           // 不完整记录永不匹配状态条件
    bool has_url_contains;
    std::string url_contains;

    RecordFilter()
        : has_host(false)
        , has_method(false)
        , has_status(false)
        , has_url_contains(false)
    {
    }

    bool empty() const {
        return !has_host && !has_method && !has_status && !has_url_contains;
    }
};

// 分页参数
struct Page {
    size_t offset;
    bool has_limit;
    size_t limit;

    Page() : offset(0), has_limit(false), limit(0) {}
};

// 列表结果
struct ListResult {
    size_t total;                          // 分页前的匹配总数
    std::vector<record::Record> records;

    ListResult() : total(0) {}
};

// 命中位置
namespace found_in {
constexpr const char* URL = "url";
constexpr const char* REQUEST_HEADERS = "request_headers";
constexpr const char* RESPONSE_HEADERS = "response_headers";
constexpr const char* REQUEST_BODY = "request_body";
constexpr const char* RESPONSE_BODY = "response_body";
} // namespace found_in

struct SearchHit {
    record::Record record;
    std::vector<std::string> found_in;
};

// 聚合统计
struct TrafficStats {
    uint64_t total;
    uint64_t partial;
    std::map<std::string, uint64_t> by_host;
    std::map<std::string, uint64_t> by_method;
    std::map<std::string, uint64_t> by_status_class;   // 2xx/3xx/4xx/5xx/other/none

    uint64_t with_duration;                            // 有耗时的记录数，为0时下列耗时字段无意义
    uint64_t min_duration_ms;
    uint64_t max_duration_ms;
    double avg_duration_ms;

    uint64_t request_bytes;
    uint64_t response_bytes;

    TrafficStats()
        : total(0)
        , partial(0)
        , with_duration(0)
        , min_duration_ms(0)
        , max_duration_ms(0)
        , avg_duration_ms(0.0)
        , request_bytes(0)
        , response_bytes(0)
    {
    }
};

} // namespace query
} // namespace traffic_probe

// 文件结束
