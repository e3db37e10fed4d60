// =============================================================================
//  Traffic Probe - Query Module
//  文件: query_engine.cpp
//  描述: 查询实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "query/query_engine.hpp"
#include "utils/text.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace traffic_probe {
namespace query {

using record::HttpHeaders;
using record::Record;
using utils::ErrorCode;
using utils::Result;
using utils::make_err;
using utils::make_ok;

namespace {

constexpr int MAX_STATUS = 999;

bool parse_int(const std::string& text, int* out) {
    if (text.empty() || text.size() > 3) {
        return false;
    }
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    *out = value;
    return true;
}

bool host_matches(const std::string& host, const std::string& wanted) {
    if (utils::iequals(host, wanted)) {
        return true;
    }
    // 子域名：api.example.com 匹配 example.com
    return host.size() > wanted.size() &&
           host[host.size() - wanted.size() - 1] == '.' &&
           utils::iends_with(host, wanted);
}

bool headers_contain(const HttpHeaders& headers, const std::string& text) {
    for (const auto& kv : headers) {
        if (utils::icontains(kv.first, text) || utils::icontains(kv.second, text)) {
            return true;
        }
    }
    return false;
}

bool body_contains(const record::Body& body, const std::string& text) {
    return body.is_text() && !body.empty() && utils::icontains(body.data, text);
}

} // namespace

Result<StatusRange> parse_status_filter(const std::string& raw) {
    std::string text = utils::to_lower(utils::trim(raw));

    // 4xx
    if (text.size() == 3 && text[1] == 'x' && text[2] == 'x' &&
        text[0] >= '1' && text[0] <= '9') {
        int base = (text[0] - '0') * 100;
        return make_ok(StatusRange(base, base + 99));
    }

    // 400-499
    size_t dash = text.find('-');
    if (dash != std::string::npos) {
        int low = 0;
        int high = 0;
        if (!parse_int(utils::trim(text.substr(0, dash)), &low) ||
            !parse_int(utils::trim(text.substr(dash + 1)), &high)) {
            return make_err<StatusRange>(ErrorCode::INVALID_ARGUMENT,
                                         "invalid status range: " + raw);
        }
        if (low > high) {
            return make_err<StatusRange>(ErrorCode::INVALID_ARGUMENT,
                                         "status range is reversed: " + raw);
        }
        return make_ok(StatusRange(low, high));
    }

    int value = 0;
    if (!parse_int(text, &value) || value > MAX_STATUS) {
        return make_err<StatusRange>(ErrorCode::INVALID_ARGUMENT,
                                     "invalid status filter: " + raw);
    }
    return make_ok(StatusRange(value, value));
}

bool matches(const Record& rec, const RecordFilter& filter) {
    if (filter.has_host && !host_matches(rec.host, filter.host)) {
        return false;
    }
    if (filter.has_method && !utils::iequals(rec.method, filter.method)) {
        return false;
    }
    if (filter.has_status && (rec.is_partial() || !filter.status.contains(rec.status))) {
        return false;
    }
    if (filter.has_url_contains && !utils::icontains(rec.url, filter.url_contains)) {
        return false;
    }
    return true;
}

std::vector<Record> filter_records(const std::vector<Record>& records, const RecordFilter& filter) {
    std::vector<Record> result;
    for (const Record& rec : records) {
        if (matches(rec, filter)) {
            result.push_back(rec);
        }
    }
    return result;
}

ListResult list(const std::vector<Record>& records, const RecordFilter& filter, const Page& page) {
    ListResult result;
    for (const Record& rec : records) {
        if (!matches(rec, filter)) {
            continue;
        }
        size_t index = result.total++;
        if (index < page.offset) {
            continue;
        }
        if (page.has_limit && result.records.size() >= page.limit) {
            continue;
        }
        result.records.push_back(rec);
    }
    return result;
}

Result<Record> get_one(const std::vector<Record>& records, uint64_t id) {
    auto it = std::lower_bound(records.begin(), records.end(), id,
                               [](const Record& rec, uint64_t value) { return rec.id < value; });
    if (it != records.end() && it->id == id) {
        return make_ok(*it);
    }
    // 快照未排序时退化为线性查找
    for (const Record& rec : records) {
        if (rec.id == id) {
            return make_ok(rec);
        }
    }
    return make_err<Record>(ErrorCode::RECORD_NOT_FOUND, "record " + std::to_string(id) + " not found");
}

Result<std::vector<SearchHit>> search(const std::vector<Record>& records, const std::string& text) {
    if (text.empty()) {
        return make_err<std::vector<SearchHit>>(ErrorCode::INVALID_ARGUMENT, "search text is empty");
    }

    std::vector<SearchHit> hits;
    for (const Record& rec : records) {
        SearchHit hit;
        if (utils::icontains(rec.url, text)) {
            hit.found_in.push_back(found_in::URL);
        }
        if (headers_contain(rec.request_headers, text)) {
            hit.found_in.push_back(found_in::REQUEST_HEADERS);
        }
        if (headers_contain(rec.response_headers, text)) {
            hit.found_in.push_back(found_in::RESPONSE_HEADERS);
        }
        if (body_contains(rec.request_body, text)) {
            hit.found_in.push_back(found_in::REQUEST_BODY);
        }
        if (body_contains(rec.response_body, text)) {
            hit.found_in.push_back(found_in::RESPONSE_BODY);
        }
        if (!hit.found_in.empty()) {
            hit.record = rec;
            hits.push_back(std::move(hit));
        }
    }
    return make_ok(std::move(hits));
}

std::string status_class(const Record& rec) {
    if (rec.is_partial()) {
        return "none";
    }
    if (rec.status >= 200 && rec.status <= 599) {
        return std::string(1, static_cast<char>('0' + rec.status / 100)) + "xx";
    }
    return "other";
}

TrafficStats stats(const std::vector<Record>& records) {
    TrafficStats result;
    uint64_t duration_sum = 0;

    for (const Record& rec : records) {
        ++result.total;
        if (rec.is_partial()) {
            ++result.partial;
        }
        ++result.by_host[rec.host];
        ++result.by_method[rec.method];
        ++result.by_status_class[status_class(rec)];

        if (rec.has_duration) {
            if (result.with_duration == 0) {
                result.min_duration_ms = rec.duration_ms;
                result.max_duration_ms = rec.duration_ms;
            } else {
                result.min_duration_ms = std::min(result.min_duration_ms, rec.duration_ms);
                result.max_duration_ms = std::max(result.max_duration_ms, rec.duration_ms);
            }
            ++result.with_duration;
            duration_sum += rec.duration_ms;
        }

        result.request_bytes += rec.request_body.size;
        result.response_bytes += rec.response_body.size;
    }

    if (result.with_duration > 0) {
        result.avg_duration_ms = static_cast<double>(duration_sum) /
                                 static_cast<double>(result.with_duration);
    }
    return result;
}

} // namespace query
} // namespace traffic_probe

// 文件结束
