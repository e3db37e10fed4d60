// =============================================================================
//  Traffic Probe - HAR Module
//  文件: har_codec.cpp
//  描述: HAR 1.2 编解码实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "har/har_codec.hpp"
#include "utils/text.hpp"
#include "utils/time.hpp"
#include <exception>
#include <stdexcept>

namespace traffic_probe {
namespace har {

using record::Body;
using record::BodyEncoding;
using record::HttpHeaders;
using record::Json;
using record::Record;
using utils::ErrorCode;
using utils::Result;
using utils::make_err;
using utils::make_ok;

namespace {

constexpr int64_t TIMING_UNAVAILABLE = -1;

Json headers_to_har(const HttpHeaders& headers) {
    Json list = Json::array();
    for (const auto& kv : headers) {
        list.push_back({{"name", kv.first}, {"value", kv.second}});
    }
    return list;
}

HttpHeaders headers_from_har(const Json& list) {
    HttpHeaders headers;
    if (!list.is_array()) {
        return headers;
    }
    for (const Json& item : list) {
        headers[item.at("name").get<std::string>()] = item.value("value", std::string());
    }
    return headers;
}

// 查询串只按 & 和 = 拆分，不做百分号解码
Json query_string_of(const std::string& url) {
    Json list = Json::array();
    size_t question = url.find('?');
    if (question == std::string::npos) {
        return list;
    }
    std::string query = url.substr(question + 1);
    size_t hash = query.find('#');
    if (hash != std::string::npos) {
        query.erase(hash);
    }

    size_t begin = 0;
    while (begin <= query.size()) {
        size_t end = query.find('&', begin);
        if (end == std::string::npos) {
            end = query.size();
        }
        std::string pair = query.substr(begin, end - begin);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                list.push_back({{"name", pair}, {"value", ""}});
            } else {
                list.push_back({{"name", pair.substr(0, eq)}, {"value", pair.substr(eq + 1)}});
            }
        }
        begin = end + 1;
    }
    return list;
}

void put_body_fields(const Body& body, Json* target) {
    (*target)["text"] = body.data;
    if (body.encoding == BodyEncoding::BASE64) {
        (*target)["encoding"] = "base64";
    }
    if (body.truncated) {
        (*target)["_truncated"] = true;
    }
}

Body body_from_har(const Json& obj, uint64_t size) {
    Body body;
    body.data = obj.value("text", std::string());
    std::string encoding = obj.value("encoding", std::string());
    if (encoding.empty()) {
        body.encoding = BodyEncoding::TEXT;
    } else if (encoding == "base64") {
        body.encoding = BodyEncoding::BASE64;
        // 外部导入的文档需校验编码内容
        auto decoded = utils::base64_decode(body.data);
        if (decoded.is_err()) {
            throw std::invalid_argument("content text is not valid base64: " + decoded.error_message());
        }
    } else {
        throw std::invalid_argument("unsupported content encoding: " + encoding);
    }
    body.size = size;
    body.truncated = obj.value("_truncated", false);
    return body;
}

Record entry_to_record(const Json& entry) {
    Record rec;
    const Json& request = entry.at("request");
    const Json& response = entry.at("response");

    rec.id = entry.value("_id", static_cast<uint64_t>(0));

    rec.method = request.at("method").get<std::string>();
    rec.url = request.at("url").get<std::string>();
    record::UrlParts parts = record::parse_url(rec.url);
    rec.scheme = parts.scheme;
    rec.host = parts.host;
    rec.port = parts.port;
    rec.path = parts.path;
    rec.request_headers = headers_from_har(request.value("headers", Json::array()));

    int64_t request_size = request.value("bodySize", static_cast<int64_t>(0));
    auto post_data = request.find("postData");
    if (post_data != request.end() && post_data->is_object()) {
        rec.request_body = body_from_har(*post_data, request_size > 0 ? request_size : 0);
    }

    bool partial = entry.value("_partial", false);
    rec.has_status = !partial;
    if (!partial) {
        rec.status = response.at("status").get<int>();
        rec.reason = response.value("statusText", std::string());
        rec.response_headers = headers_from_har(response.value("headers", Json::array()));
        auto content = response.find("content");
        if (content != response.end() && content->is_object()) {
            int64_t size = content->value("size", static_cast<int64_t>(0));
            rec.response_body = body_from_har(*content, size > 0 ? size : 0);
        }
    } else {
        rec.error = entry.value("_error", std::string());
    }

    int64_t wait = TIMING_UNAVAILABLE;
    auto timings = entry.find("timings");
    if (timings != entry.end() && timings->is_object()) {
        wait = timings->value("wait", TIMING_UNAVAILABLE);
    }
    rec.has_duration = !partial && wait != TIMING_UNAVAILABLE;
    int64_t time = entry.value("time", static_cast<int64_t>(0));
    rec.duration_ms = rec.has_duration && time > 0 ? static_cast<uint64_t>(time) : 0;

    uint64_t started = 0;
    if (!utils::parse_iso8601(entry.at("startedDateTime").get<std::string>(), &started)) {
        throw std::invalid_argument("invalid startedDateTime");
    }
    rec.timestamp_ms = started + rec.duration_ms;
    return rec;
}

} // namespace

Json encode_entry(const Record& rec) {
    bool timed = rec.has_status && rec.has_duration;
    uint64_t duration = timed ? rec.duration_ms : 0;
    uint64_t started = rec.timestamp_ms >= duration ? rec.timestamp_ms - duration : 0;

    Json request = {
        {"method", rec.method},
        {"url", rec.url},
        {"httpVersion", HTTP_VERSION},
        {"cookies", Json::array()},
        {"headers", headers_to_har(rec.request_headers)},
        {"queryString", query_string_of(rec.url)},
        {"headersSize", -1},
        {"bodySize", rec.request_body.size}
    };
    if (!rec.request_body.empty()) {
        Json post_data = {{"mimeType", record::content_type_of(rec.request_headers)}};
        put_body_fields(rec.request_body, &post_data);
        request["postData"] = post_data;
    }

    Json response;
    if (rec.has_status) {
        Json content = {
            {"size", rec.response_body.size},
            {"mimeType", record::content_type_of(rec.response_headers)}
        };
        put_body_fields(rec.response_body, &content);
        const std::string* location = record::find_header(rec.response_headers, "Location");
        response = {
            {"status", rec.status},
            {"statusText", rec.reason},
            {"httpVersion", HTTP_VERSION},
            {"cookies", Json::array()},
            {"headers", headers_to_har(rec.response_headers)},
            {"content", content},
            {"redirectURL", location != nullptr ? *location : std::string()},
            {"headersSize", -1},
            {"bodySize", rec.response_body.size}
        };
    } else {
        response = {
            {"status", 0},
            {"statusText", ""},
            {"httpVersion", HTTP_VERSION},
            {"cookies", Json::array()},
            {"headers", Json::array()},
            {"content", {{"size", 0}, {"mimeType", ""}, {"text", ""}}},
            {"redirectURL", ""},
            {"headersSize", -1},
            {"bodySize", -1}
        };
    }

    Json timings;
    if (timed) {
        timings = {{"send", 0}, {"wait", rec.duration_ms}, {"receive", 0}};
    } else {
        timings = {{"send", TIMING_UNAVAILABLE}, {"wait", TIMING_UNAVAILABLE},
                   {"receive", TIMING_UNAVAILABLE}};
    }

    Json entry = {
        {"startedDateTime", utils::format_iso8601_utc(started)},
        {"time", duration},
        {"request", request},
        {"response", response},
        {"cache", Json::object()},
        {"timings", timings},
        {"_id", rec.id}
    };
    if (rec.is_partial()) {
        entry["_partial"] = true;
        entry["_error"] = rec.error;
    }
    return entry;
}

Json encode(const std::vector<Record>& records, const Creator& creator) {
    Json entries = Json::array();
    for (const Record& rec : records) {
        entries.push_back(encode_entry(rec));
    }

    return {
        {"log", {
            {"version", HAR_VERSION},
            {"creator", {{"name", creator.name}, {"version", creator.version}}},
            {"pages", Json::array()},
            {"entries", entries}
        }}
    };
}

Result<std::vector<Record>> decode(const Json& document) {
    if (!document.is_object() || !document.contains("log") ||
        !document["log"].is_object() || !document["log"].contains("entries") ||
        !document["log"]["entries"].is_array()) {
        return make_err<std::vector<Record>>(ErrorCode::CODEC_INVALID_FIELD,
                                             "document has no log.entries array");
    }

    std::vector<Record> records;
    size_t index = 0;
    for (const Json& entry : document["log"]["entries"]) {
        try {
            records.push_back(entry_to_record(entry));
        } catch (const std::exception& e) {
            return make_err<std::vector<Record>>(
                ErrorCode::CODEC_INVALID_FIELD,
                "invalid entry " + std::to_string(index) + ": " + e.what());
        }
        ++index;
    }
    return make_ok(std::move(records));
}

} // namespace har
} // namespace traffic_probe

// 文件结束
