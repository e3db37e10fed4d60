// =============================================================================
//  Traffic Probe - Record Module
//  文件: record_codec.cpp
//  描述: Record与JSON之间的编解码实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "record/record_codec.hpp"
#include "utils/time.hpp"
#include <stdexcept>

namespace traffic_probe {
namespace record {

using utils::ErrorCode;
using utils::Result;
using utils::make_err;
using utils::make_ok;

namespace {

HttpHeaders headers_from_json(const Json& j) {
    HttpHeaders headers;
    if (j.is_null()) {
        return headers;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        headers[it.key()] = it.value().get<std::string>();
    }
    return headers;
}

Body body_from_json(const Json& j) {
    Body body;
    if (j.is_null()) {
        return body;
    }
    body.data = j.at("data").get<std::string>();
    std::string encoding = j.value("encoding", std::string("text"));
    if (encoding == "base64") {
        body.encoding = BodyEncoding::BASE64;
    } else if (encoding == "text") {
        body.encoding = BodyEncoding::TEXT;
    } else {
        throw std::invalid_argument("unknown body encoding: " + encoding);
    }
    body.size = j.value("size", static_cast<uint64_t>(body.data.size()));
    body.truncated = j.value("truncated", false);
    return body;
}

} // namespace

Json headers_to_json(const HttpHeaders& headers) {
    Json j = Json::object();
    for (const auto& kv : headers) {
        j[kv.first] = kv.second;
    }
    return j;
}

Json body_to_json(const Body& body) {
    Json j;
    j["data"] = body.data;
    j["encoding"] = body_encoding_to_string(body.encoding);
    j["size"] = body.size;
    j["truncated"] = body.truncated;
    return j;
}

Json record_to_json(const Record& rec) {
    Json j;
    j["id"] = rec.id;
    j["timestamp_ms"] = rec.timestamp_ms;
    j["timestamp"] = utils::format_iso8601_utc(rec.timestamp_ms);

    Json& req = j["request"];
    req["method"] = rec.method;
    req["url"] = rec.url;
    req["scheme"] = rec.scheme;
    req["host"] = rec.host;
    req["port"] = rec.port;
    req["path"] = rec.path;
    req["headers"] = headers_to_json(rec.request_headers);
    req["body"] = body_to_json(rec.request_body);

    if (rec.has_status) {
        Json& resp = j["response"];
        resp["status"] = rec.status;
        resp["reason"] = rec.reason;
        resp["headers"] = headers_to_json(rec.response_headers);
        resp["body"] = body_to_json(rec.response_body);
    } else {
        j["response"] = nullptr;
    }

    if (rec.has_duration) {
        j["duration_ms"] = rec.duration_ms;
    } else {
        j["duration_ms"] = nullptr;
    }

    if (!rec.error.empty()) {
        j["error"] = rec.error;
    }
    return j;
}

Result<Record> record_from_json(const Json& j) {
    if (!j.is_object()) {
        return make_err<Record>(ErrorCode::CODEC_INVALID_FIELD, "record must be a JSON object");
    }

    try {
        Record rec;
        rec.id = j.at("id").get<uint64_t>();
        rec.timestamp_ms = j.at("timestamp_ms").get<uint64_t>();

        const Json& req = j.at("request");
        rec.method = req.at("method").get<std::string>();
        rec.url = req.at("url").get<std::string>();
        rec.scheme = req.value("scheme", std::string());
        rec.host = req.value("host", std::string());
        rec.port = req.value("port", static_cast<uint16_t>(0));
        rec.path = req.value("path", std::string());
        rec.request_headers = headers_from_json(req.value("headers", Json()));
        rec.request_body = body_from_json(req.value("body", Json()));

        const Json& resp = j.at("response");
        if (!resp.is_null()) {
            rec.has_status = true;
            rec.status = resp.at("status").get<int>();
            rec.reason = resp.value("reason", std::string());
            rec.response_headers = headers_from_json(resp.value("headers", Json()));
            rec.response_body = body_from_json(resp.value("body", Json()));
        }

        const Json duration = j.value("duration_ms", Json());
        if (!duration.is_null()) {
            rec.has_duration = true;
            rec.duration_ms = duration.get<uint64_t>();
        }

        rec.error = j.value("error", std::string());
        return make_ok(std::move(rec));
    } catch (const std::exception& e) {
        // 包含nlohmann的type_error/out_of_range与未知编码
        return make_err<Record>(ErrorCode::CODEC_INVALID_FIELD,
                                std::string("invalid record: ") + e.what());
    }
}

std::string record_to_line(const Record& rec) {
    return record_to_json(rec).dump(-1, ' ', false, Json::error_handler_t::replace);
}

Result<Record> record_from_line(const std::string& line) {
    Json j = Json::parse(line, nullptr, false);
    if (j.is_discarded()) {
        return make_err<Record>(ErrorCode::CODEC_INVALID_JSON, "record line is not valid JSON");
    }
    return record_from_json(j);
}

Json record_to_summary_json(const Record& rec) {
    Json j;
    j["id"] = rec.id;
    j["timestamp"] = utils::format_iso8601_utc(rec.timestamp_ms);
    j["method"] = rec.method;
    j["host"] = rec.host;
    j["path"] = rec.path;
    j["url"] = rec.url;
    if (rec.has_status) {
        j["status"] = rec.status;
    } else {
        j["status"] = nullptr;
    }
    if (rec.has_duration) {
        j["duration_ms"] = rec.duration_ms;
    } else {
        j["duration_ms"] = nullptr;
    }
    j["request_size"] = rec.request_body.size;
    j["response_size"] = rec.response_body.size;
    if (!rec.error.empty()) {
        j["error"] = rec.error;
    }
    return j;
}

} // namespace record
} // namespace traffic_probe

// 文件结束
