// =============================================================================
//  Traffic Probe - Record Module
//  文件: record.cpp
//  描述: 记录模型辅助函数实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "record/record.hpp"
#include "utils/text.hpp"
#include <cstdlib>

namespace traffic_probe {
namespace record {

const char* body_encoding_to_string(BodyEncoding encoding) {
    switch (encoding) {
        case BodyEncoding::TEXT: return "text";
        case BodyEncoding::BASE64: return "base64";
        default: return "unknown";
    }
}

UrlParts parse_url(const std::string& url) {
    UrlParts parts;

    std::string rest = url;
    size_t scheme_end = url.find("://");
    if (scheme_end != std::string::npos) {
        parts.scheme = utils::to_lower(url.substr(0, scheme_end));
        rest = url.substr(scheme_end + 3);
    } else {
        // origin-form，只有路径
        parts.path = url.empty() ? "/" : url;
        return parts;
    }

    size_t path_begin = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, path_begin);
    parts.path = (path_begin == std::string::npos) ? "/" : rest.substr(path_begin);
    if (!parts.path.empty() && parts.path[0] != '/') {
        parts.path.insert(0, "/");
    }

    // 去掉userinfo
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string port_str;
    if (!authority.empty() && authority[0] == '[') {
        // IPv6字面量
        size_t close = authority.find(']');
        if (close != std::string::npos) {
            parts.host = authority.substr(1, close - 1);
            if (close + 1 < authority.size() && authority[close + 1] == ':') {
                port_str = authority.substr(close + 2);
            }
        } else {
            parts.host = authority;
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            parts.host = authority.substr(0, colon);
            port_str = authority.substr(colon + 1);
        } else {
            parts.host = authority;
        }
    }
    parts.host = utils::to_lower(parts.host);

    if (!port_str.empty()) {
        char* end = nullptr;
        unsigned long value = std::strtoul(port_str.c_str(), &end, 10);
        if (end != nullptr && *end == '\0' && value > 0 && value <= 65535) {
            parts.port = static_cast<uint16_t>(value);
        }
    }
    if (parts.port == 0) {
        if (parts.scheme == "https") {
            parts.port = 443;
        } else if (parts.scheme == "http") {
            parts.port = 80;
        }
    }
    return parts;
}

const std::string* find_header(const HttpHeaders& headers, const std::string& name) {
    for (const auto& kv : headers) {
        if (utils::iequals(kv.first, name)) {
            return &kv.second;
        }
    }
    return nullptr;
}

std::string content_type_of(const HttpHeaders& headers) {
    const std::string* value = find_header(headers, "content-type");
    return value ? *value : std::string();
}

} // namespace record
} // namespace traffic_probe

// 文件结束
