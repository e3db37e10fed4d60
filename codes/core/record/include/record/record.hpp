// =============================================================================
//  Traffic Probe - Record Module
//  文件: record.hpp
//  描述: 抓包记录（一次请求/响应交换）数据模型
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace traffic_probe {
namespace record {

// ==================== HTTP头部集合类型 ====================
using HttpHeaders = std::map<std::string, std::string>;

// ==================== 消息体编码 ====================
enum class BodyEncoding : uint8_t {
    TEXT = 0,    // data为UTF-8文本
    BASE64 = 1   // data为二进制内容的base64编码
};

const char* body_encoding_to_string(BodyEncoding encoding);

// ==================== 消息体 ====================
struct Body {
    std::string data;        // 文本或base64
    BodyEncoding encoding;
    uint64_t size;           // 原始字节数（截断前）
    bool truncated;          // 抓取时超过上限被截断

    Body()
        : encoding(BodyEncoding::TEXT)
        , size(0)
        , truncated(false)
    {
    }

    bool empty() const { return data.empty(); }
    bool is_text() const { return encoding == BodyEncoding::TEXT; }
};

// ==================== 抓包记录 ====================
// 由抓包钩子创建，写入存储后不可修改
struct Record {
    uint64_t id;                 // 存储分配的序号，0表示尚未分配
    uint64_t timestamp_ms;       // 抓取时间（收到响应或判定失败的时刻）

    std::string method;
    std::string url;
    std::string scheme;
    std::string host;
    uint16_t port;
    std::string path;

    HttpHeaders request_headers;
    Body request_body;

    bool has_status;             // false表示不完整记录（连接失败、超时等）
    int status;
    std::string reason;
    HttpHeaders response_headers;
    Body response_body;

    bool has_duration;
    uint64_t duration_ms;

    std::string error;           // 不完整记录的失败原因

    Record()
        : id(0)
        , timestamp_ms(0)
        , port(0)
        , has_status(false)
        , status(0)
        , has_duration(false)
        , duration_ms(0)
    {
    }

    bool is_partial() const { return !has_status; }
};

// ==================== URL拆分结果 ====================
struct UrlParts {
    std::string scheme;
    std::string host;
    uint16_t port;
    std::string path;    // 含查询串，至少为"/"

    UrlParts() : port(0) {}
};

/**
 * @brief 拆分URL为scheme/host/port/path
 * @param url 绝对URL（scheme://host[:port][/path]）或origin-form路径
 * @return 拆分结果；缺省端口按scheme推断（http=80, https=443）
 */
UrlParts parse_url(const std::string& url);

/**
 * @brief 大小写不敏感查找头部
 * @return 找到返回值指针，否则nullptr
 */
const std::string* find_header(const HttpHeaders& headers, const std::string& name);

/**
 * @brief 取Content-Type头，不存在返回空串
 */
std::string content_type_of(const HttpHeaders& headers);

} // namespace record
} // namespace traffic_probe

// 文件结束
