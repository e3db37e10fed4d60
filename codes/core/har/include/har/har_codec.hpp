// =============================================================================
//  Traffic Probe - HAR Module
//  文件: har_codec.hpp
//  描述: HAR 1.2 (HTTP Archive) 导出与导入
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <string>
#include <vector>
#include "record/record.hpp"
#include "record/record_codec.hpp"
#include "utils/error.hpp"

namespace traffic_probe {
namespace har {

constexpr const char* HAR_VERSION = "1.2";
constexpr const char* HTTP_VERSION = "HTTP/1.1";

// log.creator
struct Creator {
    std::string name;
    std::string version;

    Creator() {}
    Creator(const std::string& n, const std::string& v) : name(n), version(v) {}
};

/**
 * @brief 记录集编码为HAR文档
 *
 * 条目顺序与输入一致。除标准字段外附带:
 *   _id         记录序号
 *   _partial    不完整记录（status=0, time=0, timings均为-1）
 *   _error      不完整记录的失败原因
 *   _truncated  消息体在抓取时被截断（位于postData/content内）
 *
 * 对任意记录集都能成功编码。
 */
record::Json encode(const std::vector<record::Record>& records, const Creator& creator);

/**
 * @brief 单个条目
 */
record::Json encode_entry(const record::Record& rec);

/**
 * @brief 解析HAR文档为记录集
 * @return CODEC_INVALID_FIELD 缺少log.entries或条目结构错误
 */
utils::Result<std::vector<record::Record>> decode(const record::Json& document);

} // namespace har
} // namespace traffic_probe
