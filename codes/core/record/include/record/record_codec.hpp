// =============================================================================
//  Traffic Probe - Record Module
//  文件: record_codec.hpp
//  描述: Record与JSON之间的编解码
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "record/record.hpp"
#include "utils/error.hpp"

namespace traffic_probe {
namespace record {

using Json = nlohmann::json;

// ==================== 完整记录 ====================

/**
 * @brief 记录编码为JSON对象（存储格式与read_request输出共用）
 * @note 不完整记录的response字段为null
 */
Json record_to_json(const Record& rec);

/**
 * @brief JSON对象解码为记录
 * @return 字段缺失或类型错误返回CODEC_INVALID_FIELD
 */
utils::Result<Record> record_from_json(const Json& j);

// ==================== 单行存储格式 ====================

/**
 * @brief 编码为不含换行的单行JSON文本
 * @note 非法UTF-8字节以U+FFFD替换，保证总能输出
 */
std::string record_to_line(const Record& rec);

/**
 * @brief 从单行JSON文本解码
 * @return 非法JSON返回CODEC_INVALID_JSON
 */
utils::Result<Record> record_from_line(const std::string& line);

// ==================== 摘要 ====================

/**
 * @brief 列表展示用摘要：id, timestamp, method, host, path, url, status,
 *        duration_ms, 请求/响应体大小；不完整记录的status/duration_ms为null
 */
Json record_to_summary_json(const Record& rec);

// ==================== 组件 ====================

Json headers_to_json(const HttpHeaders& headers);
Json body_to_json(const Body& body);

} // namespace record
} // namespace traffic_probe

// 文件结束
