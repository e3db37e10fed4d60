// =============================================================================
//  Traffic Probe - Query Module
//  文件: query_engine.hpp
//  描述: 基于存储快照的只读查询
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "query/query_types.hpp"
#include "record/record.hpp"
#include "utils/error.hpp"

namespace traffic_probe {
namespace query {

// 以下函数只读取传入的快照，不修改存储
// 快照需按序号升序排列（CaptureStore::snapshot的保证）

/**
 * @brief 判断记录是否满足过滤条件
 */
bool matches(const record::Record& rec, const RecordFilter& filter);

/**
 * @brief 过滤并分页
 */
ListResult list(const std::vector<record::Record>& records,
                const RecordFilter& filter,
                const Page& page);

/**
 * @brief 只过滤不分页
 */
std::vector<record::Record> filter_records(const std::vector<record::Record>& records,
                                           const RecordFilter& filter);

/**
 * @brief 按序号查找
 * @return RECORD_NOT_FOUND
 */
utils::Result<record::Record> get_one(const std::vector<record::Record>& records, uint64_t id);

/**
 * @brief 全文搜索（URL、双向头部、双向文本消息体），大小写不敏感
 * @return INVALID_ARGUMENT text为空
 * @note base64编码的二进制消息体不参与匹配
 */
utils::Result<std::vector<SearchHit>> search(const std::vector<record::Record>& records,
                                             const std::string& text);

TrafficStats stats(const std::vector<record::Record>& records);

/**
 * @brief 状态码分类：2xx/3xx/4xx/5xx/other，不完整记录为none
 */
std::string status_class(const record::Record& rec);

} // namespace query
} // namespace traffic_probe
