// =============================================================================
//  Traffic Probe - Tool Server Module
//  文件: tool_args.hpp
//  描述: 工具调用参数校验
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <set>
#include <string>
#include "query/query_types.hpp"
#include "record/record_codec.hpp"
#include "utils/error.hpp"

namespace traffic_probe {
namespace tool_server {

// list_requests参数
struct ListArgs {
    query::RecordFilter filter;
    query::Page page;
};

// export_har参数，ids为空表示不按序号筛选
struct ExportArgs {
    query::RecordFilter filter;
    std::set<uint64_t> ids;
};

// 以下函数在参数到达查询层之前完成全部校验，失败均返回INVALID_ARGUMENT:
//   未知参数名、类型错误、负数limit/offset、非法status、非数字id
// args为null或缺省时视为空对象

/**
 * @param default_limit 未指定limit时使用，0表示不限制
 */
utils::Result<ListArgs> parse_list_args(const record::Json& args, uint32_t default_limit);

/**
 * @brief id接受非负整数或十进制数字字符串
 */
utils::Result<uint64_t> parse_read_args(const record::Json& args);

utils::Result<std::string> parse_search_args(const record::Json& args);

/**
 * @brief 过滤条件外可带ids数组（元素规则同read_request的id）
 */
utils::Result<ExportArgs> parse_export_args(const record::Json& args);

/**
 * @brief 无参数工具，只允许空对象
 */
utils::Result<void> parse_empty_args(const record::Json& args);

} // namespace tool_server
} // namespace traffic_probe
