// =============================================================================
//  Traffic Probe - Tool Server Module
//  文件: tool_server.hpp
//  描述: 面向Agent的查询工具服务（JSON-RPC 2.0 over stdio）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <iosfwd>
#include <string>
#include "config/config.hpp"
#include "record/record_codec.hpp"
#include "store/capture_store.hpp"
#include "utils/error.hpp"

namespace traffic_probe {
namespace tool_server {

// JSON-RPC错误码
constexpr int RPC_PARSE_ERROR = -32700;
constexpr int RPC_INVALID_REQUEST = -32600;
constexpr int RPC_METHOD_NOT_FOUND = -32601;
constexpr int RPC_INVALID_PARAMS = -32602;
constexpr int RPC_INTERNAL_ERROR = -32603;

constexpr const char* JSONRPC_VERSION = "2.0";

/**
 * @brief 工具服务
 *
 * 每行一条JSON-RPC消息，响应同样按行输出。支持的方法:
 *   initialize / notifications/initialized / ping
 *   tools/list / tools/call / resources/list
 *
 * 工具执行失败不会产生JSON-RPC错误，而是返回isError=true的工具结果，
 * 其中携带 {"error": {"kind", "code", "message"}}。
 */
class ToolServer {
public:
    ToolServer(store::CaptureStore& store, const config::ServerConfig& config);
    ~ToolServer();

    // 禁止拷贝
    ToolServer(const ToolServer&) = delete;
    ToolServer& operator=(const ToolServer&) = delete;

    /**
     * @brief 处理一行输入
     * @param reply 输出响应文本（不含换行）
     * @return 是否需要回复（通知消息不回复）
     */
    bool handle_line(const std::string& line, std::string* reply);

    /**
     * @brief 处理一条已解析的消息
     * @return 响应对象，通知消息返回null
     */
    record::Json handle_message(const record::Json& message);

    /**
     * @brief 执行工具，返回MCP工具结果（content/structuredContent/isError）
     * @note 任何异常都转换为InternalError结果，不会抛出
     */
    record::Json call_tool(const std::string& name, const record::Json& args);

    /**
     * @brief tools/list结果中的工具描述
     */
    static record::Json tool_definitions();

    static bool is_known_tool(const std::string& name);

    /**
     * @brief 主循环，读到EOF返回
     * @return 进程退出码
     */
    int run(std::istream& in, std::ostream& out);

private:
    record::Json handle_initialize(const record::Json& params) const;
    record::Json handle_tools_call(const record::Json& id, const record::Json& params);

    utils::Result<record::Json> dispatch_tool(const std::string& name, const record::Json& args);

    utils::Result<record::Json> tool_list_requests(const record::Json& args);
    utils::Result<record::Json> tool_read_request(const record::Json& args);
    utils::Result<record::Json> tool_search_requests(const record::Json& args);
    utils::Result<record::Json> tool_get_request_stats(const record::Json& args);
    utils::Result<record::Json> tool_clear_requests(const record::Json& args);
    utils::Result<record::Json> tool_export_har(const record::Json& args);

    void clip_body(record::Json* body) const;

    store::CaptureStore& store_;
    config::ServerConfig config_;
};

/**
 * @brief 工具结果（成功）
 */
record::Json make_tool_result(const record::Json& payload);

/**
 * @brief 工具结果（失败），kind取自error_kind_name(code)
 */
record::Json make_tool_error(utils::ErrorCode code, const std::string& message);

/**
 * @brief JSON序列化，非法UTF-8以U+FFFD替换
 */
std::string dump_json(const record::Json& value, int indent = -1);

} // namespace tool_server
} // namespace traffic_probe
