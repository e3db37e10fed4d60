// =============================================================================
//  Traffic Probe - Tool Server Module
//  文件: tool_server.cpp
//  描述: 工具服务实现（消息分发与六个查询工具）
//  版权: Copyright (c) 2026
// =============================================================================
#include "tool_server/tool_server.hpp"
#include "tool_server/tool_args.hpp"
#include "har/har_codec.hpp"
#include "query/query_engine.hpp"
#include "utils/logger.hpp"
#include "utils/text.hpp"
#include <exception>
#include <istream>
#include <ostream>

namespace traffic_probe {
namespace tool_server {

using record::Json;
using record::Record;
using utils::ErrorCode;
using utils::Result;
using utils::make_err;
using utils::make_ok;

namespace {

const char* const MODULE = "ToolServer";

Json rpc_result(const Json& id, const Json& result) {
    return {{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"result", result}};
}

Json rpc_error(const Json& id, int code, const std::string& message) {
    return {{"jsonrpc", JSONRPC_VERSION}, {"id", id},
            {"error", {{"code", code}, {"message", message}}}};
}

Json filter_properties() {
    return {
        {"host", {{"type", "string"},
                  {"description", "Exact host, or parent domain matching its subdomains"}}},
        {"method", {{"type", "string"},
                    {"description", "HTTP method, case-insensitive"}}},
        {"status", {{"type", {"integer", "string"}},
                    {"description", "Status code (404), class (\"4xx\") or range (\"400-499\")"}}},
        {"url_contains", {{"type", "string"},
                          {"description", "Case-insensitive URL substring"}}}
    };
}

Json stats_to_json(const query::TrafficStats& stats) {
    Json duration = nullptr;
    if (stats.with_duration > 0) {
        duration = {
            {"min", stats.min_duration_ms},
            {"max", stats.max_duration_ms},
            {"avg", stats.avg_duration_ms},
            {"count", stats.with_duration}
        };
    }

    Json by_status = Json::object();
    for (const char* cls : {"2xx", "3xx", "4xx", "5xx", "other", "none"}) {
        auto it = stats.by_status_class.find(cls);
        by_status[cls] = it != stats.by_status_class.end() ? it->second : 0;
    }

    return {
        {"total_requests", stats.total},
        {"partial_requests", stats.partial},
        {"by_host", stats.by_host},
        {"by_method", stats.by_method},
        {"by_status_class", by_status},
        {"duration_ms", duration},
        {"request_bytes", stats.request_bytes},
        {"response_bytes", stats.response_bytes}
    };
}

} // namespace

// ==================== 公共函数 ====================

std::string dump_json(const Json& value, int indent) {
    return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

Json make_tool_result(const Json& payload) {
    return {
        {"content", {{{"type", "text"}, {"text", dump_json(payload, 2)}}}},
        {"structuredContent", payload},
        {"isError", false}
    };
}

Json make_tool_error(ErrorCode code, const std::string& message) {
    Json payload = {
        {"error", {
            {"kind", utils::error_kind_name(code)},
            {"code", utils::error_code_to_string(code)},
            {"message", message}
        }}
    };
    return {
        {"content", {{{"type", "text"}, {"text", dump_json(payload, 2)}}}},
        {"structuredContent", payload},
        {"isError", true}
    };
}

// ==================== ToolServer实现 ====================

ToolServer::ToolServer(store::CaptureStore& store, const config::ServerConfig& config)
    : store_(store)
    , config_(config)
{
}

ToolServer::~ToolServer() = default;

Json ToolServer::tool_definitions() {
    Json list_props = filter_properties();
    list_props["limit"] = {{"type", "integer"}, {"minimum", 0},
                           {"description", "Maximum number of requests to return"}};
    list_props["offset"] = {{"type", "integer"}, {"minimum", 0},
                            {"description", "Number of matching requests to skip"}};

    Json export_props = filter_properties();
    export_props["ids"] = {{"type", "array"},
                           {"items", {{"type", {"integer", "string"}}}},
                           {"description", "Record ids from list_requests or search_requests; "
                                           "empty or absent exports every matching request"}};

    auto tool = [](const char* name, const char* description, const Json& properties,
                   const Json& required) {
        return Json{
            {"name", name},
            {"description", description},
            {"inputSchema", {
                {"type", "object"},
                {"properties", properties},
                {"required", required},
                {"additionalProperties", false}
            }}
        };
    };

    return Json::array({
        tool("list_requests",
             "List captured HTTP requests in capture order with summary information "
             "(id, timestamp, method, host, path, status, duration_ms). "
             "Use the id with read_request for full details.",
             list_props, Json::array()),
        tool("read_request",
             "Read the full details of one captured request/response, including all headers and bodies.",
             {{"id", {{"type", {"integer", "string"}},
                      {"description", "Record id from list_requests"}}}},
             Json::array({"id"})),
        tool("search_requests",
             "Search captured requests by case-insensitive text in URL, headers and text bodies.",
             {{"text", {{"type", "string"}, {"description", "Text to search for"}}}},
             Json::array({"text"})),
        tool("get_request_stats",
             "Get statistics about captured traffic: totals, counts by host, method and status class, "
             "and duration range.",
             Json::object(), Json::array()),
        tool("clear_requests",
             "Delete all captured requests. Returns the number of records removed.",
             Json::object(), Json::array()),
        tool("export_har",
             "Export captured traffic, optionally filtered or limited to the given ids, "
             "as a HAR 1.2 (HTTP Archive) document.",
             export_props, Json::array())
    });
}

bool ToolServer::is_known_tool(const std::string& name) {
    return name == "list_requests" || name == "read_request" || name == "search_requests" ||
           name == "get_request_stats" || name == "clear_requests" || name == "export_har";
}

bool ToolServer::handle_line(const std::string& line, std::string* reply) {
    Json message = Json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        LOG_WARN(MODULE, "discarding malformed JSON input (%zu bytes)", line.size());
        *reply = dump_json(rpc_error(nullptr, RPC_PARSE_ERROR, "Parse error"));
        return true;
    }

    Json response = handle_message(message);
    if (response.is_null()) {
        return false;
    }
    *reply = dump_json(response);
    return true;
}

Json ToolServer::handle_message(const Json& message) {
    if (!message.is_object() || !message.contains("method") || !message["method"].is_string()) {
        Json id = (message.is_object() && message.contains("id")) ? message["id"] : Json(nullptr);
        return rpc_error(id, RPC_INVALID_REQUEST, "Invalid Request");
    }

    const std::string method = message["method"].get<std::string>();
    const bool is_notification = !message.contains("id");
    const Json id = is_notification ? Json(nullptr) : message["id"];
    const Json params = message.contains("params") ? message["params"] : Json::object();

    LOG_DEBUG(MODULE, "processing method: %s", method.c_str());

    try {
        if (method == "notifications/initialized" || is_notification) {
            // 通知不需要回复
            return nullptr;
        }
        if (method == "initialize") {
            return rpc_result(id, handle_initialize(params));
        }
        if (method == "ping") {
            return rpc_result(id, Json::object());
        }
        if (method == "tools/list") {
            return rpc_result(id, {{"tools", tool_definitions()}});
        }
        if (method == "resources/list") {
            return rpc_result(id, {{"resources", Json::array()}});
        }
        if (method == "tools/call") {
            return handle_tools_call(id, params);
        }
        return rpc_error(id, RPC_METHOD_NOT_FOUND, "Method not found: " + method);
    } catch (const std::exception& e) {
        LOG_ERROR(MODULE, "method %s failed: %s", method.c_str(), e.what());
        return rpc_error(id, RPC_INTERNAL_ERROR, e.what());
    }
}

Json ToolServer::handle_initialize(const Json& params) const {
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        LOG_INFO(MODULE, "client connected: %s",
                 params["clientInfo"].value("name", std::string("unknown")).c_str());
    }
    return {
        {"protocolVersion", config_.protocol_version},
        {"capabilities", {{"tools", Json::object()}, {"resources", Json::object()}}},
        {"serverInfo", {{"name", config_.name}, {"version", config_.version}}}
    };
}

Json ToolServer::handle_tools_call(const Json& id, const Json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return rpc_error(id, RPC_INVALID_PARAMS, "tools/call requires a string 'name'");
    }

    const std::string name = params["name"].get<std::string>();
    if (!is_known_tool(name)) {
        return rpc_error(id, RPC_METHOD_NOT_FOUND, "Unknown tool: " + name);
    }

    Json args = params.contains("arguments") ? params["arguments"] : Json::object();
    return rpc_result(id, call_tool(name, args));
}

Json ToolServer::call_tool(const std::string& name, const Json& args) {
    LOG_DEBUG(MODULE, "tool call: %s %s", name.c_str(), dump_json(args).c_str());

    try {
        auto ret = dispatch_tool(name, args);
        if (ret.is_err()) {
            LOG_WARN(MODULE, "tool %s failed: [%s] %s", name.c_str(),
                     utils::error_code_to_string(ret.error_code()), ret.error_message().c_str());
            return make_tool_error(ret.error_code(), ret.error_message());
        }
        return make_tool_result(ret.value());
    } catch (const std::exception& e) {
        // 单次调用的意外错误不影响后续调用
        LOG_ERROR(MODULE, "tool %s raised: %s", name.c_str(), e.what());
        return make_tool_error(ErrorCode::INTERNAL_ERROR, e.what());
    }
}

int ToolServer::run(std::istream& in, std::ostream& out) {
    LOG_INFO(MODULE, "tool server started, store: %s", store_.directory().c_str());

    std::string line;
    while (std::getline(in, line)) {
        if (utils::trim(line).empty()) {
            continue;
        }

        std::string reply;
        if (handle_line(line, &reply)) {
            out << reply << '\n';
            out.flush();
            if (!out) {
                LOG_ERROR(MODULE, "output stream closed, tool server exiting");
                return 1;
            }
        }
    }

    LOG_INFO(MODULE, "input closed, tool server exiting");
    return 0;
}

// ==================== 工具实现 ====================

Result<Json> ToolServer::dispatch_tool(const std::string& name, const Json& args) {
    if (name == "list_requests") {
        return tool_list_requests(args);
    }
    if (name == "read_request") {
        return tool_read_request(args);
    }
    if (name == "search_requests") {
        return tool_search_requests(args);
    }
    if (name == "get_request_stats") {
        return tool_get_request_stats(args);
    }
    if (name == "clear_requests") {
        return tool_clear_requests(args);
    }
    if (name == "export_har") {
        return tool_export_har(args);
    }
    return make_err<Json>(ErrorCode::INVALID_ARGUMENT, "unknown tool: " + name);
}

Result<Json> ToolServer::tool_list_requests(const Json& args) {
    auto parsed = parse_list_args(args, config_.default_list_limit);
    if (parsed.is_err()) {
        return utils::forward_err<Json>(parsed);
    }

    auto snapshot = store_.snapshot();
    if (snapshot.is_err()) {
        return utils::forward_err<Json>(snapshot);
    }

    const query::Page& page = parsed.value().page;
    query::ListResult result = query::list(snapshot.value(), parsed.value().filter, page);

    Json requests = Json::array();
    for (const Record& rec : result.records) {
        requests.push_back(record::record_to_summary_json(rec));
    }

    Json payload = {
        {"total", result.total},
        {"count", result.records.size()},
        {"offset", page.offset},
        {"limit", page.has_limit ? Json(page.limit) : Json(nullptr)},
        {"requests", requests}
    };
    return make_ok(payload);
}

Result<Json> ToolServer::tool_read_request(const Json& args) {
    auto id = parse_read_args(args);
    if (id.is_err()) {
        return utils::forward_err<Json>(id);
    }

    auto rec = store_.get(id.value());
    if (rec.is_err()) {
        return utils::forward_err<Json>(rec);
    }

    Json payload = record::record_to_json(rec.value());
    clip_body(&payload["request"]["body"]);
    if (payload["response"].is_object()) {
        clip_body(&payload["response"]["body"]);
    }
    return make_ok(payload);
}

Result<Json> ToolServer::tool_search_requests(const Json& args) {
    auto text = parse_search_args(args);
    if (text.is_err()) {
        return utils::forward_err<Json>(text);
    }

    auto snapshot = store_.snapshot();
    if (snapshot.is_err()) {
        return utils::forward_err<Json>(snapshot);
    }

    auto hits = query::search(snapshot.value(), text.value());
    if (hits.is_err()) {
        return utils::forward_err<Json>(hits);
    }

    Json requests = Json::array();
    for (const query::SearchHit& hit : hits.value()) {
        Json summary = record::record_to_summary_json(hit.record);
        summary["found_in"] = hit.found_in;
        requests.push_back(summary);
    }

    Json payload = {
        {"text", text.value()},
        {"count", hits.value().size()},
        {"requests", requests}
    };
    return make_ok(payload);
}

Result<Json> ToolServer::tool_get_request_stats(const Json& args) {
    auto checked = parse_empty_args(args);
    if (checked.is_err()) {
        return utils::forward_err<Json>(checked);
    }

    auto snapshot = store_.snapshot();
    if (snapshot.is_err()) {
        return utils::forward_err<Json>(snapshot);
    }
    return make_ok(stats_to_json(query::stats(snapshot.value())));
}

Result<Json> ToolServer::tool_clear_requests(const Json& args) {
    auto checked = parse_empty_args(args);
    if (checked.is_err()) {
        return utils::forward_err<Json>(checked);
    }

    auto removed = store_.clear();
    if (removed.is_err()) {
        return utils::forward_err<Json>(removed);
    }
    Json payload = {{"removed", removed.value()}};
    return make_ok(payload);
}

Result<Json> ToolServer::tool_export_har(const Json& args) {
    auto parsed = parse_export_args(args);
    if (parsed.is_err()) {
        return utils::forward_err<Json>(parsed);
    }

    auto snapshot = store_.snapshot();
    if (snapshot.is_err()) {
        return utils::forward_err<Json>(snapshot);
    }

    const ExportArgs& export_args = parsed.value();
    std::vector<Record> selected = query::filter_records(snapshot.value(), export_args.filter);
    if (!export_args.ids.empty()) {
        // 不存在的序号直接忽略，输出保持序号升序
        std::vector<Record> picked;
        for (Record& rec : selected) {
            if (export_args.ids.count(rec.id) > 0) {
                picked.push_back(std::move(rec));
            }
        }
        selected.swap(picked);
    }
    return make_ok(har::encode(selected, har::Creator(config_.name, config_.version)));
}

void ToolServer::clip_body(Json* body) const {
    if (body == nullptr || !body->is_object() || config_.read_body_limit == 0) {
        return;
    }
    auto data = body->find("data");
    if (data == body->end() || !data->is_string()) {
        return;
    }
    const std::string& text = data->get_ref<const std::string&>();
    if (text.size() <= config_.read_body_limit) {
        return;
    }
    size_t cut = config_.read_body_limit;
    // 避免切断UTF-8多字节字符
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    std::string clipped = text.substr(0, cut);
    *data = clipped;
    (*body)["display_truncated"] = true;
}

} // namespace tool_server
} // namespace traffic_probe

// 文件结束
