// =============================================================================
//  Traffic Probe - Tool Server Module
//  文件: tool_args.cpp
//  描述: 工具调用参数校验实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "tool_server/tool_args.hpp"
#include "query/query_engine.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <set>

namespace traffic_probe {
namespace tool_server {

using record::Json;
using utils::ErrorCode;
using utils::Result;
using utils::make_err;
using utils::make_ok;

namespace {

const std::set<std::string> FILTER_KEYS = {"host", "method", "status", "url_contains"};

Result<void> invalid(const std::string& message) {
    return make_err(ErrorCode::INVALID_ARGUMENT, message);
}

// 参数必须是对象，且只包含允许的键
Result<void> check_keys(const Json& args, const std::set<std::string>& allowed) {
    if (args.is_null()) {
        return make_ok();
    }
    if (!args.is_object()) {
        return invalid("arguments must be an object");
    }
    for (auto it = args.begin(); it != args.end(); ++it) {
        if (allowed.find(it.key()) == allowed.end()) {
            return invalid("unknown argument: " + it.key());
        }
    }
    return make_ok();
}

bool has_arg(const Json& args, const char* key) {
    return args.is_object() && args.contains(key) && !args[key].is_null();
}

Result<std::string> string_arg(const Json& args, const char* key) {
    const Json& value = args[key];
    if (!value.is_string()) {
        return make_err<std::string>(ErrorCode::INVALID_ARGUMENT,
                                     std::string("argument '") + key + "' must be a string");
    }
    return make_ok(value.get<std::string>());
}

Result<size_t> count_arg(const Json& args, const char* key) {
    const Json& value = args[key];
    if (value.is_number_unsigned()) {
        return make_ok(static_cast<size_t>(value.get<uint64_t>()));
    }
    if (value.is_number_integer()) {
        return make_err<size_t>(ErrorCode::INVALID_ARGUMENT,
                                std::string("argument '") + key + "' must not be negative");
    }
    return make_err<size_t>(ErrorCode::INVALID_ARGUMENT,
                            std::string("argument '") + key + "' must be an integer");
}

// 非负整数或不超过20位的十进制数字字符串
Result<uint64_t> id_value(const Json& value, const std::string& what) {
    if (value.is_number_unsigned()) {
        return make_ok(value.get<uint64_t>());
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        bool digits = !text.empty() && text.size() <= 20;
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                digits = false;
                break;
            }
        }
        if (digits) {
            errno = 0;
            unsigned long long id = std::strtoull(text.c_str(), nullptr, 10);
            if (errno == 0) {
                return make_ok(static_cast<uint64_t>(id));
            }
        }
    }
    return make_err<uint64_t>(ErrorCode::INVALID_ARGUMENT,
                              what + " must be a non-negative integer");
}

Result<query::RecordFilter> parse_filter(const Json& args) {
    query::RecordFilter filter;

    if (has_arg(args, "host")) {
        auto host = string_arg(args, "host");
        if (host.is_err()) {
            return utils::forward_err<query::RecordFilter>(host);
        }
        filter.has_host = true;
        filter.host = host.value();
    }

    if (has_arg(args, "method")) {
        auto method = string_arg(args, "method");
        if (method.is_err()) {
            return utils::forward_err<query::RecordFilter>(method);
        }
        filter.has_method = true;
        filter.method = method.value();
    }

    if (has_arg(args, "status")) {
        const Json& value = args["status"];
        std::string text;
        if (value.is_number_integer()) {
            text = std::to_string(value.get<int64_t>());
        } else if (value.is_string()) {
            text = value.get<std::string>();
        } else {
            return make_err<query::RecordFilter>(ErrorCode::INVALID_ARGUMENT,
                                                 "argument 'status' must be an integer or a string");
        }
        auto range = query::parse_status_filter(text);
        if (range.is_err()) {
            return utils::forward_err<query::RecordFilter>(range);
        }
        filter.has_status = true;
        filter.status = range.value();
    }

    if (has_arg(args, "url_contains")) {
        auto url = string_arg(args, "url_contains");
        if (url.is_err()) {
            return utils::forward_err<query::RecordFilter>(url);
        }
        filter.has_url_contains = true;
        filter.url_contains = url.value();
    }

    return make_ok(filter);
}

} // namespace

Result<ListArgs> parse_list_args(const Json& args, uint32_t default_limit) {
    std::set<std::string> allowed = FILTER_KEYS;
    allowed.insert("limit");
    allowed.insert("offset");
    auto keys = check_keys(args, allowed);
    if (keys.is_err()) {
        return utils::forward_err<ListArgs>(keys);
    }

    ListArgs result;
    auto filter = parse_filter(args);
    if (filter.is_err()) {
        return utils::forward_err<ListArgs>(filter);
    }
    result.filter = filter.value();

    if (has_arg(args, "offset")) {
        auto offset = count_arg(args, "offset");
        if (offset.is_err()) {
            return utils::forward_err<ListArgs>(offset);
        }
        result.page.offset = offset.value();
    }

    if (has_arg(args, "limit")) {
        auto limit = count_arg(args, "limit");
        if (limit.is_err()) {
            return utils::forward_err<ListArgs>(limit);
        }
        result.page.has_limit = true;
        result.page.limit = limit.value();
    } else if (default_limit > 0) {
        result.page.has_limit = true;
        result.page.limit = default_limit;
    }

    return make_ok(result);
}

Result<uint64_t> parse_read_args(const Json& args) {
    auto keys = check_keys(args, {"id"});
    if (keys.is_err()) {
        return utils::forward_err<uint64_t>(keys);
    }
    if (!has_arg(args, "id")) {
        return make_err<uint64_t>(ErrorCode::INVALID_ARGUMENT, "missing argument: id");
    }

    return id_value(args["id"], "argument 'id'");
}

Result<std::string> parse_search_args(const Json& args) {
    auto keys = check_keys(args, {"text"});
    if (keys.is_err()) {
        return utils::forward_err<std::string>(keys);
    }
    if (!has_arg(args, "text")) {
        return make_err<std::string>(ErrorCode::INVALID_ARGUMENT, "missing argument: text");
    }
    auto text = string_arg(args, "text");
    if (text.is_err()) {
        return text;
    }
    if (text.value().empty()) {
        return make_err<std::string>(ErrorCode::INVALID_ARGUMENT, "argument 'text' must not be empty");
    }
    return text;
}

Result<ExportArgs> parse_export_args(const Json& args) {
    std::set<std::string> allowed = FILTER_KEYS;
    allowed.insert("ids");
    auto keys = check_keys(args, allowed);
    if (keys.is_err()) {
        return utils::forward_err<ExportArgs>(keys);
    }

    ExportArgs result;
    auto filter = parse_filter(args);
    if (filter.is_err()) {
        return utils::forward_err<ExportArgs>(filter);
    }
    result.filter = filter.value();

    if (has_arg(args, "ids")) {
        const Json& ids = args["ids"];
        if (!ids.is_array()) {
            return make_err<ExportArgs>(ErrorCode::INVALID_ARGUMENT, "argument 'ids' must be an array");
        }
        for (size_t i = 0; i < ids.size(); ++i) {
            auto id = id_value(ids[i], "argument 'ids[" + std::to_string(i) + "]'");
            if (id.is_err()) {
                return utils::forward_err<ExportArgs>(id);
            }
            result.ids.insert(id.value());
        }
    }
    return make_ok(result);
}

Result<void> parse_empty_args(const Json& args) {
    return check_keys(args, {});
}

} // namespace tool_server
} // namespace traffic_probe
