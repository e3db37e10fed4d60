// =============================================================================
//  Traffic Probe - Test Support
//  文件: test_helpers.hpp
//  描述: 单元测试公共辅助（临时目录、测试记录）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdlib>
#include <dirent.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include "record/record.hpp"

namespace traffic_probe {
namespace test {

// 创建唯一临时目录，失败返回空串
inline std::string make_temp_dir(const std::string& prefix = "traffic_probe_test") {
    std::string pattern = "/tmp/" + prefix + "_XXXXXX";
    char* result = ::mkdtemp(&pattern[0]);
    return result != nullptr ? std::string(result) : std::string();
}

// 递归删除目录
inline void remove_dir(const std::string& path) {
    if (path.empty()) {
        return;
    }
    DIR* dir = ::opendir(path.c_str());
    if (dir == nullptr) {
        ::unlink(path.c_str());
        return;
    }
    struct dirent* entry;
    while ((entry = ::readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") {
            continue;
        }
        std::string child = path + "/" + name;
        struct stat st;
        if (::lstat(child.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
            remove_dir(child);
        } else {
            ::unlink(child.c_str());
        }
    }
    ::closedir(dir);
    ::rmdir(path.c_str());
}

// 构造一条完整记录
inline record::Record make_record(const std::string& method,
                                  const std::string& url,
                                  int status,
                                  uint64_t duration_ms = 10) {
    record::Record rec;
    rec.timestamp_ms = 1700000000000ULL;
    rec.method = method;
    rec.url = url;
    record::UrlParts parts = record::parse_url(url);
    rec.scheme = parts.scheme;
    rec.host = parts.host;
    rec.port = parts.port;
    rec.path = parts.path;
    rec.request_headers["User-Agent"] = "probe-test/1.0";
    rec.has_status = true;
    rec.status = status;
    rec.reason = status == 200 ? "OK" : "Status";
    rec.response_headers["Content-Type"] = "text/plain";
    rec.has_duration = true;
    rec.duration_ms = duration_ms;
    return rec;
}

// 构造一条不完整记录
inline record::Record make_partial(const std::string& method,
                                   const std::string& url,
                                   const std::string& error) {
    record::Record rec = make_record(method, url, 0);
    rec.has_status = false;
    rec.status = 0;
    rec.reason.clear();
    rec.response_headers.clear();
    rec.has_duration = false;
    rec.duration_ms = 0;
    rec.error = error;
    return rec;
}

inline record::Body text_body(const std::string& data) {
    record::Body body;
    body.data = data;
    body.size = data.size();
    return body;
}

} // namespace test
} // namespace traffic_probe
