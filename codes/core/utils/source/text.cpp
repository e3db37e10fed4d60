// =============================================================================
//  Traffic Probe - Utils Module
//  文件: text.cpp
//  描述: 字符串工具函数实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "utils/text.hpp"
#include <algorithm>
#include <cctype>
#include <strings.h>
#include <vector>
#include <openssl/evp.h>

namespace traffic_probe {
namespace utils {

namespace {

inline char lower_char(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string to_lower(const std::string& str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(), lower_char);
    return result;
}

std::string to_upper(const std::string& str) {
    std::string result(str);
    for (auto& c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && strcasecmp(a.c_str(), b.c_str()) == 0;
}

bool icontains(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return true;
    }
    auto it = std::search(haystack.begin(), haystack.end(),
                          needle.begin(), needle.end(),
                          [](char a, char b) { return lower_char(a) == lower_char(b); });
    return it != haystack.end();
}

bool iends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) {
        return false;
    }
    return strcasecmp(str.c_str() + (str.size() - suffix.size()), suffix.c_str()) == 0;
}

bool is_valid_utf8(const std::string& data) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data.data());
    size_t len = data.size();
    size_t i = 0;

    while (i < len) {
        unsigned char c = bytes[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t extra = 0;
        uint32_t code_point = 0;
        if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code_point = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= len) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = bytes[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cc & 0x3F);
        }

        // 过长编码、代理区、超出Unicode范围
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string trim(const std::string& str) {
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && is_space(str[begin])) {
        ++begin;
    }
    while (end > begin && is_space(str[end - 1])) {
        --end;
    }
    return str.substr(begin, end - begin);
}

std::string base64_encode(const std::string& data) {
    if (data.empty()) {
        return std::string();
    }

    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<size_t>(written));
}

Result<std::string> base64_decode(const std::string& text) {
    if (text.empty()) {
        return make_ok(std::string());
    }
    if (text.size() % 4 != 0) {
        return make_err<std::string>(ErrorCode::CODEC_INVALID_BASE64,
                                     "base64 length is not a multiple of 4");
    }

    std::vector<unsigned char> out(3 * (text.size() / 4) + 1);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        return make_err<std::string>(ErrorCode::CODEC_INVALID_BASE64, "malformed base64 data");
    }

    // EVP_DecodeBlock不处理填充，按'='个数回退
    size_t length = static_cast<size_t>(written);
    if (text[text.size() - 1] == '=') {
        --length;
        if (text[text.size() - 2] == '=') {
            --length;
        }
    }
    return make_ok(std::string(reinterpret_cast<const char*>(out.data()), length));
}

} // namespace utils
} // namespace traffic_probe

// 文件结束
