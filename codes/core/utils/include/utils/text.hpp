// =============================================================================
//  Traffic Probe - Utils Module
//  文件: text.hpp
//  描述: 字符串匹配、UTF-8校验、Base64编解码工具函数
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include "utils/error.hpp"

namespace traffic_probe {
namespace utils {

// ASCII转小写/大写
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);

// 大小写不敏感比较（ASCII）
bool iequals(const std::string& a, const std::string& b);

// 大小写不敏感子串查找（ASCII），needle为空时返回true
bool icontains(const std::string& haystack, const std::string& needle);

// 大小写不敏感后缀判断（ASCII）
bool iends_with(const std::string& str, const std::string& suffix);

// 是否为合法UTF-8序列（拒绝过长编码和代理区码点）
bool is_valid_utf8(const std::string& data);

// 去除首尾空白
std::string trim(const std::string& str);

// Base64编码（基于OpenSSL EVP_EncodeBlock，无换行）
std::string base64_encode(const std::string& data);

// Base64解码（基于OpenSSL EVP_DecodeBlock）
// return: 非法输入返回CODEC_INVALID_BASE64
Result<std::string> base64_decode(const std::string& text);

} // namespace utils
} // namespace traffic_probe

// 文件结束
