// =============================================================================
//  Traffic Probe - Capture Module
//  文件: capture_hook.h
//  描述: 抓包钩子C接口（供代理引擎嵌入调用）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ==================== 错误码定义 ====================
// 统一使用宏定义，C和C++都可以使用
#define CAPTURE_SUCCESS              0   // 操作成功
#define CAPTURE_ERR_INVALID_PARAM   -1   // 参数无效（空指针、空字符串等）
#define CAPTURE_ERR_STORE_OPEN      -2   // 存储目录无法打开（创建时）
#define CAPTURE_ERR_INTERNAL        -3   // 内部异常

// 单个HTTP头部
typedef struct {
    const char* name;    // 头部名称（不可为NULL）
    const char* value;   // 头部值（NULL视为空串）
} CaptureHeader;

// 钩子实例前置声明
typedef struct TrafficCapture TrafficCapture;

/**
 * @brief 创建抓包钩子
 * @param store_dir 存储目录，不可为NULL
 * @param config_path 配置文件路径，可为NULL（使用默认配置）；给出时按其logging段初始化日志
 * @return 钩子指针，失败返回NULL
 */
TrafficCapture* traffic_capture_create(const char* store_dir, const char* config_path);

/**
 * @brief 销毁抓包钩子，未完成的请求写为不完整记录
 * @param capture 钩子指针，可为NULL
 */
void traffic_capture_destroy(TrafficCapture* capture);

/**
 * @brief 请求事件
 * @param flow_key 请求/响应关联键，不可为NULL
 * @param headers 头部数组，header_count>0时不可为NULL
 * @param body 消息体，body_len>0时不可为NULL
 * @return CAPTURE_SUCCESS 或 CAPTURE_ERR_INVALID_PARAM
 * @note 存储失败不会通过返回值体现，只记录日志
 */
int traffic_capture_on_request(TrafficCapture* capture,
                               const char* flow_key,
                               const char* method,
                               const char* url,
                               const CaptureHeader* headers,
                               uint32_t header_count,
                               const uint8_t* body,
                               uint32_t body_len);

/**
 * @brief 响应事件
 * @param elapsed_ms 引擎测得的耗时，负数表示由钩子计算
 */
int traffic_capture_on_response(TrafficCapture* capture,
                                const char* flow_key,
                                int status,
                                const char* reason,
                                const CaptureHeader* headers,
                                uint32_t header_count,
                                const uint8_t* body,
                                uint32_t body_len,
                                int64_t elapsed_ms);

/**
 * @brief 交换失败事件（连接错误、超时等）
 */
int traffic_capture_on_error(TrafficCapture* capture,
                             const char* flow_key,
                             const char* reason);

/**
 * @brief 处理超时未响应的请求，代理引擎应周期性调用
 * @return 处理的请求数，参数无效返回CAPTURE_ERR_INVALID_PARAM，内部错误返回CAPTURE_ERR_INTERNAL
 */
int traffic_capture_sweep(TrafficCapture* capture);

#ifdef __cplusplus
}
#endif
