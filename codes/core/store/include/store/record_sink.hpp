// =============================================================================
//  Traffic Probe - Store Module
//  文件: record_sink.hpp
//  描述: 记录写入接口（抓包钩子只依赖此接口）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include "record/record.hpp"
#include "utils/error.hpp"

namespace traffic_probe {
namespace store {

class RecordSink {
public:
    virtual ~RecordSink() = default;

    /**
     * @brief 追加一条记录，忽略rec.id，由实现分配序号
     * @return 分配的序号
     */
    virtual utils::Result<uint64_t> append(const record::Record& rec) = 0;
};

} // namespace store
} // namespace traffic_probe

// 文件结束
