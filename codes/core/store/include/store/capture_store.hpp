// =============================================================================
//  Traffic Probe - Store Module
//  文件: capture_store.hpp
//  描述: 抓包记录的持久化存储
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "record/record.hpp"
#include "store/record_sink.hpp"
#include "utils/error.hpp"

namespace traffic_probe {
namespace store {

/**
 * @brief 目录式记录存储
 *
 * 目录布局:
 *   records.jsonl  每行一条记录，行序即序号升序
 *   sequence       最后分配的序号（十进制文本，整体替换写入）
 *   store.lock     advisory锁文件
 *
 * 锁规则: append/clear持写锁，snapshot/get/count/last_id持读锁。
 * 写入方（抓包进程）与读取方（工具服务进程）只通过本目录交互，
 * 任何一方都不需要与另一方直接协调。
 *
 * 序号规则: 先写sequence再写记录行，崩溃最多造成序号空洞，不会复用；
 * clear只清空记录文件，sequence保持单调。
 */
class CaptureStore : public RecordSink {
public:
    static constexpr const char* RECORDS_FILE = "records.jsonl";
    static constexpr const char* SEQUENCE_FILE = "sequence";
    static constexpr const char* LOCK_FILE = "store.lock";

    /**
     * @param directory 存储目录
     * @param sync_writes 每次append后fdatasync
     */
    explicit CaptureStore(const std::string& directory, bool sync_writes = true);
    ~CaptureStore() override;

    // 禁止拷贝
    CaptureStore(const CaptureStore&) = delete;
    CaptureStore& operator=(const CaptureStore&) = delete;

    /**
     * @brief 创建目录与存储文件（已存在时保持原内容）
     * @return STORE_UNAVAILABLE 目录无法创建
     */
    utils::Result<void> open();

    /**
     * @brief 追加记录并分配下一个序号
     * @note 返回成功即已写入文件（sync_writes时已落盘）
     */
    utils::Result<uint64_t> append(const record::Record& rec) override;

    /**
     * @brief 读取当前全部记录，按序号升序
     * @note 无法解析的行会被跳过并告警
     */
    utils::Result<std::vector<record::Record>> snapshot() const;

    /**
     * @brief 按序号读取单条记录
     * @return RECORD_NOT_FOUND 不存在或已被清空
     */
    utils::Result<record::Record> get(uint64_t id) const;

    /**
     * @brief 清空全部记录，序号计数保持不变
     * @return 被删除的记录数，空存储返回0
     */
    utils::Result<size_t> clear();

    /**
     * @brief 当前记录数
     */
    utils::Result<size_t> count() const;

    /**
     * @brief 最后分配的序号，从未分配返回0
     */
    utils::Result<uint64_t> last_id() const;

    const std::string& directory() const { return directory_; }

private:
    std::string path_of(const char* name) const;

    // 以下函数要求调用方已持有锁
    utils::Result<std::string> read_records_file() const;
    utils::Result<uint64_t> read_sequence() const;
    utils::Result<void> write_sequence(uint64_t value);
    utils::Result<void> repair_torn_tail(int fd);

    std::string directory_;
    bool sync_writes_;
};

} // namespace store
} // namespace traffic_probe

// 文件结束
