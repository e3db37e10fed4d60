// =============================================================================
//  Traffic Probe - Store Module
//  文件: file_lock.hpp
//  描述: 基于flock的跨进程读写锁
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <string>
#include "utils/error.hpp"

namespace traffic_probe {
namespace store {

// 锁模式
enum class LockMode {
    SHARED = 0,     // 读锁，可与其他读锁并存
    EXCLUSIVE = 1   // 写锁，与任何锁互斥
};

/**
 * @brief 锁文件上的advisory锁，析构时自动释放
 * @note 每个FileLock对象独立open锁文件，因此同一进程内的不同线程
 *       与不同进程之间的互斥语义一致
 */
class FileLock {
public:
    FileLock();
    ~FileLock();

    // 禁止拷贝
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    /**
     * @brief 打开（必要时创建）锁文件并阻塞等待加锁
     * @param path 锁文件路径
     * @param mode 锁模式
     * @return STORE_LOCK_ERROR 打开或加锁失败
     */
    utils::Result<void> acquire(const std::string& path, LockMode mode);

    /**
     * @brief 释放锁并关闭文件，未加锁时为空操作
     */
    void release();

    bool is_locked() const { return fd_ >= 0; }

private:
    int fd_;
};

} // namespace store
} // namespace traffic_probe

// 文件结束
