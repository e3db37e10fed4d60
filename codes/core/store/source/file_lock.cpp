// =============================================================================
//  Traffic Probe - Store Module
//  文件: file_lock.cpp
//  描述: 基于flock的跨进程读写锁实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "store/file_lock.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace traffic_probe {
namespace store {

using utils::ErrorCode;
using utils::make_err;
using utils::make_ok;

FileLock::FileLock()
    : fd_(-1)
{
}

FileLock::~FileLock() {
    release();
}

utils::Result<void> FileLock::acquire(const std::string& path, LockMode mode) {
    if (fd_ >= 0) {
        return make_err(ErrorCode::STORE_LOCK_ERROR, "lock already held: " + path);
    }

    int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) {
        return make_err(ErrorCode::STORE_LOCK_ERROR,
                        "cannot open lock file " + path + ": " + std::strerror(errno));
    }

    int operation = (mode == LockMode::EXCLUSIVE) ? LOCK_EX : LOCK_SH;
    int ret;
    do {
        ret = ::flock(fd, operation);
    } while (ret != 0 && errno == EINTR);

    if (ret != 0) {
        int saved_errno = errno;
        ::close(fd);
        return make_err(ErrorCode::STORE_LOCK_ERROR,
                        "cannot lock " + path + ": " + std::strerror(saved_errno));
    }

    fd_ = fd;
    return make_ok();
}

void FileLock::release() {
    if (fd_ < 0) {
        return;
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace store
} // namespace traffic_probe

// 文件结束
