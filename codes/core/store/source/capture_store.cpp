// =============================================================================
//  Traffic Probe - Store Module
//  文件: capture_store.cpp
//  描述: 抓包记录持久化存储实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "store/capture_store.hpp"
#include "store/file_lock.hpp"
#include "record/record_codec.hpp"
#include "utils/logger.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace traffic_probe {
namespace store {

using record::Record;
using utils::ErrorCode;
using utils::Result;
using utils::make_err;
using utils::make_ok;

constexpr const char* CaptureStore::RECORDS_FILE;
constexpr const char* CaptureStore::SEQUENCE_FILE;
constexpr const char* CaptureStore::LOCK_FILE;

namespace {

const char* const MODULE = "Store";
constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

std::string errno_text() {
    return std::strerror(errno);
}

// 逐级创建目录
Result<void> make_directories(const std::string& path) {
    if (path.empty()) {
        return make_err(ErrorCode::STORE_UNAVAILABLE, "store directory is empty");
    }

    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = path.find('/', pos + 1);
        std::string partial = path.substr(0, pos);
        if (partial.empty()) {
            continue;
        }
        if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            return make_err(ErrorCode::STORE_UNAVAILABLE,
                            "cannot create directory " + partial + ": " + errno_text());
        }
    }

    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        return make_err(ErrorCode::STORE_UNAVAILABLE, "not a directory: " + path);
    }
    return make_ok();
}

// 完整写入，处理短写与EINTR
bool write_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

// 逐条回调已完整写入的记录，返回false时停止
template<typename Visitor>
void for_each_record(const std::string& content, const std::string& source, Visitor visit) {
    size_t begin = 0;
    size_t line_no = 0;
    while (begin < content.size()) {
        size_t end = content.find('\n', begin);
        if (end == std::string::npos) {
            // 写入方持写锁期间读方无法进入，出现半行只可能是崩溃残留
            LOG_WARN(MODULE, "ignoring unterminated trailing data (%zu bytes) in %s",
                     content.size() - begin, source.c_str());
            break;
        }
        ++line_no;
        if (end > begin) {
            auto parsed = record::record_from_line(content.substr(begin, end - begin));
            if (parsed.is_ok()) {
                if (!visit(parsed.value())) {
                    return;
                }
            } else {
                LOG_WARN(MODULE, "skipping corrupt line %zu in %s: %s",
                         line_no, source.c_str(), parsed.error_message().c_str());
            }
        }
        begin = end + 1;
    }
}

size_t count_records(const std::string& content, const std::string& source) {
    size_t count = 0;
    for_each_record(content, source, [&count](const Record&) {
        ++count;
        return true;
    });
    return count;
}

} // namespace

CaptureStore::CaptureStore(const std::string& directory, bool sync_writes)
    : directory_(directory)
    , sync_writes_(sync_writes)
{
    while (directory_.size() > 1 && directory_.back() == '/') {
        directory_.pop_back();
    }
}

CaptureStore::~CaptureStore() = default;

std::string CaptureStore::path_of(const char* name) const {
    return directory_ + "/" + name;
}

Result<void> CaptureStore::open() {
    auto dir_ret = make_directories(directory_);
    if (dir_ret.is_err()) {
        return dir_ret;
    }

    FileLock lock;
    auto lock_ret = lock.acquire(path_of(LOCK_FILE), LockMode::EXCLUSIVE);
    if (lock_ret.is_err()) {
        return lock_ret;
    }

    int fd = ::open(path_of(RECORDS_FILE).c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return make_err(ErrorCode::STORE_UNAVAILABLE,
                        "cannot create " + path_of(RECORDS_FILE) + ": " + errno_text());
    }
    ::close(fd);

    if (::access(path_of(SEQUENCE_FILE).c_str(), F_OK) != 0) {
        // 记录文件非空时以现存最大序号重建，避免序号复用
        uint64_t last = 0;
        struct stat st;
        if (::stat(path_of(RECORDS_FILE).c_str(), &st) == 0 && st.st_size > 0) {
            auto recovered = read_sequence();
            if (recovered.is_err()) {
                return utils::forward_err<void>(recovered);
            }
            last = recovered.value();
        }
        auto seq_ret = write_sequence(last);
        if (seq_ret.is_err()) {
            return seq_ret;
        }
    }

    LOG_INFO(MODULE, "capture store opened at %s", directory_.c_str());
    return make_ok();
}

Result<uint64_t> CaptureStore::append(const Record& rec) {
    FileLock lock;
    auto lock_ret = lock.acquire(path_of(LOCK_FILE), LockMode::EXCLUSIVE);
    if (lock_ret.is_err()) {
        return utils::forward_err<uint64_t>(lock_ret);
    }

    int fd = ::open(path_of(RECORDS_FILE).c_str(), O_CREAT | O_RDWR | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return make_err<uint64_t>(ErrorCode::STORE_UNAVAILABLE,
                                  "cannot open " + path_of(RECORDS_FILE) + ": " + errno_text());
    }

    auto repair_ret = repair_torn_tail(fd);
    if (repair_ret.is_err()) {
        ::close(fd);
        return utils::forward_err<uint64_t>(repair_ret);
    }

    auto seq_ret = read_sequence();
    if (seq_ret.is_err()) {
        ::close(fd);
        return seq_ret;
    }
    uint64_t id = seq_ret.value() + 1;

    // 先持久化序号，保证即使后续写入失败该序号也不会被复用
    auto write_seq_ret = write_sequence(id);
    if (write_seq_ret.is_err()) {
        ::close(fd);
        return utils::forward_err<uint64_t>(write_seq_ret);
    }

    Record stored = rec;
    stored.id = id;
    std::string line = record::record_to_line(stored);
    line.push_back('\n');

    struct stat st;
    off_t original_size = (::fstat(fd, &st) == 0) ? st.st_size : -1;

    if (!write_all(fd, line.data(), line.size())) {
        std::string reason = errno_text();
        // 回滚半行，读方永远看不到不完整记录
        if (original_size >= 0 && ::ftruncate(fd, original_size) != 0) {
            LOG_ERROR(MODULE, "rollback of partial write failed: %s", errno_text().c_str());
        }
        ::close(fd);
        return make_err<uint64_t>(ErrorCode::FILE_WRITE_ERROR, "append failed: " + reason);
    }

    if (sync_writes_ && ::fdatasync(fd) != 0) {
        std::string reason = errno_text();
        ::close(fd);
        return make_err<uint64_t>(ErrorCode::FILE_WRITE_ERROR, "fdatasync failed: " + reason);
    }

    ::close(fd);
    LOG_DEBUG(MODULE, "appended record %llu (%s %s)",
              static_cast<unsigned long long>(id), rec.method.c_str(), rec.url.c_str());
    return make_ok(id);
}

Result<std::vector<Record>> CaptureStore::snapshot() const {
    FileLock lock;
    auto lock_ret = lock.acquire(path_of(LOCK_FILE), LockMode::SHARED);
    if (lock_ret.is_err()) {
        return utils::forward_err<std::vector<Record>>(lock_ret);
    }

    auto content = read_records_file();
    if (content.is_err()) {
        return utils::forward_err<std::vector<Record>>(content);
    }
    lock.release();

    std::vector<Record> records;
    for_each_record(content.value(), path_of(RECORDS_FILE), [&records](const Record& rec) {
        records.push_back(rec);
        return true;
    });
    return make_ok(std::move(records));
}

Result<Record> CaptureStore::get(uint64_t id) const {
    FileLock lock;
    auto lock_ret = lock.acquire(path_of(LOCK_FILE), LockMode::SHARED);
    if (lock_ret.is_err()) {
        return utils::forward_err<Record>(lock_ret);
    }

    auto content = read_records_file();
    if (content.is_err()) {
        return utils::forward_err<Record>(content);
    }
    lock.release();

    bool found = false;
    Record result;
    for_each_record(content.value(), path_of(RECORDS_FILE), [&](const Record& rec) {
        if (rec.id == id) {
            result = rec;
            found = true;
            return false;
        }
        // 行序即序号升序，越过目标即可停止
        return rec.id < id;
    });

    if (!found) {
        return make_err<Record>(ErrorCode::RECORD_NOT_FOUND,
                                "record " + std::to_string(id) + " not found");
    }
    return make_ok(std::move(result));
}

Result<size_t> CaptureStore::clear() {
    FileLock lock;
    auto lock_ret = lock.acquire(path_of(LOCK_FILE), LockMode::EXCLUSIVE);
    if (lock_ret.is_err()) {
        return utils::forward_err<size_t>(lock_ret);
    }

    auto content = read_records_file();
    if (content.is_err()) {
        return utils::forward_err<size_t>(content);
    }
    // 只统计可解析的记录，与snapshot可见的条数一致
    size_t removed = count_records(content.value(), path_of(RECORDS_FILE));

    int fd = ::open(path_of(RECORDS_FILE).c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return make_err<size_t>(ErrorCode::FILE_WRITE_ERROR,
                                "cannot truncate " + path_of(RECORDS_FILE) + ": " + errno_text());
    }
    if (sync_writes_) {
        ::fdatasync(fd);
    }
    ::close(fd);

    LOG_INFO(MODULE, "cleared %zu records", removed);
    return make_ok(removed);
}

Result<size_t> CaptureStore::count() const {
    FileLock lock;
    auto lock_ret = lock.acquire(path_of(LOCK_FILE), LockMode::SHARED);
    if (lock_ret.is_err()) {
        return utils::forward_err<size_t>(lock_ret);
    }

    auto content = read_records_file();
    if (content.is_err()) {
        return utils::forward_err<size_t>(content);
    }
    return make_ok(count_records(content.value(), path_of(RECORDS_FILE)));
}

Result<uint64_t> CaptureStore::last_id() const {
    FileLock lock;
    auto lock_ret = lock.acquire(path_of(LOCK_FILE), LockMode::SHARED);
    if (lock_ret.is_err()) {
        return utils::forward_err<uint64_t>(lock_ret);
    }
    return read_sequence();
}

Result<std::string> CaptureStore::read_records_file() const {
    std::string path = path_of(RECORDS_FILE);
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return make_ok(std::string());
        }
        return make_err<std::string>(ErrorCode::FILE_READ_ERROR,
                                     "cannot open " + path + ": " + errno_text());
    }

    std::string content;
    char buffer[READ_CHUNK_SIZE];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = errno_text();
            ::close(fd);
            return make_err<std::string>(ErrorCode::FILE_READ_ERROR,
                                         "cannot read " + path + ": " + reason);
        }
        if (n == 0) {
            break;
        }
        content.append(buffer, static_cast<size_t>(n));
    }
    ::close(fd);
    return make_ok(std::move(content));
}

Result<uint64_t> CaptureStore::read_sequence() const {
    std::string path = path_of(SEQUENCE_FILE);
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno != ENOENT) {
            return make_err<uint64_t>(ErrorCode::FILE_READ_ERROR,
                                      "cannot open " + path + ": " + errno_text());
        }
    } else {
        char buffer[32] = {0};
        ssize_t n = ::read(fd, buffer, sizeof(buffer) - 1);
        ::close(fd);
        if (n > 0) {
            char* end = nullptr;
            errno = 0;
            unsigned long long value = std::strtoull(buffer, &end, 10);
            if (errno == 0 && end != buffer) {
                return make_ok(static_cast<uint64_t>(value));
            }
        }
    }

    // 序号文件丢失或损坏：以现存记录的最大序号恢复
    auto content = read_records_file();
    if (content.is_err()) {
        return utils::forward_err<uint64_t>(content);
    }
    uint64_t max_id = 0;
    for_each_record(content.value(), path_of(RECORDS_FILE), [&max_id](const Record& rec) {
        if (rec.id > max_id) {
            max_id = rec.id;
        }
        return true;
    });
    LOG_WARN(MODULE, "sequence file missing or unreadable, recovered last id %llu from records",
             static_cast<unsigned long long>(max_id));
    return make_ok(max_id);
}

Result<void> CaptureStore::write_sequence(uint64_t value) {
    std::string path = path_of(SEQUENCE_FILE);
    std::string tmp_path = path + ".tmp";

    int fd = ::open(tmp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return make_err(ErrorCode::FILE_WRITE_ERROR,
                        "cannot open " + tmp_path + ": " + errno_text());
    }

    std::string text = std::to_string(value) + "\n";
    if (!write_all(fd, text.data(), text.size())) {
        std::string reason = errno_text();
        ::close(fd);
        return make_err(ErrorCode::FILE_WRITE_ERROR, "cannot write " + tmp_path + ": " + reason);
    }
    if (sync_writes_ && ::fdatasync(fd) != 0) {
        std::string reason = errno_text();
        ::close(fd);
        return make_err(ErrorCode::FILE_WRITE_ERROR, "fdatasync failed: " + reason);
    }
    ::close(fd);

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        return make_err(ErrorCode::FILE_WRITE_ERROR,
                        "cannot replace " + path + ": " + errno_text());
    }
    return make_ok();
}

Result<void> CaptureStore::repair_torn_tail(int fd) {
    struct stat st;
    if (::fstat(fd, &st) != 0) {
        return make_err(ErrorCode::FILE_READ_ERROR, "fstat failed: " + errno_text());
    }
    if (st.st_size == 0) {
        return make_ok();
    }

    char last = 0;
    if (::pread(fd, &last, 1, st.st_size - 1) != 1) {
        return make_err(ErrorCode::FILE_READ_ERROR, "pread failed: " + errno_text());
    }
    if (last == '\n') {
        return make_ok();
    }

    // 从尾部向前寻找最后一个换行
    off_t keep = 0;
    off_t end = st.st_size;
    char buffer[4096];
    while (end > 0) {
        off_t begin = end > static_cast<off_t>(sizeof(buffer)) ? end - static_cast<off_t>(sizeof(buffer)) : 0;
        size_t len = static_cast<size_t>(end - begin);
        if (::pread(fd, buffer, len, begin) != static_cast<ssize_t>(len)) {
            return make_err(ErrorCode::FILE_READ_ERROR, "pread failed: " + errno_text());
        }
        bool found = false;
        for (size_t i = len; i > 0; --i) {
            if (buffer[i - 1] == '\n') {
                keep = begin + static_cast<off_t>(i);
                found = true;
                break;
            }
        }
        if (found) {
            break;
        }
        end = begin;
    }

    if (::ftruncate(fd, keep) != 0) {
        return make_err(ErrorCode::STORE_CORRUPTED,
                        "cannot cut torn tail: " + errno_text());
    }
    LOG_WARN(MODULE, "removed %lld bytes of torn trailing data from %s",
             static_cast<long long>(st.st_size - keep), path_of(RECORDS_FILE).c_str());
    return make_ok();
}

} // namespace store
} // namespace traffic_probe

// 文件结束
