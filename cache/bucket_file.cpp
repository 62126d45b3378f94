#include "bucket_file.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string describeErrno(const std::string& what, const std::string& path, int err) {
    return what + " " + path + ": " + std::strerror(err);
}

static bool isQuotaErrno(int err) {
    return err == ENOSPC || err == EDQUOT || err == EFBIG;
}

PosixBucketFile::PosixBucketFile(int fd, const std::string& path, PosixCacheDirectory* owner)
    : fd(fd), path(path), owner(owner) {}

PosixBucketFile::~PosixBucketFile() {
    if (fd >= 0) {
        ::close(fd);
    }
}

int64_t PosixBucketFile::size() const {
    struct stat st;
    if (fd < 0 || fstat(fd, &st) != 0) {
        throw StorageError(describeErrno("Failed to stat", path, errno), errno);
    }
    return st.st_size;
}

size_t PosixBucketFile::read(char* buffer, size_t len, int64_t at) const {
    size_t total = 0;
    while (total < len) {
        ssize_t n = pread(fd, buffer + total, len - total, at + static_cast<int64_t>(total));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw StorageError(describeErrno("Failed to read", path, errno), errno);
        }
        if (n == 0) {
            break;  // end of file
        }
        total += static_cast<size_t>(n);
    }
    return total;
}

int64_t PosixBucketFile::write(const char* buffer, size_t len, int64_t at) {
    if (owner) {
        int64_t growth = at + static_cast<int64_t>(len) - size();
        if (growth > 0) {
            owner->reserve(growth);
        }
    }

    ssize_t n;
    do {
        n = pwrite(fd, buffer, len, at);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        if (isQuotaErrno(errno)) {
            throw QuotaExceededError(describeErrno("Quota exceeded writing", path, errno), errno);
        }
        throw StorageError(describeErrno("Failed to write", path, errno), errno);
    }
    return n;
}

void PosixBucketFile::truncate(int64_t size) {
    if (ftruncate(fd, size) != 0) {
        throw StorageError(describeErrno("Failed to truncate", path, errno), errno);
    }
}

void PosixBucketFile::flush() {
    if (fd >= 0 && fsync(fd) != 0) {
        throw StorageError(describeErrno("Failed to flush", path, errno), errno);
    }
}

void PosixBucketFile::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool PosixBucketFile::tryLockExclusive() {
    return flock(fd, LOCK_EX | LOCK_NB) == 0;
}

bool PosixBucketFile::tryLockShared() {
    return flock(fd, LOCK_SH | LOCK_NB) == 0;
}

void PosixBucketFile::unlock() {
    if (fd >= 0) {
        flock(fd, LOCK_UN);
    }
}

PosixCacheDirectory::PosixCacheDirectory(const std::string& root_path,
                                         const std::string& directory_name,
                                         int64_t capacity_bytes)
    : directory_path(fs::path(root_path) / directory_name), capacity_bytes(capacity_bytes) {}

void PosixCacheDirectory::initialize() {
    std::error_code ec;
    fs::create_directories(directory_path, ec);
    if (ec || !fs::is_directory(directory_path)) {
        throw StorageError("Failed to open cache directory " + directory_path.string() + ": " + ec.message(),
                           ec.value());
    }
}

std::vector<CacheFileInfo> PosixCacheDirectory::listFiles() const {
    std::vector<CacheFileInfo> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_path, ec)) {
        struct stat st;
        if (stat(entry.path().c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            continue;  // removed concurrently, or not a bucket file
        }

        CacheFileInfo info;
        info.name = entry.path().filename().string();
        info.size = st.st_size;
        info.last_modified = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec)));
        files.push_back(info);
    }
    if (ec) {
        std::cerr << "[WARNING] Failed to list cache directory " << directory_path << ": " << ec.message() << "\n";
    }
    return files;
}

std::unique_ptr<BucketFile> PosixCacheDirectory::openFile(const std::string& name) {
    std::string file_path = (directory_path / name).string();
    int fd = ::open(file_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (isQuotaErrno(errno)) {
            throw QuotaExceededError(describeErrno("Quota exceeded creating", file_path, errno), errno);
        }
        throw StorageError(describeErrno("Failed to open", file_path, errno), errno);
    }
    return std::make_unique<PosixBucketFile>(fd, file_path, this);
}

RemoveResult PosixCacheDirectory::removeFile(const std::string& name) {
    std::string file_path = (directory_path / name).string();
    int fd = ::open(file_path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        std::cerr << "[WARNING] " << describeErrno("Failed to open for removal", file_path, errno) << "\n";
        return RemoveResult::Failed;
    }

    // Any open bucket holds at least a shared lock on its files
    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        ::close(fd);
        return RemoveResult::Busy;
    }

    int rc = unlink(file_path.c_str());
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        std::cerr << "[WARNING] " << describeErrno("Failed to remove", file_path, err) << "\n";
        return RemoveResult::Failed;
    }
    return RemoveResult::Removed;
}

int64_t PosixCacheDirectory::usage() const {
    int64_t total = 0;
    for (const auto& file : listFiles()) {
        total += file.size;
    }
    return total;
}

int64_t PosixCacheDirectory::quota() const {
    if (capacity_bytes > 0) {
        return capacity_bytes;
    }
    std::error_code ec;
    auto space = fs::space(directory_path, ec);
    if (ec) {
        return 0;
    }
    return usage() + static_cast<int64_t>(space.available);
}

void PosixCacheDirectory::reserve(int64_t growth) const {
    if (capacity_bytes <= 0) {
        return;
    }
    int64_t used = usage();
    if (used + growth > capacity_bytes) {
        throw QuotaExceededError("Cache directory capacity of " + std::to_string(capacity_bytes) +
                                 " bytes exceeded (" + std::to_string(used) + " used, " +
                                 std::to_string(growth) + " requested)");
    }
}
