#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "storage_error.hpp"

// Synchronous random-access handle to one file of a bucket.
class BucketFile {
public:
    virtual ~BucketFile() = default;

    virtual int64_t size() const = 0;

    // Returns the number of bytes read, which is less than len at end of file
    virtual size_t read(char* buffer, size_t len, int64_t at) const = 0;

    // Returns the number of bytes the platform reports as written.
    // Throws QuotaExceededError when out of space, StorageError otherwise.
    virtual int64_t write(const char* buffer, size_t len, int64_t at) = 0;

    virtual void truncate(int64_t size) = 0;
    virtual void flush() = 0;
    virtual void close() = 0;

    // Advisory locks, never blocking. Closing the file releases them.
    virtual bool tryLockExclusive() = 0;
    virtual bool tryLockShared() = 0;
    virtual void unlock() = 0;
};

struct CacheFileInfo {
    std::string name;
    int64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
};

enum class RemoveResult {
    Removed,
    Busy,       // open elsewhere, the platform refused the modification
    Failed
};

// The directory holding all bucket files. Eviction and statistics only go through
// this interface so they can run against a fake listing.
class CacheDirectory {
public:
    virtual ~CacheDirectory() = default;

    // Creates the directory if needed. Throws StorageError if it is unavailable.
    virtual void initialize() = 0;

    virtual std::vector<CacheFileInfo> listFiles() const = 0;

    // Opens or creates the file. Throws StorageError.
    virtual std::unique_ptr<BucketFile> openFile(const std::string& name) = 0;

    virtual RemoveResult removeFile(const std::string& name) = 0;

    // Bytes in use and the available quota, for analytics
    virtual int64_t usage() const = 0;
    virtual int64_t quota() const = 0;
};

class PosixCacheDirectory;

class PosixBucketFile : public BucketFile {
private:
    int fd;
    std::string path;
    PosixCacheDirectory* owner;

public:
    PosixBucketFile(int fd, const std::string& path, PosixCacheDirectory* owner);
    ~PosixBucketFile() override;

    PosixBucketFile(const PosixBucketFile&) = delete;
    PosixBucketFile& operator=(const PosixBucketFile&) = delete;

    int64_t size() const override;
    size_t read(char* buffer, size_t len, int64_t at) const override;
    int64_t write(const char* buffer, size_t len, int64_t at) override;
    void truncate(int64_t size) override;
    void flush() override;
    void close() override;

    bool tryLockExclusive() override;
    bool tryLockShared() override;
    void unlock() override;
};

class PosixCacheDirectory : public CacheDirectory {
private:
    std::filesystem::path directory_path;
    int64_t capacity_bytes;   // 0 = limited only by the file system

public:
    explicit PosixCacheDirectory(const std::string& root_path,
                                 const std::string& directory_name = "otg_cache",
                                 int64_t capacity_bytes = 0);

    void initialize() override;
    std::vector<CacheFileInfo> listFiles() const override;
    std::unique_ptr<BucketFile> openFile(const std::string& name) override;
    RemoveResult removeFile(const std::string& name) override;
    int64_t usage() const override;
    int64_t quota() const override;

    const std::filesystem::path& path() const { return directory_path; }

    // Throws QuotaExceededError if growing the directory by growth bytes exceeds the capacity
    void reserve(int64_t growth) const;
};
