#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "bucket_file.hpp"
#include "bucket_format.hpp"
#include "content_hash.hpp"

enum class BucketOpenStatus {
    Ready,              // files open, this instance holds the write lock
    ReadOnlyDegraded,   // files open, another process or instance holds the write lock
    Failed              // sticky until close()
};

struct BucketOpenResult {
    BucketOpenStatus status = BucketOpenStatus::Failed;
    std::string reason;
};

struct CacheStats {
    int64_t entries = 0;        // Number of cache entries
    int64_t data_size = 0;      // Bytes of blob data on disk
    int64_t metadata_size = 0;  // Bytes of metadata on disk
};

using AnalyticsCallback = std::function<void(const std::string& event,
                                             const std::map<std::string, std::string>& properties)>;

// Durable cache of content-addressed blobs, partitioned into named buckets.
// Each bucket is stored as two append-only files in the cache directory: the
// concatenated blobs, and a metadata file with hashes and sizes.
//
// Several instances (or processes) may share one cache directory. Only the
// instance holding a bucket's write lock appends to it; the others serve reads
// from the index they loaded when opening.
class CacheStore {
private:
    struct Bucket {
        std::string name;
        BucketOpenResult open_result;
        std::unique_ptr<BucketFile> data_file;
        std::unique_ptr<BucketFile> metadata_file;
        BucketIndex offsets;
        bool write_lock = false;
        std::mutex io_mutex;
    };
    using BucketPtr = std::shared_ptr<Bucket>;

    std::unique_ptr<CacheDirectory> directory;
    AnalyticsCallback analytics;
    double quota_eviction_fraction;

    mutable std::mutex state_mutex;
    std::shared_future<void> init_future;
    bool directory_ready = false;
    std::unordered_map<std::string, BucketPtr> buckets;
    std::unordered_map<std::string, std::shared_future<BucketPtr>> initializing_buckets;
    std::shared_future<bool> evict_future;
    std::vector<std::shared_future<void>> pending_writes;
    std::atomic<bool> quota_exceeded_reported{false};

    void init();
    bool waitForDirectory() const;
    BucketPtr openBucket(const std::string& bucket_name);
    BucketPtr getOrOpenBucket(const std::string& bucket_name);
    void loadMetadata(Bucket& bucket);
    void releaseBucket(Bucket& bucket);

    void storeBatch(const BucketBatch& batch);
    bool writeBatchWithRollback(Bucket& bucket, const BucketBatch& batch);
    void writeFully(BucketFile& file, const char* buffer, size_t len, int64_t at);

    void reportAnalytics(const std::string& event, const std::map<std::string, std::string>& properties);
    void sendQuotaExceededAnalytics();

public:
    explicit CacheStore(std::unique_ptr<CacheDirectory> directory,
                        AnalyticsCallback analytics = nullptr,
                        double quota_eviction_fraction = 0.1);
    ~CacheStore();

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    // Opens the bucket if needed. Concurrent callers share one open.
    BucketOpenResult open(const std::string& bucket_name);

    // Appends the blobs to their buckets. The buffers are assembled before returning;
    // the durable write happens on the returned handle, which rethrows any
    // non-quota storage error. Buckets without the write lock are left untouched.
    std::shared_future<void> store(const std::vector<ContentHash>& hashes,
                                   const std::vector<std::string>& bucket_names,
                                   const std::vector<std::vector<char>>& datas);

    // One result per input position, nullopt on a miss
    std::vector<std::optional<std::vector<char>>> get(const std::vector<ContentHash>& hashes,
                                                      const std::vector<std::string>& bucket_names);

    // Returns true if at least min_fraction of the cache directory's bytes were freed
    bool evict(double min_fraction);

    // Closes all buckets and releases their write locks, then evicts expired buckets
    void close();

    // Closes and deletes every bucket not open elsewhere
    void clear();

    CacheStats getStats();
};
