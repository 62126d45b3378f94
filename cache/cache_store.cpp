#include "cache_store.hpp"
#include "eviction.hpp"
#include "frame_codec.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

CacheStore::CacheStore(std::unique_ptr<CacheDirectory> directory,
                       AnalyticsCallback analytics,
                       double quota_eviction_fraction)
    : directory(std::move(directory)),
      analytics(std::move(analytics)),
      quota_eviction_fraction(quota_eviction_fraction) {
    init_future = std::async(std::launch::async, [this]() { init(); }).share();
}

CacheStore::~CacheStore() {
    try {
        close();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Failed to close cache: " << e.what() << "\n";
    }
}

void CacheStore::init() {
    try {
        directory->initialize();
        std::lock_guard<std::mutex> lock(state_mutex);
        directory_ready = true;
    } catch (const StorageError& e) {
        std::cerr << "[WARNING] Failed to open cache directory: " << e.what() << "\n";
        reportAnalytics("assetcache.cacheOpenFailed", {{"errorMessage", e.what()}});
    }
}

bool CacheStore::waitForDirectory() const {
    init_future.wait();
    std::lock_guard<std::mutex> lock(state_mutex);
    return directory_ready;
}

BucketOpenResult CacheStore::open(const std::string& bucket_name) {
    return getOrOpenBucket(bucket_name)->open_result;
}

CacheStore::BucketPtr CacheStore::getOrOpenBucket(const std::string& bucket_name) {
    std::shared_future<BucketPtr> pending;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        auto it = buckets.find(bucket_name);
        if (it != buckets.end()) {
            return it->second;
        }

        auto init_it = initializing_buckets.find(bucket_name);
        if (init_it != initializing_buckets.end()) {
            pending = init_it->second;
        } else {
            pending = std::async(std::launch::async, [this, bucket_name]() {
                return openBucket(bucket_name);
            }).share();
            initializing_buckets[bucket_name] = pending;
        }
    }
    return pending.get();
}

CacheStore::BucketPtr CacheStore::openBucket(const std::string& bucket_name) {
    bool ready = waitForDirectory();

    auto bucket = std::make_shared<Bucket>();
    bucket->name = bucket_name;
    std::string bucket_file_name = makeFilenameSafe(bucket_name);

    try {
        if (!ready) {
            throw StorageError("Cache directory not initialized");
        }

        bucket->data_file = directory->openFile(dataFileName(bucket_file_name));
        bucket->metadata_file = directory->openFile(metadataFileName(bucket_file_name));

        // Marks the bucket as open, which keeps eviction away from it
        if (!bucket->metadata_file->tryLockShared()) {
            throw StorageError("Bucket " + bucket_name + " is being evicted");
        }

        // Rewriting the header updates the modification time eviction sorts by
        char timestamp[METADATA_OFFSET];
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        writeUint32LE(timestamp, static_cast<uint32_t>(now_ms));
        writeFully(*bucket->metadata_file, timestamp, sizeof(timestamp), 0);

        bucket->write_lock = bucket->data_file->tryLockExclusive();
        if (!bucket->write_lock) {
            std::cout << "[INFO] Cache bucket " << bucket_name
                      << " is open for writing elsewhere, opening read-only\n";
        }

        loadMetadata(*bucket);

        bucket->open_result.status = bucket->write_lock ? BucketOpenStatus::Ready
                                                        : BucketOpenStatus::ReadOnlyDegraded;
        std::cout << "[INFO] Opened cache bucket " << bucket_name << " with "
                  << bucket->offsets.size() << " entries\n";
    } catch (const StorageError& e) {
        std::cerr << "[WARNING] Failed to initialize cache bucket " << bucket_name << ": " << e.what() << "\n";
        // Directory failures were already reported by init()
        if (ready) {
            reportAnalytics("assetcache.bucketOpenFailed", {
                {"bucketName", bucket_name},
                {"errorMessage", e.what()}
            });
        }

        releaseBucket(*bucket);
        bucket->offsets.clear();
        bucket->open_result.status = BucketOpenStatus::Failed;
        bucket->open_result.reason = e.what();
    }

    std::lock_guard<std::mutex> lock(state_mutex);
    buckets[bucket_name] = bucket;
    initializing_buckets.erase(bucket_name);
    return bucket;
}

void CacheStore::loadMetadata(Bucket& bucket) {
    int64_t metadata_size = bucket.metadata_file->size();
    std::vector<char> records(metadata_size > static_cast<int64_t>(METADATA_OFFSET)
                                  ? metadata_size - METADATA_OFFSET : 0);
    size_t read = bucket.metadata_file->read(records.data(), records.size(), METADATA_OFFSET);
    records.resize(read);

    int64_t expected_data_size = parseMetadataRecords(records, bucket.offsets);
    int64_t actual_data_size = bucket.data_file->size();
    if (expected_data_size == actual_data_size) {
        return;
    }

    std::cerr << "[WARNING] Data file has unexpected size (" << actual_data_size << " instead of "
              << expected_data_size << "), clearing cache for " << bucket.name << "\n";
    bucket.offsets.clear();

    // A reader must not cut the files out from under the writer
    if (bucket.write_lock) {
        bucket.data_file->truncate(0);
        bucket.metadata_file->truncate(METADATA_OFFSET);
    }
}

void CacheStore::releaseBucket(Bucket& bucket) {
    std::lock_guard<std::mutex> lock(bucket.io_mutex);

    for (auto* file : {&bucket.data_file, &bucket.metadata_file}) {
        if (!*file) {
            continue;
        }
        try {
            (*file)->flush();
        } catch (const StorageError& e) {
            std::cerr << "[WARNING] Failed to flush cache bucket " << bucket.name << ": " << e.what() << "\n";
        }
        if (file == &bucket.data_file && bucket.write_lock) {
            (*file)->unlock();
            bucket.write_lock = false;
        }
        (*file)->close();
        file->reset();
    }
    bucket.write_lock = false;
}

std::shared_future<void> CacheStore::store(const std::vector<ContentHash>& hashes,
                                           const std::vector<std::string>& bucket_names,
                                           const std::vector<std::vector<char>>& datas) {
    // Copy everything first so the caller may reuse its buffers immediately
    std::vector<BucketBatch> batches = assembleBatches(hashes, bucket_names, datas);

    std::shared_future<void> write = std::async(std::launch::async, [this, batches = std::move(batches)]() {
        std::exception_ptr first_error;
        for (const auto& batch : batches) {
            try {
                storeBatch(batch);
            } catch (const std::exception& e) {
                std::cerr << "[ERROR] Failed to store " << batch.hashes.size() << " entries in cache bucket "
                          << batch.bucket_name << ": " << e.what() << "\n";
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
        if (first_error) {
            std::rethrow_exception(first_error);
        }
    }).share();

    std::lock_guard<std::mutex> lock(state_mutex);
    pending_writes.erase(std::remove_if(pending_writes.begin(), pending_writes.end(),
                                        [](const std::shared_future<void>& f) {
                                            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                        }),
                         pending_writes.end());
    pending_writes.push_back(write);
    return write;
}

void CacheStore::storeBatch(const BucketBatch& batch) {
    BucketPtr bucket = getOrOpenBucket(batch.bucket_name);

    std::lock_guard<std::mutex> lock(bucket->io_mutex);
    if (!bucket->write_lock || !bucket->data_file) {
        return;
    }

    if (!writeBatchWithRollback(*bucket, batch)) {
        evict(quota_eviction_fraction);
        if (!writeBatchWithRollback(*bucket, batch)) {
            std::cerr << "[WARNING] Cache quota still exceeded, dropping " << batch.hashes.size()
                      << " entries for bucket " << batch.bucket_name << "\n";
            return;
        }
    }

    int64_t offset = bucket->data_file->size() - static_cast<int64_t>(batch.data.size());
    for (size_t i = 0; i < batch.hashes.size(); ++i) {
        bucket->offsets[batch.hashes[i]] = BlobExtent{offset, batch.sizes[i]};
        offset += batch.sizes[i];
    }
}

bool CacheStore::writeBatchWithRollback(Bucket& bucket, const BucketBatch& batch) {
    int64_t data_size = bucket.data_file->size();
    int64_t metadata_size = bucket.metadata_file->size();

    // Every failure may come with a partial write. If the truncation fails too,
    // the size check on the next open clears the bucket.
    auto rollback = [&]() {
        bucket.data_file->truncate(data_size);
        bucket.metadata_file->truncate(metadata_size);
    };

    try {
        writeFully(*bucket.data_file, batch.data.data(), batch.data.size(), data_size);
        writeFully(*bucket.metadata_file, batch.metadata.data(), batch.metadata.size(), metadata_size);
    } catch (const QuotaExceededError& e) {
        rollback();
        std::cerr << "[WARNING] Cache quota exceeded for bucket " << bucket.name << ": " << e.what() << "\n";
        sendQuotaExceededAnalytics();
        return false;
    } catch (const StorageError&) {
        rollback();
        throw;
    }
    return true;
}

void CacheStore::writeFully(BucketFile& file, const char* buffer, size_t len, int64_t at) {
    int64_t written = file.write(buffer, len, at);
    if (written > static_cast<int64_t>(len)) {
        throw QuotaExceededError("Write reported " + std::to_string(written) + " bytes for a " +
                                 std::to_string(len) + " byte buffer");
    }
    if (written != static_cast<int64_t>(len)) {
        throw QuotaExceededError("Partial write detected (" + std::to_string(written) + " of " +
                                 std::to_string(len) + " bytes)");
    }
}

std::vector<std::optional<std::vector<char>>> CacheStore::get(const std::vector<ContentHash>& hashes,
                                                              const std::vector<std::string>& bucket_names) {
    if (hashes.size() != bucket_names.size()) {
        throw std::invalid_argument("hashes and bucket names must have the same length");
    }

    std::vector<std::optional<std::vector<char>>> result(hashes.size());
    for (size_t i = 0; i < hashes.size(); ++i) {
        BucketPtr bucket = getOrOpenBucket(bucket_names[i]);

        std::lock_guard<std::mutex> lock(bucket->io_mutex);
        if (!bucket->data_file) {
            continue;
        }
        auto it = bucket->offsets.find(hashes[i]);
        if (it == bucket->offsets.end()) {
            continue;
        }

        const BlobExtent& extent = it->second;
        std::vector<char> data(extent.size);
        try {
            size_t read = bucket->data_file->read(data.data(), data.size(), extent.offset);
            if (read != data.size()) {
                std::cerr << "[WARNING] Short read of " << hashes[i].toHex() << " from cache bucket "
                          << bucket->name << " (" << read << " of " << data.size() << " bytes)\n";
                continue;
            }
        } catch (const StorageError& e) {
            std::cerr << "[WARNING] Failed to read " << hashes[i].toHex() << " from cache bucket "
                      << bucket->name << ": " << e.what() << "\n";
            continue;
        }
        result[i] = std::move(data);
    }
    return result;
}

bool CacheStore::evict(double min_fraction) {
    std::promise<bool> promise;
    std::shared_future<bool> in_flight;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (evict_future.valid()) {
            in_flight = evict_future;
        } else {
            evict_future = promise.get_future().share();
        }
    }
    if (in_flight.valid()) {
        return in_flight.get();
    }

    bool target_met = false;
    if (waitForDirectory()) {
        try {
            EvictionResult result = evictBuckets(*directory, min_fraction);
            target_met = result.target_met;
            if (result.removed_buckets > 0 || result.busy_buckets > 0) {
                std::cout << "[INFO] Cache eviction removed " << result.removed_buckets << " buckets ("
                          << result.deleted_bytes << " of " << result.total_bytes << " bytes), skipped "
                          << result.busy_buckets << " open buckets\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "[WARNING] Error during cache eviction: " << e.what() << "\n";
        }
    }

    promise.set_value(target_met);
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        evict_future = std::shared_future<bool>();
    }
    return target_met;
}

void CacheStore::close() {
    init_future.wait();

    std::vector<std::shared_future<BucketPtr>> opening;
    std::vector<std::shared_future<void>> writes;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        for (const auto& [name, pending] : initializing_buckets) {
            opening.push_back(pending);
        }
        writes = pending_writes;
    }
    for (const auto& pending : opening) {
        pending.wait();
    }
    for (const auto& write : writes) {
        write.wait();
    }

    std::unordered_map<std::string, BucketPtr> closing;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        closing.swap(buckets);
        pending_writes.clear();
    }
    for (const auto& [name, bucket] : closing) {
        releaseBucket(*bucket);
    }

    evict(0.0);
}

void CacheStore::clear() {
    close();
    evict(1.0);
}

CacheStats CacheStore::getStats() {
    CacheStats stats;
    if (!waitForDirectory()) {
        return stats;
    }

    for (const auto& file : directory->listFiles()) {
        if (isMetadataFileName(file.name)) {
            stats.metadata_size += file.size;
            stats.entries += entryCountForMetadataSize(file.size);
        } else {
            stats.data_size += file.size;
        }
    }
    return stats;
}

void CacheStore::reportAnalytics(const std::string& event, const std::map<std::string, std::string>& properties) {
    if (analytics) {
        analytics(event, properties);
    }
}

void CacheStore::sendQuotaExceededAnalytics() {
    if (quota_exceeded_reported.exchange(true)) {
        return;
    }
    reportAnalytics("assetcache.quotaExceeded", {
        {"usage", std::to_string(directory->usage())},
        {"quota", std::to_string(directory->quota())}
    });
}
