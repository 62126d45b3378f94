#pragma once

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "content_hash.hpp"

struct BlobMetadata {
    size_t size;
};

// Content-addressed blob files: <storage_path>/<first two hex digits>/<hex>.blob,
// where the name is the SHA-1 of the contents.
class BlobRepository {
private:
    std::string storage_path;
    std::atomic<int64_t> total_capacity;
    std::atomic<int64_t> used_space;

    mutable std::mutex metadata_mutex;
    std::unordered_map<ContentHash, BlobMetadata> blob_metadata;

    std::string getBlobPath(const ContentHash& hash) const;
    void ensureStorageDirectory();
    void loadExistingBlobs();

public:
    explicit BlobRepository(const std::string& storage_path, int64_t capacity_bytes = 10L * 1024 * 1024 * 1024); // Default 10GB

    // Returns the hash the blob is stored under, nullopt if it could not be stored
    std::optional<ContentHash> storeBlob(const std::vector<char>& data);
    std::optional<ContentHash> importFile(const std::string& file_path);

    // nullopt if missing or if the contents no longer match the hash
    std::optional<std::vector<char>> readBlob(const ContentHash& hash);

    bool deleteBlob(const ContentHash& hash);
    bool hasBlob(const ContentHash& hash) const;

    std::vector<ContentHash> getStoredHashes() const;
    int64_t getAvailableSpace() const;
    int64_t getUsedSpace() const;
};
