#include "eviction.hpp"
#include "bucket_format.hpp"
#include <algorithm>
#include <iostream>
#include <unordered_map>

EvictionResult evictBuckets(CacheDirectory& directory, double min_fraction,
                            std::chrono::system_clock::time_point now) {
    EvictionResult result;

    std::vector<CacheFileInfo> metadata_files;
    std::unordered_map<std::string, int64_t> file_sizes;
    for (const auto& file : directory.listFiles()) {
        result.total_bytes += file.size;
        file_sizes[file.name] = file.size;
        if (isMetadataFileName(file.name)) {
            metadata_files.push_back(file);
        }
    }

    result.min_bytes = static_cast<int64_t>(static_cast<double>(result.total_bytes) * min_fraction);

    // The metadata header is rewritten on every open, so its modification time is the last use
    std::sort(metadata_files.begin(), metadata_files.end(),
              [](const CacheFileInfo& a, const CacheFileInfo& b) { return a.last_modified < b.last_modified; });

    auto cutoff = now - EVICTION_CUTOFF;
    for (const auto& metadata_file : metadata_files) {
        if (metadata_file.last_modified > cutoff && result.deleted_bytes >= result.min_bytes) {
            break;
        }

        RemoveResult removed = directory.removeFile(metadata_file.name);
        if (removed == RemoveResult::Busy) {
            result.busy_buckets++;
            continue;
        }
        if (removed == RemoveResult::Failed) {
            std::cerr << "[WARNING] Error during cache eviction of " << metadata_file.name << "\n";
            continue;
        }
        result.deleted_bytes += metadata_file.size;

        std::string data_file = dataFileNameFor(metadata_file.name);
        auto size_it = file_sizes.find(data_file);
        removed = directory.removeFile(data_file);
        if (removed == RemoveResult::Removed) {
            if (size_it != file_sizes.end()) {
                result.deleted_bytes += size_it->second;
            }
            result.removed_buckets++;
        } else if (removed == RemoveResult::Failed) {
            std::cerr << "[WARNING] Error during cache eviction of " << data_file << "\n";
        }
    }

    result.target_met = result.deleted_bytes >= result.min_bytes;
    return result;
}
