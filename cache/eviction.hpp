#pragma once

#include <chrono>
#include <cstdint>
#include "bucket_file.hpp"

// Buckets not touched for this long are always evicted
constexpr std::chrono::hours EVICTION_CUTOFF{3 * 30 * 24};

struct EvictionResult {
    int64_t total_bytes = 0;
    int64_t min_bytes = 0;
    int64_t deleted_bytes = 0;
    int removed_buckets = 0;
    int busy_buckets = 0;
    bool target_met = false;
};

// Deletes (metadata, data) pairs oldest first: everything older than the cutoff,
// then more until at least min_fraction of the directory's bytes are gone.
// Buckets open elsewhere are skipped.
EvictionResult evictBuckets(CacheDirectory& directory, double min_fraction,
                            std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
