#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "cache_store.hpp"
#include "resource_client.hpp"

struct ResourceRequest {
    ContentHash hash;
    std::string url;
    std::string lineage_urn;   // also the cache bucket
};

using ResourceCallback = std::function<void(const ContentHash& hash, const std::string& lineage_urn,
                                            const std::vector<char>& payload, char resource_type,
                                            bool from_cache)>;
using ResourceErrorCallback = std::function<void(const ContentHash& hash, char resource_type,
                                                 const std::string& message)>;

// Serves resources from the cache and fetches the misses over the resource stream.
// Everything fetched is written back to the cache, one bucket per lineage.
class ResourceLoader {
private:
    CacheStore& cache;
    ResourceCallback on_resource;
    ResourceErrorCallback on_error;
    std::string request_params;
    std::unique_ptr<ResourceStreamClient> client;

    mutable std::mutex mutex;
    std::condition_variable idle_cv;
    // Lineages waiting for each outstanding hash, in request order
    std::unordered_map<ContentHash, std::vector<std::string>> outstanding;
    size_t num_delivering = 0;
    std::vector<std::shared_future<void>> pending_stores;
    size_t num_cache_hits = 0;
    size_t num_fetched = 0;
    size_t num_failed = 0;

    void onResourcesReceived(const std::vector<ContentHash>& hashes, const std::vector<std::string>& lineage_urns,
                             std::vector<std::vector<char>>& payloads, char resource_type);
    void onResourceFailed(const ContentHash& hash, char resource_type, const std::string& message);
    void onConnectionFailed(const InFlightRequests& in_flight);
    std::vector<std::vector<std::string>> takeOutstanding(const std::vector<ContentHash>& hashes);
    void finishDelivery(size_t fetched, size_t failed);
    void failHashes(const std::vector<ContentHash>& hashes, const std::vector<char>& resource_types,
                    const std::string& message);
    void keepStore(std::shared_future<void> stored);

public:
    ResourceLoader(CacheStore& cache,
                   std::shared_ptr<grpc::ChannelInterface> channel,
                   ResourceCallback on_resource,
                   ResourceErrorCallback on_error,
                   const std::string& query_params = "",
                   const std::map<std::string, std::string>& headers = {});
    ~ResourceLoader();

    void authorize(const std::string& urn);

    // Hashes already being fetched are not requested twice; they are delivered to
    // every lineage that asked
    void load(const std::vector<ResourceRequest>& requests, char resource_type);

    // Returns false if requests are still outstanding after the timeout
    bool waitForIdle(std::chrono::milliseconds timeout);

    // Waits for the cache writes, then closes the stream and the cache
    void flushCacheAndDisconnect();

    size_t numOutstanding() const;
    size_t numCacheHits() const;
    size_t numFetched() const;
    size_t numFailed() const;

    ResourceStreamClient& streamClient() { return *client; }
};
