#include "resource_loader.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

ResourceLoader::ResourceLoader(CacheStore& cache,
                               std::shared_ptr<grpc::ChannelInterface> channel,
                               ResourceCallback on_resource,
                               ResourceErrorCallback on_error,
                               const std::string& query_params,
                               const std::map<std::string, std::string>& headers)
    : cache(cache), on_resource(std::move(on_resource)), on_error(std::move(on_error)),
      request_params(query_params) {
    ResourceStreamCallbacks callbacks;
    callbacks.on_resources_received = [this](const std::vector<ContentHash>& hashes,
                                             const std::vector<std::string>& lineage_urns,
                                             std::vector<std::vector<char>>& payloads,
                                             char resource_type) {
        onResourcesReceived(hashes, lineage_urns, payloads, resource_type);
    };
    callbacks.on_resource_failed = [this](const ContentHash& hash, char resource_type, const std::string& message) {
        onResourceFailed(hash, resource_type, message);
    };
    callbacks.on_connection_failed = [this](const InFlightRequests& in_flight) {
        onConnectionFailed(in_flight);
    };
    client = std::make_unique<ResourceStreamClient>(channel, std::move(callbacks), query_params, headers);
}

ResourceLoader::~ResourceLoader() {
    // Stops the reader thread before the callbacks' target goes away
    client.reset();
}

void ResourceLoader::authorize(const std::string& urn) {
    client->addAuthorizeUrn(urn);
}

void ResourceLoader::load(const std::vector<ResourceRequest>& requests, char resource_type) {
    std::vector<ContentHash> hashes;
    std::vector<std::string> bucket_names;
    for (const auto& request : requests) {
        hashes.push_back(request.hash);
        bucket_names.push_back(request.lineage_urn);
    }

    auto cached = cache.get(hashes, bucket_names);

    std::vector<const ResourceRequest*> misses;
    for (size_t i = 0; i < requests.size(); ++i) {
        if (cached[i]) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                num_cache_hits++;
            }
            if (on_resource) {
                on_resource(requests[i].hash, requests[i].lineage_urn, *cached[i], resource_type, true);
            }
        } else {
            misses.push_back(&requests[i]);
        }
    }

    if (misses.empty()) {
        return;
    }

    size_t requested = 0;
    size_t attached = 0;
    std::vector<ContentHash> unavailable;
    for (const auto* request : misses) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = outstanding.find(request->hash);
            if (it != outstanding.end()) {
                std::vector<std::string>& lineages = it->second;
                if (std::find(lineages.begin(), lineages.end(), request->lineage_urn) == lineages.end()) {
                    lineages.push_back(request->lineage_urn);
                }
                attached++;
                continue;
            }
            outstanding[request->hash].push_back(request->lineage_urn);
        }

        // The stream may fail at any point; a refused request would otherwise never complete
        if (client->requestResource(request->url, request->lineage_urn, request->hash, resource_type,
                                    request_params)) {
            requested++;
        } else {
            unavailable.push_back(request->hash);
        }
    }

    std::cout << "[INFO] Loading " << requests.size() << " resources of type '" << resource_type << "': "
              << requests.size() - misses.size() << " from cache, " << requested << " requested, "
              << attached << " already outstanding\n";

    if (!unavailable.empty()) {
        failHashes(unavailable, std::vector<char>(unavailable.size(), resource_type),
                   "Resource stream unavailable: " + client->lastError());
    }
    if (requested > 0) {
        client->flushSendQueue();
    }
}

std::vector<std::vector<std::string>> ResourceLoader::takeOutstanding(const std::vector<ContentHash>& hashes) {
    std::vector<std::vector<std::string>> waiting(hashes.size());
    std::lock_guard<std::mutex> lock(mutex);
    for (size_t i = 0; i < hashes.size(); ++i) {
        auto it = outstanding.find(hashes[i]);
        if (it != outstanding.end()) {
            waiting[i] = std::move(it->second);
            outstanding.erase(it);
        }
    }
    // Idle only once the callbacks for these hashes have run
    num_delivering++;
    return waiting;
}

void ResourceLoader::finishDelivery(size_t fetched, size_t failed) {
    std::lock_guard<std::mutex> lock(mutex);
    num_fetched += fetched;
    num_failed += failed;
    num_delivering--;
    if (outstanding.empty() && num_delivering == 0) {
        idle_cv.notify_all();
    }
}

void ResourceLoader::failHashes(const std::vector<ContentHash>& hashes, const std::vector<char>& resource_types,
                                const std::string& message) {
    auto waiting = takeOutstanding(hashes);
    size_t failed = 0;
    for (size_t i = 0; i < hashes.size(); ++i) {
        if (!waiting[i].empty()) {
            failed++;
        }
        if (on_error) {
            on_error(hashes[i], resource_types[i], message);
        }
    }
    finishDelivery(0, failed);
}

void ResourceLoader::keepStore(std::shared_future<void> stored) {
    std::lock_guard<std::mutex> lock(mutex);
    auto finished = std::remove_if(pending_stores.begin(), pending_stores.end(),
                                   [](const std::shared_future<void>& f) {
                                       return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                   });
    for (auto it = finished; it != pending_stores.end(); ++it) {
        try {
            it->get();
        } catch (const std::exception& e) {
            std::cerr << "[WARNING] Failed to persist resources in the cache: " << e.what() << "\n";
        }
    }
    pending_stores.erase(finished, pending_stores.end());
    pending_stores.push_back(std::move(stored));
}

void ResourceLoader::onResourcesReceived(const std::vector<ContentHash>& hashes,
                                         const std::vector<std::string>& lineage_urns,
                                         std::vector<std::vector<char>>& payloads,
                                         char resource_type) {
    auto waiting = takeOutstanding(hashes);

    // One entry per lineage that asked, so each lineage's bucket gets its own copy
    std::vector<ContentHash> delivered_hashes;
    std::vector<std::string> delivered_lineages;
    std::vector<std::vector<char>> delivered_payloads;
    size_t fetched = 0;
    for (size_t i = 0; i < hashes.size(); ++i) {
        if (waiting[i].empty()) {
            waiting[i].push_back(lineage_urns[i]);
        } else {
            fetched++;
        }
        for (size_t j = 0; j < waiting[i].size(); ++j) {
            delivered_hashes.push_back(hashes[i]);
            delivered_lineages.push_back(waiting[i][j]);
            if (j + 1 == waiting[i].size()) {
                delivered_payloads.push_back(std::move(payloads[i]));
            } else {
                delivered_payloads.push_back(payloads[i]);
            }
        }
    }

    try {
        keepStore(cache.store(delivered_hashes, delivered_lineages, delivered_payloads));
    } catch (const std::invalid_argument& e) {
        std::cerr << "[WARNING] Not caching " << delivered_hashes.size() << " resources: " << e.what() << "\n";
    }

    if (on_resource) {
        for (size_t i = 0; i < delivered_hashes.size(); ++i) {
            on_resource(delivered_hashes[i], delivered_lineages[i], delivered_payloads[i], resource_type, false);
        }
    }
    finishDelivery(fetched, 0);
}

void ResourceLoader::onResourceFailed(const ContentHash& hash, char resource_type, const std::string& message) {
    std::cerr << "[WARNING] Failed to load " << hash.toHex() << ": " << message << "\n";
    failHashes({hash}, {resource_type}, message);
}

void ResourceLoader::onConnectionFailed(const InFlightRequests& in_flight) {
    std::vector<ContentHash> hashes;
    std::vector<char> resource_types;
    for (const auto& [hash, request] : in_flight) {
        hashes.push_back(hash);
        resource_types.push_back(request.resource_type);
    }
    failHashes(hashes, resource_types, "Connection to the resource server failed");
}

bool ResourceLoader::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return idle_cv.wait_for(lock, timeout, [this]() { return outstanding.empty() && num_delivering == 0; });
}

void ResourceLoader::flushCacheAndDisconnect() {
    std::vector<std::shared_future<void>> stores;
    {
        std::lock_guard<std::mutex> lock(mutex);
        stores.swap(pending_stores);
    }
    for (auto& stored : stores) {
        try {
            stored.get();
        } catch (const std::exception& e) {
            std::cerr << "[WARNING] Failed to persist resources in the cache: " << e.what() << "\n";
        }
    }

    client->closeConnection();
    cache.close();
}

size_t ResourceLoader::numOutstanding() const {
    std::lock_guard<std::mutex> lock(mutex);
    return outstanding.size();
}

size_t ResourceLoader::numCacheHits() const {
    std::lock_guard<std::mutex> lock(mutex);
    return num_cache_hits;
}

size_t ResourceLoader::numFetched() const {
    std::lock_guard<std::mutex> lock(mutex);
    return num_fetched;
}

size_t ResourceLoader::numFailed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return num_failed;
}
