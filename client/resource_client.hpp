#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <grpcpp/grpcpp.h>
#include "content_hash.hpp"
#include "resource_stream.grpc.pb.h"

struct InFlightRequest {
    std::string url;
    std::string lineage_urn;
    char resource_type = 0;
    std::string query_params;   // opaque, handed back on connection failure
};

using InFlightRequests = std::unordered_map<ContentHash, InFlightRequest>;

struct ResourceStreamCallbacks {
    std::function<void(const std::vector<ContentHash>& hashes,
                       const std::vector<std::string>& lineage_urns,
                       std::vector<std::vector<char>>& payloads,
                       char resource_type)> on_resources_received;
    std::function<void(const ContentHash& hash, char resource_type, const std::string& message)> on_resource_failed;
    std::function<void(const InFlightRequests& in_flight)> on_connection_failed;
};

// Multiplexes hash-addressed resource requests over one persistent ResourceStream.
// Requests are queued per account and resource type and go out as one frame per
// type on flushSendQueue(). Callbacks run on the stream's reader thread and must
// not call closeConnection().
class ResourceStreamClient {
private:
    struct PendingAccount {
        std::string account_id;
        std::map<char, std::vector<ContentHash>> hashes_by_type;
    };

    std::unique_ptr<ResourceStream::Stub> stub;
    ResourceStreamCallbacks callbacks;
    std::string query_params;
    std::map<std::string, std::string> headers;

    // Taken before mutex and held across stream writes, so a write blocked on flow
    // control never stalls the reader thread. The stream is only replaced under both.
    std::mutex write_mutex;
    mutable std::mutex mutex;
    std::unique_ptr<grpc::ClientContext> context;
    std::unique_ptr<grpc::ClientReaderWriter<StreamFrame, StreamFrame>> stream;
    std::thread reader_thread;
    bool stream_finished = false;
    bool closing = false;
    bool permanent_error = false;
    std::string last_error;
    std::optional<std::string> account_id_sent;
    std::vector<std::string> authorize_urns;

    std::vector<PendingAccount> pending_sends;
    size_t num_pending_sends = 0;
    InFlightRequests in_flight;

    size_t num_requests_sent = 0;
    size_t num_responses_received = 0;
    size_t num_unmatched_responses = 0;

    std::string msg_buffer;

    bool isOpenLocked() const;
    bool openConnectionLocked(std::vector<StreamFrame>& outgoing);
    void reapStreamLocked();
    bool writeFrames(const std::vector<StreamFrame>& frames);
    void readLoop();
    void handleStreamEnd();

public:
    ResourceStreamClient(std::shared_ptr<grpc::ChannelInterface> channel,
                         ResourceStreamCallbacks callbacks,
                         const std::string& query_params = "",
                         const std::map<std::string, std::string>& headers = {});
    ~ResourceStreamClient();

    ResourceStreamClient(const ResourceStreamClient&) = delete;
    ResourceStreamClient& operator=(const ResourceStreamClient&) = delete;

    // Registers the URN with the server, opening the stream if needed
    void addAuthorizeUrn(const std::string& urn);

    // Queues the hash for the account named in url. Never blocks. Returns false,
    // queueing nothing, once the stream has failed for good.
    bool requestResource(const std::string& url, const std::string& lineage_urn, const ContentHash& hash,
                         char resource_type, const std::string& query_params = "");

    // Sends all queued requests, opening the stream if needed
    void flushSendQueue();

    // Decodes one inbound binary frame and notifies the callbacks
    void handleFrame(const std::string& buffer);

    // Intentional close. Queued requests stay queued for the next stream.
    void closeConnection();

    bool hasPermanentError() const;
    std::string lastError() const;
    bool isConnected() const;

    size_t numRequestsSent() const;
    size_t numResponsesReceived() const;
    size_t numUnmatchedResponses() const;
    size_t numPendingSends() const;
    size_t numInFlight() const;

    static std::string accountIdFromUrl(const std::string& url);
};
