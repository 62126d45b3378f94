#pragma once

#include <atomic>
#include <set>
#include <string>
#include <grpcpp/grpcpp.h>
#include "blob_repository.hpp"
#include "frame_codec.hpp"
#include "resource_stream.grpc.pb.h"

constexpr uint32_t RESOURCE_NOT_FOUND_STATUS = 404;

// Per-stream state set by the control messages
struct StreamSession {
    std::string account_id;
    std::set<std::string> authorized_urns;
    bool batch_responses = false;
    bool report_errors = false;
};

class ResourceService final : public ResourceStream::Service {
private:
    BlobRepository* repository;
    std::atomic<int64_t> frames_served{0};
    std::atomic<int64_t> blobs_served{0};
    std::atomic<int32_t> open_streams{0};

    void handleControlMessage(const std::string& text, StreamSession& session,
                              grpc::ServerReaderWriter<StreamFrame, StreamFrame>* stream);
    grpc::Status handleRequestFrame(const std::string& buffer, StreamSession& session,
                                    grpc::ServerReaderWriter<StreamFrame, StreamFrame>* stream);
    bool sendFrame(const ResponseFrame& frame, grpc::ServerReaderWriter<StreamFrame, StreamFrame>* stream);

public:
    explicit ResourceService(BlobRepository* repository) : repository(repository) {}

    grpc::Status Connect(grpc::ServerContext* context,
                         grpc::ServerReaderWriter<StreamFrame, StreamFrame>* stream) override;

    int64_t getFramesServed() const { return frames_served.load(); }
    int64_t getBlobsServed() const { return blobs_served.load(); }
    int32_t getOpenStreams() const { return open_streams.load(); }
};
