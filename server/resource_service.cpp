#include "resource_service.hpp"
#include <iostream>

using grpc::ServerContext;
using grpc::ServerReaderWriter;
using grpc::Status;

static bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

// Options arrive as a flat JSON object, e.g. {"batch_responses":true,"report_errors":true}
static bool optionEnabled(const std::string& json, const std::string& name) {
    std::string key = "\"" + name + "\"";
    size_t pos = json.find(key);
    if (pos == std::string::npos) {
        return false;
    }
    pos = json.find(':', pos + key.size());
    if (pos == std::string::npos) {
        return false;
    }
    pos = json.find_first_not_of(" \t", pos + 1);
    return pos != std::string::npos && json.compare(pos, 4, "true") == 0;
}

Status ResourceService::Connect(ServerContext* context, ServerReaderWriter<StreamFrame, StreamFrame>* stream) {
    open_streams++;
    std::cout << "[INFO] Resource stream opened by " << context->peer() << "\n";

    StreamSession session;
    Status status = Status::OK;

    StreamFrame frame;
    while (stream->Read(&frame)) {
        if (frame.payload_case() == StreamFrame::kText) {
            handleControlMessage(frame.text(), session, stream);
        } else if (frame.payload_case() == StreamFrame::kBinary) {
            status = handleRequestFrame(frame.binary(), session, stream);
            if (!status.ok()) {
                break;
            }
        }
    }

    open_streams--;
    std::cout << "[INFO] Resource stream closed by " << context->peer() << "\n";
    return status;
}

void ResourceService::handleControlMessage(const std::string& text, StreamSession& session,
                                           ServerReaderWriter<StreamFrame, StreamFrame>* stream) {
    if (startsWith(text, "/account_id/")) {
        session.account_id = text.substr(12);
    } else if (startsWith(text, "/auth/")) {
        session.authorized_urns.insert(text.substr(6));
    } else if (startsWith(text, "/options/")) {
        std::string options = text.substr(9);
        session.batch_responses = optionEnabled(options, "batch_responses");
        session.report_errors = optionEnabled(options, "report_errors");
    } else if (startsWith(text, "/headers/")) {
        // Headers travel as call metadata, nothing to do
    } else {
        std::cerr << "[WARNING] Unknown control message: " << text << "\n";
        StreamFrame reply;
        reply.set_text("Unknown control message");
        if (!stream->Write(reply)) {
            std::cerr << "[WARNING] Failed to answer control message\n";
        }
    }
}

Status ResourceService::handleRequestFrame(const std::string& buffer, StreamSession& session,
                                           ServerReaderWriter<StreamFrame, StreamFrame>* stream) {
    if (session.authorized_urns.empty()) {
        std::cerr << "[ERROR] Resource request on an unauthorized stream\n";
        return Status(grpc::StatusCode::PERMISSION_DENIED, "401 (Unauthorized)");
    }

    std::optional<RequestFrame> request = decodeRequestFrame(buffer);
    if (!request) {
        std::cerr << "[ERROR] Malformed request frame (" << buffer.size() << " bytes)\n";
        return Status(grpc::StatusCode::INVALID_ARGUMENT, "Malformed request frame");
    }

    ResponseFrame found;
    found.resource_type = request->resource_type;
    ResponseFrame missing;
    missing.resource_type = ERROR_RESOURCE_TYPE;

    for (const auto& hash : request->hashes) {
        std::optional<std::vector<char>> data = repository->readBlob(hash);
        if (data) {
            found.items.push_back(ResponseItem{hash, std::move(*data)});
        } else {
            missing.items.push_back(ResponseItem{hash, encodeErrorPayload(RESOURCE_NOT_FOUND_STATUS, "Resource not found")});
        }
    }

    std::cout << "[INFO] Account " << (session.account_id.empty() ? "-" : session.account_id) << " requested "
              << request->hashes.size() << " resources of type '" << request->resource_type << "', "
              << found.items.size() << " found\n";

    if (session.batch_responses) {
        if (!found.items.empty() && !sendFrame(found, stream)) {
            return Status(grpc::StatusCode::UNAVAILABLE, "Stream closed by client");
        }
    } else {
        for (auto& item : found.items) {
            ResponseFrame single;
            single.resource_type = found.resource_type;
            single.items.push_back(std::move(item));
            if (!sendFrame(single, stream)) {
                return Status(grpc::StatusCode::UNAVAILABLE, "Stream closed by client");
            }
        }
    }

    if (session.report_errors && !missing.items.empty() && !sendFrame(missing, stream)) {
        return Status(grpc::StatusCode::UNAVAILABLE, "Stream closed by client");
    }

    blobs_served += found.items.size();
    return Status::OK;
}

bool ResourceService::sendFrame(const ResponseFrame& frame, ServerReaderWriter<StreamFrame, StreamFrame>* stream) {
    StreamFrame reply;
    reply.set_binary(encodeResponseFrame(frame));
    if (!stream->Write(reply)) {
        std::cerr << "[WARNING] Failed to send response frame\n";
        return false;
    }
    frames_served++;
    return true;
}
