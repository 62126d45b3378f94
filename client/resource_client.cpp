#include "resource_client.hpp"
#include "frame_codec.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

static const char* STREAM_OPTIONS = "/options/{\"batch_responses\":true,\"report_errors\":true}";
static const char* ERROR_MESSAGE_PREFIX = "The service returned the following message: ";

static StreamFrame textFrame(const std::string& text) {
    StreamFrame frame;
    frame.set_text(text);
    return frame;
}

ResourceStreamClient::ResourceStreamClient(std::shared_ptr<grpc::ChannelInterface> channel,
                                           ResourceStreamCallbacks callbacks,
                                           const std::string& query_params,
                                           const std::map<std::string, std::string>& headers)
    : callbacks(std::move(callbacks)), query_params(query_params) {
    // gRPC metadata keys must be lower case
    for (const auto& [key, value] : headers) {
        std::string lower_key = key;
        std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        this->headers[lower_key] = value;
    }

    if (channel) {
        stub = ResourceStream::NewStub(channel);
    } else {
        permanent_error = true;
        last_error = "No channel to the resource server";
    }
}

ResourceStreamClient::~ResourceStreamClient() {
    closeConnection();
}

std::string ResourceStreamClient::accountIdFromUrl(const std::string& url) {
    size_t cdn = url.find("/cdn/");
    if (cdn == std::string::npos) {
        return "";
    }

    // <cdn path>/<account id>/...
    std::string path = url.substr(cdn + 5);
    size_t first = path.find('/');
    if (first == std::string::npos) {
        return "";
    }
    size_t second = path.find('/', first + 1);
    return path.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
}

bool ResourceStreamClient::isOpenLocked() const {
    return stream && !stream_finished && !closing;
}

bool ResourceStreamClient::openConnectionLocked(std::vector<StreamFrame>& outgoing) {
    if (permanent_error || closing) {
        return false;
    }
    if (stream) {
        if (!stream_finished) {
            return true;
        }
        // The server closed the previous stream while idle
        reapStreamLocked();
    }

    context = std::make_unique<grpc::ClientContext>();
    for (const auto& [key, value] : headers) {
        context->AddMetadata(key, value);
    }
    if (!query_params.empty()) {
        context->AddMetadata("query-params", query_params);
    }

    stream = stub->Connect(context.get());
    stream_finished = false;
    account_id_sent.reset();
    reader_thread = std::thread(&ResourceStreamClient::readLoop, this);

    // Batched responses and error frames are what handleFrame expects
    outgoing.push_back(textFrame(STREAM_OPTIONS));
    for (const auto& urn : authorize_urns) {
        outgoing.push_back(textFrame("/auth/" + urn));
    }

    std::cout << "[INFO] Opened resource stream\n";
    return true;
}

void ResourceStreamClient::reapStreamLocked() {
    // Only called once the reader thread no longer touches any state
    if (reader_thread.joinable()) {
        reader_thread.join();
    }
    stream.reset();
    context.reset();
    stream_finished = false;
    account_id_sent.reset();
}

bool ResourceStreamClient::writeFrames(const std::vector<StreamFrame>& frames) {
    // The caller holds write_mutex, which keeps the stream in place
    for (const auto& frame : frames) {
        if (!stream->Write(frame)) {
            // The reader reports the requests in flight
            std::cerr << "[WARNING] Failed to send " << frames.size() << " frames, the stream is closing\n";
            return false;
        }
    }
    return true;
}

void ResourceStreamClient::addAuthorizeUrn(const std::string& urn) {
    std::lock_guard<std::mutex> write_lock(write_mutex);
    std::vector<StreamFrame> outgoing;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (permanent_error ||
            std::find(authorize_urns.begin(), authorize_urns.end(), urn) != authorize_urns.end()) {
            return;
        }
        authorize_urns.push_back(urn);

        if (isOpenLocked()) {
            outgoing.push_back(textFrame("/auth/" + urn));
        } else if (!openConnectionLocked(outgoing)) {
            // Opening sends every registered URN
            return;
        }
    }
    writeFrames(outgoing);
}

bool ResourceStreamClient::requestResource(const std::string& url, const std::string& lineage_urn,
                                           const ContentHash& hash, char resource_type,
                                           const std::string& query_params) {
    std::lock_guard<std::mutex> lock(mutex);
    if (permanent_error) {
        std::cerr << "[ERROR] requestResource called on unusable resource stream\n";
        return false;
    }

    std::string account_id = accountIdFromUrl(url);
    auto account = std::find_if(pending_sends.begin(), pending_sends.end(),
                                [&](const PendingAccount& pending) { return pending.account_id == account_id; });
    if (account == pending_sends.end()) {
        PendingAccount pending;
        pending.account_id = account_id;
        pending.hashes_by_type['g'];
        pending.hashes_by_type['m'];
        pending_sends.push_back(std::move(pending));
        account = pending_sends.end() - 1;
    }
    account->hashes_by_type[resource_type].push_back(hash);
    num_pending_sends++;

    in_flight[hash] = InFlightRequest{url, lineage_urn, resource_type, query_params};
    return true;
}

void ResourceStreamClient::flushSendQueue() {
    std::lock_guard<std::mutex> write_lock(write_mutex);
    std::vector<StreamFrame> outgoing;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (num_pending_sends == 0 || !openConnectionLocked(outgoing)) {
            return;
        }

        for (const auto& account : pending_sends) {
            // Selects the account for the frames that follow
            if (account_id_sent != account.account_id) {
                outgoing.push_back(textFrame("/account_id/" + account.account_id));
                account_id_sent = account.account_id;
            }

            for (const auto& [type, hashes] : account.hashes_by_type) {
                if (hashes.empty()) {
                    continue;
                }
                num_requests_sent += hashes.size();

                encodeRequestFrame(type, hashes, msg_buffer);
                StreamFrame frame;
                frame.set_binary(msg_buffer);
                outgoing.push_back(std::move(frame));
            }
        }

        pending_sends.clear();
        num_pending_sends = 0;
    }

    // Responses keep arriving while these writes wait for the server to read
    writeFrames(outgoing);
}

void ResourceStreamClient::handleFrame(const std::string& buffer) {
    std::string error;
    std::optional<ResponseFrame> frame = decodeResponseFrame(buffer, &error);
    if (!frame) {
        std::cerr << "[ERROR] Invalid response frame: " << error << "\n";
        return;
    }

    std::vector<ContentHash> hashes;
    std::vector<std::string> lineage_urns;
    std::vector<std::vector<char>> payloads;
    std::vector<std::pair<ContentHash, char>> failed;
    std::vector<std::string> failure_messages;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto& item : frame->items) {
            num_responses_received++;

            auto request = in_flight.find(item.hash);
            if (request == in_flight.end()) {
                num_unmatched_responses++;
                std::cerr << "[WARNING] Dropping response for " << item.hash.toHex()
                          << ", no request in flight\n";
                continue;
            }

            if (frame->resource_type == ERROR_RESOURCE_TYPE) {
                failed.emplace_back(item.hash, request->second.resource_type);
                failure_messages.push_back(ERROR_MESSAGE_PREFIX + errorMessageFromPayload(item.payload));
            } else {
                hashes.push_back(item.hash);
                lineage_urns.push_back(request->second.lineage_urn);
                payloads.push_back(std::move(item.payload));
            }
            in_flight.erase(request);
        }
    }

    for (size_t i = 0; i < failed.size(); ++i) {
        if (callbacks.on_resource_failed) {
            callbacks.on_resource_failed(failed[i].first, failed[i].second, failure_messages[i]);
        }
    }
    if (!hashes.empty() && callbacks.on_resources_received) {
        callbacks.on_resources_received(hashes, lineage_urns, payloads, frame->resource_type);
    }
}

void ResourceStreamClient::readLoop() {
    StreamFrame frame;
    while (stream->Read(&frame)) {
        switch (frame.payload_case()) {
            case StreamFrame::kBinary:
                handleFrame(frame.binary());
                break;
            case StreamFrame::kText:
                std::cout << "[INFO] Resource server says: " << frame.text() << "\n";
                break;
            default:
                break;
        }
    }
    handleStreamEnd();
}

void ResourceStreamClient::handleStreamEnd() {
    InFlightRequests failed;
    {
        // The stream has ended, so a write in progress fails promptly and Finish never runs beside it
        std::lock_guard<std::mutex> write_lock(write_mutex);
        std::lock_guard<std::mutex> lock(mutex);
        grpc::Status status = stream->Finish();

        if (closing) {
            stream_finished = true;
            return;
        }

        // The server ends idle streams normally; the next request reopens
        if (status.ok() && in_flight.empty()) {
            std::cout << "[INFO] Resource stream closed by the server while idle\n";
            stream_finished = true;
            return;
        }

        std::cerr << "[ERROR] Abnormal resource stream close: "
                  << (status.ok() ? "closed with requests in flight" : status.error_message())
                  << " (pending sends: " << num_pending_sends << ", in flight: " << in_flight.size() << ")\n";

        pending_sends.clear();
        num_pending_sends = 0;
        permanent_error = true;
        last_error = status.ok() ? "Stream closed with requests in flight" : status.error_message();
        failed.swap(in_flight);
        stream_finished = true;
    }

    if (callbacks.on_connection_failed) {
        callbacks.on_connection_failed(failed);
    }
}

void ResourceStreamClient::closeConnection() {
    std::thread reader;
    {
        std::lock_guard<std::mutex> write_lock(write_mutex);
        bool half_close = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!stream) {
                return;
            }
            if (!in_flight.empty()) {
                std::cerr << "[WARNING] Closing resource stream with " << in_flight.size() << " requests in flight\n";
            }

            closing = true;
            half_close = !stream_finished;
            reader = std::move(reader_thread);
        }
        if (half_close) {
            stream->WritesDone();
        }
    }

    // The reader needs write_mutex to finish the stream
    if (reader.joinable()) {
        reader.join();
    }

    std::lock_guard<std::mutex> write_lock(write_mutex);
    std::lock_guard<std::mutex> lock(mutex);
    stream.reset();
    context.reset();
    stream_finished = false;
    closing = false;
    account_id_sent.reset();
    std::cout << "[INFO] Closed resource stream\n";
}

bool ResourceStreamClient::hasPermanentError() const {
    std::lock_guard<std::mutex> lock(mutex);
    return permanent_error;
}

std::string ResourceStreamClient::lastError() const {
    std::lock_guard<std::mutex> lock(mutex);
    return last_error;
}

bool ResourceStreamClient::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex);
    return isOpenLocked();
}

size_t ResourceStreamClient::numRequestsSent() const {
    std::lock_guard<std::mutex> lock(mutex);
    return num_requests_sent;
}

size_t ResourceStreamClient::numResponsesReceived() const {
    std::lock_guard<std::mutex> lock(mutex);
    return num_responses_received;
}

size_t ResourceStreamClient::numUnmatchedResponses() const {
    std::lock_guard<std::mutex> lock(mutex);
    return num_unmatched_responses;
}

size_t ResourceStreamClient::numPendingSends() const {
    std::lock_guard<std::mutex> lock(mutex);
    return num_pending_sends;
}

size_t ResourceStreamClient::numInFlight() const {
    std::lock_guard<std::mutex> lock(mutex);
    return in_flight.size();
}
