#include <gtest/gtest.h>
#include "../utils/test_utils.hpp"
#include "frame_codec.hpp"
#include "resource_stream.grpc.pb.h"
#include <grpcpp/grpcpp.h>

class ResourceServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<test_utils::TestResourceServer>();
        ASSERT_TRUE(server_->start()) << "Failed to start resource server";

        stub_ = ResourceStream::NewStub(server_->createChannel());
        context_ = std::make_unique<grpc::ClientContext>();
        context_->set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(10));
        stream_ = stub_->Connect(context_.get());
    }

    void TearDown() override {
        stream_.reset();
        context_.reset();
        if (server_) {
            server_->stop();
        }
    }

    ContentHash storeBlob(const std::string& content) {
        auto hash = server_->repository()->storeBlob(std::vector<char>(content.begin(), content.end()));
        EXPECT_TRUE(hash.has_value());
        return hash.value_or(ContentHash());
    }

    void sendText(const std::string& text) {
        StreamFrame frame;
        frame.set_text(text);
        ASSERT_TRUE(stream_->Write(frame));
    }

    void sendRequest(char type, const std::vector<ContentHash>& hashes) {
        std::string buffer;
        encodeRequestFrame(type, hashes, buffer);
        StreamFrame frame;
        frame.set_binary(buffer);
        ASSERT_TRUE(stream_->Write(frame));
    }

    std::optional<ResponseFrame> readResponse() {
        StreamFrame frame;
        if (!stream_->Read(&frame) || frame.payload_case() != StreamFrame::kBinary) {
            return std::nullopt;
        }
        return decodeResponseFrame(frame.binary());
    }

    // Ends the client side and returns the status the server closed with
    grpc::Status finish() {
        stream_->WritesDone();
        StreamFrame frame;
        while (stream_->Read(&frame)) {
            extra_frames_++;
        }
        return stream_->Finish();
    }

    std::unique_ptr<test_utils::TestResourceServer> server_;
    std::unique_ptr<ResourceStream::Stub> stub_;
    std::unique_ptr<grpc::ClientContext> context_;
    std::unique_ptr<grpc::ClientReaderWriter<StreamFrame, StreamFrame>> stream_;
    int extra_frames_ = 0;
};

TEST_F(ResourceServiceTest, BatchedResponse) {
    ContentHash first = storeBlob("first mesh");
    ContentHash second = storeBlob("second mesh");

    sendText("/options/{\"batch_responses\":true,\"report_errors\":true}");
    sendText("/auth/urn:project:1");
    sendText("/account_id/account-1");
    sendRequest('g', {first, second});

    auto response = readResponse();
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->resource_type, 'g');
    ASSERT_EQ(response->items.size(), 2u);
    EXPECT_EQ(response->items[0].hash, first);
    EXPECT_EQ(std::string(response->items[0].payload.begin(), response->items[0].payload.end()), "first mesh");
    EXPECT_EQ(response->items[1].hash, second);

    EXPECT_TRUE(finish().ok());
    EXPECT_EQ(extra_frames_, 0);
    EXPECT_EQ(server_->service()->getFramesServed(), 1);
    EXPECT_EQ(server_->service()->getBlobsServed(), 2);
}

TEST_F(ResourceServiceTest, UnbatchedResponsesArriveOnePerFrame) {
    ContentHash first = storeBlob("first material");
    ContentHash second = storeBlob("second material");

    sendText("/auth/urn:project:1");
    sendRequest('m', {first, second});

    auto one = readResponse();
    auto two = readResponse();
    ASSERT_TRUE(one.has_value());
    ASSERT_TRUE(two.has_value());
    ASSERT_EQ(one->items.size(), 1u);
    ASSERT_EQ(two->items.size(), 1u);
    EXPECT_EQ(one->resource_type, 'm');
    EXPECT_EQ(one->items[0].hash, first);
    EXPECT_EQ(two->items[0].hash, second);

    EXPECT_TRUE(finish().ok());
}

TEST_F(ResourceServiceTest, MissingResourcesReportedAsErrorFrame) {
    ContentHash present = storeBlob("present");
    ContentHash missing = test_utils::generateRandomHash();

    sendText("/options/{\"batch_responses\":true,\"report_errors\":true}");
    sendText("/auth/urn:project:1");
    sendRequest('g', {present, missing});

    auto found = readResponse();
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(found->items.size(), 1u);
    EXPECT_EQ(found->items[0].hash, present);

    auto errors = readResponse();
    ASSERT_TRUE(errors.has_value());
    EXPECT_EQ(errors->resource_type, ERROR_RESOURCE_TYPE);
    ASSERT_EQ(errors->items.size(), 1u);
    EXPECT_EQ(errors->items[0].hash, missing);
    EXPECT_EQ(readUint32LE(errors->items[0].payload.data()), RESOURCE_NOT_FOUND_STATUS);
    EXPECT_EQ(errorMessageFromPayload(errors->items[0].payload), "Resource not found");

    EXPECT_TRUE(finish().ok());
}

TEST_F(ResourceServiceTest, MissingResourcesSilentWithoutErrorReporting) {
    sendText("/options/{\"batch_responses\":true,\"report_errors\":false}");
    sendText("/auth/urn:project:1");
    sendRequest('g', {test_utils::generateRandomHash()});

    EXPECT_TRUE(finish().ok());
    EXPECT_EQ(extra_frames_, 0);
}

TEST_F(ResourceServiceTest, RequestWithoutAuthorizationIsRejected) {
    ContentHash present = storeBlob("secret");
    sendRequest('g', {present});

    grpc::Status status = finish();
    EXPECT_EQ(status.error_code(), grpc::StatusCode::PERMISSION_DENIED);
    EXPECT_EQ(status.error_message(), "401 (Unauthorized)");
    EXPECT_EQ(extra_frames_, 0);
}

TEST_F(ResourceServiceTest, MalformedRequestEndsStream) {
    sendText("/auth/urn:project:1");

    StreamFrame frame;
    frame.set_binary(std::string("g") + std::string(HASH_SIZE - 1, 'x'));
    ASSERT_TRUE(stream_->Write(frame));

    EXPECT_EQ(finish().error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(ResourceServiceTest, UnknownControlMessageGetsTextReply) {
    sendText("/no_such_command/1");

    StreamFrame reply;
    ASSERT_TRUE(stream_->Read(&reply));
    EXPECT_EQ(reply.payload_case(), StreamFrame::kText);
    EXPECT_FALSE(reply.text().empty());

    EXPECT_TRUE(finish().ok());
}

TEST_F(ResourceServiceTest, OpenStreamsAreCounted) {
    sendText("/auth/urn:project:1");
    EXPECT_TRUE(test_utils::waitForCondition([this]() {
        return server_->service()->getOpenStreams() == 1;
    }));

    EXPECT_TRUE(finish().ok());
    EXPECT_TRUE(test_utils::waitForCondition([this]() {
        return server_->service()->getOpenStreams() == 0;
    }));
}
