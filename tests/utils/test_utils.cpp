#include "test_utils.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <cstdlib>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <gtest/gtest.h>

namespace test_utils {

// TempFile implementation
TempFile::TempFile(const std::string& content, bool cleanup)
    : cleanup_on_destroy_(cleanup) {
    char temp_template[] = "/tmp/assetcache_test_XXXXXX";
    int fd = mkstemp(temp_template);
    if (fd == -1) {
        throw std::runtime_error("Failed to create temporary file");
    }
    path_ = temp_template;
    close(fd);

    if (!content.empty()) {
        write(content);
    }
}

TempFile::~TempFile() {
    if (cleanup_on_destroy_) {
        cleanup();
    }
}

void TempFile::write(const std::string& content) {
    std::ofstream file(path_, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open temp file for writing");
    }
    file.write(content.data(), content.size());
    file.close();
}

std::string TempFile::read() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open temp file for reading");
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

size_t TempFile::size() const {
    return std::filesystem::file_size(path_);
}

void TempFile::cleanup() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

// TempDirectory implementation
TempDirectory::TempDirectory(bool cleanup) : cleanup_on_destroy_(cleanup) {
    char temp_template[] = "/tmp/assetcache_test_dir_XXXXXX";
    if (mkdtemp(temp_template) == nullptr) {
        throw std::runtime_error("Failed to create temporary directory");
    }
    path_ = temp_template;
}

TempDirectory::~TempDirectory() {
    if (cleanup_on_destroy_) {
        cleanup();
    }
}

std::string TempDirectory::file_path(const std::string& filename) const {
    return path_ + "/" + filename;
}

void TempDirectory::cleanup() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

// Data generation utilities
std::vector<char> generateRandomData(size_t size) {
    std::vector<char> data(size);
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>(dis(gen));
    }

    return data;
}

std::vector<char> generatePatternData(size_t size, const std::string& pattern) {
    std::vector<char> data;
    data.reserve(size);

    size_t pattern_pos = 0;
    for (size_t i = 0; i < size; ++i) {
        data.push_back(pattern[pattern_pos]);
        pattern_pos = (pattern_pos + 1) % pattern.size();
    }

    return data;
}

ContentHash generateRandomHash() {
    auto bytes = generateRandomData(HASH_SIZE);
    return ContentHash::fromBytes(bytes.data());
}

// TestResourceServer implementation
TestResourceServer::TestResourceServer(const std::string& address, grpc::Service* service)
    : address_(address), service_(service) {
    if (address_.find(":0") != std::string::npos) {
        // Replace :0 with available port
        int port = findAvailablePort();
        size_t colon_pos = address_.rfind(':');
        address_ = address_.substr(0, colon_pos + 1) + std::to_string(port);
    }

    if (!service_) {
        blob_dir_ = std::make_unique<TempDirectory>();
        repository_ = std::make_unique<BlobRepository>(blob_dir_->path(), 100 * 1024 * 1024);
        default_service_ = std::make_unique<ResourceService>(repository_.get());
        service_ = default_service_.get();
    }
}

TestResourceServer::~TestResourceServer() {
    stop();
}

bool TestResourceServer::start() {
    if (running_) return true;

    grpc::ServerBuilder builder;
    builder.AddListeningPort(address_, grpc::InsecureServerCredentials());
    builder.RegisterService(service_);

    server_ = builder.BuildAndStart();
    if (!server_) {
        std::cerr << "Failed to start TestResourceServer on " << address_ << std::endl;
        return false;
    }

    running_ = true;

    server_thread_ = std::thread([this]() {
        server_->Wait();
    });

    return waitForServerReady(address_);
}

void TestResourceServer::stop() {
    if (!running_) return;

    running_ = false;

    if (server_) {
        // Open streams are cancelled once the deadline passes
        server_->Shutdown(std::chrono::system_clock::now() + std::chrono::milliseconds(500));
    }

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    server_.reset();
}

bool TestResourceServer::isRunning() const {
    return running_;
}

std::string TestResourceServer::address() const {
    return address_;
}

std::shared_ptr<grpc::Channel> TestResourceServer::createChannel() const {
    return grpc::CreateChannel(address_, grpc::InsecureChannelCredentials());
}

// Network utilities
int findAvailablePort() {
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) return 0;

    struct sockaddr_in addr;
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = 0;

    if (bind(sock, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(sock);
        return 0;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(sock, (struct sockaddr*)&addr, &len) < 0) {
        close(sock);
        return 0;
    }

    int port = ntohs(addr.sin_port);
    close(sock);
    return port;
}

std::string createTestAddress() {
    return "localhost:" + std::to_string(findAvailablePort());
}

// Assertion utilities
void expectDataEqual(const std::vector<char>& data1, const std::vector<char>& data2) {
    EXPECT_EQ(data1.size(), data2.size()) << "Data sizes don't match";
    EXPECT_EQ(data1, data2) << "Data content doesn't match";
}

// Timer implementation
Timer::Timer() {
    reset();
}

void Timer::reset() {
    start_time_ = std::chrono::high_resolution_clock::now();
}

int64_t Timer::elapsedMilliseconds() const {
    auto now = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_).count();
}

// Wait utilities
bool waitForCondition(std::function<bool()> condition,
                     std::chrono::milliseconds timeout,
                     std::chrono::milliseconds poll_interval) {
    auto start = std::chrono::steady_clock::now();

    while (std::chrono::steady_clock::now() - start < timeout) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(poll_interval);
    }

    return condition();
}

bool waitForServerReady(const std::string& address, std::chrono::milliseconds timeout) {
    auto channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
    return channel->WaitForConnected(std::chrono::system_clock::now() + timeout);
}

} // namespace test_utils
