#include <iostream>
#include <thread>
#include <chrono>
#include <atomic>
#include <csignal>
#include <vector>
#include <grpcpp/grpcpp.h>
#include <grpcpp/server.h>
#include <grpcpp/server_builder.h>
#include "blob_repository.hpp"
#include "resource_service.hpp"

using grpc::Server;
using grpc::ServerBuilder;

// Global flag for graceful shutdown
std::atomic<bool> running{true};

void runServer(const std::string& listen_addr,
               const std::string& blob_path,
               int64_t storage_capacity,
               const std::vector<std::string>& imports) {

    BlobRepository repository(blob_path, storage_capacity);

    for (const auto& file_path : imports) {
        auto hash = repository.importFile(file_path);
        if (hash) {
            std::cout << "[SUCCESS] Imported " << file_path << " as " << hash->toHex() << "\n";
        } else {
            std::cerr << "[ERROR] Failed to import " << file_path << "\n";
        }
    }

    ResourceService service(&repository);

    ServerBuilder builder;
    builder.AddListeningPort(listen_addr, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<Server> server(builder.BuildAndStart());

    if (!server) {
        std::cerr << "[ERROR] Failed to start resource server\n";
        return;
    }

    std::cout << "[INFO] Resource server listening on " << listen_addr << "\n";
    std::cout << "[INFO] Blob path: " << blob_path << "\n";
    std::cout << "[INFO] Storage capacity: " << storage_capacity / (1024*1024) << " MB\n";

    signal(SIGINT, [](int) {
        running = false;
    });

    // Streams stay open until the clients close them, so shut down from a watcher
    std::thread shutdown_watcher([&server]() {
        while (running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        std::cout << "\n[INFO] Shutdown signal received\n";
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    });

    server->Wait();

    running = false;
    if (shutdown_watcher.joinable()) {
        shutdown_watcher.join();
    }

    std::cout << "[INFO] Served " << service.getBlobsServed() << " blobs in "
              << service.getFramesServed() << " frames\n";
    std::cout << "[INFO] Resource server shutdown complete\n";
}

int main(int argc, char* argv[]) {
    std::string listen_addr = "0.0.0.0:50061";
    std::string blob_path = "./blob_storage";
    int64_t storage_capacity = 10L * 1024 * 1024 * 1024;  // Default 10GB
    std::vector<std::string> imports;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--listen-addr" && i + 1 < argc) {
            listen_addr = argv[++i];
        } else if (arg == "--blob-path" && i + 1 < argc) {
            blob_path = argv[++i];
        } else if (arg == "--storage-capacity" && i + 1 < argc) {
            storage_capacity = std::stoll(argv[++i]) * 1024 * 1024;  // Convert MB to bytes
        } else if (arg == "--import" && i + 1 < argc) {
            imports.push_back(argv[++i]);
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --listen-addr <addr>       Listen address (default: 0.0.0.0:50061)\n"
                      << "  --blob-path <path>         Blob directory path (default: ./blob_storage)\n"
                      << "  --storage-capacity <MB>    Storage capacity in MB (default: 10240)\n"
                      << "  --import <file>            Add a file to the repository (repeatable)\n"
                      << "  --help                     Show this help message\n";
            return 0;
        }
    }

    std::cout << "====================================\n";
    std::cout << "    AssetCache Resource Server      \n";
    std::cout << "====================================\n";

    try {
        runServer(listen_addr, blob_path, storage_capacity, imports);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
