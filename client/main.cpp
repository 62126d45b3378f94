#include <string>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <vector>
#include <grpcpp/grpcpp.h>
#include "bucket_file.hpp"
#include "cache_store.hpp"
#include "resource_loader.hpp"

void writeOutput(const std::string& output_dir, const ContentHash& hash, const std::vector<char>& payload) {
    std::filesystem::path file_path = std::filesystem::path(output_dir) / (hash.toHex() + ".bin");
    std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "[ERROR] Cannot open file: " << file_path << "\n";
        return;
    }
    file.write(payload.data(), payload.size());
    if (!file.good()) {
        std::cerr << "[ERROR] Failed to write " << file_path << "\n";
    }
}

int runFetch(const std::string& server_addr,
             const std::string& cache_root,
             const std::string& cache_dir,
             const std::string& url,
             const std::string& lineage,
             char resource_type,
             const std::vector<std::string>& authorize_urns,
             const std::string& output_dir,
             const std::vector<ContentHash>& hashes) {
    CacheStore cache(std::make_unique<PosixCacheDirectory>(cache_root, cache_dir));

    std::shared_ptr<grpc::ChannelInterface> channel{
        grpc::CreateChannel(server_addr, grpc::InsecureChannelCredentials())
    };

    ResourceLoader loader(
        cache, channel,
        [&output_dir](const ContentHash& hash, const std::string&, const std::vector<char>& payload,
                      char, bool from_cache) {
            std::cout << "[SUCCESS] " << hash.toHex() << " (" << payload.size() << " bytes, "
                      << (from_cache ? "cache" : "server") << ")\n";
            if (!output_dir.empty()) {
                writeOutput(output_dir, hash, payload);
            }
        },
        [](const ContentHash& hash, char, const std::string& message) {
            std::cerr << "[ERROR] " << hash.toHex() << ": " << message << "\n";
        });

    loader.authorize(lineage);
    for (const auto& urn : authorize_urns) {
        loader.authorize(urn);
    }

    std::vector<ResourceRequest> requests;
    for (const auto& hash : hashes) {
        requests.push_back(ResourceRequest{hash, url, lineage});
    }
    loader.load(requests, resource_type);

    bool idle = loader.waitForIdle(std::chrono::seconds(30));
    if (!idle) {
        std::cerr << "[ERROR] Timed out with " << loader.numOutstanding() << " requests outstanding\n";
    }

    loader.flushCacheAndDisconnect();

    std::cout << "[INFO] " << loader.numCacheHits() << " from cache, " << loader.numFetched()
              << " fetched, " << loader.numFailed() << " failed\n";
    return (idle && loader.numFailed() == 0) ? 0 : 1;
}

int main(int argc, char* argv[]) {
    std::string server_addr = "localhost:50061";
    std::string cache_root = "./assetcache";
    std::string cache_dir = "otg_cache";
    std::string url = "http://localhost/cdn/v1/default/";
    std::string lineage = "urn:assetcache:default";
    char resource_type = 'g';
    std::vector<std::string> authorize_urns;
    std::string output_dir;
    std::vector<ContentHash> hashes;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--server-addr" && i + 1 < argc) {
            server_addr = argv[++i];
        } else if (arg == "--cache-root" && i + 1 < argc) {
            cache_root = argv[++i];
        } else if (arg == "--cache-dir" && i + 1 < argc) {
            cache_dir = argv[++i];
        } else if (arg == "--url" && i + 1 < argc) {
            url = argv[++i];
        } else if (arg == "--lineage" && i + 1 < argc) {
            lineage = argv[++i];
        } else if (arg == "--type" && i + 1 < argc) {
            std::string type = argv[++i];
            if (type.size() != 1) {
                std::cerr << "[ERROR] Resource type must be a single character\n";
                return 1;
            }
            resource_type = type[0];
        } else if (arg == "--authorize" && i + 1 < argc) {
            authorize_urns.push_back(argv[++i]);
        } else if (arg == "--output-dir" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options] <hash>...\n"
                      << "Options:\n"
                      << "  --server-addr <addr>    Resource server address (default: localhost:50061)\n"
                      << "  --cache-root <path>     Cache root directory (default: ./assetcache)\n"
                      << "  --cache-dir <name>      Cache directory name (default: otg_cache)\n"
                      << "  --url <url>             Resource url, selects the account (default: http://localhost/cdn/v1/default/)\n"
                      << "  --lineage <urn>         Lineage urn, also the cache bucket (default: urn:assetcache:default)\n"
                      << "  --type <c>              Resource type, e.g. g or m (default: g)\n"
                      << "  --authorize <urn>       Additional urn to authorize (repeatable)\n"
                      << "  --output-dir <path>     Write each resource to <hash>.bin in this directory\n"
                      << "  --help                  Show this help message\n";
            return 0;
        } else {
            auto hash = ContentHash::fromHex(arg);
            if (!hash) {
                std::cerr << "[ERROR] Not a 40 digit hex hash: " << arg << "\n";
                return 1;
            }
            hashes.push_back(*hash);
        }
    }

    if (hashes.empty()) {
        std::cerr << "[ERROR] No hashes given, see --help\n";
        return 1;
    }

    return runFetch(server_addr, cache_root, cache_dir, url, lineage, resource_type,
                    authorize_urns, output_dir, hashes);
}
