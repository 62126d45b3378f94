#include <iostream>
#include <string>
#include <vector>
#include "bucket_file.hpp"
#include "cache_store.hpp"

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command>\n"
              << "Commands:\n"
              << "  stats                   Show entry count and sizes\n"
              << "  clear                   Delete every bucket not open elsewhere\n"
              << "  evict <fraction>        Free at least this fraction of the cache (0.0 - 1.0)\n"
              << "Options:\n"
              << "  --cache-root <path>     Cache root directory (default: ./assetcache)\n"
              << "  --cache-dir <name>      Cache directory name (default: otg_cache)\n"
              << "  --help                  Show this help message\n";
}

int main(int argc, char* argv[]) {
    std::string cache_root = "./assetcache";
    std::string cache_dir = "otg_cache";
    std::vector<std::string> command;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--cache-root" && i + 1 < argc) {
            cache_root = argv[++i];
        } else if (arg == "--cache-dir" && i + 1 < argc) {
            cache_dir = argv[++i];
        } else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            command.push_back(arg);
        }
    }

    if (command.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    CacheStore cache(std::make_unique<PosixCacheDirectory>(cache_root, cache_dir),
                     [](const std::string& event, const std::map<std::string, std::string>& properties) {
                         std::cerr << "[WARNING] " << event;
                         for (const auto& [key, value] : properties) {
                             std::cerr << " " << key << "=" << value;
                         }
                         std::cerr << "\n";
                     });

    const std::string& cmd = command[0];
    if (cmd == "stats" && command.size() == 1) {
        CacheStats stats = cache.getStats();
        std::cout << "Entries:        " << stats.entries << "\n";
        std::cout << "Data size:      " << stats.data_size << " bytes\n";
        std::cout << "Metadata size:  " << stats.metadata_size << " bytes\n";
    } else if (cmd == "clear" && command.size() == 1) {
        cache.clear();
        CacheStats stats = cache.getStats();
        std::cout << "[SUCCESS] Cache cleared, " << stats.entries << " entries left in open buckets\n";
    } else if (cmd == "evict" && command.size() == 2) {
        double fraction;
        try {
            fraction = std::stod(command[1]);
        } catch (const std::exception&) {
            std::cerr << "[ERROR] Invalid fraction: " << command[1] << "\n";
            return 1;
        }
        if (fraction < 0.0 || fraction > 1.0) {
            std::cerr << "[ERROR] Fraction must be between 0.0 and 1.0\n";
            return 1;
        }
        bool target_met = cache.evict(fraction);
        std::cout << (target_met ? "[SUCCESS] Eviction target met\n"
                                 : "[WARNING] Eviction target not met, buckets are open elsewhere\n");
    } else {
        std::cout << "[ERROR] Invalid command.\n";
        printUsage(argv[0]);
        return 1;
    }

    return 0;
}
