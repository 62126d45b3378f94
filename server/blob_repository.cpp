#include "blob_repository.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

BlobRepository::BlobRepository(const std::string& storage_path, int64_t capacity_bytes)
    : storage_path(storage_path), total_capacity(capacity_bytes), used_space(0) {

    ensureStorageDirectory();
    loadExistingBlobs();

    std::cout << "[INFO] Blob repository initialized at " << storage_path
              << " with capacity " << capacity_bytes / (1024*1024) << " MB\n";
    std::cout << "[INFO] Found " << blob_metadata.size() << " existing blobs, "
              << "using " << used_space.load() / (1024*1024) << " MB\n";
}

void BlobRepository::ensureStorageDirectory() {
    std::error_code ec;
    fs::create_directories(storage_path, ec);
    if (ec) {
        throw std::runtime_error("Failed to create blob directory " + storage_path + ": " + ec.message());
    }
}

void BlobRepository::loadExistingBlobs() {
    std::lock_guard<std::mutex> lock(metadata_mutex);

    for (const auto& dir_entry : fs::recursive_directory_iterator(storage_path)) {
        if (!dir_entry.is_regular_file() || dir_entry.path().extension() != ".blob") {
            continue;
        }

        auto hash = ContentHash::fromHex(dir_entry.path().stem().string());
        if (!hash) {
            std::cerr << "[WARNING] Ignoring unexpected file " << dir_entry.path() << "\n";
            continue;
        }

        BlobMetadata metadata;
        metadata.size = dir_entry.file_size();

        blob_metadata[*hash] = metadata;
        used_space += metadata.size;
    }
}

std::string BlobRepository::getBlobPath(const ContentHash& hash) const {
    // First 2 hex chars pick one of 256 directories
    std::string hex = hash.toHex();
    return (fs::path(storage_path) / hex.substr(0, 2) / (hex + ".blob")).string();
}

std::optional<ContentHash> BlobRepository::storeBlob(const std::vector<char>& data) {
    ContentHash hash = ContentHash::ofData(data);
    if (hasBlob(hash)) {
        return hash;
    }

    if (used_space.load() + static_cast<int64_t>(data.size()) > total_capacity.load()) {
        std::cerr << "[ERROR] Insufficient storage space for blob " << hash.toHex() << "\n";
        return std::nullopt;
    }

    std::string blob_path = getBlobPath(hash);
    std::error_code ec;
    fs::create_directories(fs::path(blob_path).parent_path(), ec);

    std::ofstream file(blob_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "[ERROR] Failed to open file for writing: " << blob_path << "\n";
        return std::nullopt;
    }

    file.write(data.data(), data.size());
    file.flush();

    if (!file.good()) {
        std::cerr << "[ERROR] Failed to write blob " << hash.toHex() << "\n";
        file.close();
        fs::remove(blob_path, ec);
        return std::nullopt;
    }
    file.close();

    {
        std::lock_guard<std::mutex> lock(metadata_mutex);
        BlobMetadata metadata;
        metadata.size = data.size();

        blob_metadata[hash] = metadata;
        used_space += metadata.size;
    }

    std::cout << "[INFO] Stored blob " << hash.toHex() << " (" << data.size() << " bytes)\n";
    return hash;
}

std::optional<ContentHash> BlobRepository::importFile(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[ERROR] Cannot open file: " << file_path << "\n";
        return std::nullopt;
    }

    std::vector<char> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return storeBlob(data);
}

std::optional<std::vector<char>> BlobRepository::readBlob(const ContentHash& hash) {
    std::string blob_path = getBlobPath(hash);

    std::ifstream file(blob_path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return std::nullopt;
    }

    size_t size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<char> data(size);
    file.read(data.data(), size);
    file.close();

    if (ContentHash::ofData(data) != hash) {
        std::cerr << "[ERROR] Checksum verification failed for blob " << hash.toHex() << "\n";
        return std::nullopt;
    }

    return data;
}

bool BlobRepository::deleteBlob(const ContentHash& hash) {
    std::error_code ec;
    if (!fs::remove(getBlobPath(hash), ec)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(metadata_mutex);
    auto it = blob_metadata.find(hash);
    if (it != blob_metadata.end()) {
        used_space -= it->second.size;
        blob_metadata.erase(it);
    }

    std::cout << "[INFO] Deleted blob " << hash.toHex() << "\n";
    return true;
}

bool BlobRepository::hasBlob(const ContentHash& hash) const {
    std::lock_guard<std::mutex> lock(metadata_mutex);
    return blob_metadata.find(hash) != blob_metadata.end();
}

std::vector<ContentHash> BlobRepository::getStoredHashes() const {
    std::lock_guard<std::mutex> lock(metadata_mutex);
    std::vector<ContentHash> hashes;
    hashes.reserve(blob_metadata.size());

    for (const auto& [hash, _] : blob_metadata) {
        hashes.push_back(hash);
    }

    return hashes;
}

int64_t BlobRepository::getAvailableSpace() const {
    return total_capacity.load() - used_space.load();
}

int64_t BlobRepository::getUsedSpace() const {
    return used_space.load();
}
