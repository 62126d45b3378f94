#include "bucket_format.hpp"
#include "frame_codec.hpp"
#include <stdexcept>

std::string makeFilenameSafe(const std::string& bucket_name) {
    std::string safe = bucket_name;
    for (char& c : safe) {
        switch (c) {
            case '<': case '>': case ':': case '"':
            case '/': case '\\': case '|': case '?': case '*':
                c = '_';
                break;
            default:
                break;
        }
    }
    if (safe.empty() || safe == "." || safe == "..") {
        safe = "_" + safe;
    }
    return safe;
}

std::string dataFileName(const std::string& bucket_file_name) {
    return bucket_file_name + DATA_SUFFIX;
}

std::string metadataFileName(const std::string& bucket_file_name) {
    return bucket_file_name + METADATA_SUFFIX;
}

bool isMetadataFileName(const std::string& file_name) {
    std::string suffix = METADATA_SUFFIX;
    return file_name.size() > suffix.size() &&
           file_name.compare(file_name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string dataFileNameFor(const std::string& metadata_file_name) {
    return dataFileName(metadata_file_name.substr(0, metadata_file_name.size() - std::string(METADATA_SUFFIX).size()));
}

int64_t parseMetadataRecords(const std::vector<char>& records, BucketIndex& index) {
    index.clear();
    if (records.size() % METADATA_STRIDE != 0) {
        return -1;
    }

    int64_t current_offset = 0;
    for (size_t offset = 0; offset < records.size(); offset += METADATA_STRIDE) {
        ContentHash hash = ContentHash::fromBytes(records.data() + offset);
        uint32_t size = readUint32LE(records.data() + offset + HASH_SIZE);
        // Later copies of the same hash shadow earlier ones
        index[hash] = BlobExtent{current_offset, size};
        current_offset += size;
    }
    return current_offset;
}

std::vector<BucketBatch> assembleBatches(const std::vector<ContentHash>& hashes,
                                         const std::vector<std::string>& bucket_names,
                                         const std::vector<std::vector<char>>& datas) {
    if (hashes.size() != bucket_names.size() || hashes.size() != datas.size()) {
        throw std::invalid_argument("hashes, bucket names and datas must have the same length");
    }

    std::vector<BucketBatch> batches;
    std::unordered_map<std::string, size_t> batch_index;

    for (size_t i = 0; i < hashes.size(); ++i) {
        auto it = batch_index.find(bucket_names[i]);
        if (it == batch_index.end()) {
            it = batch_index.emplace(bucket_names[i], batches.size()).first;
            batches.emplace_back();
            batches.back().bucket_name = bucket_names[i];
        }
        BucketBatch& batch = batches[it->second];

        const auto& data = datas[i];
        if (data.size() > UINT32_MAX) {
            throw std::invalid_argument("Blob too large for the metadata format");
        }

        size_t record_offset = batch.metadata.size();
        batch.metadata.resize(record_offset + METADATA_STRIDE);
        hashes[i].packInto(batch.metadata.data(), record_offset);
        writeUint32LE(batch.metadata.data() + record_offset + HASH_SIZE, static_cast<uint32_t>(data.size()));

        batch.data.insert(batch.data.end(), data.begin(), data.end());
        batch.hashes.push_back(hashes[i]);
        batch.sizes.push_back(static_cast<uint32_t>(data.size()));
    }

    return batches;
}

int64_t entryCountForMetadataSize(int64_t metadata_file_size) {
    if (metadata_file_size <= static_cast<int64_t>(METADATA_OFFSET)) {
        return 0;
    }
    return (metadata_file_size - static_cast<int64_t>(METADATA_OFFSET)) / static_cast<int64_t>(METADATA_STRIDE);
}
