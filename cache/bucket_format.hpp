#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include "content_hash.hpp"

// Metadata file layout:
//   4 bytes   last access timestamp
//   then per stored blob, in write order: 20 byte hash + 4 byte little endian size
// The data file is the plain concatenation of the blobs in the same order.
constexpr size_t METADATA_OFFSET = 4;
constexpr size_t METADATA_STRIDE = HASH_SIZE + 4;
// Distinct suffixes keep a bucket's files from colliding with another bucket's,
// whatever the bucket names are
constexpr const char* DATA_SUFFIX = "_data";
constexpr const char* METADATA_SUFFIX = "_metadata";

struct BlobExtent {
    int64_t offset = 0;
    uint32_t size = 0;
};

using BucketIndex = std::unordered_map<ContentHash, BlobExtent>;

// Everything one store() call appends to a single bucket
struct BucketBatch {
    std::string bucket_name;
    std::vector<ContentHash> hashes;
    std::vector<uint32_t> sizes;
    std::vector<char> data;
    std::vector<char> metadata;
};

std::string makeFilenameSafe(const std::string& bucket_name);
std::string dataFileName(const std::string& bucket_file_name);
std::string metadataFileName(const std::string& bucket_file_name);
bool isMetadataFileName(const std::string& file_name);
std::string dataFileNameFor(const std::string& metadata_file_name);

// Rebuilds the index from the records following the header. Returns the data size
// the records imply, or -1 if the records end in a partial entry.
int64_t parseMetadataRecords(const std::vector<char>& records, BucketIndex& index);

// Splits the parallel arrays by bucket name, keeping input order within each bucket.
// Buckets appear in the order of their first entry.
std::vector<BucketBatch> assembleBatches(const std::vector<ContentHash>& hashes,
                                         const std::vector<std::string>& bucket_names,
                                         const std::vector<std::vector<char>>& datas);

int64_t entryCountForMetadataSize(int64_t metadata_file_size);
