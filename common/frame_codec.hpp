#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "content_hash.hpp"

// Response frame layout (all integers little endian):
//
//   Bytes      Meaning
//   ------------------------------
//   0-3        Magic number, the bytes 'OPK1'
//   4-7        Unused flags + resource type (ASCII 'g', 'm', 'e', ...) in the low byte
//   8-11       Number of items N
//   12-15      Offset of the first item in the item blob (always 0)
//   16-19      Offset of the second item, and so on, one per item
//   ...        All items concatenated; each item is a 20 byte hash followed by its payload
//
// Request frames are a 1 byte resource type followed by the raw hashes.
constexpr uint32_t RESPONSE_MAGIC = 0x314B504F;
constexpr size_t RESPONSE_PREFIX_SIZE = 12;
constexpr char ERROR_RESOURCE_TYPE = 'e';

struct ResponseItem {
    ContentHash hash;
    std::vector<char> payload;
};

struct ResponseFrame {
    char resource_type = 0;
    std::vector<ResponseItem> items;
};

struct RequestFrame {
    char resource_type = 0;
    std::vector<ContentHash> hashes;
};

// Returns nullopt for frames with a bad magic number or an inconsistent layout.
// On failure, error (if given) receives a description.
std::optional<ResponseFrame> decodeResponseFrame(const char* data, size_t size, std::string* error = nullptr);
std::optional<ResponseFrame> decodeResponseFrame(const std::string& buffer, std::string* error = nullptr);

std::string encodeResponseFrame(const ResponseFrame& frame);

// Writes the request frame into out, reusing its capacity
void encodeRequestFrame(char resource_type, const std::vector<ContentHash>& hashes, std::string& out);
std::optional<RequestFrame> decodeRequestFrame(const std::string& buffer);

// Error item payload: 4 byte status code followed by a UTF-8 message
std::vector<char> encodeErrorPayload(uint32_t status, const std::string& message);
std::string errorMessageFromPayload(const std::vector<char>& payload);

uint32_t readUint32LE(const char* p);
void writeUint32LE(char* p, uint32_t value);
