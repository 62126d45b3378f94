#include "content_hash.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <openssl/sha.h>

static_assert(SHA_DIGEST_LENGTH == HASH_SIZE, "content hashes are SHA-1 digests");

ContentHash ContentHash::fromBytes(const void* data) {
    ContentHash hash;
    std::memcpy(hash.bytes.data(), data, HASH_SIZE);
    return hash;
}

ContentHash ContentHash::fromBytes(const std::vector<char>& data, size_t offset) {
    if (offset + HASH_SIZE > data.size()) {
        throw std::out_of_range("Not enough bytes for a content hash");
    }
    return fromBytes(data.data() + offset);
}

std::optional<ContentHash> ContentHash::fromHex(const std::string& hex) {
    if (hex.size() != HASH_SIZE * 2) {
        return std::nullopt;
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    ContentHash hash;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        int hi = nibble(hex[2 * i]);
        int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        hash.bytes[i] = static_cast<uint8_t>(hi << 4 | lo);
    }
    return hash;
}

ContentHash ContentHash::ofData(const char* data, size_t size) {
    ContentHash hash;
    SHA1(reinterpret_cast<const unsigned char*>(data), size, hash.bytes.data());
    return hash;
}

ContentHash ContentHash::ofData(const std::vector<char>& data) {
    return ofData(data.data(), data.size());
}

std::vector<char> ContentHash::toBytes() const {
    return std::vector<char>(bytes.begin(), bytes.end());
}

void ContentHash::packInto(char* dest, size_t offset) const {
    std::memcpy(dest + offset, bytes.data(), HASH_SIZE);
}

void ContentHash::packInto(std::vector<char>& dest, size_t offset) const {
    if (offset + HASH_SIZE > dest.size()) {
        dest.resize(offset + HASH_SIZE);
    }
    packInto(dest.data(), offset);
}

std::string ContentHash::toHex() const {
    std::stringstream ss;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return ss.str();
}
