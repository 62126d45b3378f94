#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <string>
#include <vector>

constexpr size_t HASH_SIZE = 20;

// 20-byte content digest of a blob. Used directly as the key of cache indexes
// and in-flight request maps.
class ContentHash {
private:
    std::array<uint8_t, HASH_SIZE> bytes{};

public:
    ContentHash() = default;

    // Copies exactly HASH_SIZE bytes starting at data
    static ContentHash fromBytes(const void* data);
    static ContentHash fromBytes(const std::vector<char>& data, size_t offset = 0);
    static std::optional<ContentHash> fromHex(const std::string& hex);

    // SHA-1 of the given blob
    static ContentHash ofData(const char* data, size_t size);
    static ContentHash ofData(const std::vector<char>& data);

    std::vector<char> toBytes() const;
    void packInto(char* dest, size_t offset) const;
    void packInto(std::vector<char>& dest, size_t offset) const;
    std::string toHex() const;

    const uint8_t* data() const { return bytes.data(); }
    static constexpr size_t size() { return HASH_SIZE; }

    bool operator==(const ContentHash& other) const { return bytes == other.bytes; }
    bool operator!=(const ContentHash& other) const { return bytes != other.bytes; }
    bool operator<(const ContentHash& other) const { return bytes < other.bytes; }
};

namespace std {
template <>
struct hash<ContentHash> {
    size_t operator()(const ContentHash& h) const {
        // The key is already a uniformly distributed digest
        size_t value;
        std::memcpy(&value, h.data(), sizeof(value));
        return value;
    }
};
}
