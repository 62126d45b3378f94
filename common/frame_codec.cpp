#include "frame_codec.hpp"

uint32_t readUint32LE(const char* p) {
    const auto* b = reinterpret_cast<const uint8_t*>(p);
    return static_cast<uint32_t>(b[0]) |
           static_cast<uint32_t>(b[1]) << 8 |
           static_cast<uint32_t>(b[2]) << 16 |
           static_cast<uint32_t>(b[3]) << 24;
}

void writeUint32LE(char* p, uint32_t value) {
    p[0] = static_cast<char>(value & 0xff);
    p[1] = static_cast<char>((value >> 8) & 0xff);
    p[2] = static_cast<char>((value >> 16) & 0xff);
    p[3] = static_cast<char>((value >> 24) & 0xff);
}

static std::optional<ResponseFrame> reject(std::string* error, const std::string& reason) {
    if (error) {
        *error = reason;
    }
    return std::nullopt;
}

std::optional<ResponseFrame> decodeResponseFrame(const char* data, size_t size, std::string* error) {
    if (size < RESPONSE_PREFIX_SIZE) {
        return reject(error, "Frame shorter than its prefix (" + std::to_string(size) + " bytes)");
    }

    uint32_t magic = readUint32LE(data);
    if (magic != RESPONSE_MAGIC) {
        return reject(error, "Invalid message format, magic " + std::to_string(magic));
    }

    ResponseFrame frame;
    frame.resource_type = static_cast<char>(readUint32LE(data + 4) & 0xff);
    uint64_t num_items = readUint32LE(data + 8);

    uint64_t base_offset = RESPONSE_PREFIX_SIZE + num_items * 4;
    if (base_offset > size) {
        return reject(error, "Offset table of " + std::to_string(num_items) + " items exceeds frame");
    }

    const char* items = data + base_offset;
    uint64_t items_size = size - base_offset;

    frame.items.reserve(num_items);
    for (uint64_t i = 0; i < num_items; ++i) {
        uint64_t start = readUint32LE(data + RESPONSE_PREFIX_SIZE + i * 4);
        uint64_t end = (i + 1 < num_items) ? readUint32LE(data + RESPONSE_PREFIX_SIZE + (i + 1) * 4) : items_size;

        if (end > items_size || start > end) {
            return reject(error, "Item " + std::to_string(i) + " has invalid bounds");
        }
        if (end - start < HASH_SIZE) {
            return reject(error, "Item " + std::to_string(i) + " is shorter than a hash");
        }

        ResponseItem item;
        item.hash = ContentHash::fromBytes(items + start);
        item.payload.assign(items + start + HASH_SIZE, items + end);
        frame.items.push_back(std::move(item));
    }

    return frame;
}

std::optional<ResponseFrame> decodeResponseFrame(const std::string& buffer, std::string* error) {
    return decodeResponseFrame(buffer.data(), buffer.size(), error);
}

std::string encodeResponseFrame(const ResponseFrame& frame) {
    size_t items_size = 0;
    for (const auto& item : frame.items) {
        items_size += HASH_SIZE + item.payload.size();
    }

    size_t base_offset = RESPONSE_PREFIX_SIZE + frame.items.size() * 4;
    std::string out(base_offset + items_size, '\0');

    writeUint32LE(&out[0], RESPONSE_MAGIC);
    writeUint32LE(&out[4], static_cast<uint8_t>(frame.resource_type));
    writeUint32LE(&out[8], static_cast<uint32_t>(frame.items.size()));

    size_t offset = 0;
    for (size_t i = 0; i < frame.items.size(); ++i) {
        const auto& item = frame.items[i];
        writeUint32LE(&out[RESPONSE_PREFIX_SIZE + i * 4], static_cast<uint32_t>(offset));
        item.hash.packInto(&out[base_offset], offset);
        if (!item.payload.empty()) {
            std::memcpy(&out[base_offset + offset + HASH_SIZE], item.payload.data(), item.payload.size());
        }
        offset += HASH_SIZE + item.payload.size();
    }

    return out;
}

void encodeRequestFrame(char resource_type, const std::vector<ContentHash>& hashes, std::string& out) {
    size_t len = 1 + hashes.size() * HASH_SIZE;
    out.resize(len);
    out[0] = resource_type;
    for (size_t i = 0; i < hashes.size(); ++i) {
        hashes[i].packInto(&out[0], 1 + i * HASH_SIZE);
    }
}

std::optional<RequestFrame> decodeRequestFrame(const std::string& buffer) {
    if (buffer.empty() || (buffer.size() - 1) % HASH_SIZE != 0) {
        return std::nullopt;
    }

    RequestFrame frame;
    frame.resource_type = buffer[0];
    size_t count = (buffer.size() - 1) / HASH_SIZE;
    frame.hashes.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        frame.hashes.push_back(ContentHash::fromBytes(buffer.data() + 1 + i * HASH_SIZE));
    }
    return frame;
}

std::vector<char> encodeErrorPayload(uint32_t status, const std::string& message) {
    std::vector<char> payload(4 + message.size());
    writeUint32LE(payload.data(), status);
    std::memcpy(payload.data() + 4, message.data(), message.size());
    return payload;
}

std::string errorMessageFromPayload(const std::vector<char>& payload) {
    // The leading status code adds nothing to the message
    if (payload.size() <= 4) {
        return "";
    }
    return std::string(payload.begin() + 4, payload.end());
}
