/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace NewsCube {

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

BLAKE3Pipeline::Stream::Stream() {
    blake3_hasher_init(&hasher_);
}

void BLAKE3Pipeline::Stream::update(std::string_view bytes) {
    blake3_hasher_update(&hasher_, bytes.data(), bytes.size());
}

void BLAKE3Pipeline::Stream::update_field(std::string_view field) {
    // 8-byte little-endian length prefix
    uint64_t len = field.size();
    uint8_t prefix[8];
    for (int i = 0; i < 8; ++i) prefix[i] = static_cast<uint8_t>((len >> (8 * i)) & 0xFF);
    blake3_hasher_update(&hasher_, prefix, sizeof(prefix));
    blake3_hasher_update(&hasher_, field.data(), field.size());
}

void BLAKE3Pipeline::Stream::end_record() {
    static const uint8_t record_sep = 0x1E;
    blake3_hasher_update(&hasher_, &record_sep, 1);
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::Stream::finalize() const {
    Hash result;
    // finalize does not mutate the hasher state
    blake3_hasher_finalize(&hasher_, result.data(), HASH_SIZE);
    return result;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : hash) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::from_hex(const std::string& hex) {
    if (hex.size() != HASH_SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length: " + std::to_string(hex.size()) +
                                    ". Expected " + std::to_string(HASH_SIZE * 2) + ".");
    }

    Hash result{};
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        std::string byte_str = hex.substr(i * 2, 2);
        size_t consumed = 0;
        unsigned long value = std::stoul(byte_str, &consumed, 16);
        if (consumed != 2) {
            throw std::invalid_argument("Invalid hex digit in: " + hex);
        }
        result[i] = static_cast<uint8_t>(value);
    }

    return result;
}

} // namespace NewsCube
