/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 content fingerprints for documents and emitted tables
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace NewsCube {

/**
 * @brief BLAKE3 hashing helpers
 *
 * SAME CONTENT = SAME FINGERPRINT. Used for the per-document Content_Hash
 * column and for the run manifest that proves two runs emitted identical
 * tables.
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     */
    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Incremental hasher for streaming a table row by row.
     *
     * Fields are framed with their length so that ("ab","c") and ("a","bc")
     * produce different fingerprints.
     */
    class Stream {
    public:
        Stream();

        void update(std::string_view bytes);
        void update_field(std::string_view field);
        void end_record();

        Hash finalize() const;

    private:
        blake3_hasher hasher_;
    };

    static std::string to_hex(const Hash& hash);

    /**
     * @throws std::invalid_argument if the string is not 32 hex digits
     */
    static Hash from_hex(const std::string& hex);
};

} // namespace NewsCube
