/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 content digests for proofs, reasoning results and cycles
 */

#pragma once

#include <export.hpp>
#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace Russell {

/**
 * @brief BLAKE3 hashing
 *
 * Every immutable record in the engine is content-addressed:
 * SAME CONTENT = SAME HASH, independent of wall-clock fields.
 */
class RUSSELL_API BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     * @param data Input data
     * @param len Length in bytes
     * @return 16-byte BLAKE3 hash
     */
    static Hash hash(const void* data, size_t len);

    /**
     * @brief Hash string
     */
    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Hash string and return lowercase hex
     */
    static std::string hash_hex(std::string_view str) {
        return to_hex(hash(str));
    }

    /**
     * @brief Convert hash to hex string
     */
    static std::string to_hex(const Hash& hash);

    /**
     * @brief Convert hex string to hash
     * @throws std::invalid_argument on wrong length or non-hex characters
     */
    static Hash from_hex(const std::string& hex);

    /**
     * @brief Incremental hasher over an ordered sequence of fields
     *
     * Each field is length-prefixed so ("ab","c") and ("a","bc") never collide.
     */
    class RUSSELL_API Incremental {
    public:
        Incremental();

        Incremental& field(std::string_view value);
        Incremental& field(double value);
        Incremental& field(int64_t value);

        Hash finalize() const;
        std::string finalize_hex() const { return to_hex(finalize()); }

    private:
        blake3_hasher hasher_;
    };
};

/**
 * @brief Hasher functor so Hash can key unordered containers
 */
struct HashHasher {
    size_t operator()(const BLAKE3Pipeline::Hash& h) const noexcept {
        size_t out;
        std::memcpy(&out, h.data(), sizeof(out));
        return out;
    }
};

} // namespace Russell
