/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Russell {

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : hash) {
        oss << std::setw(2) << (int)byte;
    }

    return oss.str();
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::from_hex(const std::string& hex) {
    if (hex.size() != HASH_SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length: " + std::to_string(hex.size()) +
                                    ". Expected " + std::to_string(HASH_SIZE * 2) + ".");
    }

    Hash result = {0};
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        char hi = hex[i * 2];
        char lo = hex[i * 2 + 1];
        if (!std::isxdigit(static_cast<unsigned char>(hi)) ||
            !std::isxdigit(static_cast<unsigned char>(lo))) {
            throw std::invalid_argument("Invalid hex character in digest: " + hex);
        }
        result[i] = (uint8_t)std::stoul(hex.substr(i * 2, 2), nullptr, 16);
    }

    return result;
}

// =============================================================================
// Incremental
// =============================================================================

BLAKE3Pipeline::Incremental::Incremental() {
    blake3_hasher_init(&hasher_);
}

BLAKE3Pipeline::Incremental& BLAKE3Pipeline::Incremental::field(std::string_view value) {
    // 8-byte little-endian length prefix
    uint64_t len = value.size();
    uint8_t prefix[8];
    for (int i = 0; i < 8; ++i) {
        prefix[i] = static_cast<uint8_t>((len >> (8 * i)) & 0xFF);
    }
    blake3_hasher_update(&hasher_, prefix, sizeof(prefix));
    blake3_hasher_update(&hasher_, value.data(), value.size());
    return *this;
}

BLAKE3Pipeline::Incremental& BLAKE3Pipeline::Incremental::field(double value) {
    // Fixed textual form keeps the digest independent of FP byte layout
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.12g", value);
    return field(std::string_view(buf));
}

BLAKE3Pipeline::Incremental& BLAKE3Pipeline::Incremental::field(int64_t value) {
    return field(std::string_view(std::to_string(value)));
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::Incremental::finalize() const {
    Hash result;
    // finalize does not consume the hasher state
    blake3_hasher_finalize(&hasher_, result.data(), HASH_SIZE);
    return result;
}

} // namespace Russell
