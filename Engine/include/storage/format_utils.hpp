/**
 * @file format_utils.hpp
 * @brief Digest encodings shared by the storage layer and session ids
 */

#pragma once

#include <hashing/blake3_pipeline.hpp>
#include <core/errors.hpp>
#include <stdexcept>
#include <string>

namespace Meisai {

/**
 * @brief First 128 bits of a digest as an RFC 4122 UUID string.
 *
 * Version nibble 8 (vendor-specific), variant bits 10.
 */
inline std::string hash_to_uuid(const BLAKE3Pipeline::Hash& hash) {
    BLAKE3Pipeline::Hash bytes = hash;
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x80);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string hex = BLAKE3Pipeline::to_hex(bytes);
    return hex.substr(0, 8) + '-' + hex.substr(8, 4) + '-' + hex.substr(12, 4) + '-' +
           hex.substr(16, 4) + '-' + hex.substr(20, 12);
}

// bytea literal in hex output format: \x followed by 64 hex digits
inline std::string hash_to_bytea_hex(const BLAKE3Pipeline::Hash& hash) {
    return "\\x" + BLAKE3Pipeline::to_hex(hash);
}

inline BLAKE3Pipeline::Hash bytea_hex_to_hash(const std::string& text) {
    if (text.size() != 2 + BLAKE3Pipeline::HASH_SIZE * 2 || text.compare(0, 2, "\\x") != 0) {
        throw MeisaiError(ErrorKind::Storage, "unexpected bytea value for content hash", {{"value", text}});
    }
    try {
        return BLAKE3Pipeline::from_hex(std::string_view(text).substr(2));
    } catch (const std::invalid_argument& e) {
        throw MeisaiError(ErrorKind::Storage, std::string("bad content hash: ") + e.what());
    }
}

} // namespace Meisai
