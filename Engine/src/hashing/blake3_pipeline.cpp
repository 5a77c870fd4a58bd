/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 digest helpers
 */

#include <hashing/blake3_pipeline.hpp>
#include <stdexcept>

namespace Meisai {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(std::string_view bytes) {
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, bytes.data(), bytes.size());

    Hash out;
    blake3_hasher_finalize(&hasher, out.data(), out.size());
    return out;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::derive(const char* context, std::string_view material) {
    blake3_hasher hasher;
    blake3_hasher_init_derive_key(&hasher, context);
    blake3_hasher_update(&hasher, material.data(), material.size());

    Hash out;
    blake3_hasher_finalize(&hasher, out.data(), out.size());
    return out;
}

BLAKE3Pipeline::FieldHasher::FieldHasher(const char* context) {
    blake3_hasher_init_derive_key(&hasher_, context);
}

void BLAKE3Pipeline::FieldHasher::put_u64(uint64_t v) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<uint8_t>(v >> (8 * i));
    }
    blake3_hasher_update(&hasher_, buf, sizeof(buf));
}

BLAKE3Pipeline::FieldHasher& BLAKE3Pipeline::FieldHasher::field(std::string_view value) {
    put_u64(value.size());
    blake3_hasher_update(&hasher_, value.data(), value.size());
    return *this;
}

BLAKE3Pipeline::FieldHasher& BLAKE3Pipeline::FieldHasher::field(int64_t value) {
    put_u64(static_cast<uint64_t>(value));
    return *this;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::FieldHasher::finish() const {
    Hash out;
    blake3_hasher_finalize(&hasher_, out.data(), out.size());
    return out;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::string out(HASH_SIZE * 2, '0');
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        out[2 * i] = kHexDigits[hash[i] >> 4];
        out[2 * i + 1] = kHexDigits[hash[i] & 0x0F];
    }
    return out;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::from_hex(std::string_view hex) {
    if (hex.size() != HASH_SIZE * 2) {
        throw std::invalid_argument("expected 64 hex characters, got " + std::to_string(hex.size()));
    }

    Hash out;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("non-hex character in digest: " + std::string(hex));
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

} // namespace Meisai
