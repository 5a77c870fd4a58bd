/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 digests for record fingerprints and identifiers
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace Meisai {

class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = BLAKE3_OUT_LEN;
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Plain BLAKE3 of a byte string.
     */
    static Hash hash(std::string_view bytes);

    /**
     * @brief BLAKE3 in derive-key mode.
     *
     * The context string must be a hardcoded, globally unique constant.
     * Digests computed under different contexts are unrelated.
     */
    static Hash derive(const char* context, std::string_view material);

    /**
     * @brief Incremental derive-key hasher fed one field at a time.
     *
     * Each field is length-prefixed, so ("ab","c") and ("a","bc") differ.
     */
    class FieldHasher {
    public:
        explicit FieldHasher(const char* context);

        FieldHasher& field(std::string_view value);
        FieldHasher& field(int64_t value);

        Hash finish() const;

    private:
        void put_u64(uint64_t v);

        blake3_hasher hasher_;
    };

    /// Lowercase, 64 characters.
    static std::string to_hex(const Hash& hash);

    /**
     * @throws std::invalid_argument on bad length or non-hex characters
     */
    static Hash from_hex(std::string_view hex);
};

/**
 * @brief std::hash-compatible functor; the digest is already uniform.
 */
struct HashHasher {
    size_t operator()(const BLAKE3Pipeline::Hash& h) const noexcept {
        size_t out;
        std::memcpy(&out, h.data(), sizeof(out));
        return out;
    }
};

} // namespace Meisai
