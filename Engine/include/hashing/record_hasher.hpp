/**
 * @file record_hasher.hpp
 * @brief Content fingerprints for statement records
 */

#pragma once

#include <hashing/blake3_pipeline.hpp>
#include <models/statement_record.hpp>
#include <string>

namespace Meisai {

/**
 * @brief Deterministic identity for statement records.
 *
 * fingerprint() covers every business field; natural_key() drops the amount
 * so the same usage event with a revised amount can be recognised as a change.
 * Both hash a length-prefixed canonical encoding, so no two distinct field
 * tuples share an input string.
 */
class RecordHasher {
public:
    static BLAKE3Pipeline::Hash fingerprint(const StatementRecord& record);

    static BLAKE3Pipeline::Hash natural_key(const StatementRecord& record);

    /**
     * @brief Canonical bytes hashed by fingerprint(). Exposed for tests.
     */
    static std::string canonical_form(const StatementRecord& record);

    /**
     * @brief Compute and store record.content_hash.
     */
    static void assign(StatementRecord& record);
};

} // namespace Meisai
