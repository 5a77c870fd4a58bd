/**
 * @file record_hasher.cpp
 * @brief Canonical encoding and BLAKE3 fingerprints for statement records
 */

#include <hashing/record_hasher.hpp>
#include <utils/unicode.hpp>
#include <cstdint>

namespace Meisai {

namespace {

// BLAKE3 derive-key contexts. Changing either invalidates every stored hash.
constexpr char kFingerprintContext[] = "meisai 2024-04 statement record fingerprint v1";
constexpr char kNaturalKeyContext[] = "meisai 2024-04 statement record natural key v1";

// 4-byte little-endian length, then the bytes.
void append_field(std::string& out, const std::string& value) {
    uint32_t len = static_cast<uint32_t>(value.size());
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((len >> (8 * i)) & 0xFF));
    }
    out.append(value);
}

std::string encode(const StatementRecord& r, bool with_amount) {
    std::string out;
    out.reserve(128);
    append_field(out, trim(r.date));
    append_field(out, trim(r.time));
    append_field(out, normalize_text(r.entry_point));
    append_field(out, normalize_text(r.exit_point));
    if (with_amount) {
        append_field(out, std::to_string(r.toll_amount));
    }
    append_field(out, normalize_text(r.vehicle_number));
    append_field(out, trim(r.card_number));
    return out;
}

} // namespace

std::string RecordHasher::canonical_form(const StatementRecord& record) {
    return encode(record, true);
}

BLAKE3Pipeline::Hash RecordHasher::fingerprint(const StatementRecord& record) {
    return BLAKE3Pipeline::derive(kFingerprintContext, canonical_form(record));
}

BLAKE3Pipeline::Hash RecordHasher::natural_key(const StatementRecord& record) {
    return BLAKE3Pipeline::derive(kNaturalKeyContext, encode(record, false));
}

void RecordHasher::assign(StatementRecord& record) {
    record.content_hash = fingerprint(record);
}

} // namespace Meisai
