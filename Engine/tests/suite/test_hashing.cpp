/**
 * @file test_hashing.cpp
 * @brief Unit tests for BLAKE3 hashing pipeline and record fingerprints
 */

#include <gtest/gtest.h>
#include <hashing/blake3_pipeline.hpp>
#include <hashing/record_hasher.hpp>
#include "../statement_fixtures.hpp"
#include <string>

using namespace Meisai;
using Meisai::Testing::make_record;

TEST(HashingTest, Determinism) {
    std::string data = "Meisai toll statement 2024";
    auto hash1 = BLAKE3Pipeline::hash(data);
    auto hash2 = BLAKE3Pipeline::hash(data);

    EXPECT_EQ(hash1, hash2);
}

TEST(HashingTest, CollisionResistance) {
    auto hash1 = BLAKE3Pipeline::hash("test1");
    auto hash2 = BLAKE3Pipeline::hash("test2");

    EXPECT_NE(hash1, hash2);
}

TEST(HashingTest, HexConversion) {
    auto hash = BLAKE3Pipeline::hash("hex_test");
    std::string hex = BLAKE3Pipeline::to_hex(hash);
    auto hash_rt = BLAKE3Pipeline::from_hex(hex);

    EXPECT_EQ(hash, hash_rt);
    EXPECT_EQ(hex.length(), 64); // 32 bytes * 2
}

TEST(HashingTest, FromHexRejectsGarbage) {
    EXPECT_THROW(BLAKE3Pipeline::from_hex("abc"), std::invalid_argument);
    EXPECT_THROW(BLAKE3Pipeline::from_hex(std::string(64, 'z')), std::invalid_argument);
}

TEST(HashingTest, KnownVector) {
    EXPECT_EQ(BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash("")),
              "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(HashingTest, DeriveSeparatesContexts) {
    auto a = BLAKE3Pipeline::derive("meisai test context a", "same material");
    auto b = BLAKE3Pipeline::derive("meisai test context b", "same material");

    EXPECT_NE(a, b);
    EXPECT_NE(a, BLAKE3Pipeline::hash("same material"));
    EXPECT_EQ(a, BLAKE3Pipeline::derive("meisai test context a", "same material"));
}

TEST(HashingTest, FieldHasherIsLengthPrefixed) {
    auto split1 = BLAKE3Pipeline::FieldHasher("meisai test fields").field("ab").field("c").finish();
    auto split2 = BLAKE3Pipeline::FieldHasher("meisai test fields").field("a").field("bc").finish();
    auto again = BLAKE3Pipeline::FieldHasher("meisai test fields").field("ab").field("c").finish();

    EXPECT_NE(split1, split2);
    EXPECT_EQ(split1, again);
}

TEST(RecordHasherTest, SameContentSameFingerprint) {
    auto a = make_record(3);
    auto b = make_record(3);
    b.id = 99;
    b.remarks = "not part of the fingerprint";
    b.external_reference_number = "REF-1";

    EXPECT_EQ(RecordHasher::fingerprint(a), RecordHasher::fingerprint(b));
}

TEST(RecordHasherTest, EveryIdentityFieldMatters) {
    auto base = make_record(3);
    auto h = RecordHasher::fingerprint(base);

    auto r = base; r.date = "2024-04-02";        EXPECT_NE(RecordHasher::fingerprint(r), h);
    r = base; r.time = "23:59";                  EXPECT_NE(RecordHasher::fingerprint(r), h);
    r = base; r.entry_point = "川崎";            EXPECT_NE(RecordHasher::fingerprint(r), h);
    r = base; r.exit_point = "東京";             EXPECT_NE(RecordHasher::fingerprint(r), h);
    r = base; r.toll_amount += 1;                EXPECT_NE(RecordHasher::fingerprint(r), h);
    r = base; r.card_number += "9";              EXPECT_NE(RecordHasher::fingerprint(r), h);
}

TEST(RecordHasherTest, WhitespaceIsNormalized) {
    auto a = make_record(5);
    auto b = a;
    b.entry_point = "  東京　";
    b.vehicle_number = "品川  300　あ 12-34";

    EXPECT_EQ(RecordHasher::fingerprint(a), RecordHasher::fingerprint(b));
}

TEST(RecordHasherTest, FieldBoundariesAreUnambiguous) {
    auto a = make_record(0);
    auto b = a;
    a.entry_point = "AB";
    a.exit_point = "C";
    b.entry_point = "A";
    b.exit_point = "BC";

    EXPECT_NE(RecordHasher::canonical_form(a), RecordHasher::canonical_form(b));
    EXPECT_NE(RecordHasher::fingerprint(a), RecordHasher::fingerprint(b));
}

TEST(RecordHasherTest, NaturalKeyIgnoresAmount) {
    auto a = make_record(7, 1200);
    auto b = make_record(7, 1500);

    EXPECT_EQ(RecordHasher::natural_key(a), RecordHasher::natural_key(b));
    EXPECT_NE(RecordHasher::fingerprint(a), RecordHasher::fingerprint(b));
}
