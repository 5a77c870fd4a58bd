/**
 * @file test_hash_index.cpp
 * @brief Deduplication index: check-and-reserve, change detection, snapshots
 */

#include <gtest/gtest.h>
#include <dedup/hash_index.hpp>
#include "../statement_fixtures.hpp"
#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

using namespace Meisai;
using Meisai::Testing::make_record;

TEST(HashIndexTest, NewThenDuplicate) {
    HashIndex index;
    auto r = make_record(1);

    auto d = index.classify(r.content_hash, r);
    EXPECT_EQ(d.kind, Classification::New);
    ASSERT_TRUE(d.reservation.active());
    d.reservation.commit(42);

    auto again = index.classify(r.content_hash, r);
    EXPECT_EQ(again.kind, Classification::Duplicate);
    EXPECT_EQ(again.existing_record_id, 42);
    EXPECT_FALSE(again.reservation.active());
    EXPECT_EQ(index.record_id(r.content_hash), 42);
}

TEST(HashIndexTest, ReleasedReservationLeavesNoTrace) {
    HashIndex index;
    auto r = make_record(2);
    {
        auto d = index.classify(r.content_hash, r);
        EXPECT_EQ(d.kind, Classification::New);
        // dropped without commit
    }
    EXPECT_FALSE(index.contains(r.content_hash));
    EXPECT_EQ(index.stats().pending_reservations, 0);

    auto d = index.classify(r.content_hash, r);
    EXPECT_EQ(d.kind, Classification::New);
    d.reservation.release();
    EXPECT_FALSE(index.contains(r.content_hash));
}

TEST(HashIndexTest, ConcurrentClassifyHasSingleWinner) {
    HashIndex index;
    auto r = make_record(3);
    std::atomic<int> news{0};
    std::atomic<int> dups{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            auto d = index.classify(r.content_hash, r);
            if (d.kind == Classification::New) {
                ++news;
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                d.reservation.commit(7);
            } else {
                ++dups;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(news.load(), 1);
    EXPECT_EQ(dups.load(), 7);
    EXPECT_EQ(index.stats().total_records, 1);
}

TEST(HashIndexTest, WaiterTakesSlotAfterRelease) {
    HashIndex index;
    auto r = make_record(4);

    auto first = index.classify(r.content_hash, r);
    ASSERT_EQ(first.kind, Classification::New);

    Classification seen = Classification::Duplicate;
    std::thread waiter([&] {
        auto d = index.classify(r.content_hash, r);
        seen = d.kind;
        if (d.reservation.active()) d.reservation.commit(9);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    first.reservation.release();
    waiter.join();

    EXPECT_EQ(seen, Classification::New);
    EXPECT_EQ(index.record_id(r.content_hash), 9);
}

TEST(HashIndexTest, ChangeDetection) {
    HashIndexOptions opts;
    opts.detect_changes = true;
    HashIndex index(opts);

    auto original = make_record(5, 1000);
    original.id = 11;
    index.insert(original);

    auto amended = make_record(5, 1300);
    auto d = index.classify(amended.content_hash, amended);
    EXPECT_EQ(d.kind, Classification::Changed);
    EXPECT_EQ(d.existing_record_id, 11);
    EXPECT_EQ(d.previous_amount, 1000);
    ASSERT_TRUE(d.previous_hash.has_value());
    EXPECT_EQ(*d.previous_hash, original.content_hash);
    d.reservation.commit(11);

    EXPECT_FALSE(index.contains(original.content_hash));
    EXPECT_TRUE(index.contains(amended.content_hash));
}

TEST(HashIndexTest, WithoutChangeDetectionAmendedRowIsNew) {
    HashIndex index;
    auto original = make_record(6, 1000);
    original.id = 1;
    index.insert(original);

    auto amended = make_record(6, 1300);
    EXPECT_EQ(index.peek(amended.content_hash, amended), Classification::New);
}

TEST(HashIndexTest, PeekHasNoSideEffects) {
    HashIndex index;
    auto r = make_record(7);
    EXPECT_EQ(index.peek(r.content_hash, r), Classification::New);
    EXPECT_EQ(index.peek(r.content_hash, r), Classification::New);
    EXPECT_EQ(index.stats().total_records, 0);
}

TEST(HashIndexTest, ClearEmptiesIndex) {
    HashIndex index;
    for (int i = 0; i < 10; ++i) {
        auto r = make_record(i);
        r.id = i + 1;
        index.insert(r);
    }
    EXPECT_EQ(index.stats().total_records, 10);
    EXPECT_GT(index.stats().memory_estimate_bytes, 0);

    index.clear();
    EXPECT_EQ(index.stats().total_records, 0);
    auto r = make_record(0);
    EXPECT_EQ(index.peek(r.content_hash, r), Classification::New);
}

TEST(HashIndexTest, EraseRemovesFingerprint) {
    HashIndex index;
    auto r = make_record(8);
    r.id = 3;
    index.insert(r);
    EXPECT_TRUE(index.erase(r.content_hash));
    EXPECT_FALSE(index.erase(r.content_hash));
    EXPECT_FALSE(index.contains(r.content_hash));
}

TEST(HashIndexTest, SnapshotRoundTrip) {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "meisai_hash_index_snapshot.json";

    HashIndexOptions opts;
    opts.detect_changes = true;
    {
        HashIndex index(opts);
        for (int i = 0; i < 5; ++i) {
            auto r = make_record(i, 900);
            r.id = 100 + i;
            index.insert(r);
        }
        index.save_snapshot(path.string());
    }

    HashIndex restored(opts);
    ASSERT_TRUE(restored.load_snapshot(path.string()));
    EXPECT_EQ(restored.stats().total_records, 5);
    EXPECT_EQ(restored.record_id(make_record(2, 900).content_hash), 102);

    auto amended = make_record(2, 950);
    EXPECT_EQ(restored.peek(amended.content_hash, amended), Classification::Changed);

    fs::remove(path);
    HashIndex untouched;
    EXPECT_FALSE(untouched.load_snapshot(path.string()));
}
