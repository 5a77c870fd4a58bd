/**
 * @file test_chunk_reassembler.cpp
 * @brief Row framing across streamed chunks
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <ingestion/chunk_reassembler.hpp>
#include <string>
#include <vector>

using namespace Meisai;

namespace {

Chunk chunk(const std::string& session, int64_t number, const std::string& data, bool last = false) {
    Chunk c;
    c.session_id = session;
    c.chunk_number = number;
    c.data = data;
    c.is_last = last;
    return c;
}

std::vector<std::string> feed_all(ChunkReassembler& r, const std::vector<std::string>& parts) {
    std::vector<std::string> rows;
    for (size_t i = 0; i < parts.size(); ++i) {
        auto out = r.feed(chunk(r.session_id(), static_cast<int64_t>(i + 1), parts[i], i + 1 == parts.size()));
        rows.insert(rows.end(), out.begin(), out.end());
    }
    return rows;
}

} // namespace

TEST(ChunkReassemblerTest, RowSplitAcrossChunks) {
    ChunkReassembler r("s1");
    auto rows = feed_all(r, {"a,b,c\r\nd,", "e,f\r", "\ng,h,i"});

    ASSERT_EQ(rows.size(), 3);
    EXPECT_EQ(rows[0], "a,b,c");
    EXPECT_EQ(rows[1], "d,e,f");
    EXPECT_EQ(rows[2], "g,h,i");
    EXPECT_TRUE(r.finished());
    EXPECT_EQ(r.buffered_bytes(), 0);
}

TEST(ChunkReassemblerTest, SplitPointDoesNotChangeRows) {
    const std::string content = "x,\"quoted\nline\",y\n1,2,3\n\n4,5,6\n";

    ChunkReassembler whole("s");
    auto expected = feed_all(whole, {content});

    for (size_t cut = 1; cut < content.size(); ++cut) {
        ChunkReassembler split("s");
        auto rows = feed_all(split, {content.substr(0, cut), content.substr(cut)});
        EXPECT_EQ(rows, expected) << "cut at " << cut;
    }
    ASSERT_EQ(expected.size(), 3);
    EXPECT_EQ(expected[0], "x,\"quoted\nline\",y");
}

TEST(ChunkReassemblerTest, StrayQuoteInUnquotedFieldIsLiteral) {
    const std::string content = "a,b,5\" tire\nc,d,e\nf,g,h\n";

    ChunkReassembler whole("s1");
    auto rows = feed_all(whole, {content});
    ASSERT_EQ(rows.size(), 3);
    EXPECT_EQ(rows[0], "a,b,5\" tire");
    EXPECT_EQ(rows[2], "f,g,h");

    for (size_t cut = 1; cut < content.size(); ++cut) {
        ChunkReassembler split("s1");
        EXPECT_EQ(feed_all(split, {content.substr(0, cut), content.substr(cut)}), rows) << "cut at " << cut;
    }
}

TEST(ChunkReassemblerTest, EscapedQuotesInsideQuotedField) {
    const std::string content = " \"say \"\"hi\"\"\nthere\",x\n\"a\"b\",y\nz,w\n";

    ChunkReassembler whole("s1");
    auto rows = feed_all(whole, {content});
    ASSERT_EQ(rows.size(), 3);
    EXPECT_EQ(rows[0], " \"say \"\"hi\"\"\nthere\",x");
    EXPECT_EQ(rows[1], "\"a\"b\",y");
    EXPECT_EQ(rows[2], "z,w");

    for (size_t cut = 1; cut < content.size(); ++cut) {
        ChunkReassembler split("s1");
        EXPECT_EQ(feed_all(split, {content.substr(0, cut), content.substr(cut)}), rows) << "cut at " << cut;
    }
}

TEST(ChunkReassemblerTest, BomSplitAcrossChunks) {
    ChunkReassembler r("s");
    auto rows = feed_all(r, {"\xEF\xBB", "\xBF" "a,b\n"});
    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0], "a,b");
}

TEST(ChunkReassemblerTest, ZeroBasedNumbering) {
    ChunkReassembler r("s");
    EXPECT_TRUE(r.feed(chunk("s", 0, "a\n")).size() == 1);
    EXPECT_TRUE(r.feed(chunk("s", 1, "b", true)).size() == 1);
}

TEST(ChunkReassemblerTest, GapFailsStream) {
    ChunkReassembler r("s");
    r.feed(chunk("s", 1, "a\n"));
    EXPECT_THROW(r.feed(chunk("s", 3, "b\n")), MeisaiError);
}

TEST(ChunkReassemblerTest, ChunkAfterLastFails) {
    ChunkReassembler r("s");
    r.feed(chunk("s", 1, "a", true));
    try {
        r.feed(chunk("s", 2, "b"));
        FAIL() << "expected SessionFailure";
    } catch (const MeisaiError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SessionFailure);
    }
}

TEST(ChunkReassemblerTest, ForeignSessionRejected) {
    ChunkReassembler r("mine", SessionMismatchPolicy::Reject);
    EXPECT_THROW(r.feed(chunk("other", 1, "a\n")), MeisaiError);
}

TEST(ChunkReassemblerTest, ForeignSessionIgnored) {
    ChunkReassembler r("mine", SessionMismatchPolicy::Ignore);
    EXPECT_TRUE(r.feed(chunk("other", 1, "zzz\n")).empty());
    EXPECT_EQ(r.ignored_chunks(), 1);

    auto rows = r.feed(chunk("mine", 1, "a\n", true));
    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0], "a");
}

TEST(ChunkReassemblerTest, ResetStopsAcceptingChunks) {
    ChunkReassembler r("s");
    r.feed(chunk("s", 1, "partial"));
    EXPECT_GT(r.buffered_bytes(), 0);
    r.reset();
    EXPECT_EQ(r.buffered_bytes(), 0);
    EXPECT_THROW(r.feed(chunk("s", 2, "more\n")), MeisaiError);
}
