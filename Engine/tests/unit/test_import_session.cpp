/**
 * @file test_import_session.cpp
 * @brief Session lifecycle, counters and progress reporting
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <ingestion/import_session.hpp>
#include <thread>
#include <vector>

using namespace Meisai;

namespace {

SessionInfo info() {
    SessionInfo i;
    i.account_id = "acct-01";
    i.file_name = "statement.csv";
    return i;
}

} // namespace

TEST(ImportSessionTest, StartsPending) {
    ImportSession s("s1", info());
    EXPECT_EQ(s.status(), SessionStatus::Pending);
    EXPECT_FALSE(s.is_terminal());
    EXPECT_EQ(s.progress().progress_percentage, 0.0);
}

TEST(ImportSessionTest, FirstRowStartsProcessing) {
    ImportSession s("s1", info());
    s.record_success();
    EXPECT_EQ(s.status(), SessionStatus::Processing);
    EXPECT_TRUE(s.summary().started_at.has_value());
}

TEST(ImportSessionTest, CountersAddUp) {
    ImportSession s("s1", info());
    s.confirm_total(4);
    s.record_success();
    s.record_success(true);
    s.record_duplicate();
    s.record_error(4, "row_parse", "bad date");

    auto sum = s.summary();
    EXPECT_EQ(sum.processed_rows, 4);
    EXPECT_EQ(sum.success_rows + sum.error_rows + sum.duplicate_rows, sum.processed_rows);
    EXPECT_EQ(sum.updated_rows, 1);
    ASSERT_EQ(sum.errors.size(), 1);
    EXPECT_EQ(sum.errors[0].row_number, 4);
    EXPECT_EQ(sum.errors[0].error_type, "row_parse");
}

TEST(ImportSessionTest, RowsCannotExceedConfirmedTotal) {
    ImportSession s("s1", info());
    s.confirm_total(1);
    s.record_success();
    EXPECT_THROW(s.record_success(), MeisaiError);
    EXPECT_EQ(s.summary().processed_rows, 1);
}

TEST(ImportSessionTest, ConfirmBelowProcessedThrows) {
    ImportSession s("s1", info());
    s.record_success();
    s.record_success();
    EXPECT_THROW(s.confirm_total(1), MeisaiError);
}

TEST(ImportSessionTest, SingleTerminalTransition) {
    ImportSession s("s1", info());
    EXPECT_TRUE(s.complete());
    EXPECT_FALSE(s.fail("late"));
    EXPECT_FALSE(s.complete());
    EXPECT_EQ(s.status(), SessionStatus::Completed);
    EXPECT_TRUE(s.summary().failure_reason.empty());
}

TEST(ImportSessionTest, NoRowsAfterTerminal) {
    ImportSession s("s1", info());
    s.fail("boom");
    try {
        s.record_success();
        FAIL() << "expected SessionFailure";
    } catch (const MeisaiError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SessionFailure);
    }
    EXPECT_EQ(s.summary().failure_reason, "boom");
}

TEST(ImportSessionTest, EmptySessionCompletesAtHundredPercent) {
    ImportSession s("s1", info());
    s.confirm_total(0);
    EXPECT_EQ(s.progress().progress_percentage, 0.0);
    s.complete();
    EXPECT_DOUBLE_EQ(s.progress().progress_percentage, 100.0);
}

TEST(ImportSessionTest, UnconfirmedProgressStaysBelowHundred) {
    ImportSession s("s1", info());
    s.set_estimated_total(2);
    s.record_success();
    EXPECT_DOUBLE_EQ(s.progress().progress_percentage, 50.0);
    s.record_success();
    s.record_success();    // estimate was low
    EXPECT_DOUBLE_EQ(s.progress().progress_percentage, 99.0);
    EXPECT_EQ(s.progress().total_rows, 3);

    s.confirm_total(3);
    EXPECT_DOUBLE_EQ(s.progress().progress_percentage, 100.0);
}

TEST(ImportSessionTest, CompleteWithoutTotalConfirmsProcessed) {
    ImportSession s("s1", info());
    s.record_success();
    s.record_duplicate();
    s.complete();
    auto sum = s.summary();
    EXPECT_TRUE(sum.total_confirmed);
    EXPECT_EQ(sum.total_rows, 2);
}

TEST(ImportSessionTest, ErrorLogIsCapped) {
    ImportSession s("s1", info());
    for (size_t i = 0; i < ImportSession::MAX_LOGGED_ERRORS + 10; ++i)
        s.record_error(i + 1, "row_parse", "bad");
    auto sum = s.summary();
    EXPECT_EQ(sum.error_rows, ImportSession::MAX_LOGGED_ERRORS + 10);
    EXPECT_EQ(sum.errors.size(), ImportSession::MAX_LOGGED_ERRORS);
}

TEST(ImportSessionTest, CancelOnlyBeforeTerminal) {
    ImportSession running("a", info());
    EXPECT_TRUE(running.request_cancel());
    EXPECT_TRUE(running.cancel_requested());

    ImportSession done("b", info());
    done.complete();
    EXPECT_FALSE(done.request_cancel());
    EXPECT_FALSE(done.cancel_requested());
}

TEST(ImportSessionTest, ConcurrentObserversSeeConsistentCounters) {
    ImportSession s("s1", info());
    s.confirm_total(20000);

    std::thread writer([&] {
        for (int i = 0; i < 20000; ++i) {
            if (i % 3 == 0) s.record_duplicate();
            else if (i % 7 == 0) s.record_error(i, "row_parse", "x");
            else s.record_success();
        }
        s.complete();
    });

    double last = 0.0;
    while (true) {
        auto p = s.progress();
        EXPECT_EQ(p.success_rows + p.error_rows + p.duplicate_rows, p.processed_rows);
        EXPECT_LE(p.processed_rows, p.total_rows);
        EXPECT_GE(p.progress_percentage, last);
        last = p.progress_percentage;
        if (p.status == SessionStatus::Completed) break;
    }
    writer.join();
    EXPECT_DOUBLE_EQ(last, 100.0);
}

TEST(ImportSessionTest, StatusStrings) {
    EXPECT_STREQ(to_string(SessionStatus::Processing), "processing");
    EXPECT_EQ(parse_session_status("FAILED"), SessionStatus::Failed);
    EXPECT_FALSE(parse_session_status("done").has_value());
    EXPECT_EQ(parse_account_type("personal"), AccountType::Personal);
}

TEST(SessionInfoTest, Validation) {
    SessionInfo ok = info();
    EXPECT_NO_THROW(ok.validate());

    SessionInfo bad = info();
    bad.account_id = "has space";
    EXPECT_THROW(bad.validate(), MeisaiError);

    bad = info();
    bad.account_id = std::string(51, 'a');
    EXPECT_THROW(bad.validate(), MeisaiError);

    bad = info();
    bad.file_name.clear();
    EXPECT_THROW(bad.validate(), MeisaiError);

    bad = info();
    bad.created_by = std::string(101, 'x');
    EXPECT_THROW(bad.validate(), MeisaiError);
}
