/**
 * @file test_postgres_repository.cpp
 * @brief PostgreSQL repositories against a live database.
 *
 * Uses the PG* environment variables (or MEISAI_TEST_CONNINFO) and works in
 * schema meisai_test. Skipped when no database is reachable.
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <dedup/hash_index.hpp>
#include <ingestion/import_service.hpp>
#include <matching/mapping_service.hpp>
#include <storage/postgres_repository.hpp>
#include <storage/retrying_repository.hpp>
#include <utils/logger.hpp>
#include "../statement_fixtures.hpp"
#include <cstdlib>
#include <memory>

using namespace Meisai;
using Meisai::Testing::make_record;

class PostgresRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(Logger::Level::Warning);
        const char* conninfo = std::getenv("MEISAI_TEST_CONNINFO");
        try {
            db = std::make_unique<PostgresConnection>(conninfo ? std::string(conninfo)
                                                               : PostgresConnection::conninfo_from_env());
        } catch (const MeisaiError& e) {
            GTEST_SKIP() << "Database not available - skipping integration test: " << e.what();
        }

        db->execute("CREATE SCHEMA IF NOT EXISTS meisai_test");
        db->execute("SET search_path TO meisai_test");
        ensure_schema(*db);
        db->execute("TRUNCATE statement_mappings, statement_records RESTART IDENTITY CASCADE");

        statements = std::make_shared<PostgresStatementRepository>(*db);
        mappings = std::make_shared<PostgresMappingRepository>(*db);
    }

    std::unique_ptr<PostgresConnection> db;
    std::shared_ptr<PostgresStatementRepository> statements;
    std::shared_ptr<PostgresMappingRepository> mappings;
};

TEST_F(PostgresRepositoryTest, CreateGetRoundTrip) {
    auto r = make_record(1);
    r.exit_date = "2024-04-01";
    r.exit_time = "10:15";
    r.remarks = "深夜割引";
    statements->create(r);
    ASSERT_GT(r.id, 0);

    auto loaded = statements->get(r.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->date, r.date);
    EXPECT_EQ(loaded->time, r.time);
    EXPECT_EQ(loaded->exit_time, "10:15");
    EXPECT_EQ(loaded->entry_point, r.entry_point);
    EXPECT_EQ(loaded->toll_amount, r.toll_amount);
    EXPECT_EQ(loaded->remarks, "深夜割引");
    EXPECT_EQ(loaded->content_hash, r.content_hash);
    EXPECT_FALSE(loaded->external_reference_number.has_value());

    EXPECT_EQ(statements->get_by_hash(r.content_hash)->id, r.id);
    EXPECT_FALSE(statements->get(r.id + 1000).has_value());
}

TEST_F(PostgresRepositoryTest, UniqueHashReportsSqlState) {
    auto a = make_record(1);
    statements->create(a);
    auto b = make_record(1);
    try {
        statements->create(b);
        FAIL() << "expected unique violation";
    } catch (const MeisaiError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Storage);
        EXPECT_EQ(e.context_value("sqlstate"), "23505");
    }
}

TEST_F(PostgresRepositoryTest, BulkInsertSkipsConflicts) {
    auto first = make_record(0);
    statements->create(first);

    std::vector<StatementRecord> batch;
    for (int i = 0; i < 50; ++i) batch.push_back(make_record(i));
    EXPECT_EQ(statements->bulk_insert(batch), 49);
    EXPECT_EQ(statements->count(), 50);
    EXPECT_GT(batch[10].id, 0);

    auto presence = statements->check_duplicates_by_hash({make_record(5).content_hash, make_record(500).content_hash});
    EXPECT_TRUE(presence[make_record(5).content_hash]);
    EXPECT_FALSE(presence[make_record(500).content_hash]);
}

TEST_F(PostgresRepositoryTest, TransactionRollsBack) {
    EXPECT_THROW(statements->with_transaction([](IStatementRepository& tx) {
        auto a = make_record(1);
        tx.create(a);
        auto dup = make_record(1);
        tx.create(dup);
    }), MeisaiError);
    EXPECT_EQ(statements->count(), 0);
}

TEST_F(PostgresRepositoryTest, UpdateAndReference) {
    auto r = make_record(2);
    statements->create(r);
    r.toll_amount = 2000;
    RecordHasher::assign(r);
    statements->update(r);
    statements->set_external_reference(r.id, "TRIP-2");

    auto loaded = statements->get(r.id);
    EXPECT_EQ(loaded->toll_amount, 2000);
    EXPECT_EQ(loaded->external_reference_number, "TRIP-2");

    auto missing = r;
    missing.id = 99999;
    EXPECT_THROW(statements->update(missing), MeisaiError);
    EXPECT_TRUE(statements->remove(r.id));
    EXPECT_FALSE(statements->remove(r.id));
}

TEST_F(PostgresRepositoryTest, OneActiveMappingPerEntityType) {
    auto r = make_record(3);
    statements->create(r);
    MappingService service(statements, mappings);

    CreateMappingRequest req;
    req.statement_record_id = r.id;
    req.external_entity_id = "E1";
    req.external_entity_type = "trip";
    req.confidence = 0.9;
    req.match_type = MatchType::Exact;
    auto a = service.create(req);
    req.external_entity_id = "E2";
    auto b = service.create(req);

    service.confirm(a.id);
    EXPECT_THROW(service.confirm(b.id), MeisaiError);
    EXPECT_EQ(statements->get(r.id)->external_reference_number, "E1");

    // The partial unique index holds even without the service
    auto raw = *mappings->get(b.id);
    raw.status = MappingStatus::Active;
    try {
        mappings->update(raw);
        FAIL() << "expected MappingConflict";
    } catch (const MeisaiError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MappingConflict);
    }

    MappingFilter pending;
    pending.status = MappingStatus::Pending;
    EXPECT_EQ(mappings->list(pending).size(), 1);
}

TEST_F(PostgresRepositoryTest, PipelineWithPreload) {
    auto repo = std::make_shared<RetryingStatementRepository>(statements);
    {
        HashIndex index;
        ImportService service(index, repo);
        SessionInfo info;
        info.account_id = "pg-test";
        info.file_name = "a.csv";
        auto s = service.import_file(info, Testing::csv_file(20));
        EXPECT_EQ(s.success_rows, 20);
    }

    HashIndex fresh;
    HashImporter(fresh, *repo).preload();
    EXPECT_EQ(fresh.stats().total_records, 20);

    ImportService service(fresh, repo);
    SessionInfo info;
    info.account_id = "pg-test";
    info.file_name = "b.csv";
    auto s = service.import_file(info, Testing::csv_file(25));
    EXPECT_EQ(s.duplicate_rows, 20);
    EXPECT_EQ(s.success_rows, 5);
    EXPECT_EQ(statements->count(), 25);
}
