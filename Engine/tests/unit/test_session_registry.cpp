/**
 * @file test_session_registry.cpp
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <ingestion/session_registry.hpp>
#include <set>

using namespace Meisai;

namespace {

SessionInfo info(const std::string& account, AccountType type = AccountType::Corporate) {
    SessionInfo i;
    i.account_type = type;
    i.account_id = account;
    i.file_name = "statement.csv";
    return i;
}

} // namespace

TEST(SessionRegistryTest, CreateAssignsUniqueIds) {
    SessionRegistry registry;
    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) ids.insert(registry.create(info("acct"))->id());
    EXPECT_EQ(ids.size(), 50);
    EXPECT_EQ(registry.size(), 50);
    EXPECT_EQ(ids.begin()->size(), 36);     // UUID text form
}

TEST(SessionRegistryTest, CreateValidatesInfo) {
    SessionRegistry registry;
    EXPECT_THROW(registry.create(info("bad id!")), MeisaiError);
    EXPECT_EQ(registry.size(), 0);
}

TEST(SessionRegistryTest, UnknownSessionIsNotFound) {
    SessionRegistry registry;
    EXPECT_EQ(registry.find("nope"), nullptr);
    try {
        registry.get("nope");
        FAIL() << "expected SessionNotFound";
    } catch (const MeisaiError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SessionNotFound);
        EXPECT_TRUE(e.is_not_found());
    }
}

TEST(SessionRegistryTest, ListFiltersAndPages) {
    SessionRegistry registry;
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) ids.push_back(registry.create(info("corp-1"))->id());
    auto personal = registry.create(info("me", AccountType::Personal));
    registry.get(ids[0])->complete();

    SessionFilter all;
    auto page1 = registry.list(all, 1, 4);
    EXPECT_EQ(page1.total, 6);
    EXPECT_EQ(page1.total_pages(), 2);
    ASSERT_EQ(page1.items.size(), 4);
    EXPECT_EQ(page1.items[0].session_id, personal->id());     // newest first

    auto page2 = registry.list(all, 2, 4);
    ASSERT_EQ(page2.items.size(), 2);
    EXPECT_EQ(page2.items.back().session_id, ids[0]);

    SessionFilter corporate;
    corporate.account_type = AccountType::Corporate;
    EXPECT_EQ(registry.list(corporate, 1, 100).total, 5);

    SessionFilter completed;
    completed.status = SessionStatus::Completed;
    EXPECT_EQ(registry.list(completed, 1, 100).total, 1);

    SessionFilter by_account;
    by_account.account_id = "me";
    EXPECT_EQ(registry.list(by_account, 1, 100).total, 1);

    EXPECT_TRUE(registry.list(all, 3, 4).items.empty());
}

TEST(SessionRegistryTest, PageBoundsValidated) {
    SessionRegistry registry;
    EXPECT_THROW(registry.list({}, 0, 10), MeisaiError);
    EXPECT_THROW(registry.list({}, 1, 0), MeisaiError);
    EXPECT_THROW(registry.list({}, 1, SessionRegistry::MAX_PAGE_SIZE + 1), MeisaiError);
}
