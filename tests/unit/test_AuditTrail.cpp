#include "WalletFixture.hpp"
#include "error/Error.hpp"

#include <limits>

using namespace cw;
using namespace cw::test;
using cw::types::AuditLogFilter;

class AuditTrailTest : public WalletTest {
protected:
    // Seven system entries, one per second, plus two for user 1 at the last timestamp
    void seed() {
        for (unsigned int i = 0; i < 7; ++i) {
            wallet->audit().append(std::nullopt, "system.tick", "tick", i);
            clock->advance(1);
        }
        actor = makeUser("auditor@example.com");
        wallet->audit().append(actor, "custom.login", std::nullopt, std::nullopt, {"192.0.2.1", "curl/8"});
    }

    unsigned int actor = 0;
};

TEST_F(AuditTrailTest, Append_ReturnsStoredEntry) {
    const auto entry = wallet->audit().append(std::nullopt, "system.start");
    EXPECT_GT(entry->id, 0u);
    EXPECT_EQ(entry->action, "system.start");
    EXPECT_EQ(entry->created_at, clock->now());
    EXPECT_FALSE(entry->user_id.has_value());
}

TEST_F(AuditTrailTest, Append_StorageFailurePropagates) {
    store->failOn("insert_audit_log");
    EXPECT_THROW(wallet->audit().append(std::nullopt, "system.start"), error::StorageFailure);
    EXPECT_EQ(store->auditLogCount(), 0u);
}

TEST_F(AuditTrailTest, Append_UnknownActorIsRecordedWithoutActor) {
    const types::RequestContext ctx{"198.51.100.7", "app/2"};
    const auto entry = wallet->audit().append(999u, "auth.login", std::nullopt, std::nullopt, ctx);
    EXPECT_GT(entry->id, 0u);
    EXPECT_FALSE(entry->user_id.has_value());

    const auto stored = auditFor("auth.login");
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_FALSE(stored[0]->user_id.has_value());
    EXPECT_EQ(stored[0]->ip_address, "198.51.100.7");
}

TEST_F(AuditTrailTest, Page_HugePageSizeIsCapped) {
    makeUser("solo@example.com");

    const auto page = wallet->audit().page({}, std::numeric_limits<unsigned int>::max());
    ASSERT_EQ(page.entries.size(), 1u);
    EXPECT_EQ(page.entries[0]->action, "user.create");
    EXPECT_FALSE(page.next_token.has_value());

    auto cursor = wallet->audit().query({}, std::numeric_limits<unsigned int>::max());
    EXPECT_NE(cursor.next(), nullptr);
    EXPECT_EQ(cursor.next(), nullptr);
}

TEST_F(AuditTrailTest, Query_OrdersNewestFirstWithIdTieBreak) {
    seed();
    std::vector<unsigned int> ids;
    std::vector<std::time_t> times;

    auto cursor = wallet->audit().query({}, 3);
    while (const auto e = cursor.next()) {
        ids.push_back(e->id);
        times.push_back(e->created_at);
    }

    ASSERT_EQ(ids.size(), 9u);
    for (size_t i = 1; i < ids.size(); ++i) {
        EXPECT_GE(times[i - 1], times[i]);
        if (times[i - 1] == times[i]) EXPECT_GT(ids[i - 1], ids[i]);
    }
    EXPECT_TRUE(cursor.exhausted());
    EXPECT_EQ(cursor.next(), nullptr);
}

TEST_F(AuditTrailTest, Query_Filters) {
    seed();

    AuditLogFilter byUser;
    byUser.user_id = actor;
    auto page = wallet->audit().page(byUser);
    ASSERT_EQ(page.entries.size(), 2u);
    EXPECT_EQ(page.entries[0]->action, "custom.login");
    EXPECT_EQ(page.entries[0]->ip_address, "192.0.2.1");
    EXPECT_EQ(page.entries[1]->action, "user.create");

    AuditLogFilter byPrefix;
    byPrefix.action_prefix = "system.";
    EXPECT_EQ(wallet->audit().page(byPrefix).entries.size(), 7u);

    const auto start = clock->now() - 7;
    AuditLogFilter window;
    window.since = start + 2;
    window.until = start + 4;
    page = wallet->audit().page(window);
    ASSERT_EQ(page.entries.size(), 3u);
    EXPECT_EQ(page.entries.front()->created_at, start + 4);
    EXPECT_EQ(page.entries.back()->created_at, start + 2);
}

TEST_F(AuditTrailTest, Query_PrefixMatchesLiterally) {
    wallet->audit().append(std::nullopt, "a_b.x");
    wallet->audit().append(std::nullopt, "aXb.x");

    AuditLogFilter filter;
    filter.action_prefix = "a_b";
    const auto page = wallet->audit().page(filter);
    ASSERT_EQ(page.entries.size(), 1u);
    EXPECT_EQ(page.entries[0]->action, "a_b.x");
}

TEST_F(AuditTrailTest, Page_TokensWalkTheWholeSequence) {
    seed();

    std::vector<unsigned int> walked;
    std::optional<std::string> token;
    size_t pages = 0;
    do {
        const auto page = wallet->audit().page({}, 4, token);
        for (const auto& e : page.entries) walked.push_back(e->id);
        token = page.next_token;
        ++pages;
    } while (token);

    EXPECT_EQ(pages, 3u);
    EXPECT_EQ(walked.size(), 9u);

    std::vector<unsigned int> direct;
    auto cursor = wallet->audit().query({}, 100);
    while (const auto e = cursor.next()) direct.push_back(e->id);
    EXPECT_EQ(walked, direct);
}

TEST_F(AuditTrailTest, Page_ExactMultipleHasNoTrailingToken) {
    for (int i = 0; i < 4; ++i) wallet->audit().append(std::nullopt, "system.tick");
    const auto first = wallet->audit().page({}, 2);
    ASSERT_TRUE(first.next_token.has_value());
    const auto second = wallet->audit().page({}, 2, first.next_token);
    EXPECT_EQ(second.entries.size(), 2u);
    EXPECT_FALSE(second.next_token.has_value());
}

TEST_F(AuditTrailTest, Cursor_TokenResumesAfterLastYielded) {
    seed();

    auto cursor = wallet->audit().query({}, 2);
    EXPECT_FALSE(cursor.token().has_value());
    const auto a = cursor.next();
    const auto b = cursor.next();
    const auto c = cursor.next();
    ASSERT_TRUE(a && b && c);

    auto resumed = wallet->audit().query({}, 2, cursor.token());
    const auto d = resumed.next();
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->id, cursor.next()->id);
}

TEST_F(AuditTrailTest, Cursor_IsRestartable) {
    seed();
    auto first = wallet->audit().query({}, 4);
    auto second = wallet->audit().query({}, 4);
    for (int i = 0; i < 9; ++i) EXPECT_EQ(first.next()->id, second.next()->id);
}

TEST_F(AuditTrailTest, MalformedToken_InvalidArgument) {
    EXPECT_THROW(wallet->audit().page({}, 10, std::string("garbage")), error::InvalidArgument);
    EXPECT_THROW((void)wallet->audit().query({}, 10, std::string("12.")), error::InvalidArgument);
}

TEST_F(AuditTrailTest, QueriesAreNotAuditedByDefault) {
    seed();
    wallet->audit().page({});
    EXPECT_TRUE(auditFor("audit.query").empty());
}

class AuditedQueriesTest : public AuditTrailTest {
protected:
    wallet::WalletOptions options() const override {
        wallet::WalletOptions opts;
        opts.audit_log_reads = true;
        opts.default_page_size = 5;
        return opts;
    }
};

TEST_F(AuditedQueriesTest, EachPageFetchIsAudited) {
    seed();

    auto cursor = wallet->audit().query({});
    size_t seen = 0;
    while (cursor.next()) ++seen;

    // 9 entries in pages of 5: two fetches, and the audit.query rows they add stay out of the walk
    EXPECT_EQ(seen, 9u);

    AuditLogFilter filter;
    filter.action_prefix = "audit.query";
    const auto entries = wallet->audit().page(filter, 100).entries;
    EXPECT_EQ(entries.size(), 2u);
}
