#include <gtest/gtest.h>

#include "database/DBConnection.hpp"
#include "database/PgStore.hpp"
#include "database/Schema.hpp"
#include "wallet/AuditTrail.hpp"
#include "wallet/CredentialStore.hpp"
#include "wallet/IdentityStore.hpp"
#include "wallet/ShareLedger.hpp"
#include "wallet/VerificationTracker.hpp"
#include "wallet/Wallet.hpp"
#include "util/Clock.hpp"

#include <cstdlib>
#include <pqxx/pqxx>

using namespace cw;
using namespace cw::types;

namespace {

// Points at a disposable database, e.g. "host=localhost dbname=credwallet_test user=credwallet"
std::optional<std::string> test_db_url() {
    if (const char* url = std::getenv("CREDWALLET_TEST_DB_URL"); url && *url) return std::string(url);
    return std::nullopt;
}

class FixedClock final : public util::Clock {
public:
    std::time_t t = 1'700'000'000;
    [[nodiscard]] std::time_t now() const override { return t; }
};

}

class PgStoreTest : public ::testing::Test {
protected:
    std::shared_ptr<database::PgStore> store;
    std::shared_ptr<FixedClock> clock = std::make_shared<FixedClock>();
    std::unique_ptr<wallet::Wallet> wallet;

    void SetUp() override {
        const auto url = test_db_url();
        if (!url) GTEST_SKIP() << "CREDWALLET_TEST_DB_URL not set";

        store = std::make_shared<database::PgStore>(*url, 2);
        store->bootstrap();
        {
            pqxx::connection conn(*url);
            database::schema::wipe_all_data_restart_identity(conn);
        }
        wallet = std::make_unique<wallet::Wallet>(store, clock);
    }
};

TEST_F(PgStoreTest, SchemaIsComplete) {
    EXPECT_TRUE(store->missingTables().empty());
}

TEST_F(PgStoreTest, UniqueEmailIsConflict) {
    wallet->identities().create("dup@example.com");
    EXPECT_THROW(wallet->identities().create("dup@example.com"), error::Conflict);
}

TEST_F(PgStoreTest, CredentialRoundTripKeepsBytes) {
    const auto owner = wallet->identities().create("owner@example.com")->id;
    const Bytes payload{0x00, 0xFF, 0x10, 0x5C};
    const auto id = wallet->credentials().create(owner, "ssh", std::string("prod box"), payload, Bytes{0x01})->id;

    const auto c = wallet->credentials().get(id, owner);
    EXPECT_EQ(c->data_encrypted, payload);
    ASSERT_TRUE(c->iv.has_value());
    EXPECT_EQ(*c->iv, Bytes{0x01});
    EXPECT_EQ(c->created_at, clock->t);
}

TEST_F(PgStoreTest, SharedAccessAndExpiry) {
    const auto owner = wallet->identities().create("owner@example.com")->id;
    const auto bob = wallet->identities().create("bob@example.com")->id;
    const auto cred = wallet->credentials().create(owner, "vpn", std::nullopt, {0x0A})->id;

    EXPECT_THROW(wallet->credentials().get(cred, bob), error::PermissionDenied);

    wallet->shares().grant(cred, owner, bob, "read", clock->t + 60);
    EXPECT_EQ(wallet->credentials().get(cred, bob)->id, cred);
    EXPECT_EQ(wallet->credentials().listForUser(bob).size(), 1u);
    EXPECT_THROW(wallet->credentials().update(cred, bob, {0x0B}), error::PermissionDenied);

    clock->t += 60;
    EXPECT_THROW(wallet->credentials().get(cred, bob), error::PermissionDenied);
    EXPECT_TRUE(wallet->credentials().listForUser(bob).empty());
    EXPECT_EQ(wallet->shares().purgeExpired(clock->t), 1u);
}

TEST_F(PgStoreTest, DeletingUserCascadesAndKeepsAudit) {
    const auto alice = wallet->identities().create("alice@example.com")->id;
    const auto bob = wallet->identities().create("bob@example.com")->id;
    const auto cred = wallet->credentials().create(alice, "pin", std::nullopt, {0x01})->id;
    wallet->shares().grant(cred, alice, bob, SharePermission::Write);
    wallet->verifications().start(alice, std::string("onfido"));

    wallet->identities().remove(alice);

    EXPECT_THROW(wallet->identities().get(alice), error::NotFound);
    EXPECT_TRUE(wallet->shares().listForGrantee(bob).empty());

    AuditLogFilter filter;
    filter.action_prefix = "credential.";
    const auto page = wallet->audit().page(filter, 10);
    ASSERT_EQ(page.entries.size(), 1u);
    EXPECT_FALSE(page.entries.front()->user_id.has_value());
}

TEST_F(PgStoreTest, AuditPaginationWithTiedTimestamps) {
    const auto alice = wallet->identities().create("alice@example.com")->id;
    for (int i = 0; i < 5; ++i) wallet->audit().append(alice, "custom.tick", std::nullopt, std::nullopt);

    AuditLogFilter filter;
    filter.action_prefix = "custom.";
    auto first = wallet->audit().page(filter, 3);
    ASSERT_EQ(first.entries.size(), 3u);
    ASSERT_TRUE(first.next_token.has_value());

    const auto second = wallet->audit().page(filter, 3, first.next_token);
    ASSERT_EQ(second.entries.size(), 2u);
    EXPECT_FALSE(second.next_token.has_value());
    EXPECT_GT(first.entries.back()->id, second.entries.front()->id);
}

TEST_F(PgStoreTest, LikeWildcardsMatchLiterally) {
    const auto alice = wallet->identities().create("alice@example.com")->id;
    wallet->audit().append(alice, "a_b.x", std::nullopt, std::nullopt);
    wallet->audit().append(alice, "axb.x", std::nullopt, std::nullopt);

    AuditLogFilter filter;
    filter.action_prefix = "a_b";
    const auto page = wallet->audit().page(filter, 10);
    ASSERT_EQ(page.entries.size(), 1u);
    EXPECT_EQ(page.entries.front()->action, "a_b.x");
}

TEST_F(PgStoreTest, ClosedConnectionIsStorageFailure) {
    database::DBConnection conn(*test_db_url());
    conn.get().close();
    EXPECT_THROW(conn.ensurePrepared(), error::StorageFailure);
}

TEST_F(PgStoreTest, UnknownAuditActorIsRecordedWithoutActor) {
    const auto entry = wallet->audit().append(4242u, "auth.login");
    EXPECT_FALSE(entry->user_id.has_value());
}

TEST_F(PgStoreTest, UnrecognizedStoredStatusIsStorageFailure) {
    const auto alice = wallet->identities().create("alice@example.com")->id;
    wallet->verifications().start(alice);
    {
        pqxx::connection conn(*test_db_url());
        pqxx::work txn(conn);
        txn.exec("UPDATE ekyc_sessions SET status = 'verified'");
        txn.commit();
    }
    EXPECT_THROW(wallet->verifications().getLatest(alice), error::StorageFailure);
}
