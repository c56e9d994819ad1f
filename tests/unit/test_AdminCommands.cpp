#include <gtest/gtest.h>

#include "ManualClock.hpp"
#include "cli/AdminCommands.hpp"
#include "cli/Parser.hpp"
#include "cli/Router.hpp"
#include "database/MemoryStore.hpp"
#include "wallet/CredentialStore.hpp"
#include "wallet/IdentityStore.hpp"
#include "wallet/ShareLedger.hpp"
#include "wallet/Wallet.hpp"

#include <nlohmann/json.hpp>

#include <sstream>

using namespace cw;
using namespace cw::cli;

TEST(ParserTest, SplitsNameFlagsAndPositionals) {
    const auto call = parseArgs({"audit", "--user", "3", "--verbose", "--action", "share.", "extra"});
    EXPECT_EQ(call.name, "audit");
    ASSERT_EQ(call.options.size(), 3u);
    EXPECT_EQ(call.options[0].key, "user");
    EXPECT_EQ(call.options[0].value, std::optional<std::string>("3"));
    EXPECT_EQ(call.options[1].key, "verbose");
    EXPECT_FALSE(call.options[1].value.has_value());
    EXPECT_EQ(call.options[2].value, std::optional<std::string>("share."));
    EXPECT_EQ(call.positionals, std::vector<std::string>{"extra"});
}

TEST(ParserTest, LastFlagWinsAndDoubleDashEndsFlags) {
    const auto call = parseArgs({"purge-shares", "--older-than-days", "1", "--older-than-days", "9", "--", "--raw"});
    ASSERT_EQ(call.options.size(), 1u);
    EXPECT_EQ(call.options[0].value, std::optional<std::string>("9"));
    EXPECT_EQ(call.positionals, std::vector<std::string>{"--raw"});
}

class AdminCommandsTest : public ::testing::Test {
protected:
    std::shared_ptr<database::MemoryStore> store = std::make_shared<database::MemoryStore>();
    std::shared_ptr<test::ManualClock> clock = std::make_shared<test::ManualClock>();
    std::shared_ptr<wallet::Wallet> wallet = std::make_shared<wallet::Wallet>(store, clock);
    std::shared_ptr<AdminContext> ctx = std::make_shared<AdminContext>();
    Router router;
    int opened = 0;

    void SetUp() override {
        ctx->config.sharing.purge_expired_after_days = 30;
        ctx->config.auditing.default_page_size = 5;
        ctx->openWallet = [this] {
            ++opened;
            return wallet;
        };
        registerAdminCommands(router, ctx);
    }

    CommandResult run(const std::vector<std::string>& args) const { return router.execute(parseArgs(args)); }

    static std::vector<nlohmann::json> jsonLines(const std::string& text) {
        std::vector<nlohmann::json> out;
        std::istringstream in(text);
        for (std::string line; std::getline(in, line);)
            if (!line.empty()) out.push_back(nlohmann::json::parse(line));
        return out;
    }
};

TEST_F(AdminCommandsTest, InitThenVerify) {
    auto res = run({"verify-db"});
    EXPECT_EQ(res.exit_code, 1);
    EXPECT_NE(res.stderr_text.find("audit_logs"), std::string::npos);

    res = run({"init-db"});
    EXPECT_EQ(res.exit_code, 0) << res.stderr_text;

    res = run({"verify-db"});
    EXPECT_EQ(res.exit_code, 0) << res.stderr_text;
    EXPECT_EQ(opened, 1);
}

TEST_F(AdminCommandsTest, ShowConfigDoesNotOpenWallet) {
    const auto res = run({"show-config"});
    ASSERT_EQ(res.exit_code, 0);
    const auto j = nlohmann::json::parse(res.stdout_text);
    EXPECT_EQ(j["sharing"]["purge_expired_after_days"], 30);
    EXPECT_EQ(opened, 0);
}

TEST_F(AdminCommandsTest, UnknownCommandIsUsageError) {
    const auto res = run({"frobnicate"});
    EXPECT_EQ(res.exit_code, 2);
    EXPECT_NE(res.stderr_text.find("purge-shares"), std::string::npos);

    EXPECT_EQ(run({}).exit_code, 0);
}

TEST_F(AdminCommandsTest, PurgeSharesHonorsRetention) {
    store->bootstrap();
    auto& ids = wallet->identities();
    const auto owner = ids.create("owner@example.com")->id;
    const auto a = ids.create("a@example.com")->id;
    const auto b = ids.create("b@example.com")->id;
    const auto cred = wallet->credentials().create(owner, "wifi", std::nullopt, {0x01})->id;

    constexpr std::time_t day = 24 * 60 * 60;
    wallet->shares().grant(cred, owner, a, types::SharePermission::Read, clock->now() - 40 * day);
    wallet->shares().grant(cred, owner, b, types::SharePermission::Read, clock->now() - 10 * day);

    auto res = run({"purge-shares"});
    ASSERT_EQ(res.exit_code, 0) << res.stderr_text;
    EXPECT_NE(res.stdout_text.find("Purged 1 shares"), std::string::npos);

    res = run({"purge-shares", "--older-than-days", "0"});
    ASSERT_EQ(res.exit_code, 0);
    EXPECT_NE(res.stdout_text.find("Purged 1 shares"), std::string::npos);
    EXPECT_TRUE(wallet->shares().listForCredential(cred, owner).empty());

    EXPECT_EQ(run({"purge-shares", "--older-than-days", "soon"}).exit_code, 2);
}

TEST_F(AdminCommandsTest, AuditPrintsJsonLinesNewestFirst) {
    store->bootstrap();
    const auto alice = wallet->identities().create("alice@example.com")->id;
    for (int i = 0; i < 3; ++i) {
        clock->advance(1);
        wallet->credentials().create(alice, "cred-" + std::to_string(i), std::nullopt, {0x0F});
    }

    auto res = run({"audit", "--action", "credential."});
    ASSERT_EQ(res.exit_code, 0) << res.stderr_text;
    auto lines = jsonLines(res.stdout_text);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_GT(lines[0]["id"].get<unsigned int>(), lines[1]["id"].get<unsigned int>());
    for (const auto& l : lines) EXPECT_EQ(l["action"], "credential.create");

    res = run({"audit", "--user", std::to_string(alice), "--limit", "2"});
    ASSERT_EQ(res.exit_code, 0);
    lines = jsonLines(res.stdout_text);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["user_id"], alice);

    // default limit comes from auditing.default_page_size
    for (int i = 0; i < 5; ++i) wallet->credentials().create(alice, "more", std::nullopt, {0x0F});
    EXPECT_EQ(jsonLines(run({"audit"}).stdout_text).size(), 5u);
}

TEST_F(AdminCommandsTest, AuditRejectsBadArguments) {
    EXPECT_EQ(run({"audit", "--limit", "0"}).exit_code, 2);
    EXPECT_EQ(run({"audit", "--user", "me"}).exit_code, 2);
    EXPECT_EQ(run({"audit", "--since", "last week"}).exit_code, 2);
}

TEST_F(AdminCommandsTest, DomainErrorsExitWithFailure) {
    store->bootstrap();
    store->failOn("query_audit_logs");
    const auto res = run({"audit"});
    EXPECT_EQ(res.exit_code, 1);
    EXPECT_FALSE(res.stderr_text.empty());
}
