#include "WalletFixture.hpp"

#include "config/Config.hpp"
#include "wallet/ShareLedger.hpp"
#include "wallet/ShareSweeper.hpp"

#include <thread>

using namespace cw;
using namespace cw::types;
using namespace std::chrono_literals;

namespace {

constexpr std::time_t DAY = 24 * 60 * 60;

}

class ShareSweeperTest : public test::WalletTest {
protected:
    unsigned int owner{}, grantee{}, cred{};

    void SetUp() override {
        WalletTest::SetUp();
        owner = makeUser("owner@example.com");
        grantee = makeUser("grantee@example.com");
        cred = makeCredential(owner);
    }

    std::shared_ptr<wallet::ShareLedger> ledger() const {
        return std::make_shared<wallet::ShareLedger>(store, clock);
    }

    size_t sharesOnRecord() const { return wallet->shares().listForCredential(cred, owner).size(); }
};

TEST_F(ShareSweeperTest, SweepKeepsSharesInsideRetention) {
    const auto other = makeUser("other@example.com");
    wallet->shares().grant(cred, owner, grantee, SharePermission::Read, clock->now() - 10 * DAY);
    wallet->shares().grant(cred, owner, other, SharePermission::Read, clock->now() - 2 * DAY);

    const wallet::ShareSweeper sweeper(ledger(), clock, 24h * 7, 60min);
    EXPECT_EQ(sweeper.sweepOnce(), 1u);
    ASSERT_EQ(sharesOnRecord(), 1u);
    EXPECT_EQ(wallet->shares().listForCredential(cred, owner).front().share->shared_with_user_id, other);

    clock->advance(6 * DAY);
    EXPECT_EQ(sweeper.sweepOnce(), 1u);
    EXPECT_EQ(sharesOnRecord(), 0u);
    EXPECT_EQ(auditFor("share.purge").size(), 2u);
}

TEST_F(ShareSweeperTest, SweepIgnoresOpenEndedShares) {
    wallet->shares().grant(cred, owner, grantee, SharePermission::Write);
    clock->advance(1000 * DAY);

    const wallet::ShareSweeper sweeper(ledger(), clock, 24h, 60min);
    EXPECT_EQ(sweeper.sweepOnce(), 0u);
    EXPECT_EQ(sharesOnRecord(), 1u);
    EXPECT_TRUE(auditFor("share.purge").empty());
}

TEST_F(ShareSweeperTest, BackgroundLoopPurgesAndStops) {
    wallet->shares().grant(cred, owner, grantee, SharePermission::Read, clock->now() - 3 * DAY);

    wallet::ShareSweeper sweeper(ledger(), clock, 24h, 60min);
    sweeper.start();
    EXPECT_TRUE(sweeper.isRunning());

    for (int i = 0; i < 100 && sharesOnRecord() != 0; ++i) std::this_thread::sleep_for(20ms);
    EXPECT_EQ(sharesOnRecord(), 0u);

    sweeper.stop();
    EXPECT_FALSE(sweeper.isRunning());
}

TEST_F(ShareSweeperTest, WalletStartsSweeperOnlyWhenConfigured) {
    config::Config cfg;
    cfg.services.share_sweeper.enabled = true;
    cfg.sharing.purge_expired_after_days = 0;
    wallet->startServices(cfg);
    EXPECT_EQ(wallet->sweeper(), nullptr);

    cfg.services.share_sweeper.enabled = false;
    cfg.sharing.purge_expired_after_days = 30;
    wallet->startServices(cfg);
    EXPECT_EQ(wallet->sweeper(), nullptr);

    cfg.services.share_sweeper.enabled = true;
    wallet->startServices(cfg);
    ASSERT_NE(wallet->sweeper(), nullptr);
    EXPECT_TRUE(wallet->sweeper()->isRunning());
    EXPECT_EQ(wallet->sweeper()->serviceName(), "ShareSweeper");

    wallet->stopServices();
    EXPECT_FALSE(wallet->sweeper()->isRunning());
}
