#include "wallet/Wallet.hpp"
#include "config/Config.hpp"
#include "database/PgStore.hpp"
#include "log/Registry.hpp"

using namespace cw::wallet;

Wallet::Wallet(std::shared_ptr<database::Store> store, std::shared_ptr<util::Clock> clock, const WalletOptions options)
    : store_(std::move(store)),
      clock_(std::move(clock)),
      options_(options),
      identities_(std::make_unique<IdentityStore>(store_, clock_)),
      credentials_(std::make_unique<CredentialStore>(store_, clock_, options_)),
      shares_(std::make_shared<ShareLedger>(store_, clock_)),
      verifications_(std::make_unique<VerificationTracker>(store_, clock_)),
      audit_(std::make_unique<AuditTrail>(store_, clock_, options_)) {
    log::Registry::wallet()->info("[Wallet] Ready on {} store", store_->name());
}

Wallet::~Wallet() {
    stopServices();
}

std::unique_ptr<Wallet> Wallet::fromConfig(const config::Config& config) {
    return std::make_unique<Wallet>(database::PgStore::fromConfig(config.database),
                                    std::make_shared<util::SystemClock>(),
                                    WalletOptions::fromConfig(config));
}

void Wallet::startServices(const config::Config& config) {
    const auto& sweeperCfg = config.services.share_sweeper;
    const auto retentionDays = config.sharing.purge_expired_after_days;

    if (!sweeperCfg.enabled || retentionDays == 0) {
        log::Registry::wallet()->info("[Wallet::startServices] Share sweeper disabled");
        return;
    }

    if (!sweeper_)
        sweeper_ = std::make_unique<ShareSweeper>(shares_, clock_, std::chrono::hours(24 * retentionDays),
                                                  sweeperCfg.sweep_interval_minutes);
    sweeper_->start();
    log::Registry::wallet()->info("[Wallet::startServices] {} running every {} min, retention {} days",
                                  sweeper_->serviceName(), sweeperCfg.sweep_interval_minutes.count(), retentionDays);
}

void Wallet::stopServices() {
    if (sweeper_) sweeper_->stop();
}
