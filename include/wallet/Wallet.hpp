#pragma once

#include "database/Store.hpp"
#include "util/Clock.hpp"
#include "wallet/AuditTrail.hpp"
#include "wallet/CredentialStore.hpp"
#include "wallet/IdentityStore.hpp"
#include "wallet/Options.hpp"
#include "wallet/ShareLedger.hpp"
#include "wallet/ShareSweeper.hpp"
#include "wallet/VerificationTracker.hpp"

#include <memory>

namespace cw::config { struct Config; }

namespace cw::wallet {

// Wires the components to one store, one clock and one set of options
class Wallet {
public:
    explicit Wallet(std::shared_ptr<database::Store> store,
                    std::shared_ptr<util::Clock> clock = std::make_shared<util::SystemClock>(),
                    WalletOptions options = {});
    ~Wallet();

    Wallet(const Wallet&) = delete;
    Wallet& operator=(const Wallet&) = delete;

    // PostgreSQL-backed wallet using the system clock
    static std::unique_ptr<Wallet> fromConfig(const config::Config& config);

    [[nodiscard]] IdentityStore& identities() const { return *identities_; }
    [[nodiscard]] CredentialStore& credentials() const { return *credentials_; }
    [[nodiscard]] ShareLedger& shares() const { return *shares_; }
    [[nodiscard]] VerificationTracker& verifications() const { return *verifications_; }
    [[nodiscard]] AuditTrail& audit() const { return *audit_; }
    [[nodiscard]] database::Store& store() const { return *store_; }
    [[nodiscard]] const util::Clock& clock() const { return *clock_; }

    // Starts the share sweeper when enabled and a retention period is configured
    void startServices(const config::Config& config);
    void stopServices();

    [[nodiscard]] const ShareSweeper* sweeper() const { return sweeper_.get(); }

private:
    std::shared_ptr<database::Store> store_;
    std::shared_ptr<util::Clock> clock_;
    WalletOptions options_;

    std::unique_ptr<IdentityStore> identities_;
    std::unique_ptr<CredentialStore> credentials_;
    std::shared_ptr<ShareLedger> shares_;
    std::unique_ptr<VerificationTracker> verifications_;
    std::unique_ptr<AuditTrail> audit_;
    std::unique_ptr<ShareSweeper> sweeper_;
};

}
