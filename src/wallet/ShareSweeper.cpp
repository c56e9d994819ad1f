#include "wallet/ShareSweeper.hpp"
#include "wallet/ShareLedger.hpp"
#include "util/Clock.hpp"
#include "log/Registry.hpp"

using namespace cw::wallet;

ShareSweeper::ShareSweeper(std::shared_ptr<ShareLedger> ledger, std::shared_ptr<util::Clock> clock,
                           const std::chrono::hours retention, const std::chrono::minutes interval)
    : AsyncService("ShareSweeper", log::Registry::sweeper()),
      ledger_(std::move(ledger)),
      clock_(std::move(clock)),
      retention_(retention),
      sweep_interval_(interval) {}

ShareSweeper::~ShareSweeper() {
    stop();
}

unsigned int ShareSweeper::sweepOnce() const {
    const auto cutoff = clock_->now() - std::chrono::duration_cast<std::chrono::seconds>(retention_).count();
    const auto purged = ledger_->purgeExpired(cutoff);
    log::Registry::sweeper()->debug("[ShareSweeper] Swept {} expired shares", purged);
    return purged;
}

void ShareSweeper::runLoop() {
    while (!shouldStop()) {
        try {
            sweepOnce();
        } catch (const std::exception& e) {
            log_->warn("[ShareSweeper] Failed to purge expired shares: {}", e.what());
        }

        if (waitForStop(sweep_interval_)) break;
    }
}
