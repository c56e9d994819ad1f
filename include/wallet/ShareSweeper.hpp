#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <memory>

namespace cw::util { class Clock; }

namespace cw::wallet {

class ShareLedger;

// Periodically purges shares that expired more than `retention` ago
class ShareSweeper final : public concurrency::AsyncService {
public:
    ShareSweeper(std::shared_ptr<ShareLedger> ledger, std::shared_ptr<util::Clock> clock,
                 std::chrono::hours retention, std::chrono::minutes interval);
    ~ShareSweeper() override;

    // One purge pass; returns the number of shares removed
    unsigned int sweepOnce() const;

protected:
    void runLoop() override;

private:
    std::shared_ptr<ShareLedger> ledger_;
    std::shared_ptr<util::Clock> clock_;
    std::chrono::hours retention_;
    std::chrono::minutes sweep_interval_;
};

}
