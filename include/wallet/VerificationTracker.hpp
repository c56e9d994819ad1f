#pragma once

#include "database/Store.hpp"
#include "types/EkycSession.hpp"
#include "types/RequestContext.hpp"
#include "util/Clock.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cw::wallet {

// Per-user eKYC session state as reported by an external provider. Statuses are
// stored as reported; no transition is refused.
class VerificationTracker {
public:
    VerificationTracker(std::shared_ptr<database::Store> store, std::shared_ptr<util::Clock> clock);

    std::shared_ptr<types::EkycSession> start(unsigned int userId,
                                              const std::optional<std::string>& provider = std::nullopt,
                                              const types::RequestContext& ctx = {}) const;

    // An absent referenceId or payload keeps the stored value
    std::shared_ptr<types::EkycSession> recordResult(unsigned int sessionId, const std::string& status,
                                                     const std::optional<std::string>& referenceId = std::nullopt,
                                                     const std::optional<nlohmann::json>& payload = std::nullopt,
                                                     const types::RequestContext& ctx = {}) const;

    std::shared_ptr<types::EkycSession> recordResult(unsigned int sessionId, types::EkycStatus status,
                                                     const std::optional<std::string>& referenceId = std::nullopt,
                                                     const std::optional<nlohmann::json>& payload = std::nullopt,
                                                     const types::RequestContext& ctx = {}) const;

    [[nodiscard]] std::shared_ptr<types::EkycSession> getLatest(unsigned int userId) const;

    [[nodiscard]] std::vector<std::shared_ptr<types::EkycSession>> listForUser(unsigned int userId) const;

private:
    std::shared_ptr<database::Store> store_;
    std::shared_ptr<util::Clock> clock_;
};

}
