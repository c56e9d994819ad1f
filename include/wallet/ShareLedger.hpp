#pragma once

#include "database/Store.hpp"
#include "types/RequestContext.hpp"
#include "types/Share.hpp"
#include "util/Clock.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cw::wallet {

class ShareLedger {
public:
    ShareLedger(std::shared_ptr<database::Store> store, std::shared_ptr<util::Clock> clock);

    // Creates the share or overwrites permission and expiry of the existing one for
    // (credentialId, granteeId). `permission` must be "read" or "write".
    std::shared_ptr<types::Share> grant(unsigned int credentialId, unsigned int ownerId, unsigned int granteeId,
                                        const std::string& permission,
                                        const std::optional<std::time_t>& expiresAt = std::nullopt,
                                        const types::RequestContext& ctx = {}) const;

    std::shared_ptr<types::Share> grant(unsigned int credentialId, unsigned int ownerId, unsigned int granteeId,
                                        types::SharePermission permission,
                                        const std::optional<std::time_t>& expiresAt = std::nullopt,
                                        const types::RequestContext& ctx = {}) const;

    void revoke(unsigned int credentialId, unsigned int ownerId, unsigned int granteeId,
                const types::RequestContext& ctx = {}) const;

    [[nodiscard]] static bool isEffective(const types::Share& share, std::time_t now) {
        return share.isEffectiveAt(now);
    }

    // Owner only; expired shares included and tagged
    [[nodiscard]] std::vector<types::ShareView> listForCredential(unsigned int credentialId,
                                                                  unsigned int ownerId) const;

    [[nodiscard]] std::vector<types::ShareView> listForGrantee(unsigned int granteeId) const;

    // Deletes shares whose expiry is at or before olderThan; returns how many went
    unsigned int purgeExpired(std::time_t olderThan, const types::RequestContext& ctx = {}) const;

    // The share that currently lets userId at credentialId, or nullptr
    static std::shared_ptr<types::Share> effectiveGrant(database::Transaction& txn, unsigned int credentialId,
                                                        unsigned int userId, std::time_t now);

private:
    std::shared_ptr<database::Store> store_;
    std::shared_ptr<util::Clock> clock_;
};

}
