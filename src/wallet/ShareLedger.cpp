#include "wallet/ShareLedger.hpp"
#include "wallet/AuditTrail.hpp"
#include "wallet/IdentityStore.hpp"
#include "database/Transactions.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace cw::wallet;
using namespace cw::types;
using namespace cw::database;
using namespace cw::error;

namespace {

std::shared_ptr<cw::types::Credential> require_owned(Transaction& txn, const unsigned int credentialId,
                                                     const unsigned int ownerId) {
    auto credential = txn.getCredential(credentialId);
    if (!credential) throw NotFound("Credential " + std::to_string(credentialId) + " does not exist");
    if (!credential->isOwnedBy(ownerId))
        throw PermissionDenied("User " + std::to_string(ownerId) + " does not own credential "
                               + std::to_string(credentialId));
    return credential;
}

std::vector<ShareView> tag(const std::vector<std::shared_ptr<Share>>& shares, const std::time_t now) {
    std::vector<ShareView> out;
    out.reserve(shares.size());
    for (const auto& s : shares) out.push_back({s, ShareLedger::isEffective(*s, now)});
    return out;
}

}

ShareLedger::ShareLedger(std::shared_ptr<Store> store, std::shared_ptr<util::Clock> clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

std::shared_ptr<Share> ShareLedger::effectiveGrant(Transaction& txn, const unsigned int credentialId,
                                                   const unsigned int userId, const std::time_t now) {
    auto share = txn.getShare(credentialId, userId);
    if (!share || !isEffective(*share, now)) return nullptr;
    return share;
}

std::shared_ptr<Share> ShareLedger::grant(const unsigned int credentialId, const unsigned int ownerId,
                                          const unsigned int granteeId, const std::string& permission,
                                          const std::optional<std::time_t>& expiresAt,
                                          const RequestContext& ctx) const {
    SharePermission parsed{};
    try {
        parsed = share_permission_from_string(permission);
    } catch (const std::invalid_argument&) {
        throw InvalidArgument("Share permission must be 'read' or 'write', got '" + permission + "'");
    }
    return grant(credentialId, ownerId, granteeId, parsed, expiresAt, ctx);
}

std::shared_ptr<Share> ShareLedger::grant(const unsigned int credentialId, const unsigned int ownerId,
                                          const unsigned int granteeId, const SharePermission permission,
                                          const std::optional<std::time_t>& expiresAt,
                                          const RequestContext& ctx) const {
    if (granteeId == ownerId) throw InvalidArgument("A credential cannot be shared with its owner");

    const auto now = clock_->now();
    AuditLogEntry entry;

    auto share = Transactions::exec(*store_, "ShareLedger::grant", [&](Transaction& txn) {
        require_owned(txn, credentialId, ownerId);
        IdentityStore::requireActive(txn, granteeId);

        Share s(credentialId, granteeId, permission, expiresAt);
        s.created_at = now;
        auto stored = txn.upsertShare(s);

        entry = AuditTrail::record(txn, now, ownerId, "share.grant", "share", stored->id, ctx);
        return stored;
    });

    AuditTrail::publish(entry);
    log::Registry::shares()->info("[ShareLedger::grant] Credential {} shared with user {} ({}{})", credentialId,
                                  granteeId, to_string(permission),
                                  share->isEffectiveAt(now) ? "" : ", already expired");
    return share;
}

void ShareLedger::revoke(const unsigned int credentialId, const unsigned int ownerId, const unsigned int granteeId,
                         const RequestContext& ctx) const {
    const auto now = clock_->now();

    const auto entry = Transactions::exec(*store_, "ShareLedger::revoke", [&](Transaction& txn) {
        require_owned(txn, credentialId, ownerId);

        const auto share = txn.getShare(credentialId, granteeId);
        if (!share)
            throw NotFound("Credential " + std::to_string(credentialId) + " is not shared with user "
                           + std::to_string(granteeId));

        txn.deleteShare(credentialId, granteeId);
        return AuditTrail::record(txn, now, ownerId, "share.revoke", "share", share->id, ctx);
    });

    AuditTrail::publish(entry);
    log::Registry::shares()->info("[ShareLedger::revoke] Revoked user {} from credential {}", granteeId,
                                  credentialId);
}

std::vector<ShareView> ShareLedger::listForCredential(const unsigned int credentialId,
                                                      const unsigned int ownerId) const {
    const auto now = clock_->now();
    return Transactions::exec(*store_, "ShareLedger::listForCredential", [&](Transaction& txn) {
        require_owned(txn, credentialId, ownerId);
        return tag(txn.listSharesForCredential(credentialId), now);
    });
}

std::vector<ShareView> ShareLedger::listForGrantee(const unsigned int granteeId) const {
    const auto now = clock_->now();
    return Transactions::exec(*store_, "ShareLedger::listForGrantee", [&](Transaction& txn) {
        if (!txn.getUser(granteeId)) throw NotFound("User " + std::to_string(granteeId) + " does not exist");
        return tag(txn.listSharesForGrantee(granteeId), now);
    });
}

unsigned int ShareLedger::purgeExpired(const std::time_t olderThan, const RequestContext& ctx) const {
    const auto now = clock_->now();
    std::optional<AuditLogEntry> entry;

    const auto count = Transactions::exec(*store_, "ShareLedger::purgeExpired", [&](Transaction& txn) {
        const auto n = txn.deleteSharesExpiredBefore(olderThan);
        if (n > 0) entry = AuditTrail::record(txn, now, std::nullopt, "share.purge", "share", std::nullopt, ctx);
        return n;
    });

    if (entry) {
        AuditTrail::publish(*entry);
        log::Registry::shares()->info("[ShareLedger::purgeExpired] Purged {} shares expired at or before {}", count,
                                      olderThan);
    }
    return count;
}
