#include "wallet/CredentialStore.hpp"
#include "wallet/AuditTrail.hpp"
#include "wallet/IdentityStore.hpp"
#include "wallet/ShareLedger.hpp"
#include "database/Transactions.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

using namespace cw::wallet;
using namespace cw::types;
using namespace cw::database;
using namespace cw::error;

namespace {

void require_requester(Transaction& txn, const unsigned int requesterId) {
    const auto user = txn.getUser(requesterId);
    if (!user || !user->is_active)
        throw PermissionDenied("User " + std::to_string(requesterId) + " is unknown or deactivated");
}

}

CredentialStore::CredentialStore(std::shared_ptr<Store> store, std::shared_ptr<util::Clock> clock,
                                 const WalletOptions options)
    : store_(std::move(store)), clock_(std::move(clock)), options_(options) {}

std::shared_ptr<Credential> CredentialStore::authorize(Transaction& txn, const unsigned int credentialId,
                                                       const unsigned int requesterId,
                                                       const SharePermission required, const std::time_t now) {
    auto credential = txn.getCredential(credentialId);
    if (!credential) throw NotFound("Credential " + std::to_string(credentialId) + " does not exist");

    // Owners keep access to their own credentials while deactivated
    if (credential->isOwnedBy(requesterId)) return credential;
    require_requester(txn, requesterId);

    const auto share = ShareLedger::effectiveGrant(txn, credentialId, requesterId, now);
    if (!share || !share->allows(required)) {
        log::Registry::credentials()->warn("[CredentialStore::authorize] Denied {} access to credential {} for user {}",
                                           to_string(required), credentialId, requesterId);
        throw PermissionDenied("User " + std::to_string(requesterId) + " has no effective " + to_string(required)
                               + " share on credential " + std::to_string(credentialId));
    }
    return credential;
}

std::shared_ptr<Credential> CredentialStore::create(const unsigned int ownerId, const std::string& title,
                                                    const std::optional<std::string>& description,
                                                    const Bytes& ciphertext, const std::optional<Bytes>& iv,
                                                    const RequestContext& ctx) const {
    if (title.empty()) throw InvalidArgument("Credential title must not be empty");
    if (ciphertext.empty()) throw InvalidArgument("Credential ciphertext must not be empty");

    const auto now = clock_->now();
    Credential credential(ownerId, title, description, ciphertext, iv);
    credential.created_at = credential.updated_at = now;

    const auto entry = Transactions::exec(*store_, "CredentialStore::create", [&](Transaction& txn) {
        IdentityStore::requireActive(txn, ownerId);
        credential.id = txn.insertCredential(credential);
        return AuditTrail::record(txn, now, ownerId, "credential.create", "credential", credential.id, ctx);
    });

    AuditTrail::publish(entry);
    log::Registry::credentials()->info("[CredentialStore::create] User {} created credential {} '{}'", ownerId,
                                       credential.id, title);
    return std::make_shared<Credential>(credential);
}

std::shared_ptr<Credential> CredentialStore::get(const unsigned int credentialId, const unsigned int requesterId,
                                                 const RequestContext& ctx) const {
    const auto now = clock_->now();
    std::optional<AuditLogEntry> entry;

    auto credential = Transactions::exec(*store_, "CredentialStore::get", [&](Transaction& txn) {
        auto c = authorize(txn, credentialId, requesterId, SharePermission::Read, now);
        if (options_.audit_credential_reads)
            entry = AuditTrail::record(txn, now, requesterId, "credential.read", "credential", credentialId, ctx);
        return c;
    });

    if (entry) AuditTrail::publish(*entry);
    return credential;
}

std::shared_ptr<Credential> CredentialStore::update(const unsigned int credentialId, const unsigned int requesterId,
                                                    const Bytes& ciphertext, const std::optional<Bytes>& iv,
                                                    const RequestContext& ctx) const {
    if (ciphertext.empty()) throw InvalidArgument("Credential ciphertext must not be empty");

    const auto now = clock_->now();
    AuditLogEntry entry;

    auto credential = Transactions::exec(*store_, "CredentialStore::update", [&](Transaction& txn) {
        auto c = authorize(txn, credentialId, requesterId, SharePermission::Write, now);
        txn.updateCredentialPayload(credentialId, ciphertext, iv, now);
        c->data_encrypted = ciphertext;
        c->iv = iv;
        c->updated_at = now;

        entry = AuditTrail::record(txn, now, requesterId, "credential.update", "credential", credentialId, ctx);
        return c;
    });

    AuditTrail::publish(entry);
    log::Registry::credentials()->debug("[CredentialStore::update] User {} replaced payload of credential {}",
                                        requesterId, credentialId);
    return credential;
}

std::shared_ptr<Credential> CredentialStore::updateDetails(const unsigned int credentialId,
                                                           const unsigned int requesterId, const std::string& title,
                                                           const std::optional<std::string>& description,
                                                           const RequestContext& ctx) const {
    if (title.empty()) throw InvalidArgument("Credential title must not be empty");

    const auto now = clock_->now();
    AuditLogEntry entry;

    auto credential = Transactions::exec(*store_, "CredentialStore::updateDetails", [&](Transaction& txn) {
        auto c = authorize(txn, credentialId, requesterId, SharePermission::Write, now);
        txn.updateCredentialDetails(credentialId, title, description, now);
        c->title = title;
        c->description = description;
        c->updated_at = now;

        entry = AuditTrail::record(txn, now, requesterId, "credential.update", "credential", credentialId, ctx);
        return c;
    });

    AuditTrail::publish(entry);
    return credential;
}

void CredentialStore::remove(const unsigned int credentialId, const unsigned int requesterId,
                             const RequestContext& ctx) const {
    const auto now = clock_->now();

    const auto entry = Transactions::exec(*store_, "CredentialStore::remove", [&](Transaction& txn) {
        const auto c = txn.getCredential(credentialId);
        if (!c) throw NotFound("Credential " + std::to_string(credentialId) + " does not exist");

        if (!c->isOwnedBy(requesterId))
            throw PermissionDenied("Only the owner may delete credential " + std::to_string(credentialId));

        txn.deleteCredential(credentialId);
        return AuditTrail::record(txn, now, requesterId, "credential.delete", "credential", credentialId, ctx);
    });

    AuditTrail::publish(entry);
    log::Registry::credentials()->info("[CredentialStore::remove] User {} deleted credential {}", requesterId,
                                       credentialId);
}

std::vector<std::shared_ptr<Credential>> CredentialStore::listForUser(const unsigned int userId) const {
    const auto now = clock_->now();
    return Transactions::exec(*store_, "CredentialStore::listForUser", [&](Transaction& txn) {
        require_requester(txn, userId);
        return txn.listAccessibleCredentials(userId, now);
    });
}
