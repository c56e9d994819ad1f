#include "wallet/VerificationTracker.hpp"
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

VerificationTracker::VerificationTracker(std::shared_ptr<Store> store, std::shared_ptr<util::Clock> clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

std::shared_ptr<EkycSession> VerificationTracker::start(const unsigned int userId,
                                                        const std::optional<std::string>& provider,
                                                        const RequestContext& ctx) const {
    const auto now = clock_->now();
    EkycSession session(userId, provider);
    session.created_at = session.updated_at = now;

    const auto entry = Transactions::exec(*store_, "VerificationTracker::start", [&](Transaction& txn) {
        IdentityStore::requireActive(txn, userId);
        session.id = txn.insertEkycSession(session);
        return AuditTrail::record(txn, now, userId, "ekyc.start", "ekyc_session", session.id, ctx);
    });

    AuditTrail::publish(entry);
    log::Registry::ekyc()->info("[VerificationTracker::start] Session {} opened for user {} with {}", session.id,
                                userId, provider.value_or("unspecified provider"));
    return std::make_shared<EkycSession>(session);
}

std::shared_ptr<EkycSession> VerificationTracker::recordResult(const unsigned int sessionId,
                                                               const std::string& status,
                                                               const std::optional<std::string>& referenceId,
                                                               const std::optional<nlohmann::json>& payload,
                                                               const RequestContext& ctx) const {
    EkycStatus parsed{};
    try {
        parsed = ekyc_status_from_string(status);
    } catch (const std::invalid_argument&) {
        throw InvalidArgument("Unrecognized eKYC status '" + status + "'");
    }
    return recordResult(sessionId, parsed, referenceId, payload, ctx);
}

std::shared_ptr<EkycSession> VerificationTracker::recordResult(const unsigned int sessionId, const EkycStatus status,
                                                               const std::optional<std::string>& referenceId,
                                                               const std::optional<nlohmann::json>& payload,
                                                               const RequestContext& ctx) const {
    const auto now = clock_->now();
    AuditLogEntry entry;
    EkycStatus previous{};

    auto session = Transactions::exec(*store_, "VerificationTracker::recordResult", [&](Transaction& txn) {
        auto s = txn.getEkycSession(sessionId);
        if (!s) throw NotFound("eKYC session " + std::to_string(sessionId) + " does not exist");

        previous = s->status;
        s->status = status;
        if (referenceId) s->reference_id = referenceId;
        if (payload) s->result = payload;
        s->updated_at = now;
        txn.updateEkycSession(*s);

        entry = AuditTrail::record(txn, now, std::nullopt, "ekyc.result", "ekyc_session", sessionId, ctx);
        return s;
    });

    AuditTrail::publish(entry);
    if (is_terminal(previous) && previous != status)
        log::Registry::ekyc()->warn("[VerificationTracker::recordResult] Session {} moved from terminal status {} to {}",
                                    sessionId, to_string(previous), to_string(status));
    else
        log::Registry::ekyc()->info("[VerificationTracker::recordResult] Session {} is now {}", sessionId,
                                    to_string(status));
    return session;
}

std::shared_ptr<EkycSession> VerificationTracker::getLatest(const unsigned int userId) const {
    auto session = Transactions::exec(*store_, "VerificationTracker::getLatest", [&](Transaction& txn) {
        return txn.getLatestEkycSession(userId);
    });
    if (!session) throw NotFound("User " + std::to_string(userId) + " has no eKYC sessions");
    return session;
}

std::vector<std::shared_ptr<EkycSession>> VerificationTracker::listForUser(const unsigned int userId) const {
    return Transactions::exec(*store_, "VerificationTracker::listForUser", [&](Transaction& txn) {
        if (!txn.getUser(userId)) throw NotFound("User " + std::to_string(userId) + " does not exist");
        return txn.listEkycSessions(userId);
    });
}
