#include "database/MemoryStore.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace cw::database;
using namespace cw::types;
using namespace cw::error;

namespace {

bool like_prefix(const std::string& action, const std::string& prefix) {
    return action.compare(0, prefix.size(), prefix) == 0;
}

// (created_at, id) strictly before `pos` in descending order
bool precedes(const AuditLogEntry& e, const AuditLogPosition& pos) {
    if (e.created_at != pos.created_at) return e.created_at < pos.created_at;
    return e.id < pos.id;
}

}

std::unique_ptr<Transaction> MemoryStore::begin() {
    maybeFail("begin");
    return std::make_unique<MemoryTransaction>(*this, std::unique_lock(mtx_));
}

void MemoryStore::deploySchema() {
    std::lock_guard lock(mtx_);
    deployed_ = true;
    log::Registry::db()->debug("[MemoryStore] Schema deployed");
}

std::vector<std::string> MemoryStore::missingTables() {
    std::lock_guard lock(mtx_);
    if (deployed_) return {};
    return REQUIRED_TABLES;
}

void MemoryStore::failOn(const std::string& op) {
    std::lock_guard lock(faultMtx_);
    faults_.insert(op);
}

size_t MemoryStore::auditLogCount() const {
    std::lock_guard lock(mtx_);
    return tables_.audit_logs.size();
}

void MemoryStore::maybeFail(const std::string& op) {
    std::lock_guard lock(faultMtx_);
    const auto it = faults_.find(op);
    if (it == faults_.end()) return;
    faults_.erase(it);
    throw StorageFailure(op + ": injected storage failure");
}

MemoryTransaction::MemoryTransaction(MemoryStore& store, std::unique_lock<std::mutex> lock)
    : store_(store), lock_(std::move(lock)), work_(store.tables_) {}

void MemoryTransaction::check(const char* op) {
    if (done_) throw StorageFailure(std::string(op) + ": transaction already committed");
    store_.maybeFail(op);
}

void MemoryTransaction::commit() {
    check("commit");
    store_.tables_ = std::move(work_);
    done_ = true;
    lock_.unlock();
}

// users

std::shared_ptr<User> MemoryTransaction::getUser(const unsigned int id) {
    check("get_user");
    const auto it = work_.users.find(id);
    if (it == work_.users.end()) return nullptr;
    return std::make_shared<User>(it->second);
}

std::shared_ptr<User> MemoryTransaction::getUserByEmail(const std::string& email) {
    check("get_user_by_email");
    for (const auto& [id, u] : work_.users)
        if (u.email == email) return std::make_shared<User>(u);
    return nullptr;
}

unsigned int MemoryTransaction::insertUser(const User& user) {
    check("insert_user");
    for (const auto& [id, u] : work_.users) {
        if (u.email == user.email) throw Conflict("insert_user: email '" + user.email + "' is already registered");
        if (user.username && u.username == user.username)
            throw Conflict("insert_user: username '" + *user.username + "' is already taken");
    }

    User row = user;
    row.id = work_.next_user_id++;
    work_.users.emplace(row.id, row);
    return row.id;
}

void MemoryTransaction::updateUserFlags(const unsigned int id, const bool isActive, const bool isAdmin,
                                        const std::time_t updatedAt) {
    check("update_user_flags");
    const auto it = work_.users.find(id);
    if (it == work_.users.end()) return;
    it->second.is_active = isActive;
    it->second.is_admin = isAdmin;
    it->second.updated_at = updatedAt;
}

bool MemoryTransaction::deleteUser(const unsigned int id) {
    check("delete_user");
    if (work_.users.erase(id) == 0) return false;

    std::set<unsigned int> owned;
    for (auto it = work_.credentials.begin(); it != work_.credentials.end();) {
        if (it->second.user_id == id) {
            owned.insert(it->first);
            it = work_.credentials.erase(it);
        } else ++it;
    }

    eraseSharesWhere([&](const Share& s) {
        return s.shared_with_user_id == id || owned.contains(s.credential_id);
    });

    std::erase_if(work_.ekyc_sessions, [&](const auto& kv) { return kv.second.user_id == id; });

    for (auto& [entryId, entry] : work_.audit_logs)
        if (entry.user_id == id) entry.user_id.reset();

    return true;
}

// credentials

std::shared_ptr<Credential> MemoryTransaction::getCredential(const unsigned int id) {
    check("get_credential");
    const auto it = work_.credentials.find(id);
    if (it == work_.credentials.end()) return nullptr;
    return std::make_shared<Credential>(it->second);
}

unsigned int MemoryTransaction::insertCredential(const Credential& credential) {
    check("insert_credential");
    if (!work_.users.contains(credential.user_id))
        throw NotFound("insert_credential: user " + std::to_string(credential.user_id) + " does not exist");

    Credential row = credential;
    row.id = work_.next_credential_id++;
    work_.credentials.emplace(row.id, row);
    return row.id;
}

void MemoryTransaction::updateCredentialPayload(const unsigned int id, const Bytes& ciphertext,
                                                const std::optional<Bytes>& iv, const std::time_t updatedAt) {
    check("update_credential_payload");
    const auto it = work_.credentials.find(id);
    if (it == work_.credentials.end()) return;
    it->second.data_encrypted = ciphertext;
    it->second.iv = iv;
    it->second.updated_at = updatedAt;
}

void MemoryTransaction::updateCredentialDetails(const unsigned int id, const std::string& title,
                                                const std::optional<std::string>& description,
                                                const std::time_t updatedAt) {
    check("update_credential_details");
    const auto it = work_.credentials.find(id);
    if (it == work_.credentials.end()) return;
    it->second.title = title;
    it->second.description = description;
    it->second.updated_at = updatedAt;
}

bool MemoryTransaction::deleteCredential(const unsigned int id) {
    check("delete_credential");
    if (work_.credentials.erase(id) == 0) return false;
    eraseSharesWhere([&](const Share& s) { return s.credential_id == id; });
    return true;
}

std::vector<std::shared_ptr<Credential>> MemoryTransaction::listAccessibleCredentials(const unsigned int userId,
                                                                                      const std::time_t now) {
    check("list_accessible_credentials");
    std::set<unsigned int> shared;
    for (const auto& [id, s] : work_.shares)
        if (s.shared_with_user_id == userId && s.isEffectiveAt(now)) shared.insert(s.credential_id);

    std::vector<std::shared_ptr<Credential>> out;
    for (const auto& [id, c] : work_.credentials)
        if (c.user_id == userId || shared.contains(id)) out.push_back(std::make_shared<Credential>(c));
    return out;
}

// shares

void MemoryTransaction::eraseSharesWhere(const std::function<bool(const Share&)>& pred) {
    std::erase_if(work_.shares, [&](const auto& kv) { return pred(kv.second); });
}

std::shared_ptr<Share> MemoryTransaction::getShare(const unsigned int credentialId, const unsigned int granteeId) {
    check("get_share");
    for (const auto& [id, s] : work_.shares)
        if (s.credential_id == credentialId && s.shared_with_user_id == granteeId) return std::make_shared<Share>(s);
    return nullptr;
}

std::shared_ptr<Share> MemoryTransaction::upsertShare(const Share& share) {
    check("upsert_share");
    if (!work_.credentials.contains(share.credential_id))
        throw NotFound("upsert_share: credential " + std::to_string(share.credential_id) + " does not exist");
    if (!work_.users.contains(share.shared_with_user_id))
        throw NotFound("upsert_share: user " + std::to_string(share.shared_with_user_id) + " does not exist");

    for (auto& [id, s] : work_.shares) {
        if (s.credential_id == share.credential_id && s.shared_with_user_id == share.shared_with_user_id) {
            s.permission = share.permission;
            s.expires_at = share.expires_at;
            return std::make_shared<Share>(s);
        }
    }

    Share row = share;
    row.id = work_.next_share_id++;
    work_.shares.emplace(row.id, row);
    return std::make_shared<Share>(row);
}

bool MemoryTransaction::deleteShare(const unsigned int credentialId, const unsigned int granteeId) {
    check("delete_share");
    return std::erase_if(work_.shares, [&](const auto& kv) {
        return kv.second.credential_id == credentialId && kv.second.shared_with_user_id == granteeId;
    }) > 0;
}

std::vector<std::shared_ptr<Share>> MemoryTransaction::listSharesForCredential(const unsigned int credentialId) {
    check("list_shares_for_credential");
    std::vector<std::shared_ptr<Share>> out;
    for (const auto& [id, s] : work_.shares)
        if (s.credential_id == credentialId) out.push_back(std::make_shared<Share>(s));
    return out;
}

std::vector<std::shared_ptr<Share>> MemoryTransaction::listSharesForGrantee(const unsigned int granteeId) {
    check("list_shares_for_grantee");
    std::vector<std::shared_ptr<Share>> out;
    for (const auto& [id, s] : work_.shares)
        if (s.shared_with_user_id == granteeId) out.push_back(std::make_shared<Share>(s));
    return out;
}

unsigned int MemoryTransaction::deleteSharesExpiredBefore(const std::time_t cutoff) {
    check("delete_expired_shares");
    return static_cast<unsigned int>(std::erase_if(work_.shares, [&](const auto& kv) {
        return kv.second.expires_at && *kv.second.expires_at <= cutoff;
    }));
}

// eKYC sessions

unsigned int MemoryTransaction::insertEkycSession(const EkycSession& session) {
    check("insert_ekyc_session");
    if (!work_.users.contains(session.user_id))
        throw NotFound("insert_ekyc_session: user " + std::to_string(session.user_id) + " does not exist");

    EkycSession row = session;
    row.id = work_.next_ekyc_id++;
    work_.ekyc_sessions.emplace(row.id, row);
    return row.id;
}

std::shared_ptr<EkycSession> MemoryTransaction::getEkycSession(const unsigned int id) {
    check("get_ekyc_session");
    const auto it = work_.ekyc_sessions.find(id);
    if (it == work_.ekyc_sessions.end()) return nullptr;
    return std::make_shared<EkycSession>(it->second);
}

void MemoryTransaction::updateEkycSession(const EkycSession& session) {
    check("update_ekyc_session");
    const auto it = work_.ekyc_sessions.find(session.id);
    if (it == work_.ekyc_sessions.end()) return;
    auto& row = it->second;
    row.status = session.status;
    row.provider = session.provider;
    row.reference_id = session.reference_id;
    row.result = session.result;
    row.updated_at = session.updated_at;
}

std::shared_ptr<EkycSession> MemoryTransaction::getLatestEkycSession(const unsigned int userId) {
    check("get_latest_ekyc_session");
    const EkycSession* latest = nullptr;
    for (const auto& [id, s] : work_.ekyc_sessions) {
        if (s.user_id != userId) continue;
        // ids ascend in map order, so >= picks the highest id on a created_at tie
        if (!latest || s.created_at >= latest->created_at) latest = &s;
    }
    if (!latest) return nullptr;
    return std::make_shared<EkycSession>(*latest);
}

std::vector<std::shared_ptr<EkycSession>> MemoryTransaction::listEkycSessions(const unsigned int userId) {
    check("list_ekyc_sessions");
    std::vector<std::shared_ptr<EkycSession>> out;
    for (const auto& [id, s] : work_.ekyc_sessions)
        if (s.user_id == userId) out.push_back(std::make_shared<EkycSession>(s));

    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        if (a->created_at != b->created_at) return a->created_at > b->created_at;
        return a->id > b->id;
    });
    return out;
}

// audit_logs

unsigned int MemoryTransaction::insertAuditLog(const AuditLogEntry& entry) {
    check("insert_audit_log");
    if (entry.user_id && !work_.users.contains(*entry.user_id))
        throw NotFound("insert_audit_log: user " + std::to_string(*entry.user_id) + " does not exist");

    AuditLogEntry row = entry;
    row.id = work_.next_audit_id++;
    work_.audit_logs.emplace(row.id, row);
    return row.id;
}

std::vector<std::shared_ptr<AuditLogEntry>> MemoryTransaction::queryAuditLogs(
    const AuditLogFilter& filter, const std::optional<AuditLogPosition>& after, const unsigned int limit) {
    check("query_audit_logs");
    std::vector<const AuditLogEntry*> matches;
    for (const auto& [id, e] : work_.audit_logs) {
        if (filter.user_id && e.user_id != filter.user_id) continue;
        if (filter.action_prefix && !like_prefix(e.action, *filter.action_prefix)) continue;
        if (filter.since && e.created_at < *filter.since) continue;
        if (filter.until && e.created_at > *filter.until) continue;
        if (after && !precedes(e, *after)) continue;
        matches.push_back(&e);
    }

    std::sort(matches.begin(), matches.end(), [](const auto* a, const auto* b) {
        if (a->created_at != b->created_at) return a->created_at > b->created_at;
        return a->id > b->id;
    });

    std::vector<std::shared_ptr<AuditLogEntry>> out;
    for (size_t i = 0; i < matches.size() && i < limit; ++i) out.push_back(std::make_shared<AuditLogEntry>(*matches[i]));
    return out;
}

// app_info

void MemoryTransaction::putAppInfo(const std::string& key, const std::string& value) {
    check("upsert_app_info");
    work_.app_info[key] = value;
}

std::optional<std::string> MemoryTransaction::getAppInfo(const std::string& key) {
    check("get_app_info");
    const auto it = work_.app_info.find(key);
    if (it == work_.app_info.end()) return std::nullopt;
    return it->second;
}
