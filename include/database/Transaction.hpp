#pragma once

#include "types/AuditLogEntry.hpp"
#include "types/AuditQuery.hpp"
#include "types/Bytes.hpp"
#include "types/Credential.hpp"
#include "types/EkycSession.hpp"
#include "types/Share.hpp"
#include "types/User.hpp"

#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cw::database {

// One unit of work against the backing store. Nothing is visible to other
// transactions until commit(); destroying an uncommitted transaction rolls it back.
//
// Lookups return nullptr when the row does not exist. Unique-constraint violations
// throw error::Conflict, dangling foreign keys error::NotFound, and anything the store
// itself cannot complete error::StorageFailure.
class Transaction {
public:
    virtual ~Transaction() = default;

    virtual void commit() = 0;

    // users
    virtual std::shared_ptr<types::User> getUser(unsigned int id) = 0;
    virtual std::shared_ptr<types::User> getUserByEmail(const std::string& email) = 0;
    virtual unsigned int insertUser(const types::User& user) = 0;
    virtual void updateUserFlags(unsigned int id, bool isActive, bool isAdmin, std::time_t updatedAt) = 0;

    // Cascades to owned credentials, their shares, shares granted to the user and eKYC
    // sessions; nulls the actor on the user's audit entries.
    virtual bool deleteUser(unsigned int id) = 0;

    // credentials
    virtual std::shared_ptr<types::Credential> getCredential(unsigned int id) = 0;
    virtual unsigned int insertCredential(const types::Credential& credential) = 0;
    virtual void updateCredentialPayload(unsigned int id, const types::Bytes& ciphertext,
                                         const std::optional<types::Bytes>& iv, std::time_t updatedAt) = 0;
    virtual void updateCredentialDetails(unsigned int id, const std::string& title,
                                         const std::optional<std::string>& description, std::time_t updatedAt) = 0;
    virtual bool deleteCredential(unsigned int id) = 0;  // cascades to its shares

    // Owned plus shared-with-effective-grant, distinct, ordered by id
    virtual std::vector<std::shared_ptr<types::Credential>> listAccessibleCredentials(unsigned int userId,
                                                                                      std::time_t now) = 0;

    // shares
    virtual std::shared_ptr<types::Share> getShare(unsigned int credentialId, unsigned int granteeId) = 0;

    // Insert-or-update on (credential_id, shared_with_user_id). An existing row keeps its
    // id and created_at; permission and expires_at are replaced.
    virtual std::shared_ptr<types::Share> upsertShare(const types::Share& share) = 0;

    virtual bool deleteShare(unsigned int credentialId, unsigned int granteeId) = 0;
    virtual std::vector<std::shared_ptr<types::Share>> listSharesForCredential(unsigned int credentialId) = 0;
    virtual std::vector<std::shared_ptr<types::Share>> listSharesForGrantee(unsigned int granteeId) = 0;
    virtual unsigned int deleteSharesExpiredBefore(std::time_t cutoff) = 0;  // expires_at <= cutoff

    // eKYC sessions
    virtual unsigned int insertEkycSession(const types::EkycSession& session) = 0;
    virtual std::shared_ptr<types::EkycSession> getEkycSession(unsigned int id) = 0;
    virtual void updateEkycSession(const types::EkycSession& session) = 0;
    virtual std::shared_ptr<types::EkycSession> getLatestEkycSession(unsigned int userId) = 0;
    virtual std::vector<std::shared_ptr<types::EkycSession>> listEkycSessions(unsigned int userId) = 0;

    // audit_logs (append-only: no update or delete)
    virtual unsigned int insertAuditLog(const types::AuditLogEntry& entry) = 0;

    // Ordered by created_at DESC, id DESC, strictly after `after` when given
    virtual std::vector<std::shared_ptr<types::AuditLogEntry>> queryAuditLogs(
        const types::AuditLogFilter& filter, const std::optional<types::AuditLogPosition>& after,
        unsigned int limit) = 0;

    // app_info
    virtual void putAppInfo(const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> getAppInfo(const std::string& key) = 0;
};

}
