#pragma once

#include "database/Store.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>

namespace cw::database {

// In-process store with the same constraint and cascade semantics as the
// PostgreSQL schema. Transactions are serialized: begin() holds the store lock
// until the transaction commits or is destroyed, and works on a private copy of
// the tables that commit() publishes.
class MemoryStore final : public Store {
public:
    struct Tables {
        std::map<unsigned int, types::User> users;
        std::map<unsigned int, types::Credential> credentials;
        std::map<unsigned int, types::Share> shares;
        std::map<unsigned int, types::EkycSession> ekyc_sessions;
        std::map<unsigned int, types::AuditLogEntry> audit_logs;
        std::map<std::string, std::string> app_info;

        unsigned int next_user_id = 1, next_credential_id = 1, next_share_id = 1,
                     next_ekyc_id = 1, next_audit_id = 1;
    };

    MemoryStore() = default;

    std::unique_ptr<Transaction> begin() override;

    [[nodiscard]] std::string name() const override { return "memory"; }

    void deploySchema() override;

    [[nodiscard]] std::vector<std::string> missingTables() override;

    // Makes the next call of `op` throw error::StorageFailure. Operation names match
    // the prepared statement names ("insert_audit_log", "upsert_share", ...) plus "commit".
    void failOn(const std::string& op);

    [[nodiscard]] size_t auditLogCount() const;

private:
    friend class MemoryTransaction;

    mutable std::mutex mtx_;
    Tables tables_;
    bool deployed_ = false;

    mutable std::mutex faultMtx_;
    std::multiset<std::string> faults_;

    void maybeFail(const std::string& op);
};

class MemoryTransaction final : public Transaction {
public:
    MemoryTransaction(MemoryStore& store, std::unique_lock<std::mutex> lock);

    void commit() override;

    std::shared_ptr<types::User> getUser(unsigned int id) override;
    std::shared_ptr<types::User> getUserByEmail(const std::string& email) override;
    unsigned int insertUser(const types::User& user) override;
    void updateUserFlags(unsigned int id, bool isActive, bool isAdmin, std::time_t updatedAt) override;
    bool deleteUser(unsigned int id) override;

    std::shared_ptr<types::Credential> getCredential(unsigned int id) override;
    unsigned int insertCredential(const types::Credential& credential) override;
    void updateCredentialPayload(unsigned int id, const types::Bytes& ciphertext,
                                 const std::optional<types::Bytes>& iv, std::time_t updatedAt) override;
    void updateCredentialDetails(unsigned int id, const std::string& title,
                                 const std::optional<std::string>& description, std::time_t updatedAt) override;
    bool deleteCredential(unsigned int id) override;
    std::vector<std::shared_ptr<types::Credential>> listAccessibleCredentials(unsigned int userId,
                                                                              std::time_t now) override;

    std::shared_ptr<types::Share> getShare(unsigned int credentialId, unsigned int granteeId) override;
    std::shared_ptr<types::Share> upsertShare(const types::Share& share) override;
    bool deleteShare(unsigned int credentialId, unsigned int granteeId) override;
    std::vector<std::shared_ptr<types::Share>> listSharesForCredential(unsigned int credentialId) override;
    std::vector<std::shared_ptr<types::Share>> listSharesForGrantee(unsigned int granteeId) override;
    unsigned int deleteSharesExpiredBefore(std::time_t cutoff) override;

    unsigned int insertEkycSession(const types::EkycSession& session) override;
    std::shared_ptr<types::EkycSession> getEkycSession(unsigned int id) override;
    void updateEkycSession(const types::EkycSession& session) override;
    std::shared_ptr<types::EkycSession> getLatestEkycSession(unsigned int userId) override;
    std::vector<std::shared_ptr<types::EkycSession>> listEkycSessions(unsigned int userId) override;

    unsigned int insertAuditLog(const types::AuditLogEntry& entry) override;
    std::vector<std::shared_ptr<types::AuditLogEntry>> queryAuditLogs(
        const types::AuditLogFilter& filter, const std::optional<types::AuditLogPosition>& after,
        unsigned int limit) override;

    void putAppInfo(const std::string& key, const std::string& value) override;
    std::optional<std::string> getAppInfo(const std::string& key) override;

private:
    MemoryStore& store_;
    std::unique_lock<std::mutex> lock_;
    MemoryStore::Tables work_;
    bool done_ = false;

    void check(const char* op);
    void eraseSharesWhere(const std::function<bool(const types::Share&)>& pred);
};

}
