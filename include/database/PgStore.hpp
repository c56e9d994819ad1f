#pragma once

#include "database/DBPool.hpp"
#include "database/PgErrors.hpp"
#include "database/Store.hpp"
#include "error/Error.hpp"

#include <memory>
#include <string>
#include <utility>
#include <pqxx/pqxx>

namespace cw::config { struct DatabaseConfig; }

namespace cw::database {

// PostgreSQL store. Cascades and set-null are delegated to the schema's native
// ON DELETE rules; uniqueness to its UNIQUE constraints.
class PgStore final : public Store {
public:
    PgStore(const std::string& connectionString, unsigned int poolSize);

    static std::shared_ptr<PgStore> fromConfig(const config::DatabaseConfig& cfg);

    std::unique_ptr<Transaction> begin() override;

    [[nodiscard]] std::string name() const override { return "postgres"; }

    void deploySchema() override;

    [[nodiscard]] std::vector<std::string> missingTables() override;

private:
    std::shared_ptr<DBPool> pool_;
};

class PgTransaction final : public Transaction {
public:
    explicit PgTransaction(DBPool::Lease lease);

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
    // Declared before txn_ so the work is aborted before the connection goes back
    DBPool::Lease lease_;
    pqxx::work txn_;

    template <typename Func>
    auto guard(const char* op, Func&& func) -> decltype(func()) {
        return pg_guard(op, std::forward<Func>(func));
    }
};

}
