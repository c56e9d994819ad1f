#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace cw::database {

class DBConnection {
  public:
    explicit DBConnection(const std::string& connectionString);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    // Prepared statements reference the schema, so they are registered lazily on the
    // first transaction after the tables exist.
    void ensurePrepared();

  private:
    std::unique_ptr<pqxx::connection> conn_;
    bool prepared_ = false;

    void initPrepared() const;
    void initPreparedUsers() const;
    void initPreparedCredentials() const;
    void initPreparedShares() const;
    void initPreparedEkycSessions() const;
    void initPreparedAuditLogs() const;
    void initPreparedAppInfo() const;
};

} // namespace cw::database
