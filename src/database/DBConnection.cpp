#include "database/DBConnection.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <pqxx/pqxx>

using namespace cw::database;

DBConnection::DBConnection(const std::string& connectionString)
    : conn_(std::make_unique<pqxx::connection>(connectionString)) {
    // Timestamps are exchanged as UTC text; pin the session so parsing stays exact
    conn_->set_session_var("timezone", "UTC");
    log::Registry::db()->debug("[DBConnection] Connected to database '{}' on {}", conn_->dbname(),
                               conn_->hostname() ? conn_->hostname() : "local socket");
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::ensurePrepared() {
    if (prepared_) return;
    initPrepared();
    prepared_ = true;
}

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw error::StorageFailure("Database connection is not open");

    initPreparedUsers();
    initPreparedCredentials();
    initPreparedShares();
    initPreparedEkycSessions();
    initPreparedAuditLogs();
    initPreparedAppInfo();
}
