#include "database/DBConnection.hpp"

using namespace cw::database;

void DBConnection::initPreparedAuditLogs() const {
    conn_->prepare("insert_audit_log",
                   "INSERT INTO audit_logs (user_id, action, resource_type, resource_id, ip_address, user_agent, created_at) "
                   "VALUES ($1, $2, $3, $4, $5, $6, $7::timestamptz) RETURNING id");
}
