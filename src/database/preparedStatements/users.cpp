#include "database/DBConnection.hpp"

using namespace cw::database;

void DBConnection::initPreparedUsers() const {
    conn_->prepare("insert_user",
                   "INSERT INTO users (email, username, password_hash, is_active, is_admin, created_at, updated_at) "
                   "VALUES ($1, $2, $3, $4, $5, $6::timestamptz, $7::timestamptz) RETURNING id");

    conn_->prepare("get_user", "SELECT * FROM users WHERE id = $1");

    conn_->prepare("get_user_by_email", "SELECT * FROM users WHERE email = $1");

    conn_->prepare("update_user_flags",
                   "UPDATE users SET is_active = $2, is_admin = $3, updated_at = $4::timestamptz WHERE id = $1");

    // credentials, shares and ekyc_sessions cascade; audit_logs.user_id is set null
    conn_->prepare("delete_user", "DELETE FROM users WHERE id = $1");
}
