#include "database/DBConnection.hpp"

using namespace cw::database;

void DBConnection::initPreparedCredentials() const {
    conn_->prepare("insert_credential",
                   "INSERT INTO credentials (user_id, title, description, data_encrypted, iv, created_at, updated_at) "
                   "VALUES ($1, $2, $3, $4::bytea, $5::bytea, $6::timestamptz, $7::timestamptz) RETURNING id");

    conn_->prepare("get_credential", "SELECT * FROM credentials WHERE id = $1");

    conn_->prepare("update_credential_payload",
                   "UPDATE credentials SET data_encrypted = $2::bytea, iv = $3::bytea, updated_at = $4::timestamptz "
                   "WHERE id = $1");

    conn_->prepare("update_credential_details",
                   "UPDATE credentials SET title = $2, description = $3, updated_at = $4::timestamptz WHERE id = $1");

    conn_->prepare("delete_credential", "DELETE FROM credentials WHERE id = $1");

    conn_->prepare("list_accessible_credentials",
                   "SELECT c.* FROM credentials c "
                   "WHERE c.user_id = $1 "
                   "   OR EXISTS (SELECT 1 FROM shares s "
                   "              WHERE s.credential_id = c.id "
                   "                AND s.shared_with_user_id = $1 "
                   "                AND (s.expires_at IS NULL OR s.expires_at > $2::timestamptz)) "
                   "ORDER BY c.id");
}
