#include "database/DBConnection.hpp"

using namespace cw::database;

void DBConnection::initPreparedShares() const {
    conn_->prepare("get_share",
                   "SELECT * FROM shares WHERE credential_id = $1 AND shared_with_user_id = $2");

    conn_->prepare("upsert_share",
                   "INSERT INTO shares (credential_id, shared_with_user_id, permission, expires_at, created_at) "
                   "VALUES ($1, $2, $3, $4::timestamptz, $5::timestamptz) "
                   "ON CONFLICT (credential_id, shared_with_user_id) DO UPDATE SET "
                   "  permission = EXCLUDED.permission, "
                   "  expires_at = EXCLUDED.expires_at "
                   "RETURNING *");

    conn_->prepare("delete_share",
                   "DELETE FROM shares WHERE credential_id = $1 AND shared_with_user_id = $2");

    conn_->prepare("list_shares_for_credential",
                   "SELECT * FROM shares WHERE credential_id = $1 ORDER BY id");

    conn_->prepare("list_shares_for_grantee",
                   "SELECT * FROM shares WHERE shared_with_user_id = $1 ORDER BY id");

    conn_->prepare("delete_expired_shares",
                   "DELETE FROM shares WHERE expires_at IS NOT NULL AND expires_at <= $1::timestamptz");
}
