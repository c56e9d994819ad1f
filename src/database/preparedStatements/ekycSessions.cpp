#include "database/DBConnection.hpp"

using namespace cw::database;

void DBConnection::initPreparedEkycSessions() const {
    conn_->prepare("insert_ekyc_session",
                   "INSERT INTO ekyc_sessions (user_id, status, provider, reference_id, result_json, created_at, updated_at) "
                   "VALUES ($1, $2, $3, $4, $5::jsonb, $6::timestamptz, $7::timestamptz) RETURNING id");

    conn_->prepare("get_ekyc_session", "SELECT * FROM ekyc_sessions WHERE id = $1");

    conn_->prepare("update_ekyc_session",
                   "UPDATE ekyc_sessions SET status = $2, provider = $3, reference_id = $4, result_json = $5::jsonb, "
                   "updated_at = $6::timestamptz WHERE id = $1");

    conn_->prepare("get_latest_ekyc_session",
                   "SELECT * FROM ekyc_sessions WHERE user_id = $1 ORDER BY created_at DESC, id DESC LIMIT 1");

    conn_->prepare("list_ekyc_sessions",
                   "SELECT * FROM ekyc_sessions WHERE user_id = $1 ORDER BY created_at DESC, id DESC");
}
