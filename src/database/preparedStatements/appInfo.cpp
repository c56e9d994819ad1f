#include "database/DBConnection.hpp"

using namespace cw::database;

void DBConnection::initPreparedAppInfo() const {
    conn_->prepare("upsert_app_info",
                   "INSERT INTO app_info (key, value) VALUES ($1, $2) "
                   "ON CONFLICT (key) DO UPDATE SET value = EXCLUDED.value");

    conn_->prepare("get_app_info", "SELECT value FROM app_info WHERE key = $1");
}
