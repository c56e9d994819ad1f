#include "database/Schema.hpp"
#include "database/Store.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <pqxx/pqxx>

namespace cw::database::schema {

namespace {

void init_identity(pqxx::work& txn) {
    txn.exec(R"(
CREATE TABLE IF NOT EXISTS app_info
(
    id          SERIAL      PRIMARY KEY,
    key         TEXT        UNIQUE NOT NULL,
    value       TEXT,
    created_at  TIMESTAMPTZ DEFAULT NOW()
);
    )");

    txn.exec(R"(
CREATE TABLE IF NOT EXISTS users
(
    id             SERIAL      PRIMARY KEY,
    email          TEXT        NOT NULL UNIQUE,
    username       TEXT        UNIQUE,
    password_hash  TEXT,
    is_active      BOOLEAN     NOT NULL DEFAULT TRUE,
    is_admin       BOOLEAN     NOT NULL DEFAULT FALSE,
    created_at     TIMESTAMPTZ DEFAULT NOW(),
    updated_at     TIMESTAMPTZ DEFAULT NOW()
);
    )");
}

void init_credentials(pqxx::work& txn) {
    txn.exec(R"(
CREATE TABLE IF NOT EXISTS credentials
(
    id              SERIAL      PRIMARY KEY,
    user_id         INTEGER     NOT NULL REFERENCES users (id) ON DELETE CASCADE,
    title           TEXT        NOT NULL,
    description     TEXT,
    data_encrypted  BYTEA       NOT NULL,
    iv              BYTEA,
    created_at      TIMESTAMPTZ DEFAULT NOW(),
    updated_at      TIMESTAMPTZ DEFAULT NOW()
);
    )");

    txn.exec(R"(
CREATE TABLE IF NOT EXISTS shares
(
    id                   SERIAL      PRIMARY KEY,
    credential_id        INTEGER     NOT NULL REFERENCES credentials (id) ON DELETE CASCADE,
    shared_with_user_id  INTEGER     NOT NULL REFERENCES users (id) ON DELETE CASCADE,
    permission           TEXT        NOT NULL DEFAULT 'read' CHECK (permission IN ('read', 'write')),
    expires_at           TIMESTAMPTZ,
    created_at           TIMESTAMPTZ DEFAULT NOW(),
    UNIQUE (credential_id, shared_with_user_id)
);
    )");
}

void init_verification(pqxx::work& txn) {
    txn.exec(R"(
CREATE TABLE IF NOT EXISTS ekyc_sessions
(
    id            SERIAL      PRIMARY KEY,
    user_id       INTEGER     NOT NULL REFERENCES users (id) ON DELETE CASCADE,
    status        TEXT        NOT NULL DEFAULT 'pending',
    provider      TEXT,
    reference_id  TEXT,
    result_json   JSONB,
    created_at    TIMESTAMPTZ DEFAULT NOW(),
    updated_at    TIMESTAMPTZ DEFAULT NOW()
);
    )");
}

void init_audit(pqxx::work& txn) {
    txn.exec(R"(
CREATE TABLE IF NOT EXISTS audit_logs
(
    id             SERIAL      PRIMARY KEY,
    user_id        INTEGER     REFERENCES users (id) ON DELETE SET NULL,
    action         TEXT        NOT NULL,
    resource_type  TEXT,
    resource_id    INTEGER,
    ip_address     TEXT,
    user_agent     TEXT,
    created_at     TIMESTAMPTZ DEFAULT NOW()
);
    )");
}

void init_indexes(pqxx::work& txn) {
    txn.exec("CREATE INDEX IF NOT EXISTS idx_users_email ON users (email)");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_users_username ON users (username)");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_credentials_user_id ON credentials (user_id)");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_shares_credential_id ON shares (credential_id)");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_shares_shared_with_user_id ON shares (shared_with_user_id)");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_ekyc_user_id ON ekyc_sessions (user_id)");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_audit_user_id ON audit_logs (user_id)");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_audit_created_at ON audit_logs (created_at, id)");
}

}

void init_tables_if_not_exists(pqxx::connection& conn) {
    pqxx::work txn(conn);
    init_identity(txn);
    init_credentials(txn);
    init_verification(txn);
    init_audit(txn);
    init_indexes(txn);
    txn.commit();

    log::Registry::db()->info("[schema] Tables and indexes are in place");
}

std::vector<std::string> missing_tables(pqxx::connection& conn) {
    pqxx::read_transaction txn(conn);
    std::vector<std::string> existing;
    for (const auto& row : txn.exec("SELECT table_name FROM information_schema.tables "
                                    "WHERE table_schema = current_schema() AND table_type = 'BASE TABLE'"))
        existing.push_back(row[0].as<std::string>());

    std::vector<std::string> missing;
    for (const auto& table : REQUIRED_TABLES)
        if (std::find(existing.begin(), existing.end(), table) == existing.end()) missing.push_back(table);
    return missing;
}

void wipe_all_data_restart_identity(pqxx::connection& conn) {
    pqxx::work txn(conn);
    txn.exec("TRUNCATE audit_logs, ekyc_sessions, shares, credentials, users, app_info RESTART IDENTITY CASCADE");
    txn.commit();
    log::Registry::db()->warn("[schema] All data wiped");
}

}
