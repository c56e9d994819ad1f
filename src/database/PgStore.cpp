#include "database/PgStore.hpp"
#include "database/Schema.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

using namespace cw::database;
using namespace cw::error;

PgStore::PgStore(const std::string& connectionString, const unsigned int poolSize) {
    try {
        pool_ = std::make_shared<DBPool>(connectionString, poolSize);
    } catch (const pqxx::broken_connection& e) {
        throw StorageFailure(std::string("Unable to connect to PostgreSQL: ") + e.what());
    }
}

std::shared_ptr<PgStore> PgStore::fromConfig(const config::DatabaseConfig& cfg) {
    log::Registry::db()->info("[PgStore] Connecting to {}:{}/{} as {} (pool size {})",
                              cfg.host, cfg.port, cfg.name, cfg.user, cfg.pool_size);
    return std::make_shared<PgStore>(cfg.connectionString(), cfg.pool_size);
}

std::unique_ptr<Transaction> PgStore::begin() {
    auto lease = pool_->acquire();
    return pg_guard("begin", [&]() -> std::unique_ptr<Transaction> {
        lease->ensurePrepared();
        return std::make_unique<PgTransaction>(std::move(lease));
    });
}

void PgStore::deploySchema() {
    const auto lease = pool_->acquire();
    pg_guard("deploy_schema", [&] { schema::init_tables_if_not_exists(lease->get()); });
}

std::vector<std::string> PgStore::missingTables() {
    const auto lease = pool_->acquire();
    return pg_guard("missing_tables", [&] { return schema::missing_tables(lease->get()); });
}

PgTransaction::PgTransaction(DBPool::Lease lease)
    : lease_(std::move(lease)), txn_(lease_->get()) {}

void PgTransaction::commit() {
    guard("commit", [&] { txn_.commit(); });
}

void PgTransaction::putAppInfo(const std::string& key, const std::string& value) {
    guard("upsert_app_info", [&] {
        txn_.exec(pqxx::prepped{"upsert_app_info"}, pqxx::params{key, value});
    });
}

std::optional<std::string> PgTransaction::getAppInfo(const std::string& key) {
    return guard("get_app_info", [&]() -> std::optional<std::string> {
        const auto res = txn_.exec(pqxx::prepped{"get_app_info"}, pqxx::params{key});
        if (res.empty()) return std::nullopt;
        return res.one_field().as<std::optional<std::string>>();
    });
}
