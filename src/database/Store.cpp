#include "database/Store.hpp"
#include "database/Transactions.hpp"
#include "log/Registry.hpp"

#ifndef CW_VERSION
#define CW_VERSION "0.0.0"
#endif

using namespace cw::database;

void Store::bootstrap() {
    log::Registry::db()->info("[Store::bootstrap] Deploying schema on {} store", name());
    deploySchema();

    Transactions::exec(*this, "Store::bootstrap", [](Transaction& txn) {
        txn.putAppInfo("project_name", "credwallet");
        txn.putAppInfo("version", CW_VERSION);
    });
}
