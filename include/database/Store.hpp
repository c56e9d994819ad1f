#pragma once

#include "database/Transaction.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cw::database {

inline const std::vector<std::string> REQUIRED_TABLES = {
    "app_info", "users", "credentials", "shares", "ekyc_sessions", "audit_logs"
};

class Store {
public:
    Store() = default;
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;
    virtual ~Store() = default;

    // Begins a unit of work. Transactions must not be nested on one thread.
    virtual std::unique_ptr<Transaction> begin() = 0;

    [[nodiscard]] virtual std::string name() const = 0;

    // Creates missing tables and indexes; safe to run repeatedly.
    virtual void deploySchema() = 0;

    [[nodiscard]] virtual std::vector<std::string> missingTables() = 0;

    // deploySchema() plus app_info seeding
    void bootstrap();
};

}
