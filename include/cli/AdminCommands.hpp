#pragma once

#include "cli/Router.hpp"
#include "config/Config.hpp"

#include <functional>
#include <memory>

namespace cw::wallet { class Wallet; }

namespace cw::cli {

struct AdminContext {
    config::Config config;

    // Opened on first use so commands like show-config never touch the database
    std::function<std::shared_ptr<wallet::Wallet>()> openWallet;
};

// init-db, verify-db, purge-shares, audit, show-config
void registerAdminCommands(Router& router, const std::shared_ptr<AdminContext>& ctx);

}
