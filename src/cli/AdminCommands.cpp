#include "cli/AdminCommands.hpp"
#include "cli/args.hpp"
#include "database/Store.hpp"
#include "types/AuditLogEntry.hpp"
#include "util/timestamp.hpp"
#include "wallet/Wallet.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace cw::cli;
using namespace cw::types;

namespace {

constexpr std::time_t SECONDS_PER_DAY = 24 * 60 * 60;

class WalletHandle {
public:
    explicit WalletHandle(std::shared_ptr<AdminContext> ctx) : ctx_(std::move(ctx)) {}

    cw::wallet::Wallet& operator*() {
        if (!wallet_) wallet_ = ctx_->openWallet();
        return *wallet_;
    }

private:
    std::shared_ptr<AdminContext> ctx_;
    std::shared_ptr<cw::wallet::Wallet> wallet_;
};

CommandResult handle_init_db(WalletHandle& wallet) {
    auto& store = (*wallet).store();
    store.bootstrap();
    return ok(fmt::format("Schema deployed on {} store\n", store.name()));
}

CommandResult handle_verify_db(WalletHandle& wallet) {
    const auto missing = (*wallet).store().missingTables();
    if (missing.empty()) return ok("All required tables are present\n");

    std::string msg = "Missing tables:\n";
    for (const auto& t : missing) msg += fmt::format("  - {}\n", t);
    return failed(msg);
}

CommandResult handle_purge_shares(const CommandCall& call, const AdminContext& ctx, WalletHandle& wallet) {
    unsigned int days = ctx.config.sharing.purge_expired_after_days;
    if (const auto v = optVal(call, "older-than-days")) {
        const auto parsed = parseUInt(*v);
        if (!parsed) return invalid("Invalid --older-than-days value: must be a non-negative integer\n");
        days = *parsed;
    }

    auto& w = *wallet;
    const auto cutoff = w.clock().now() - static_cast<std::time_t>(days) * SECONDS_PER_DAY;
    const auto purged = w.shares().purgeExpired(cutoff);
    return ok(fmt::format("Purged {} shares expired at or before {}\n", purged, cw::util::timestampToString(cutoff)));
}

CommandResult handle_audit(const CommandCall& call, const AdminContext& ctx, WalletHandle& wallet) {
    AuditLogFilter filter;

    if (const auto v = optVal(call, "user")) {
        const auto id = parseUInt(*v);
        if (!id) return invalid("Invalid --user value: must be a user id\n");
        filter.user_id = *id;
    }
    if (const auto v = optVal(call, "action")) {
        if (v->empty()) return invalid("Invalid --action value: cannot be empty\n");
        filter.action_prefix = *v;
    }
    if (const auto v = optVal(call, "since")) {
        filter.since = parseTime(*v);
        if (!filter.since) return invalid("Invalid --since value: expected ISO-8601 UTC or epoch seconds\n");
    }
    if (const auto v = optVal(call, "until")) {
        filter.until = parseTime(*v);
        if (!filter.until) return invalid("Invalid --until value: expected ISO-8601 UTC or epoch seconds\n");
    }

    unsigned int limit = ctx.config.auditing.default_page_size;
    if (const auto v = optVal(call, "limit")) {
        const auto parsed = parseUInt(*v);
        if (!parsed || *parsed == 0) return invalid("Invalid --limit value: must be a positive integer\n");
        limit = *parsed;
    }

    auto cursor = (*wallet).audit().query(filter, limit);
    std::string out;
    for (unsigned int n = 0; n < limit; ++n) {
        const auto entry = cursor.next();
        if (!entry) break;
        out += nlohmann::json(*entry).dump() + "\n";
    }
    return ok(out);
}

CommandResult handle_show_config(const AdminContext& ctx) {
    return ok(nlohmann::json(ctx.config).dump(2) + "\n");
}

}

void cw::cli::registerAdminCommands(Router& router, const std::shared_ptr<AdminContext>& ctx) {
    auto wallet = std::make_shared<WalletHandle>(ctx);

    router.registerCommand("init-db", "init-db", "Create missing tables and indexes, seed app_info",
                           [wallet](const CommandCall&) { return handle_init_db(*wallet); });

    router.registerCommand("verify-db", "verify-db", "Report required tables that are missing",
                           [wallet](const CommandCall&) { return handle_verify_db(*wallet); });

    router.registerCommand("purge-shares", "purge-shares [--older-than-days N]",
                           "Delete shares expired at least N days ago",
                           [ctx, wallet](const CommandCall& call) { return handle_purge_shares(call, *ctx, *wallet); });

    router.registerCommand("audit", "audit [--user ID] [--action PREFIX] [--since TS] [--until TS] [--limit N]",
                           "Print audit entries, newest first, as JSON lines",
                           [ctx, wallet](const CommandCall& call) { return handle_audit(call, *ctx, *wallet); });

    router.registerCommand("show-config", "show-config", "Print the effective configuration as JSON",
                           [ctx](const CommandCall&) { return handle_show_config(*ctx); });
}
