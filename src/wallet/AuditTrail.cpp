#include "wallet/AuditTrail.hpp"
#include "database/Transactions.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace cw::wallet;
using namespace cw::types;
using namespace cw::database;

AuditTrail::AuditTrail(std::shared_ptr<Store> store, std::shared_ptr<util::Clock> clock, WalletOptions options)
    : store_(std::move(store)), clock_(std::move(clock)), options_(options) {}

AuditLogEntry AuditTrail::record(Transaction& txn, const std::time_t now,
                                 const std::optional<unsigned int>& actor, const std::string& action,
                                 const std::optional<std::string>& resourceType,
                                 const std::optional<unsigned int>& resourceId,
                                 const RequestContext& ctx) {
    AuditLogEntry entry;
    entry.user_id = actor;
    if (actor && !txn.getUser(*actor)) {
        log::Registry::audit()->warn("[AuditTrail] Unknown actor {} on '{}', recording without actor", *actor, action);
        entry.user_id.reset();
    }
    entry.action = action;
    entry.resource_type = resourceType;
    entry.resource_id = resourceId;
    entry.ip_address = ctx.ip_address;
    entry.user_agent = ctx.user_agent;
    entry.created_at = now;
    entry.id = txn.insertAuditLog(entry);
    return entry;
}

void AuditTrail::publish(const AuditLogEntry& entry) {
    log::Registry::audit()->info(to_string(entry));
}

std::shared_ptr<AuditLogEntry> AuditTrail::append(const std::optional<unsigned int>& actor,
                                                  const std::string& action,
                                                  const std::optional<std::string>& resourceType,
                                                  const std::optional<unsigned int>& resourceId,
                                                  const RequestContext& ctx) const {
    const auto now = clock_->now();
    const auto entry = Transactions::exec(*store_, "AuditTrail::append", [&](Transaction& txn) {
        return record(txn, now, actor, action, resourceType, resourceId, ctx);
    });
    publish(entry);
    return std::make_shared<AuditLogEntry>(entry);
}

unsigned int AuditTrail::resolvePageSize(const unsigned int pageSize) const {
    const auto size = pageSize > 0 ? pageSize : options_.default_page_size > 0 ? options_.default_page_size : 100;
    return std::min(size, MAX_PAGE_SIZE);
}

std::optional<AuditLogPosition> AuditTrail::decodeToken(const std::optional<std::string>& token) {
    if (!token || token->empty()) return std::nullopt;
    try {
        return decode_page_token(*token);
    } catch (const std::invalid_argument& e) {
        throw error::InvalidArgument(std::string("Malformed audit page token: ") + e.what());
    }
}

std::vector<std::shared_ptr<AuditLogEntry>> AuditTrail::fetch(const AuditLogFilter& filter,
                                                              const std::optional<AuditLogPosition>& after,
                                                              const unsigned int limit,
                                                              const RequestContext& ctx) const {
    const auto now = options_.audit_log_reads ? clock_->now() : 0;
    std::optional<AuditLogEntry> readEntry;

    auto rows = Transactions::exec(*store_, "AuditTrail::fetch", [&](Transaction& txn) {
        auto res = txn.queryAuditLogs(filter, after, limit);
        if (options_.audit_log_reads)
            readEntry = record(txn, now, std::nullopt, "audit.query", "audit_log", std::nullopt, ctx);
        return res;
    });

    if (readEntry) publish(*readEntry);
    return rows;
}

AuditCursor AuditTrail::query(const AuditLogFilter& filter, const unsigned int pageSize,
                              const std::optional<std::string>& pageToken, const RequestContext& ctx) const {
    return {*this, filter, resolvePageSize(pageSize), decodeToken(pageToken), ctx};
}

AuditPage AuditTrail::page(const AuditLogFilter& filter, const unsigned int pageSize,
                           const std::optional<std::string>& pageToken, const RequestContext& ctx) const {
    const auto size = resolvePageSize(pageSize);

    // One extra row tells us whether another page exists
    auto rows = fetch(filter, decodeToken(pageToken), size + 1, ctx);

    AuditPage out;
    if (rows.size() > size) {
        rows.resize(size);
        const auto& last = rows.back();
        out.next_token = encode_page_token({last->created_at, last->id});
    }
    out.entries = std::move(rows);
    return out;
}

AuditCursor::AuditCursor(const AuditTrail& trail, AuditLogFilter filter, const unsigned int pageSize,
                         std::optional<AuditLogPosition> start, RequestContext ctx)
    : trail_(&trail), filter_(std::move(filter)), pageSize_(pageSize), position_(start), ctx_(std::move(ctx)) {}

std::shared_ptr<AuditLogEntry> AuditCursor::next() {
    if (buffer_.empty() && !drained_) {
        const auto rows = trail_->fetch(filter_, position_, pageSize_, ctx_);
        if (rows.size() < pageSize_) drained_ = true;
        buffer_.assign(rows.begin(), rows.end());
    }

    if (buffer_.empty()) return nullptr;

    auto entry = buffer_.front();
    buffer_.pop_front();
    position_ = AuditLogPosition{entry->created_at, entry->id};
    return entry;
}

std::optional<std::string> AuditCursor::token() const {
    if (!position_) return std::nullopt;
    return encode_page_token(*position_);
}
