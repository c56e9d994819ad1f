#pragma once

#include "database/Store.hpp"
#include "types/AuditLogEntry.hpp"
#include "types/AuditQuery.hpp"
#include "types/RequestContext.hpp"
#include "util/Clock.hpp"
#include "wallet/Options.hpp"

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cw::wallet {

class AuditTrail;

struct AuditPage {
    std::vector<std::shared_ptr<types::AuditLogEntry>> entries;
    std::optional<std::string> next_token;  // nullopt on the last page
};

// Lazy walk over matching entries, newest first. Pages are fetched on demand, so a
// cursor never holds more than one page. token() resumes a fresh cursor right after
// the last entry this one yielded.
class AuditCursor {
public:
    // nullptr once the sequence is exhausted
    std::shared_ptr<types::AuditLogEntry> next();

    [[nodiscard]] std::optional<std::string> token() const;

    [[nodiscard]] bool exhausted() const { return buffer_.empty() && drained_; }

private:
    friend class AuditTrail;

    AuditCursor(const AuditTrail& trail, types::AuditLogFilter filter, unsigned int pageSize,
                std::optional<types::AuditLogPosition> start, types::RequestContext ctx);

    const AuditTrail* trail_;
    types::AuditLogFilter filter_;
    unsigned int pageSize_;
    std::optional<types::AuditLogPosition> position_;
    types::RequestContext ctx_;
    std::deque<std::shared_ptr<types::AuditLogEntry>> buffer_;
    bool drained_ = false;
};

class AuditTrail {
public:
    // Upper bound on any requested or configured page size
    static constexpr unsigned int MAX_PAGE_SIZE = 10000;

    AuditTrail(std::shared_ptr<database::Store> store, std::shared_ptr<util::Clock> clock, WalletOptions options);

    // Standalone append in its own transaction
    std::shared_ptr<types::AuditLogEntry> append(const std::optional<unsigned int>& actor,
                                                 const std::string& action,
                                                 const std::optional<std::string>& resourceType = std::nullopt,
                                                 const std::optional<unsigned int>& resourceId = std::nullopt,
                                                 const types::RequestContext& ctx = {}) const;

    // Appends inside the caller's transaction. The returned entry carries its id; the
    // caller publishes it once the transaction has committed. An actor id naming no
    // user is dropped with a warning rather than rejected.
    static types::AuditLogEntry record(database::Transaction& txn, std::time_t now,
                                       const std::optional<unsigned int>& actor, const std::string& action,
                                       const std::optional<std::string>& resourceType,
                                       const std::optional<unsigned int>& resourceId,
                                       const types::RequestContext& ctx);

    // Mirrors a committed entry to the audit log file
    static void publish(const types::AuditLogEntry& entry);

    // pageSize 0 selects the configured default and sizes above MAX_PAGE_SIZE are capped.
    // Throws error::InvalidArgument on a malformed pageToken.
    [[nodiscard]] AuditCursor query(const types::AuditLogFilter& filter, unsigned int pageSize = 0,
                                    const std::optional<std::string>& pageToken = std::nullopt,
                                    const types::RequestContext& ctx = {}) const;

    [[nodiscard]] AuditPage page(const types::AuditLogFilter& filter, unsigned int pageSize = 0,
                                 const std::optional<std::string>& pageToken = std::nullopt,
                                 const types::RequestContext& ctx = {}) const;

private:
    friend class AuditCursor;

    std::shared_ptr<database::Store> store_;
    std::shared_ptr<util::Clock> clock_;
    WalletOptions options_;

    std::vector<std::shared_ptr<types::AuditLogEntry>> fetch(const types::AuditLogFilter& filter,
                                                             const std::optional<types::AuditLogPosition>& after,
                                                             unsigned int limit,
                                                             const types::RequestContext& ctx) const;

    [[nodiscard]] unsigned int resolvePageSize(unsigned int pageSize) const;

    static std::optional<types::AuditLogPosition> decodeToken(const std::optional<std::string>& token);
};

}
