#include "database/PgStore.hpp"
#include "database/encoding/timestamp.hpp"

using namespace cw::database;
using namespace cw::database::encoding;
using namespace cw::types;

unsigned int PgTransaction::insertAuditLog(const AuditLogEntry& entry) {
    return guard("insert_audit_log", [&] {
        const pqxx::params p{
            entry.user_id,
            entry.action,
            entry.resource_type,
            entry.resource_id,
            entry.ip_address,
            entry.user_agent,
            to_pg_timestamp(entry.created_at)
        };
        return txn_.exec(pqxx::prepped{"insert_audit_log"}, p).one_field().as<unsigned int>();
    });
}

std::vector<std::shared_ptr<AuditLogEntry>> PgTransaction::queryAuditLogs(
    const AuditLogFilter& filter, const std::optional<AuditLogPosition>& after, const unsigned int limit) {
    return guard("query_audit_logs", [&] {
        std::string sql = "SELECT * FROM audit_logs WHERE TRUE";

        if (filter.user_id) sql += " AND user_id = " + txn_.quote(*filter.user_id);
        if (filter.action_prefix)
            sql += " AND action LIKE " + txn_.quote(like_prefix_pattern(*filter.action_prefix)) + " ESCAPE '\\'";
        if (filter.since) sql += " AND created_at >= " + txn_.quote(to_pg_timestamp(*filter.since)) + "::timestamptz";
        if (filter.until) sql += " AND created_at <= " + txn_.quote(to_pg_timestamp(*filter.until)) + "::timestamptz";

        if (after)
            sql += " AND (created_at, id) < (" + txn_.quote(to_pg_timestamp(after->created_at)) + "::timestamptz, "
                   + txn_.quote(after->id) + ")";

        sql += " ORDER BY created_at DESC, id DESC LIMIT " + std::to_string(limit);

        return audit_log_entries_from_pq_res(txn_.exec(sql));
    });
}
