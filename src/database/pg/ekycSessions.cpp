#include "database/PgStore.hpp"
#include "database/encoding/timestamp.hpp"

using namespace cw::database;
using namespace cw::database::encoding;
using namespace cw::types;

namespace {
std::optional<std::string> result_text(const EkycSession& s) {
    if (!s.result) return std::nullopt;
    return s.result->dump();
}
}

unsigned int PgTransaction::insertEkycSession(const EkycSession& session) {
    return guard("insert_ekyc_session", [&] {
        const pqxx::params p{
            session.user_id,
            to_string(session.status),
            session.provider,
            session.reference_id,
            result_text(session),
            to_pg_timestamp(session.created_at),
            to_pg_timestamp(session.updated_at)
        };
        return txn_.exec(pqxx::prepped{"insert_ekyc_session"}, p).one_field().as<unsigned int>();
    });
}

std::shared_ptr<EkycSession> PgTransaction::getEkycSession(const unsigned int id) {
    return guard("get_ekyc_session", [&]() -> std::shared_ptr<EkycSession> {
        const auto res = txn_.exec(pqxx::prepped{"get_ekyc_session"}, pqxx::params{id});
        if (res.empty()) return nullptr;
        return std::make_shared<EkycSession>(res.one_row());
    });
}

void PgTransaction::updateEkycSession(const EkycSession& session) {
    guard("update_ekyc_session", [&] {
        const pqxx::params p{
            session.id,
            to_string(session.status),
            session.provider,
            session.reference_id,
            result_text(session),
            to_pg_timestamp(session.updated_at)
        };
        txn_.exec(pqxx::prepped{"update_ekyc_session"}, p);
    });
}

std::shared_ptr<EkycSession> PgTransaction::getLatestEkycSession(const unsigned int userId) {
    return guard("get_latest_ekyc_session", [&]() -> std::shared_ptr<EkycSession> {
        const auto res = txn_.exec(pqxx::prepped{"get_latest_ekyc_session"}, pqxx::params{userId});
        if (res.empty()) return nullptr;
        return std::make_shared<EkycSession>(res.one_row());
    });
}

std::vector<std::shared_ptr<EkycSession>> PgTransaction::listEkycSessions(const unsigned int userId) {
    return guard("list_ekyc_sessions", [&] {
        return ekyc_sessions_from_pq_res(txn_.exec(pqxx::prepped{"list_ekyc_sessions"}, pqxx::params{userId}));
    });
}
