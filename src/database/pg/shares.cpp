#include "database/PgStore.hpp"
#include "database/encoding/timestamp.hpp"

using namespace cw::database;
using namespace cw::database::encoding;
using namespace cw::types;

std::shared_ptr<Share> PgTransaction::getShare(const unsigned int credentialId, const unsigned int granteeId) {
    return guard("get_share", [&]() -> std::shared_ptr<Share> {
        const auto res = txn_.exec(pqxx::prepped{"get_share"}, pqxx::params{credentialId, granteeId});
        if (res.empty()) return nullptr;
        return std::make_shared<Share>(res.one_row());
    });
}

std::shared_ptr<Share> PgTransaction::upsertShare(const Share& share) {
    return guard("upsert_share", [&] {
        const pqxx::params p{
            share.credential_id,
            share.shared_with_user_id,
            to_string(share.permission),
            to_pg_timestamp(share.expires_at),
            to_pg_timestamp(share.created_at)
        };
        return std::make_shared<Share>(txn_.exec(pqxx::prepped{"upsert_share"}, p).one_row());
    });
}

bool PgTransaction::deleteShare(const unsigned int credentialId, const unsigned int granteeId) {
    return guard("delete_share", [&] {
        return txn_.exec(pqxx::prepped{"delete_share"}, pqxx::params{credentialId, granteeId}).affected_rows() > 0;
    });
}

std::vector<std::shared_ptr<Share>> PgTransaction::listSharesForCredential(const unsigned int credentialId) {
    return guard("list_shares_for_credential", [&] {
        return shares_from_pq_res(txn_.exec(pqxx::prepped{"list_shares_for_credential"}, pqxx::params{credentialId}));
    });
}

std::vector<std::shared_ptr<Share>> PgTransaction::listSharesForGrantee(const unsigned int granteeId) {
    return guard("list_shares_for_grantee", [&] {
        return shares_from_pq_res(txn_.exec(pqxx::prepped{"list_shares_for_grantee"}, pqxx::params{granteeId}));
    });
}

unsigned int PgTransaction::deleteSharesExpiredBefore(const std::time_t cutoff) {
    return guard("delete_expired_shares", [&] {
        const auto res = txn_.exec(pqxx::prepped{"delete_expired_shares"}, pqxx::params{to_pg_timestamp(cutoff)});
        return static_cast<unsigned int>(res.affected_rows());
    });
}
