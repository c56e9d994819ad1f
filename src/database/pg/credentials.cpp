#include "database/PgStore.hpp"
#include "database/encoding/bytea.hpp"
#include "database/encoding/timestamp.hpp"

using namespace cw::database;
using namespace cw::database::encoding;
using namespace cw::types;

std::shared_ptr<Credential> PgTransaction::getCredential(const unsigned int id) {
    return guard("get_credential", [&]() -> std::shared_ptr<Credential> {
        const auto res = txn_.exec(pqxx::prepped{"get_credential"}, pqxx::params{id});
        if (res.empty()) return nullptr;
        return std::make_shared<Credential>(res.one_row());
    });
}

unsigned int PgTransaction::insertCredential(const Credential& credential) {
    return guard("insert_credential", [&] {
        const pqxx::params p{
            credential.user_id,
            credential.title,
            credential.description,
            to_hex_bytea(credential.data_encrypted),
            to_hex_bytea(credential.iv),
            to_pg_timestamp(credential.created_at),
            to_pg_timestamp(credential.updated_at)
        };
        return txn_.exec(pqxx::prepped{"insert_credential"}, p).one_field().as<unsigned int>();
    });
}

void PgTransaction::updateCredentialPayload(const unsigned int id, const Bytes& ciphertext,
                                            const std::optional<Bytes>& iv, const std::time_t updatedAt) {
    guard("update_credential_payload", [&] {
        const pqxx::params p{id, to_hex_bytea(ciphertext), to_hex_bytea(iv), to_pg_timestamp(updatedAt)};
        txn_.exec(pqxx::prepped{"update_credential_payload"}, p);
    });
}

void PgTransaction::updateCredentialDetails(const unsigned int id, const std::string& title,
                                            const std::optional<std::string>& description,
                                            const std::time_t updatedAt) {
    guard("update_credential_details", [&] {
        const pqxx::params p{id, title, description, to_pg_timestamp(updatedAt)};
        txn_.exec(pqxx::prepped{"update_credential_details"}, p);
    });
}

bool PgTransaction::deleteCredential(const unsigned int id) {
    return guard("delete_credential", [&] {
        return txn_.exec(pqxx::prepped{"delete_credential"}, pqxx::params{id}).affected_rows() > 0;
    });
}

std::vector<std::shared_ptr<Credential>> PgTransaction::listAccessibleCredentials(const unsigned int userId,
                                                                                  const std::time_t now) {
    return guard("list_accessible_credentials", [&] {
        const pqxx::params p{userId, to_pg_timestamp(now)};
        return credentials_from_pq_res(txn_.exec(pqxx::prepped{"list_accessible_credentials"}, p));
    });
}
