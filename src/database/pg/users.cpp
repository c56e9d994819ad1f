#include "database/PgStore.hpp"
#include "database/encoding/timestamp.hpp"

using namespace cw::database;
using namespace cw::database::encoding;
using namespace cw::types;

std::shared_ptr<User> PgTransaction::getUser(const unsigned int id) {
    return guard("get_user", [&]() -> std::shared_ptr<User> {
        const auto res = txn_.exec(pqxx::prepped{"get_user"}, pqxx::params{id});
        if (res.empty()) return nullptr;
        return std::make_shared<User>(res.one_row());
    });
}

std::shared_ptr<User> PgTransaction::getUserByEmail(const std::string& email) {
    return guard("get_user_by_email", [&]() -> std::shared_ptr<User> {
        const auto res = txn_.exec(pqxx::prepped{"get_user_by_email"}, pqxx::params{email});
        if (res.empty()) return nullptr;
        return std::make_shared<User>(res.one_row());
    });
}

unsigned int PgTransaction::insertUser(const User& user) {
    return guard("insert_user", [&] {
        const pqxx::params p{
            user.email,
            user.username,
            user.password_hash,
            user.is_active,
            user.is_admin,
            to_pg_timestamp(user.created_at),
            to_pg_timestamp(user.updated_at)
        };
        return txn_.exec(pqxx::prepped{"insert_user"}, p).one_field().as<unsigned int>();
    });
}

void PgTransaction::updateUserFlags(const unsigned int id, const bool isActive, const bool isAdmin,
                                    const std::time_t updatedAt) {
    guard("update_user_flags", [&] {
        txn_.exec(pqxx::prepped{"update_user_flags"}, pqxx::params{id, isActive, isAdmin, to_pg_timestamp(updatedAt)});
    });
}

bool PgTransaction::deleteUser(const unsigned int id) {
    return guard("delete_user", [&] {
        return txn_.exec(pqxx::prepped{"delete_user"}, pqxx::params{id}).affected_rows() > 0;
    });
}
