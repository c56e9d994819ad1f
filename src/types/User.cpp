#include "types/User.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/row>

namespace cw::types {

User::User(std::string email, std::optional<std::string> username, std::optional<std::string> passwordHash,
           const bool isAdmin)
    : email(std::move(email)),
      username(std::move(username)),
      password_hash(std::move(passwordHash)),
      is_admin(isAdmin) {}

User::User(const pqxx::row& row)
    : id(row["id"].as<unsigned int>()),
      email(row["email"].as<std::string>()),
      username(row["username"].as<std::optional<std::string>>()),
      password_hash(row["password_hash"].as<std::optional<std::string>>()),
      is_active(row["is_active"].as<bool>()),
      is_admin(row["is_admin"].as<bool>()),
      created_at(util::parsePostgresTimestamp(row["created_at"].as<std::string>())),
      updated_at(util::parsePostgresTimestamp(row["updated_at"].as<std::string>())) {}

bool User::operator==(const User& other) const {
    return id == other.id && email == other.email && username == other.username;
}

bool User::operator!=(const User& other) const { return !(*this == other); }

void to_json(nlohmann::json& j, const User& u) {
    j = {
        {"id", u.id},
        {"email", u.email},
        {"is_active", u.is_active},
        {"is_admin", u.is_admin},
        {"created_at", util::timestampToString(u.created_at)},
        {"updated_at", util::timestampToString(u.updated_at)}
    };
    if (u.username) j["username"] = *u.username;
    else j["username"] = nullptr;
}

void to_json(nlohmann::json& j, const std::shared_ptr<User>& u) {
    if (!u) j = nullptr;
    else to_json(j, *u);
}

}
