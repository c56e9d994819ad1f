#pragma once

#include <ctime>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
}

namespace cw::types {

struct User {
    unsigned int id{0};
    std::string email{};
    std::optional<std::string> username{std::nullopt}, password_hash{std::nullopt};
    bool is_active{true}, is_admin{false};
    std::time_t created_at{}, updated_at{};

    User() = default;
    explicit User(std::string email,
                  std::optional<std::string> username = std::nullopt,
                  std::optional<std::string> passwordHash = std::nullopt,
                  bool isAdmin = false);
    explicit User(const pqxx::row& row);

    bool operator==(const User& other) const;
    bool operator!=(const User& other) const;
};

// password_hash is never serialized
void to_json(nlohmann::json& j, const User& u);
void to_json(nlohmann::json& j, const std::shared_ptr<User>& u);

}
