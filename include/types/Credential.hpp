#pragma once

#include "types/Bytes.hpp"

#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
class result;
}

namespace cw::types {

// An encrypted secret owned by exactly one user. The ciphertext and iv are carried
// byte-for-byte and never decrypted, inspected or re-encoded by the wallet.
struct Credential {
    unsigned int id{0}, user_id{0};
    std::string title{};
    std::optional<std::string> description{std::nullopt};
    Bytes data_encrypted{};
    std::optional<Bytes> iv{std::nullopt};
    std::time_t created_at{}, updated_at{};

    Credential() = default;
    Credential(unsigned int ownerId, std::string title, std::optional<std::string> description,
               Bytes ciphertext, std::optional<Bytes> iv);
    explicit Credential(const pqxx::row& row);

    [[nodiscard]] bool isOwnedBy(const unsigned int userId) const { return user_id == userId; }
};

void to_json(nlohmann::json& j, const Credential& c);
void to_json(nlohmann::json& j, const std::shared_ptr<Credential>& c);
void to_json(nlohmann::json& j, const std::vector<std::shared_ptr<Credential>>& c);

std::vector<std::shared_ptr<Credential>> credentials_from_pq_res(const pqxx::result& res);

}
