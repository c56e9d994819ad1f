#include "types/Credential.hpp"
#include "database/encoding/bytea.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/result>
#include <pqxx/row>

using namespace cw::database::encoding;

namespace cw::types {

Credential::Credential(const unsigned int ownerId, std::string title, std::optional<std::string> description,
                       Bytes ciphertext, std::optional<Bytes> iv)
    : user_id(ownerId),
      title(std::move(title)),
      description(std::move(description)),
      data_encrypted(std::move(ciphertext)),
      iv(std::move(iv)) {}

Credential::Credential(const pqxx::row& row)
    : id(row["id"].as<unsigned int>()),
      user_id(row["user_id"].as<unsigned int>()),
      title(row["title"].as<std::string>()),
      description(row["description"].as<std::optional<std::string>>()),
      data_encrypted(from_hex_bytea(row["data_encrypted"].as<std::string>())),
      created_at(util::parsePostgresTimestamp(row["created_at"].as<std::string>())),
      updated_at(util::parsePostgresTimestamp(row["updated_at"].as<std::string>())) {
    if (!row["iv"].is_null()) iv = from_hex_bytea(row["iv"].as<std::string>());
}

void to_json(nlohmann::json& j, const Credential& c) {
    // hex without the "\x" prefix; the payload itself stays opaque
    const auto hex = [](const Bytes& b) { return to_hex_bytea(b).substr(2); };

    j = {
        {"id", c.id},
        {"user_id", c.user_id},
        {"title", c.title},
        {"data_encrypted", hex(c.data_encrypted)},
        {"created_at", util::timestampToString(c.created_at)},
        {"updated_at", util::timestampToString(c.updated_at)}
    };
    if (c.description) j["description"] = *c.description;
    else j["description"] = nullptr;
    if (c.iv) j["iv"] = hex(*c.iv);
    else j["iv"] = nullptr;
}

void to_json(nlohmann::json& j, const std::shared_ptr<Credential>& c) {
    if (!c) j = nullptr;
    else to_json(j, *c);
}

void to_json(nlohmann::json& j, const std::vector<std::shared_ptr<Credential>>& c) {
    j = nlohmann::json::array();
    for (const auto& cred : c) j.push_back(cred);
}

std::vector<std::shared_ptr<Credential>> credentials_from_pq_res(const pqxx::result& res) {
    std::vector<std::shared_ptr<Credential>> creds;
    creds.reserve(res.size());
    for (const auto& row : res) creds.push_back(std::make_shared<Credential>(row));
    return creds;
}

}
