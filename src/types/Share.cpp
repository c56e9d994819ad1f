#include "types/Share.hpp"
#include "util/timestamp.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>
#include <pqxx/result>
#include <pqxx/row>

namespace cw::types {

std::string to_string(const SharePermission permission) {
    switch (permission) {
        case SharePermission::Read: return "read";
        case SharePermission::Write: return "write";
        default: throw std::invalid_argument("Unknown SharePermission enum value");
    }
}

SharePermission share_permission_from_string(const std::string& str) {
    if (str == "read") return SharePermission::Read;
    if (str == "write") return SharePermission::Write;
    throw std::invalid_argument("Invalid share permission: " + str);
}

Share::Share(const unsigned int credentialId, const unsigned int granteeId, const SharePermission permission,
             const std::optional<std::time_t> expiresAt)
    : credential_id(credentialId), shared_with_user_id(granteeId), permission(permission), expires_at(expiresAt) {}

Share::Share(const pqxx::row& row)
    : id(row["id"].as<unsigned int>()),
      credential_id(row["credential_id"].as<unsigned int>()),
      shared_with_user_id(row["shared_with_user_id"].as<unsigned int>()),
      permission(share_permission_from_string(row["permission"].as<std::string>())),
      created_at(util::parsePostgresTimestamp(row["created_at"].as<std::string>())) {
    if (!row["expires_at"].is_null())
        expires_at = util::parsePostgresTimestamp(row["expires_at"].as<std::string>());
}

bool Share::isEffectiveAt(const std::time_t now) const {
    return !expires_at || *expires_at > now;
}

bool Share::allows(const SharePermission required) const {
    return required == SharePermission::Read || permission == SharePermission::Write;
}

void to_json(nlohmann::json& j, const Share& s) {
    j = {
        {"id", s.id},
        {"credential_id", s.credential_id},
        {"shared_with_user_id", s.shared_with_user_id},
        {"permission", to_string(s.permission)},
        {"created_at", util::timestampToString(s.created_at)}
    };
    if (s.expires_at) j["expires_at"] = util::timestampToString(*s.expires_at);
    else j["expires_at"] = nullptr;
}

void to_json(nlohmann::json& j, const ShareView& v) {
    to_json(j, *v.share);
    j["effective"] = v.effective;
}

void to_json(nlohmann::json& j, const std::vector<ShareView>& v) {
    j = nlohmann::json::array();
    for (const auto& view : v) j.push_back(view);
}

std::vector<std::shared_ptr<Share>> shares_from_pq_res(const pqxx::result& res) {
    std::vector<std::shared_ptr<Share>> shares;
    shares.reserve(res.size());
    for (const auto& row : res) shares.push_back(std::make_shared<Share>(row));
    return shares;
}

}
