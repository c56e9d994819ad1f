#include "types/EkycSession.hpp"
#include "util/timestamp.hpp"

#include <stdexcept>
#include <unordered_map>
#include <pqxx/result>
#include <pqxx/row>

namespace cw::types {

std::string to_string(const EkycStatus status) {
    switch (status) {
        case EkycStatus::Pending: return "pending";
        case EkycStatus::InReview: return "in_review";
        case EkycStatus::Approved: return "approved";
        case EkycStatus::Rejected: return "rejected";
        case EkycStatus::Expired: return "expired";
        default: throw std::invalid_argument("Unknown EkycStatus enum value");
    }
}

EkycStatus ekyc_status_from_string(const std::string& str) {
    static const std::unordered_map<std::string, EkycStatus> mapping = {
        {"pending", EkycStatus::Pending},
        {"in_review", EkycStatus::InReview},
        {"approved", EkycStatus::Approved},
        {"rejected", EkycStatus::Rejected},
        {"expired", EkycStatus::Expired}
    };
    if (const auto it = mapping.find(str); it != mapping.end()) return it->second;
    throw std::invalid_argument("Invalid eKYC status: " + str);
}

bool is_terminal(const EkycStatus status) {
    return status == EkycStatus::Approved || status == EkycStatus::Rejected || status == EkycStatus::Expired;
}

EkycSession::EkycSession(const unsigned int userId, std::optional<std::string> provider)
    : user_id(userId), provider(std::move(provider)) {}

EkycSession::EkycSession(const pqxx::row& row)
    : id(row["id"].as<unsigned int>()),
      user_id(row["user_id"].as<unsigned int>()),
      status(ekyc_status_from_string(row["status"].as<std::string>())),
      provider(row["provider"].as<std::optional<std::string>>()),
      reference_id(row["reference_id"].as<std::optional<std::string>>()),
      created_at(util::parsePostgresTimestamp(row["created_at"].as<std::string>())),
      updated_at(util::parsePostgresTimestamp(row["updated_at"].as<std::string>())) {
    if (!row["result_json"].is_null()) result = nlohmann::json::parse(row["result_json"].as<std::string>());
}

void to_json(nlohmann::json& j, const EkycSession& s) {
    j = {
        {"id", s.id},
        {"user_id", s.user_id},
        {"status", to_string(s.status)},
        {"provider", s.provider ? nlohmann::json(*s.provider) : nlohmann::json(nullptr)},
        {"reference_id", s.reference_id ? nlohmann::json(*s.reference_id) : nlohmann::json(nullptr)},
        {"result", s.result ? *s.result : nlohmann::json(nullptr)},
        {"created_at", util::timestampToString(s.created_at)},
        {"updated_at", util::timestampToString(s.updated_at)}
    };
}

void to_json(nlohmann::json& j, const std::shared_ptr<EkycSession>& s) {
    if (!s) j = nullptr;
    else to_json(j, *s);
}

std::vector<std::shared_ptr<EkycSession>> ekyc_sessions_from_pq_res(const pqxx::result& res) {
    std::vector<std::shared_ptr<EkycSession>> sessions;
    sessions.reserve(res.size());
    for (const auto& row : res) sessions.push_back(std::make_shared<EkycSession>(row));
    return sessions;
}

}
