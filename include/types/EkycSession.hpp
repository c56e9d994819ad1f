#pragma once

#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pqxx {
class row;
class result;
}

namespace cw::types {

enum class EkycStatus { Pending, InReview, Approved, Rejected, Expired };

std::string to_string(EkycStatus status);
EkycStatus ekyc_status_from_string(const std::string& str);

// Approved, rejected and expired end a session. Informational only: transitions
// between statuses are recorded as reported, not validated.
bool is_terminal(EkycStatus status);

struct EkycSession {
    unsigned int id{0}, user_id{0};
    EkycStatus status{EkycStatus::Pending};
    std::optional<std::string> provider{std::nullopt}, reference_id{std::nullopt};
    std::optional<nlohmann::json> result{std::nullopt};
    std::time_t created_at{}, updated_at{};

    EkycSession() = default;
    EkycSession(unsigned int userId, std::optional<std::string> provider);
    explicit EkycSession(const pqxx::row& row);
};

void to_json(nlohmann::json& j, const EkycSession& s);
void to_json(nlohmann::json& j, const std::shared_ptr<EkycSession>& s);

std::vector<std::shared_ptr<EkycSession>> ekyc_sessions_from_pq_res(const pqxx::result& res);

}
