#pragma once

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

struct AuditLogEntry {
    unsigned int id{0};
    std::optional<unsigned int> user_id{std::nullopt};  // null: system action or deleted user
    std::string action{};
    std::optional<std::string> resource_type{std::nullopt};
    std::optional<unsigned int> resource_id{std::nullopt};  // not a foreign key
    std::optional<std::string> ip_address{std::nullopt}, user_agent{std::nullopt};
    std::time_t created_at{};

    AuditLogEntry() = default;
    explicit AuditLogEntry(const pqxx::row& row);
};

void to_json(nlohmann::json& j, const AuditLogEntry& e);
void to_json(nlohmann::json& j, const std::shared_ptr<AuditLogEntry>& e);

std::vector<std::shared_ptr<AuditLogEntry>> audit_log_entries_from_pq_res(const pqxx::result& res);

std::string to_string(const AuditLogEntry& e);

}
