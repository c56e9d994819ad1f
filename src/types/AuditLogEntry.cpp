#include "types/AuditLogEntry.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/result>
#include <pqxx/row>

namespace cw::types {

namespace {
template <typename T>
nlohmann::json optional_json(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}
}

AuditLogEntry::AuditLogEntry(const pqxx::row& row)
    : id(row["id"].as<unsigned int>()),
      user_id(row["user_id"].as<std::optional<unsigned int>>()),
      action(row["action"].as<std::string>()),
      resource_type(row["resource_type"].as<std::optional<std::string>>()),
      resource_id(row["resource_id"].as<std::optional<unsigned int>>()),
      ip_address(row["ip_address"].as<std::optional<std::string>>()),
      user_agent(row["user_agent"].as<std::optional<std::string>>()),
      created_at(util::parsePostgresTimestamp(row["created_at"].as<std::string>())) {}

void to_json(nlohmann::json& j, const AuditLogEntry& e) {
    j = {
        {"id", e.id},
        {"user_id", optional_json(e.user_id)},
        {"action", e.action},
        {"resource_type", optional_json(e.resource_type)},
        {"resource_id", optional_json(e.resource_id)},
        {"ip_address", optional_json(e.ip_address)},
        {"user_agent", optional_json(e.user_agent)},
        {"created_at", util::timestampToString(e.created_at)}
    };
}

void to_json(nlohmann::json& j, const std::shared_ptr<AuditLogEntry>& e) {
    if (!e) j = nullptr;
    else to_json(j, *e);
}

std::vector<std::shared_ptr<AuditLogEntry>> audit_log_entries_from_pq_res(const pqxx::result& res) {
    std::vector<std::shared_ptr<AuditLogEntry>> entries;
    entries.reserve(res.size());
    for (const auto& row : res) entries.push_back(std::make_shared<AuditLogEntry>(row));
    return entries;
}

// One-line form used for the audit file sink
std::string to_string(const AuditLogEntry& e) {
    std::string out = e.action;
    out += " actor=" + (e.user_id ? std::to_string(*e.user_id) : std::string("-"));
    if (e.resource_type) {
        out += " resource=" + *e.resource_type;
        if (e.resource_id) out += ":" + std::to_string(*e.resource_id);
    }
    if (e.ip_address) out += " ip=" + *e.ip_address;
    if (e.user_agent) out += " ua=\"" + *e.user_agent + "\"";
    out += " id=" + std::to_string(e.id);
    return out;
}

}
