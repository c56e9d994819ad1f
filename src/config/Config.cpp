#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace cw::config {

namespace {

// libpq keyword/value quoting: wrap in single quotes, escape ' and backslash
std::string quoteConnValue(const std::string& v) {
    std::string out = "'";
    for (const char c : v) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

}

Config loadConfig(const std::string& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path);

    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["sharing"]) YAML::convert<SharingConfig>::decode(node, cfg.sharing);
    if (auto node = root["auditing"]) YAML::convert<AuditingConfig>::decode(node, cfg.auditing);
    if (auto node = root["services"]) YAML::convert<ServicesConfig>::decode(node, cfg.services);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::string DatabaseConfig::connectionString() const {
    std::string conn = "host=" + quoteConnValue(host) +
                       " port=" + std::to_string(port) +
                       " dbname=" + quoteConnValue(name) +
                       " user=" + quoteConnValue(user);

    if (!password_env.empty())
        if (const char* pw = std::getenv(password_env.c_str()); pw && *pw) conn += " password=" + quoteConnValue(pw);

    return conn;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"database", c.database},
        {"sharing", c.sharing},
        {"auditing", c.auditing},
        {"services", c.services},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user},
        {"password_env", c.password_env},
        {"pool_size", c.pool_size}
    };
}

void to_json(nlohmann::json& j, const SharingConfig& c) {
    j = {
        {"purge_expired_after_days", c.purge_expired_after_days}
    };
}

void to_json(nlohmann::json& j, const AuditingConfig& c) {
    j = {
        {"audit_credential_reads", c.audit_credential_reads},
        {"audit_log_reads", c.audit_log_reads},
        {"default_page_size", c.default_page_size}
    };
}

void to_json(nlohmann::json& j, const ShareSweeperConfig& c) {
    j = {
        {"enabled", c.enabled},
        {"sweep_interval_minutes", c.sweep_interval_minutes.count()}
    };
}

void to_json(nlohmann::json& j, const ServicesConfig& c) {
    j = {
        {"share_sweeper", c.share_sweeper}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"wallet", levelName(c.wallet)},
        {"identity", levelName(c.identity)},
        {"credentials", levelName(c.credentials)},
        {"shares", levelName(c.shares)},
        {"ekyc", levelName(c.ekyc)},
        {"db", levelName(c.db)},
        {"sweeper", levelName(c.sweeper)}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

} // namespace cw::config
