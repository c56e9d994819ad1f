#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace cw::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["password_env"] = rhs.password_env;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("credwallet");
        rhs.user = node["user"].as<std::string>("credwallet");
        rhs.password_env = node["password_env"].as<std::string>("CREDWALLET_DB_PASSWORD");
        rhs.pool_size = node["pool_size"].as<unsigned int>(8);
        return true;
    }
};

template<>
struct convert<SharingConfig> {
    static Node encode(const SharingConfig& rhs) {
        Node node;
        node["purge_expired_after_days"] = rhs.purge_expired_after_days;
        return node;
    }

    static bool decode(const Node& node, SharingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.purge_expired_after_days = node["purge_expired_after_days"].as<unsigned int>(0);
        return true;
    }
};

template<>
struct convert<AuditingConfig> {
    static Node encode(const AuditingConfig& rhs) {
        Node node;
        node["audit_credential_reads"] = rhs.audit_credential_reads;
        node["audit_log_reads"] = rhs.audit_log_reads;
        node["default_page_size"] = rhs.default_page_size;
        return node;
    }

    static bool decode(const Node& node, AuditingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.audit_credential_reads = node["audit_credential_reads"].as<bool>(false);
        rhs.audit_log_reads = node["audit_log_reads"].as<bool>(false);
        rhs.default_page_size = node["default_page_size"].as<unsigned int>(100);
        return true;
    }
};

template<>
struct convert<ServicesConfig> {
    static Node encode(const ServicesConfig& rhs) {
        Node sweeper;
        sweeper["enabled"] = rhs.share_sweeper.enabled;
        sweeper["sweep_interval_minutes"] = rhs.share_sweeper.sweep_interval_minutes.count();

        Node node;
        node["share_sweeper"] = sweeper;
        return node;
    }

    static bool decode(const Node& node, ServicesConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto sweeper = node["share_sweeper"]) {
            rhs.share_sweeper.enabled = sweeper["enabled"].as<bool>(false);
            rhs.share_sweeper.sweep_interval_minutes =
                std::chrono::minutes(sweeper["sweep_interval_minutes"].as<unsigned int>(60));
        }
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["wallet"]      = to_std_string(spdlog::level::to_string_view(rhs.wallet));
        node["identity"]    = to_std_string(spdlog::level::to_string_view(rhs.identity));
        node["credentials"] = to_std_string(spdlog::level::to_string_view(rhs.credentials));
        node["shares"]      = to_std_string(spdlog::level::to_string_view(rhs.shares));
        node["ekyc"]        = to_std_string(spdlog::level::to_string_view(rhs.ekyc));
        node["db"]          = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["sweeper"]     = to_std_string(spdlog::level::to_string_view(rhs.sweeper));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.wallet = spdlog::level::from_str(node["wallet"].as<std::string>("info"));
        rhs.identity = spdlog::level::from_str(node["identity"].as<std::string>("info"));
        rhs.credentials = spdlog::level::from_str(node["credentials"].as<std::string>("info"));
        rhs.shares = spdlog::level::from_str(node["shares"].as<std::string>("info"));
        rhs.ekyc = spdlog::level::from_str(node["ekyc"].as<std::string>("info"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("error"));
        rhs.sweeper = spdlog::level::from_str(node["sweeper"].as<std::string>("warning"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warning"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/credwallet");
        if (const auto levels = node["levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
