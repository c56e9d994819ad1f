#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace cw::config {

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "credwallet";
    std::string user = "credwallet";
    std::string password_env = "CREDWALLET_DB_PASSWORD"; // env var holding the password, never the password itself
    unsigned int pool_size = 8;

    // libpq keyword/value connection string; the password is read from password_env
    [[nodiscard]] std::string connectionString() const;
};

struct SharingConfig {
    // Expired shares stay for history until purged; 0 keeps them forever
    unsigned int purge_expired_after_days = 0;
};

struct AuditingConfig {
    bool audit_credential_reads = false;
    bool audit_log_reads = false;
    unsigned int default_page_size = 100;
};

struct ShareSweeperConfig {
    bool enabled = false;
    std::chrono::minutes sweep_interval_minutes = std::chrono::minutes(60);
};

struct ServicesConfig {
    ShareSweeperConfig share_sweeper;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum wallet       = spdlog::level::info;   // Startup, shutdown, wiring
    spdlog::level::level_enum identity     = spdlog::level::info;   // Account creation, deactivation, removal
    spdlog::level::level_enum credentials  = spdlog::level::info;   // Create/update/delete, denied access
    spdlog::level::level_enum shares       = spdlog::level::info;   // Grants, revocations, purges
    spdlog::level::level_enum ekyc         = spdlog::level::info;   // Session starts and provider results
    spdlog::level::level_enum db           = spdlog::level::err;    // Only if DB is unreachable, failed tx, corruption
    spdlog::level::level_enum sweeper      = spdlog::level::warn;   // Failed sweeps
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/credwallet";
    LogLevelsConfig levels;
};

struct Config {
    DatabaseConfig database;
    SharingConfig sharing;
    AuditingConfig auditing;
    ServicesConfig services;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void to_json(nlohmann::json& j, const SharingConfig& c);
void to_json(nlohmann::json& j, const AuditingConfig& c);
void to_json(nlohmann::json& j, const ShareSweeperConfig& c);
void to_json(nlohmann::json& j, const ServicesConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace cw::config
