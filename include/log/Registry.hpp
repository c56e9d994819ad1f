#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace cw::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels from ConfigRegistry's logging section.
    static void init();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> wallet()      { return get("wallet"); }
    static std::shared_ptr<spdlog::logger> identity()    { return get("identity"); }
    static std::shared_ptr<spdlog::logger> credentials() { return get("credentials"); }
    static std::shared_ptr<spdlog::logger> shares()      { return get("shares"); }
    static std::shared_ptr<spdlog::logger> ekyc()        { return get("ekyc"); }
    static std::shared_ptr<spdlog::logger> db()          { return get("db"); }
    static std::shared_ptr<spdlog::logger> sweeper()     { return get("sweeper"); }
    static std::shared_ptr<spdlog::logger> audit()       { return get("audit"); }

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr const auto* AUDIT_FORMAT = "[%Y-%m-%d %H:%M:%S] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;
    static inline std::filesystem::path audit_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt>    audit_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
