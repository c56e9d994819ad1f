#include "cli/args.hpp"
#include "util/timestamp.hpp"

#include <limits>
#include <stdexcept>

using namespace cw::cli;

CommandResult cw::cli::ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult cw::cli::invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult cw::cli::failed(std::string msg) { return {1, "", std::move(msg)}; }

std::optional<std::string> cw::cli::optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<unsigned int> cw::cli::parseUInt(const std::string& sv) {
    if (sv.empty()) return std::nullopt;

    unsigned long long v = 0;
    for (const char c : sv) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) return std::nullopt;
    }

    return static_cast<unsigned int>(v);
}

std::optional<std::time_t> cw::cli::parseTime(const std::string& sv) {
    if (const auto epoch = parseUInt(sv)) return static_cast<std::time_t>(*epoch);
    try {
        return util::parseTimestampFromString(sv);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}
