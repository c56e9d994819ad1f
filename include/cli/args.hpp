#pragma once

#include "cli/types.hpp"

#include <ctime>
#include <optional>
#include <string>

namespace cw::cli {

CommandResult ok(std::string out);
CommandResult invalid(std::string msg);
CommandResult failed(std::string msg);

// Value of --key; an empty string for a bare flag
std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

std::optional<unsigned int> parseUInt(const std::string& sv);

// ISO-8601 UTC ("2024-05-01T12:00:00Z") or seconds since the epoch
std::optional<std::time_t> parseTime(const std::string& sv);

}
