#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cw::cli {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;        // 0 = success, 1 = failure, 2 = usage error
    std::string stdout_text;
    std::string stderr_text;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string description;
    std::string synopsis;
    CommandHandler handler;
};

}
