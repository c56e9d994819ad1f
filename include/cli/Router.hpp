#pragma once

#include "cli/types.hpp"

#include <map>
#include <string>

namespace cw::cli {

class Router {
public:
    void registerCommand(const std::string& name, const std::string& synopsis, const std::string& description,
                         CommandHandler handler);

    // Domain errors become exit code 1 with the message on stderr
    CommandResult execute(const CommandCall& call) const;

    [[nodiscard]] std::string usage(const std::string& program) const;

private:
    std::map<std::string, CommandInfo> commands_;
};

}
