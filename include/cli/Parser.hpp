#pragma once

#include "cli/types.hpp"

#include <string>
#include <vector>

namespace cw::cli {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

inline bool is_flag(const std::string& s) { return s.size() > 2 && s.rfind("--", 0) == 0; }

// First bare word is the command name. "--key value" binds the value, a "--key"
// followed by another flag (or nothing) is a bare flag, and "--" ends flag parsing.
inline CommandCall parseArgs(const std::vector<std::string>& args) {
    CommandCall call;
    bool stop_flags = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];

        if (!stop_flags && a == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && is_flag(a)) {
            const auto key = a.substr(2);
            if (i + 1 < args.size() && !is_flag(args[i + 1]) && args[i + 1] != "--") {
                setOpt(call, key, args[i + 1]);
                ++i;
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        if (call.name.empty()) call.name = a;
        else call.positionals.push_back(a);
    }

    return call;
}

}
