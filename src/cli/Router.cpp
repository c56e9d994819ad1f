#include "cli/Router.hpp"
#include "cli/args.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

using namespace cw::cli;

void Router::registerCommand(const std::string& name, const std::string& synopsis, const std::string& description,
                             CommandHandler handler) {
    commands_[name] = CommandInfo{description, synopsis, std::move(handler)};
}

CommandResult Router::execute(const CommandCall& call) const {
    if (call.name.empty() || call.name == "help") return ok(usage("credwallet-admin"));

    const auto it = commands_.find(call.name);
    if (it == commands_.end()) return invalid(fmt::format("Unknown command '{}'\n\n{}", call.name, usage("credwallet-admin")));

    try {
        return it->second.handler(call);
    } catch (const error::Error& e) {
        log::Registry::wallet()->error("[cli::Router] '{}' failed ({}): {}", call.name, error::to_string(e.kind()),
                                       e.what());
        return failed(fmt::format("{}: {}\n", error::to_string(e.kind()), e.what()));
    } catch (const std::exception& e) {
        log::Registry::wallet()->error("[cli::Router] '{}' failed: {}", call.name, e.what());
        return failed(fmt::format("error: {}\n", e.what()));
    }
}

std::string Router::usage(const std::string& program) const {
    std::string out = fmt::format("usage: {} [--config PATH] <command> [options]\n\ncommands:\n", program);
    for (const auto& [name, info] : commands_)
        out += fmt::format("  {:<52} {}\n", info.synopsis, info.description);
    return out;
}
