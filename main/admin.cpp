#include "cli/AdminCommands.hpp"
#include "cli/Parser.hpp"
#include "cli/args.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "wallet/Wallet.hpp"

#include <filesystem>
#include <fmt/core.h>
#include <yaml-cpp/exceptions.h>

using namespace cw;

int main(int argc, char** argv) {
    const cli::CommandCall call = cli::parseArgs(std::vector<std::string>(argv + 1, argv + argc));

    const auto explicitPath = cli::optVal(call, "config");
    const std::filesystem::path configPath = explicitPath ? std::filesystem::path(*explicitPath)
                                                          : config::defaultConfigPath();

    auto ctx = std::make_shared<cli::AdminContext>();
    try {
        if (std::filesystem::exists(configPath)) ctx->config = config::loadConfig(configPath.string());
        else if (explicitPath) {
            fmt::print(stderr, "Config file not found: {}\n", configPath.string());
            return 1;
        } else {
            fmt::print(stderr, "[!] {} not found, using built-in defaults\n", configPath.string());
        }

        config::ConfigRegistry::init(ctx->config);
        log::Registry::init();
    } catch (const YAML::Exception& e) {
        fmt::print(stderr, "Failed to parse {}: {}\n", configPath.string(), e.what());
        return 1;
    } catch (const std::exception& e) {
        fmt::print(stderr, "Failed to initialize credwallet-admin: {}\n", e.what());
        return 1;
    }

    ctx->openWallet = [cfg = ctx->config]() -> std::shared_ptr<wallet::Wallet> { return wallet::Wallet::fromConfig(cfg); };

    cli::Router router;
    cli::registerAdminCommands(router, ctx);

    const auto result = router.execute(call);
    if (!result.stdout_text.empty()) fmt::print("{}", result.stdout_text);
    if (!result.stderr_text.empty()) fmt::print(stderr, "{}", result.stderr_text);
    return result.exit_code;
}
