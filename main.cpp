#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "paths/PathResolver.hpp"
#include "protocols/shell/Parser.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/commands/all.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "runtime/Deps.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

using namespace ms::config;
using namespace ms::logging;
using namespace ms::shell;

namespace {
std::atomic<bool>* interruptTarget = nullptr;

void signalHandler(const int signum) {
    if (interruptTarget) interruptTarget->store(true);
    // a second signal terminates immediately
    std::signal(signum, SIG_DFL);
}

bool isGlobalOption(const std::string& key) {
    return key == "root" || key == "settings" || key == "verbose" || key == "v" || key == "quiet" || key == "q"
           || key == "help" || key == "h";
}

void emit(const CommandResult& res) {
    if (!res.stdout_text.empty())
        fmt::print("{}{}", res.stdout_text, res.stdout_text.ends_with('\n') ? "" : "\n");
    if (!res.stderr_text.empty())
        fmt::print(stderr, "{}{}", res.stderr_text, res.stderr_text.ends_with('\n') ? "" : "\n");
}
}

int main(int argc, char** argv) {
    auto call = parseArgs(std::vector<std::string>(argv + 1, argv + argc));

    const auto rootOpt = optVal(call, "root");
    const auto settingsOpt = optVal(call, "settings");
    const bool verbose = hasFlag(call, std::vector<std::string>{"verbose", "v"});
    const bool quiet = hasFlag(call, std::vector<std::string>{"quiet", "q"});
    if (call.name.empty() && hasFlag(call, std::vector<std::string>{"help", "h"})) call.name = "help";
    std::erase_if(call.options, [](const FlagKV& kv) { return isGlobalOption(kv.key); });

    if (verbose && quiet) {
        emit(invalid("monosync: --verbose and --quiet are mutually exclusive"));
        return 2;
    }
    if ((rootOpt && rootOpt->empty()) || (settingsOpt && settingsOpt->empty())) {
        emit(invalid("monosync: --root and --settings require a value"));
        return 2;
    }

    fs::path root;
    try {
        if (rootOpt) root = *rootOpt;
        else if (call.name == "init") root = fs::current_path();
        else root = ms::paths::findMonorepoRoot(fs::current_path()).value_or(fs::current_path());
        root = ms::paths::normalizeRoot(root);

        std::optional<fs::path> settingsPath;
        if (settingsOpt) settingsPath = fs::path(*settingsOpt);
        ConfigRegistry::init(ConfigRegistry::locate(settingsPath, root));

        std::optional<spdlog::level::level_enum> consoleLevel;
        if (verbose) consoleLevel = spdlog::level::debug;
        if (quiet) consoleLevel = spdlog::level::err;
        LogRegistry::init(consoleLevel);

        const auto& source = ConfigRegistry::sourcePath();
        LogRegistry::config()->debug("[main] Settings from {}: {}", source ? source->string() : "built-in defaults",
                                     nlohmann::json(ConfigRegistry::get()).dump());
    } catch (const std::exception& e) {
        fmt::print(stderr, "monosync: failed to initialize: {}\n", e.what());
        return 1;
    }

    try {
        const auto interruptFlag = std::make_shared<std::atomic<bool>>(false);
        interruptTarget = interruptFlag.get();
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        const auto router = std::make_shared<Router>();
        ms::shell::commands::registerAllCommands(router);

        if (call.name.empty()) call.name = "help";
        call.deps = ms::runtime::Deps::make(root, ConfigRegistry::get(), interruptFlag);

        const auto res = router->execute(call);
        emit(res);

        LogRegistry::monosync()->debug("[main] '{}' finished with exit code {}", call.name, res.exit_code);
        interruptTarget = nullptr;
        LogRegistry::shutdown();
        return res.exit_code;
    } catch (const std::exception& e) {
        LogRegistry::monosync()->error("[main] {}", e.what());
        fmt::print(stderr, "monosync: {}\n", e.what());
        interruptTarget = nullptr;
        return 1;
    }
}
