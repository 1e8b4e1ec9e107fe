#include "protocols/shell/Router.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <cctype>
#include <string>

using namespace ms::shell;
using namespace ms::logging;

void Router::registerCommand(CommandUsage usage, CommandHandler handler) {
    const std::string key = normalize(usage.name);

    for (const std::string& alias : usage.aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            LogRegistry::shell()->warn("[Router] Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                       a, aliasMap_.at(a), key);
            continue;
        }
        aliasMap_[a] = key;
    }

    commands_[key] = CommandInfo{std::move(usage), std::move(handler)};
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

bool Router::knows(const std::string& nameOrAlias) const {
    return commands_.contains(canonicalFor(nameOrAlias));
}

CommandResult Router::execute(const CommandCall& call) const {
    if (call.name.empty()) return invalid(helpText(), "No command provided.");

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return invalid(helpText(), fmt::format("Unknown command: {}", call.name));

    LogRegistry::shell()->debug("[Router] Executing command: '{}' ({} positionals, {} options)",
                                canonical, call.positionals.size(), call.options.size());

    return commands_.at(canonical).handler(call);
}

std::string Router::helpText() const {
    std::string out = "Usage: monosync [--root <dir>] [--settings <file>] [--verbose|--quiet] <command> ...\n\nCommands:\n";
    for (const auto& [name, info] : commands_) {
        const auto head = info.usage.synopsis.empty() ? name : name + " " + info.usage.synopsis;
        out += fmt::format("  {:<52} {}\n", head, info.usage.description);
    }
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}
