#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace ms::runtime { struct Deps; }

namespace ms::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;        // command-line order, repeats kept
    std::vector<std::string> positionals;
    std::shared_ptr<runtime::Deps> deps;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success, 1 = operation failed, 2 = usage
    std::string stdout_text;           // CLI stdout
    std::string stderr_text;           // CLI stderr
    nlohmann::json data;               // optional machine-readable payload
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandUsage {
    std::string name;
    std::string synopsis;               // "<name> [--include p]..."
    std::string description;
    std::unordered_set<std::string> aliases;
};

struct CommandInfo {
    CommandUsage usage;
    CommandHandler handler;
};

}
