#pragma once

#include "protocols/shell/types.hpp"
#include "types/SyncRule.hpp"

#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace ms::shell {

struct RuleParse {
    bool ok = false;
    std::vector<types::SyncRule> rules;  // --include/--exclude in command-line order
    bool given = false;                  // at least one rule flag was present
    std::string error;
};

CommandResult invalid(std::string msg);
CommandResult invalid(std::string usage, std::string msg);
CommandResult ok(std::string out);
CommandResult ok(std::string out, nlohmann::json data);

// Operational failure (exit 1), "<command>: [Kind] message"
CommandResult fail(const std::string& command, const std::exception& e);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);

// Every value given for key, in order.
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);

std::optional<unsigned int> parseUInt(const std::string& sv);

RuleParse parseRuleFlags(const CommandCall& call, const std::string& errPrefix);

// "a, b,c" -> {"a", "b", "c"}; empty items are kept so callers can reject them.
std::vector<std::string> splitList(const std::string& s);

}
