#pragma once

#include "protocols/shell/types.hpp"

#include <map>
#include <string>
#include <unordered_map>

namespace ms::shell {

class Router {
public:
    void registerCommand(CommandUsage usage, CommandHandler handler);

    CommandResult execute(const CommandCall& call) const;

    [[nodiscard]] bool knows(const std::string& nameOrAlias) const;
    [[nodiscard]] std::string helpText() const;

private:
    std::map<std::string, CommandInfo> commands_;  // sorted for help output
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical

    std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

}
