#pragma once

#include "protocols/shell/types.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace ms::shell {

// Flags that never take a value, so "sync --dry-run app" keeps "app" positional.
inline const std::unordered_set<std::string> SWITCHES = {
    "dry-run", "json", "defaults", "checksum", "no-checksum", "verbose", "v", "quiet", "q", "help", "h",
};

inline std::string strip_leading_dashes(const std::string& s) {
    size_t i = 0; while (i < s.size() && s[i] == '-' && i < 2) ++i;
    return s.substr(i);
}

inline bool isFlag(const std::string& s) {
    return s.size() > 1 && s[0] == '-' && s != "--";
}

// First word is the command name. "--key=value" and "--key value" both set key; switches take
// no value; "--" ends flag parsing. Options are appended, never merged, so order survives.
inline CommandCall parseArgs(const std::vector<std::string>& args,
                             const std::unordered_set<std::string>& switches = SWITCHES) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    bool stop_flags = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];

        if (!stop_flags && a == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && isFlag(a)) {
            auto key = strip_leading_dashes(a);
            if (const auto eq = key.find('='); eq != std::string::npos) {
                call.options.push_back({key.substr(0, eq), key.substr(eq + 1)});
                continue;
            }
            if (!switches.contains(key) && i + 1 < args.size() && !isFlag(args[i + 1])) {
                call.options.push_back({key, args[i + 1]});
                ++i; // consumed value
            } else {
                call.options.push_back({key, std::nullopt});
            }
            continue;
        }

        if (call.name.empty()) call.name = a;
        else call.positionals.push_back(a);
    }

    return call;
}

}
