#include "protocols/shell/util/argsHelpers.hpp"
#include "types/Error.hpp"

#include <algorithm>
#include <limits>
#include <sstream>

using namespace ms::types;

namespace ms::shell {

CommandResult invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult invalid(std::string usage, std::string msg) { return {2, std::move(usage), std::move(msg)}; }
CommandResult ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult ok(std::string out, nlohmann::json data) { return {0, std::move(out), "", std::move(data), true}; }

CommandResult fail(const std::string& command, const std::exception& e) {
    if (const auto* err = dynamic_cast<const Error*>(&e))
        return {1, "", command + ": [" + to_string(err->kind()) + "] " + err->what()};
    return {1, "", command + ": " + e.what()};
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (const auto v = optVal(c, k)) return v;
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (hasFlag(c, k)) return true;
    return false;
}

bool hasKey(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

std::optional<unsigned int> parseUInt(const std::string& sv) {
    if (sv.empty()) return std::nullopt;

    unsigned long long v = 0; // wide enough for overflow check
    for (const char c : sv) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) return std::nullopt;
    }

    return static_cast<unsigned int>(v);
}

RuleParse parseRuleFlags(const CommandCall& call, const std::string& errPrefix) {
    RuleParse out;
    for (const auto& [k, v] : call.options) {
        if (k != "include" && k != "exclude") continue;
        out.given = true;
        if (!v) {
            out.error = errPrefix + ": --" + k + " requires a pattern";
            return out;
        }
        out.rules.emplace_back(*v, k == "include" ? RuleKind::Include : RuleKind::Exclude);
    }
    out.ok = true;
    return out;
}

std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto b = item.find_first_not_of(" \t");
        const auto e = item.find_last_not_of(" \t");
        out.push_back(b == std::string::npos ? std::string{} : item.substr(b, e - b + 1));
    }
    if (!s.empty() && s.back() == ',') out.emplace_back();
    return out;
}

}
