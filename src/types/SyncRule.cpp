#include "types/SyncRule.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace ms::types {

SyncRule::SyncRule(std::string pattern, const RuleKind kind) : pattern(std::move(pattern)), kind(kind) {}

std::string SyncRule::str() const {
    return fmt::format("{} {}", kind == RuleKind::Include ? '+' : '-', pattern);
}

std::string to_string(const RuleKind kind) {
    return kind == RuleKind::Include ? "include" : "exclude";
}

RuleKind parseRuleKind(const std::string& str) {
    if (str == "include" || str == "+") return RuleKind::Include;
    if (str == "exclude" || str == "-") return RuleKind::Exclude;
    throw std::invalid_argument("Invalid rule kind: " + str);
}

std::string to_string(const std::vector<SyncRule>& rules) {
    if (rules.empty()) return "  (no rules)\n";
    std::string out;
    for (size_t i = 0; i < rules.size(); ++i)
        out += fmt::format("  {:>2}. {:<7} {}\n", i + 1, to_string(rules[i].kind), rules[i].pattern);
    return out;
}

void to_json(nlohmann::json& j, const SyncRule& r) {
    j = {
        {"kind", to_string(r.kind)},
        {"pattern", r.pattern}
    };
}

void from_json(const nlohmann::json& j, SyncRule& r) {
    r.kind = parseRuleKind(j.at("kind").get<std::string>());
    r.pattern = j.at("pattern").get<std::string>();
}

}
