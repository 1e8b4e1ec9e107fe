#pragma once

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ms::types {

enum class RuleKind { Include, Exclude };

struct SyncRule {
    std::string pattern;
    RuleKind kind{RuleKind::Include};

    SyncRule() = default;
    SyncRule(std::string pattern, RuleKind kind);

    static SyncRule include(std::string pattern) { return {std::move(pattern), RuleKind::Include}; }
    static SyncRule exclude(std::string pattern) { return {std::move(pattern), RuleKind::Exclude}; }

    [[nodiscard]] bool isInclude() const { return kind == RuleKind::Include; }
    [[nodiscard]] bool isCatchAllExclude() const { return kind == RuleKind::Exclude && pattern == "*"; }

    // "+ lib/***" / "- *", the notation rsync uses in filter files
    [[nodiscard]] std::string str() const;

    bool operator==(const SyncRule& other) const = default;
};

std::string to_string(RuleKind kind);
RuleKind parseRuleKind(const std::string& str);

std::string to_string(const std::vector<SyncRule>& rules);

void to_json(nlohmann::json& j, const SyncRule& r);
void from_json(const nlohmann::json& j, SyncRule& r);

}
