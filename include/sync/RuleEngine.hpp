#pragma once

#include "types/SyncRule.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ms::sync {

struct Decision {
    types::RuleKind kind{types::RuleKind::Exclude};
    std::optional<size_t> rule;  // index into RuleSet::rules()
    bool implicit = false;       // decided by the appended catch-all
    std::string decidedAt;       // the path, or the excluded ancestor that hid it

    [[nodiscard]] bool included() const { return kind == types::RuleKind::Include; }
};

// Canonical, ready-to-hand-off rule list. Only RuleEngine::compile() produces one.
class RuleSet {
public:
    [[nodiscard]] const std::vector<types::SyncRule>& rules() const { return rules_; }
    [[nodiscard]] bool hasImplicitCatchAll() const { return implicit_; }

    // First matching rule wins. Ancestors are decided first: an excluded directory
    // hides everything below it, as the mirroring tool never descends into it.
    [[nodiscard]] Decision decide(std::string_view relPath, bool isDir = false) const;
    [[nodiscard]] bool includes(std::string_view relPath, bool isDir = false) const { return decide(relPath, isDir).included(); }

    bool operator==(const RuleSet& other) const = default;

private:
    friend struct RuleEngine;

    std::vector<types::SyncRule> rules_;
    bool implicit_ = false;

    [[nodiscard]] Decision decideOne(std::string_view path, bool isDir) const;
};

struct RuleEngine {
    // Input order is kept, except that a rule nested strictly inside the subtree of an
    // earlier rule of the opposite kind moves just above it, taking along the opposite-kind
    // rules placed between them that lie inside its own subtree. Directory includes are added
    // so every included path stays reachable. An Exclude * catch-all is appended unless the
    // list already ends with one.
    // Throws VacuousRuleSet (no Include rule) or InvalidRule.
    static RuleSet compile(const std::vector<types::SyncRule>& rules, const std::string& submodule = {});

    static void validate(const types::SyncRule& rule, const std::string& submodule = {});

    [[nodiscard]] static bool matches(const types::SyncRule& rule, std::string_view path, bool isDir);

    // outer is "dir/***", "dir/**" or "dir/" and inner's pattern lies below dir
    [[nodiscard]] static bool containsSubtreeOf(const types::SyncRule& outer, const types::SyncRule& inner);
};

}
