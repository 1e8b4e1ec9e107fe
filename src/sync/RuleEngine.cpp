#include "sync/RuleEngine.hpp"
#include "sync/glob.hpp"
#include "types/Error.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <fmt/core.h>

using namespace ms::sync;
using namespace ms::types;
using namespace ms::logging;

static constexpr auto npos = std::string_view::npos;

static bool matchesPath(const std::string_view pat, const bool anchored, const std::string_view path) {
    const bool fullPath = anchored || pat.find('/') != npos || pat.find("**") != npos;

    if (!fullPath) {
        const auto slash = path.rfind('/');
        return globMatch(pat, slash == npos ? path : path.substr(slash + 1));
    }

    if (globMatch(pat, path)) return true;
    if (anchored) return false;

    // unanchored patterns may match any trailing run of components
    for (size_t pos = path.find('/'); pos != npos; pos = path.find('/', pos + 1))
        if (globMatch(pat, path.substr(pos + 1))) return true;
    return false;
}

static std::string_view subtreeBase(std::string_view pattern) {
    if (!pattern.empty() && pattern.front() == '/') pattern.remove_prefix(1);
    if (pattern.ends_with("/***")) pattern.remove_suffix(4);
    else if (pattern.ends_with("/**")) pattern.remove_suffix(3);
    else if (pattern.ends_with('/')) pattern.remove_suffix(1);
    else return {};
    return pattern;
}

// Deepest directory (or file) a rule names, without anchor or subtree suffix
static std::string_view namedPath(const SyncRule& rule) {
    if (const auto base = subtreeBase(rule.pattern); !base.empty()) return base;
    std::string_view p = rule.pattern;
    if (!p.empty() && p.front() == '/') p.remove_prefix(1);
    return p;
}

static void pushUnique(std::vector<SyncRule>& out, SyncRule rule) {
    if (std::ranges::find(out, rule) != out.end()) return;
    out.push_back(std::move(rule));
}

// Directory includes for every directory from base down to the parent of what include names,
// so the mirroring tool descends far enough to reach it.
static void pushReachIncludes(std::vector<SyncRule>& out, const std::string_view base, const SyncRule& include) {
    const auto path = namedPath(include);
    const std::string anchor = include.pattern.starts_with('/') ? "/" : "";
    for (size_t pos = path.find('/', base.size()); pos != npos; pos = path.find('/', pos + 1))
        pushUnique(out, SyncRule::include(anchor + std::string(path.substr(0, pos)) + "/"));
}

void RuleEngine::validate(const SyncRule& rule, const std::string& submodule) {
    const auto& p = rule.pattern;
    if (std::ranges::all_of(p, [](const unsigned char c) { return std::isspace(c); }))
        throw Error(ErrorKind::InvalidRule, fmt::format("empty {} pattern", to_string(rule.kind)), submodule);
    if (std::ranges::any_of(p, [](const char c) { return c == '\n' || c == '\r' || c == '\0'; }))
        throw Error(ErrorKind::InvalidRule, fmt::format("pattern '{}' contains a control character", p), submodule);
}

bool RuleEngine::matches(const SyncRule& rule, const std::string_view path, const bool isDir) {
    std::string_view pat = rule.pattern;
    const bool anchored = !pat.empty() && pat.front() == '/';
    if (anchored) pat.remove_prefix(1);

    bool subtree = false;
    if (pat.ends_with("/***")) {
        subtree = true;
        pat.remove_suffix(4);
    } else if (pat.ends_with('/')) {
        if (!isDir) return false;
        pat.remove_suffix(1);
    }

    if (!subtree) return matchesPath(pat, anchored, path);

    // "dir/***" covers the directory itself and everything below it
    if (isDir && matchesPath(pat, anchored, path)) return true;
    for (size_t pos = path.find('/'); pos != npos; pos = path.find('/', pos + 1))
        if (matchesPath(pat, anchored, path.substr(0, pos))) return true;
    return false;
}

bool RuleEngine::containsSubtreeOf(const SyncRule& outer, const SyncRule& inner) {
    const auto base = subtreeBase(outer.pattern);
    if (base.empty()) return false;

    std::string_view in = inner.pattern;
    if (!in.empty() && in.front() == '/') in.remove_prefix(1);
    return in.size() > base.size() + 1 && in.starts_with(base) && in[base.size()] == '/';
}

RuleSet RuleEngine::compile(const std::vector<SyncRule>& rules, const std::string& submodule) {
    if (rules.empty())
        throw Error(ErrorKind::VacuousRuleSet, "no sync rules defined, nothing would be mirrored", submodule);

    for (size_t i = 0; i < rules.size(); ++i) {
        try {
            validate(rules[i], submodule);
        } catch (const Error& e) {
            throw Error(ErrorKind::InvalidRule, fmt::format("rule {}: {}", i + 1, e.reason()), submodule);
        }
    }

    if (std::ranges::none_of(rules, [](const SyncRule& r) { return r.isInclude(); }))
        throw Error(ErrorKind::VacuousRuleSet, "only exclude rules defined, nothing could ever be included", submodule);

    RuleSet set;
    set.rules_.reserve(rules.size() + 1);

    auto& out = set.rules_;
    for (const auto& rule : rules) {
        const auto pos = std::ranges::find_if(out, [&rule](const SyncRule& earlier) {
            return earlier.kind != rule.kind && containsSubtreeOf(earlier, rule);
        });
        if (pos == out.end()) {
            out.push_back(rule);
            continue;
        }

        const auto at = pos - out.begin();
        const SyncRule broader = *pos;
        LogRegistry::rules()->debug("[RuleEngine] '{}' moved above '{}'", rule.str(), broader.str());

        // carve-outs placed after the broader rule that fall inside this one keep precedence over it
        std::vector<SyncRule> carveOuts;
        for (auto it = out.begin() + at + 1; it != out.end();) {
            if (it->kind != rule.kind && containsSubtreeOf(rule, *it)) {
                carveOuts.push_back(*it);
                it = out.erase(it);
            } else ++it;
        }

        const SyncRule& excluding = rule.isInclude() ? broader : rule;
        std::vector<SyncRule> reach;
        if (rule.isInclude()) pushReachIncludes(reach, subtreeBase(broader.pattern), rule);
        else for (const auto& c : carveOuts) pushReachIncludes(reach, subtreeBase(rule.pattern), c);

        std::vector<SyncRule> block = carveOuts;
        if (rule.isInclude()) {
            block.push_back(rule);
            block.insert(block.end(), reach.begin(), reach.end());
        } else {
            block.insert(block.end(), reach.begin(), reach.end());
            block.push_back(rule);
        }

        // a directory-only exclude stops matching once its directory is included, its contents still must not
        if (!reach.empty() && excluding.pattern.ends_with('/')) {
            std::string contents = excluding.pattern;
            contents += "***";
            pushUnique(block, SyncRule::exclude(std::move(contents)));
        }

        out.insert(out.begin() + at, block.begin(), block.end());
    }

    if (!set.rules_.back().isCatchAllExclude()) {
        set.rules_.push_back(SyncRule::exclude("*"));
        set.implicit_ = true;
    }

    return set;
}

Decision RuleSet::decideOne(const std::string_view path, const bool isDir) const {
    for (size_t i = 0; i < rules_.size(); ++i) {
        if (!RuleEngine::matches(rules_[i], path, isDir)) continue;
        return {rules_[i].kind, i, implicit_ && i + 1 == rules_.size(), std::string(path)};
    }
    return {RuleKind::Exclude, std::nullopt, true, std::string(path)};
}

Decision RuleSet::decide(std::string_view relPath, bool isDir) const {
    while (relPath.starts_with("./")) relPath.remove_prefix(2);
    while (relPath.starts_with('/')) relPath.remove_prefix(1);
    while (relPath.ends_with('/')) {
        relPath.remove_suffix(1);
        isDir = true;
    }
    if (relPath.empty() || relPath == ".") throw std::invalid_argument("Cannot evaluate rules for an empty path");

    for (size_t pos = relPath.find('/'); pos != npos; pos = relPath.find('/', pos + 1)) {
        if (auto d = decideOne(relPath.substr(0, pos), true); !d.included()) return d;
    }
    return decideOne(relPath, isDir);
}
