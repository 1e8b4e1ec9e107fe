#pragma once

#include "types/MonorepoConfig.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ms::types;

template<>
struct convert<SyncRule> {
    static Node encode(const SyncRule& rhs) {
        Node node;
        node.SetStyle(EmitterStyle::Flow);
        node["kind"] = to_string(rhs.kind);
        node["pattern"] = rhs.pattern;
        return node;
    }

    // Accepts {kind, pattern} maps and the "+ pattern" / "- pattern" shorthand.
    static bool decode(const Node& node, SyncRule& rhs) {
        if (node.IsScalar()) {
            const auto s = node.as<std::string>();
            if (s.size() < 3 || (s[0] != '+' && s[0] != '-') || s[1] != ' ') return false;
            rhs.kind = s[0] == '+' ? RuleKind::Include : RuleKind::Exclude;
            rhs.pattern = s.substr(2);
            return true;
        }
        if (!node.IsMap() || !node["kind"] || !node["pattern"]) return false;
        const auto kind = node["kind"].as<std::string>();
        if (kind != "include" && kind != "exclude") return false;
        rhs.kind = parseRuleKind(kind);
        rhs.pattern = node["pattern"].as<std::string>();
        return true;
    }
};

template<>
struct convert<Submodule> {
    static Node encode(const Submodule& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["strategy"] = strategyName(rhs.strategy);
        if (const auto* mirror = std::get_if<strategy::Mirror>(&rhs.strategy)) node["checksum"] = mirror->checksum;
        Node rules(NodeType::Sequence);
        for (const auto& r : rhs.rules) rules.push_back(r);
        node["rules"] = rules;
        return node;
    }

    static bool decode(const Node& node, Submodule& rhs) {
        if (!node.IsMap() || !node["name"]) return false;
        rhs.name = node["name"].as<std::string>();

        if (node["strategy"].as<std::string>("mirror") != "mirror") return false;
        rhs.strategy = strategy::Mirror{node["checksum"].as<bool>(false)};

        rhs.rules.clear();
        if (const auto rules = node["rules"]) {
            if (rules.IsNull()) return true;
            if (!rules.IsSequence()) return false;
            for (const auto& r : rules) rhs.rules.push_back(r.as<SyncRule>());
        }
        return true;
    }
};

template<>
struct convert<MonorepoConfig> {
    static Node encode(const MonorepoConfig& rhs) {
        Node node;
        node["version"] = rhs.version;
        node["root_path"] = rhs.root_path.string();
        Node subs(NodeType::Sequence);
        for (const auto& s : rhs.submodules) subs.push_back(s);
        node["submodules"] = subs;
        return node;
    }

    static bool decode(const Node& node, MonorepoConfig& rhs) {
        if (!node.IsMap() || !node["root_path"]) return false;
        rhs.version = node["version"].as<unsigned int>(CONFIG_FORMAT_VERSION);
        rhs.root_path = node["root_path"].as<std::string>();

        rhs.submodules.clear();
        if (const auto subs = node["submodules"]) {
            if (subs.IsNull()) return true;
            if (!subs.IsSequence()) return false;
            for (const auto& s : subs) rhs.submodules.push_back(s.as<Submodule>());
        }
        return true;
    }
};

}
