#include "types/MonorepoConfig.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace ms::types {

bool MonorepoConfig::contains(const std::string& name) const {
    return find(name) != nullptr;
}

const Submodule* MonorepoConfig::find(const std::string& name) const {
    const auto it = std::ranges::find_if(submodules, [&name](const Submodule& s) { return s.name == name; });
    return it == submodules.end() ? nullptr : &*it;
}

Submodule* MonorepoConfig::find(const std::string& name) {
    const auto it = std::ranges::find_if(submodules, [&name](const Submodule& s) { return s.name == name; });
    return it == submodules.end() ? nullptr : &*it;
}

void to_json(nlohmann::json& j, const MonorepoConfig& c) {
    j = {
        {"version", c.version},
        {"root_path", c.root_path.string()},
        {"submodules", c.submodules}
    };
}

void from_json(const nlohmann::json& j, MonorepoConfig& c) {
    c.version = j.value("version", CONFIG_FORMAT_VERSION);
    c.root_path = j.at("root_path").get<std::string>();
    c.submodules = j.value("submodules", std::vector<Submodule>{});
}

}
