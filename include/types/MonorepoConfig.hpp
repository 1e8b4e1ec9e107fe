#pragma once

#include "types/Submodule.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ms::types {

constexpr static unsigned int CONFIG_FORMAT_VERSION = 1;

struct MonorepoConfig {
    unsigned int version = CONFIG_FORMAT_VERSION;
    std::filesystem::path root_path;
    std::vector<Submodule> submodules;  // insertion order is the listing order

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] const Submodule* find(const std::string& name) const;
    Submodule* find(const std::string& name);

    bool operator==(const MonorepoConfig& other) const = default;
};

void to_json(nlohmann::json& j, const MonorepoConfig& c);
void from_json(const nlohmann::json& j, MonorepoConfig& c);

}
