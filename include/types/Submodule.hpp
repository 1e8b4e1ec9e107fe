#pragma once

#include "types/SyncRule.hpp"

#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ms::types {

namespace strategy {

// Delete-extraneous one-way mirroring of the rule-selected subset.
struct Mirror {
    bool checksum = false;  // compare content instead of size+mtime

    bool operator==(const Mirror& other) const = default;
};

}

// Closed set: new strategies are added here and every std::visit over it must handle them.
using Strategy = std::variant<strategy::Mirror>;

std::string strategyName(const Strategy& s);

struct Submodule {
    std::string name;
    Strategy strategy{strategy::Mirror{}};
    std::vector<SyncRule> rules;

    bool operator==(const Submodule& other) const = default;
};

std::string to_string(const Submodule& s);

void to_json(nlohmann::json& j, const Submodule& s);
void from_json(const nlohmann::json& j, Submodule& s);

}
