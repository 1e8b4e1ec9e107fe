#include "types/Submodule.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace ms::types {

namespace {

struct StrategyName {
    std::string operator()(const strategy::Mirror&) const { return "mirror"; }
};

struct StrategyJson {
    nlohmann::json& j;
    void operator()(const strategy::Mirror& m) const { j["checksum"] = m.checksum; }
};

struct StrategyDetail {
    std::string operator()(const strategy::Mirror& m) const { return m.checksum ? ", checksum" : ""; }
};

}

std::string strategyName(const Strategy& s) {
    return std::visit(StrategyName{}, s);
}

std::string to_string(const Submodule& s) {
    std::string out = fmt::format("{} [{}{}]\n", s.name, strategyName(s.strategy), std::visit(StrategyDetail{}, s.strategy));
    out += to_string(s.rules);
    return out;
}

void to_json(nlohmann::json& j, const Submodule& s) {
    j = {
        {"name", s.name},
        {"strategy", strategyName(s.strategy)},
        {"rules", s.rules}
    };
    std::visit(StrategyJson{j}, s.strategy);
}

void from_json(const nlohmann::json& j, Submodule& s) {
    s.name = j.at("name").get<std::string>();
    const auto kind = j.value("strategy", std::string("mirror"));
    if (kind != "mirror") throw std::invalid_argument("Unknown submodule strategy: " + kind);
    s.strategy = strategy::Mirror{j.value("checksum", false)};
    s.rules = j.value("rules", std::vector<SyncRule>{});
}

}
