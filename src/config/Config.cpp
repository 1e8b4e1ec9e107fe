#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace ms::config {

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

static spdlog::level::level_enum levelFrom(const nlohmann::json& j, const char* key, const spdlog::level::level_enum def) {
    if (!j.contains(key)) return def;
    return spdlog::level::from_str(j.at(key).get<std::string>());
}

std::vector<types::SyncRule> Config::defaultRules() const {
    std::vector<types::SyncRule> rules;
    rules.reserve(defaults.include.size() + defaults.exclude.size());
    for (const auto& p : defaults.include) rules.push_back(types::SyncRule::include(p));
    for (const auto& p : defaults.exclude) rules.push_back(types::SyncRule::exclude(p));
    return rules;
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());
    if (root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Settings file is not a YAML mapping: " + path.string());

    if (const auto node = root["tools"]) YAML::convert<ToolsConfig>::decode(node, cfg.tools);
    if (const auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
    if (const auto node = root["vcs"]) YAML::convert<VcsConfig>::decode(node, cfg.vcs);
    if (const auto node = root["defaults"]) YAML::convert<DefaultsConfig>::decode(node, cfg.defaults);
    if (const auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"tools", c.tools},
        {"sync", c.sync},
        {"vcs", c.vcs},
        {"defaults", c.defaults},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("tools")) j.at("tools").get_to(c.tools);
    if (j.contains("sync")) j.at("sync").get_to(c.sync);
    if (j.contains("vcs")) j.at("vcs").get_to(c.vcs);
    if (j.contains("defaults")) j.at("defaults").get_to(c.defaults);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const ToolsConfig& c) {
    j = {
        {"rsync", c.rsync},
        {"git", c.git},
        {"rsync_extra_args", c.rsync_extra_args}
    };
}

void from_json(const nlohmann::json& j, ToolsConfig& c) {
    c.rsync = j.value("rsync", "rsync");
    c.git = j.value("git", "git");
    c.rsync_extra_args = j.value("rsync_extra_args", std::vector<std::string>{});
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {{"max_parallel", c.max_parallel}};
}

void from_json(const nlohmann::json& j, SyncConfig& c) {
    c.max_parallel = j.value("max_parallel", 1u);
    if (c.max_parallel == 0) c.max_parallel = 1;
}

void to_json(nlohmann::json& j, const VcsConfig& c) {
    j = {{"stage_config", c.stage_config}};
}

void from_json(const nlohmann::json& j, VcsConfig& c) {
    c.stage_config = j.value("stage_config", false);
}

void to_json(nlohmann::json& j, const DefaultsConfig& c) {
    j = {
        {"include", c.include},
        {"exclude", c.exclude}
    };
}

void from_json(const nlohmann::json& j, DefaultsConfig& c) {
    c.include = j.value("include", std::vector<std::string>{"lib/***", "pubspec.yaml", "test/***"});
    c.exclude = j.value("exclude", std::vector<std::string>{"*"});
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"monosync", levelName(c.monosync)},
        {"config", levelName(c.config)},
        {"registry", levelName(c.registry)},
        {"paths", levelName(c.paths)},
        {"rules", levelName(c.rules)},
        {"sync", levelName(c.sync)},
        {"shell", levelName(c.shell)},
        {"vcs", levelName(c.vcs)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.monosync = levelFrom(j, "monosync", spdlog::level::info);
    c.config = levelFrom(j, "config", spdlog::level::info);
    c.registry = levelFrom(j, "registry", spdlog::level::info);
    c.paths = levelFrom(j, "paths", spdlog::level::info);
    c.rules = levelFrom(j, "rules", spdlog::level::info);
    c.sync = levelFrom(j, "sync", spdlog::level::info);
    c.shell = levelFrom(j, "shell", spdlog::level::info);
    c.vcs = levelFrom(j, "vcs", spdlog::level::info);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = levelFrom(j, "console_log_level", spdlog::level::warn);
    c.file_log_level = levelFrom(j, "file_log_level", spdlog::level::debug);
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", std::string{});
    if (j.contains("levels")) j.at("levels").get_to(c.levels);
}

}
