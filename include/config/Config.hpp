#pragma once

#include "types/SyncRule.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace ms::config {

struct ToolsConfig {
    std::string rsync = "rsync";
    std::string git = "git";
    std::vector<std::string> rsync_extra_args;
};

struct SyncConfig {
    unsigned int max_parallel = 1;  // >1 runs disjoint siblings on worker threads
};

struct VcsConfig {
    bool stage_config = false;
};

struct DefaultsConfig {
    std::vector<std::string> include = {"lib/***", "pubspec.yaml", "test/***"};
    std::vector<std::string> exclude = {"*"};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum monosync = spdlog::level::info;
    spdlog::level::level_enum config   = spdlog::level::info;
    spdlog::level::level_enum registry = spdlog::level::info;
    spdlog::level::level_enum paths    = spdlog::level::info;
    spdlog::level::level_enum rules    = spdlog::level::info;
    spdlog::level::level_enum sync     = spdlog::level::info;
    spdlog::level::level_enum shell    = spdlog::level::info;
    spdlog::level::level_enum vcs      = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty = console only
    LogLevelsConfig levels;
};

struct Config {
    ToolsConfig tools;
    SyncConfig sync;
    VcsConfig vcs;
    DefaultsConfig defaults;
    LoggingConfig logging;

    // defaults.include followed by defaults.exclude
    [[nodiscard]] std::vector<types::SyncRule> defaultRules() const;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const ToolsConfig& c);
void from_json(const nlohmann::json& j, ToolsConfig& c);
void to_json(nlohmann::json& j, const SyncConfig& c);
void from_json(const nlohmann::json& j, SyncConfig& c);
void to_json(nlohmann::json& j, const VcsConfig& c);
void from_json(const nlohmann::json& j, VcsConfig& c);
void to_json(nlohmann::json& j, const DefaultsConfig& c);
void from_json(const nlohmann::json& j, DefaultsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

}
