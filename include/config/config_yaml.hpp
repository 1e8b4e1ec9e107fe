#pragma once

#include "config/Config.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ms::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<ToolsConfig> {
    static Node encode(const ToolsConfig& rhs) {
        Node node;
        node["rsync"] = rhs.rsync;
        node["git"] = rhs.git;
        node["rsync_extra_args"] = rhs.rsync_extra_args;
        return node;
    }

    static bool decode(const Node& node, ToolsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.rsync = node["rsync"].as<std::string>("rsync");
        rhs.git = node["git"].as<std::string>("git");
        if (node["rsync_extra_args"]) rhs.rsync_extra_args = node["rsync_extra_args"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["max_parallel"] = rhs.max_parallel;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_parallel = node["max_parallel"].as<unsigned int>(1);
        if (rhs.max_parallel == 0) rhs.max_parallel = 1;
        return true;
    }
};

template<>
struct convert<VcsConfig> {
    static Node encode(const VcsConfig& rhs) {
        Node node;
        node["stage_config"] = rhs.stage_config;
        return node;
    }

    static bool decode(const Node& node, VcsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.stage_config = node["stage_config"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<DefaultsConfig> {
    static Node encode(const DefaultsConfig& rhs) {
        Node node;
        node["include"] = rhs.include;
        node["exclude"] = rhs.exclude;
        return node;
    }

    static bool decode(const Node& node, DefaultsConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["include"]) rhs.include = node["include"].as<std::vector<std::string>>();
        if (node["exclude"]) rhs.exclude = node["exclude"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["monosync"] = to_std_string(spdlog::level::to_string_view(rhs.monosync));
        node["config"]   = to_std_string(spdlog::level::to_string_view(rhs.config));
        node["registry"] = to_std_string(spdlog::level::to_string_view(rhs.registry));
        node["paths"]    = to_std_string(spdlog::level::to_string_view(rhs.paths));
        node["rules"]    = to_std_string(spdlog::level::to_string_view(rhs.rules));
        node["sync"]     = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["shell"]    = to_std_string(spdlog::level::to_string_view(rhs.shell));
        node["vcs"]      = to_std_string(spdlog::level::to_string_view(rhs.vcs));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.monosync = spdlog::level::from_str(node["monosync"].as<std::string>("info"));
        rhs.config   = spdlog::level::from_str(node["config"].as<std::string>("info"));
        rhs.registry = spdlog::level::from_str(node["registry"].as<std::string>("info"));
        rhs.paths    = spdlog::level::from_str(node["paths"].as<std::string>("info"));
        rhs.rules    = spdlog::level::from_str(node["rules"].as<std::string>("info"));
        rhs.sync     = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.shell    = spdlog::level::from_str(node["shell"].as<std::string>("info"));
        rhs.vcs      = spdlog::level::from_str(node["vcs"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("warning"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
