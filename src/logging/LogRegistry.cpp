#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <vector>

namespace fs = std::filesystem;

namespace ms::logging {

void LogRegistry::init(const std::optional<spdlog::level::level_enum> consoleOverride) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = ms::config::ConfigRegistry::get().logging;

    // stdout carries command output, diagnostics go to stderr
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(consoleOverride.value_or(cnf.levels.console_log_level));
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (!cnf.log_dir.empty()) {
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);
        file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (cnf.log_dir / "monosync.log").string(), max_bytes_, max_files_);
        file_sink_->set_level(cnf.levels.file_log_level);
        file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink_);
    }

    // --verbose must not be swallowed by a quieter subsystem level
    const bool forceDebug = consoleOverride && *consoleOverride <= spdlog::level::debug;

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(forceDebug ? *consoleOverride : lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub = cnf.levels.subsystem_levels;
    makeLogger("monosync", sub.monosync);
    makeLogger("config",   sub.config);
    makeLogger("registry", sub.registry);
    makeLogger("paths",    sub.paths);
    makeLogger("rules",    sub.rules);
    makeLogger("sync",     sub.sync);
    makeLogger("shell",    sub.shell);
    makeLogger("vcs",      sub.vcs);

    initialized_ = true;
    get("monosync")->debug("[LogRegistry] Initialized");
}

void LogRegistry::shutdown() {
    if (!initialized_) return;
    for (const auto* name : {"monosync", "config", "registry", "paths", "rules", "sync", "shell", "vcs"})
        spdlog::drop(name);
    console_sink_.reset();
    file_sink_.reset();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

}
