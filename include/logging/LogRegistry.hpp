#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace ms::logging {

class LogRegistry {
public:
    // Builds every subsystem logger from the settings in ConfigRegistry.
    // consoleOverride replaces the configured console level (--verbose / --quiet).
    static void init(std::optional<spdlog::level::level_enum> consoleOverride = std::nullopt);

    // Drops every logger; init() may be called again afterwards.
    static void shutdown();

    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    static std::shared_ptr<spdlog::logger> monosync() { return get("monosync"); }
    static std::shared_ptr<spdlog::logger> config()   { return get("config"); }
    static std::shared_ptr<spdlog::logger> registry() { return get("registry"); }
    static std::shared_ptr<spdlog::logger> paths()    { return get("paths"); }
    static std::shared_ptr<spdlog::logger> rules()    { return get("rules"); }
    static std::shared_ptr<spdlog::logger> sync()     { return get("sync"); }
    static std::shared_ptr<spdlog::logger> shell()    { return get("shell"); }
    static std::shared_ptr<spdlog::logger> vcs()      { return get("vcs"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_;

    static inline size_t max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t max_files_ = 5;
};

}
