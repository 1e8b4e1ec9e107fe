#include "config/ConfigRegistry.hpp"

#include <cstdlib>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ms::config {

void ConfigRegistry::init(const std::optional<fs::path>& path) {
    std::error_code ec;
    if (path && fs::exists(*path, ec)) {
        config_ = loadConfig(*path);
        source_ = *path;
    } else {
        config_ = Config{};
        source_.reset();
    }
    initialized_ = true;
}

void ConfigRegistry::init(const Config& config) {
    config_ = config;
    source_.reset();
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

Config& ConfigRegistry::mutate() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

const std::optional<fs::path>& ConfigRegistry::sourcePath() { return source_; }

std::optional<fs::path> ConfigRegistry::locate(const std::optional<fs::path>& explicitPath,
                                               const std::optional<fs::path>& root) {
    if (explicitPath) {
        std::error_code ec;
        if (!fs::exists(*explicitPath, ec))
            throw std::runtime_error("Settings file not found: " + explicitPath->string());
        return explicitPath;
    }

    if (const char* env = std::getenv("MONOSYNC_SETTINGS"); env && *env) return fs::path(env);

    if (root) {
        const auto candidate = *root / ".monorepo" / "settings.yaml";
        std::error_code ec;
        if (fs::exists(candidate, ec)) return candidate;
    }

    return std::nullopt;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

}
