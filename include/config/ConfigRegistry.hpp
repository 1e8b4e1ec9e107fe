#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>

namespace ms::config {

// Process-wide tool settings. Holds no monorepo state.
class ConfigRegistry {
public:
    // Loads the settings file if one is given and exists, built-in defaults otherwise.
    static void init(const std::optional<std::filesystem::path>& path = std::nullopt);
    static void init(const Config& config);

    static const Config& get();
    static Config& mutate();

    [[nodiscard]] static bool isInitialized();
    [[nodiscard]] static const std::optional<std::filesystem::path>& sourcePath();

    // --settings, then $MONOSYNC_SETTINGS, then <root>/.monorepo/settings.yaml
    static std::optional<std::filesystem::path> locate(const std::optional<std::filesystem::path>& explicitPath,
                                                       const std::optional<std::filesystem::path>& root);

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::optional<std::filesystem::path> source_;
};

}
