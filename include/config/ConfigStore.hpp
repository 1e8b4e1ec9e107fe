#pragma once

#include "types/MonorepoConfig.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>

namespace ms::config {

// Durable home of the monorepo configuration: <root>/.monorepo/config.yaml.
// One instance is created per process and handed to every component that needs it.
class ConfigStore {
public:
    static constexpr const auto* CONFIG_DIR = ".monorepo";
    static constexpr const auto* ARTIFACT_NAME = "config.yaml";
    static constexpr const auto* LEGACY_ARTIFACT_NAME = "config.json";
    static constexpr const auto* LOCK_NAME = ".lock";

    explicit ConfigStore(const std::filesystem::path& root);

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }
    [[nodiscard]] std::filesystem::path configDir() const;
    [[nodiscard]] std::filesystem::path artifactPath() const;
    [[nodiscard]] std::filesystem::path legacyArtifactPath() const;

    [[nodiscard]] bool isInitialized() const;

    // Creates .monorepo/ and an empty configuration unless one already exists.
    // Returns true when a new configuration was written.
    bool init();

    // Throws NotInitialized when no artifact exists and ConfigCorrupt when it cannot be parsed.
    // Never writes, not even after a legacy import.
    [[nodiscard]] types::MonorepoConfig load() const;

    // Full replacement through a temp file and rename, serialized with every other writer.
    void save(const types::MonorepoConfig& config);

    // One serialized load-modify-save cycle. If mutate throws nothing is written.
    types::MonorepoConfig update(const std::function<void(types::MonorepoConfig&)>& mutate);

    static std::string serialize(const types::MonorepoConfig& config);
    static types::MonorepoConfig parse(const std::string& text, const std::filesystem::path& source);

private:
    std::filesystem::path root_;
    std::mutex mutex_;

    void writeLocked(const types::MonorepoConfig& config) const;
    [[nodiscard]] types::MonorepoConfig loadLegacy() const;
};

}
