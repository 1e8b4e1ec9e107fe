#include "config/ConfigStore.hpp"
#include "config/monorepo_yaml.hpp"
#include "paths/PathResolver.hpp"
#include "types/Error.hpp"
#include "util/FileLock.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

using namespace ms::config;
using namespace ms::types;
using namespace ms::logging;

static void checkUniqueNames(const MonorepoConfig& cfg, const fs::path& source) {
    std::set<std::string> seen;
    for (const auto& s : cfg.submodules) {
        if (s.name.empty())
            throw Error(ErrorKind::ConfigCorrupt, source.string() + ": submodule entry without a name");
        if (!seen.insert(s.name).second)
            throw Error(ErrorKind::ConfigCorrupt, source.string() + ": submodule '" + s.name + "' is listed twice");
    }
}

ConfigStore::ConfigStore(const fs::path& root) : root_(paths::normalizeRoot(root)) {}

fs::path ConfigStore::configDir() const { return root_ / CONFIG_DIR; }

fs::path ConfigStore::artifactPath() const { return configDir() / ARTIFACT_NAME; }

fs::path ConfigStore::legacyArtifactPath() const { return configDir() / LEGACY_ARTIFACT_NAME; }

bool ConfigStore::isInitialized() const {
    std::error_code ec;
    return fs::exists(artifactPath(), ec) || fs::exists(legacyArtifactPath(), ec);
}

bool ConfigStore::init() {
    std::scoped_lock lock(mutex_);
    fs::create_directories(configDir());
    util::FileLock fileLock(configDir() / LOCK_NAME);

    if (isInitialized()) {
        LogRegistry::config()->info("[ConfigStore] Already initialized at {}", configDir().string());
        return false;
    }

    MonorepoConfig cfg;
    cfg.root_path = root_;
    writeLocked(cfg);
    LogRegistry::config()->info("[ConfigStore] Initialized monorepo configuration at {}", artifactPath().string());
    return true;
}

MonorepoConfig ConfigStore::load() const {
    std::error_code ec;
    if (!fs::exists(artifactPath(), ec)) {
        if (fs::exists(legacyArtifactPath(), ec)) return loadLegacy();
        throw Error(ErrorKind::NotInitialized,
                    "no monorepo configuration at " + artifactPath().string() + ", run 'monosync init' first");
    }

    std::string text;
    try {
        text = util::readFileToString(artifactPath());
    } catch (const std::exception& e) {
        throw Error(ErrorKind::ConfigCorrupt, e.what());
    }

    auto cfg = parse(text, artifactPath());

    if (cfg.version > CONFIG_FORMAT_VERSION)
        LogRegistry::config()->warn("[ConfigStore] {} has format version {}, newer than {}; unknown fields are ignored",
                                    artifactPath().string(), cfg.version, CONFIG_FORMAT_VERSION);
    if (cfg.root_path != root_)
        LogRegistry::config()->warn("[ConfigStore] Recorded root_path {} differs from {}", cfg.root_path.string(), root_.string());

    return cfg;
}

MonorepoConfig ConfigStore::parse(const std::string& text, const fs::path& source) {
    MonorepoConfig cfg;
    try {
        const YAML::Node node = YAML::Load(text);
        if (!YAML::convert<MonorepoConfig>::decode(node, cfg))
            throw Error(ErrorKind::ConfigCorrupt, source.string() + ": not a monorepo configuration document");
    } catch (const Error&) {
        throw;
    } catch (const YAML::Exception& e) {
        throw Error(ErrorKind::ConfigCorrupt, source.string() + ": " + e.what());
    } catch (const std::exception& e) {
        throw Error(ErrorKind::ConfigCorrupt, source.string() + ": " + e.what());
    }

    checkUniqueNames(cfg, source);
    return cfg;
}

std::string ConfigStore::serialize(const MonorepoConfig& config) {
    YAML::Emitter out;
    out << YAML::convert<MonorepoConfig>::encode(config);
    if (!out.good()) throw std::runtime_error(std::string("Failed to encode monorepo configuration: ") + out.GetLastError());
    std::string text = out.c_str();
    text.push_back('\n');
    return text;
}

void ConfigStore::save(const MonorepoConfig& config) {
    std::scoped_lock lock(mutex_);
    fs::create_directories(configDir());
    util::FileLock fileLock(configDir() / LOCK_NAME);
    writeLocked(config);
}

MonorepoConfig ConfigStore::update(const std::function<void(MonorepoConfig&)>& mutate) {
    std::scoped_lock lock(mutex_);
    if (!isInitialized())
        throw Error(ErrorKind::NotInitialized,
                    "no monorepo configuration at " + artifactPath().string() + ", run 'monosync init' first");
    util::FileLock fileLock(configDir() / LOCK_NAME);

    auto cfg = load();
    const auto rootBefore = cfg.root_path;

    mutate(cfg);

    if (cfg.root_path != rootBefore) throw std::logic_error("root_path is fixed at initialization and cannot change");
    cfg.version = std::max(cfg.version, CONFIG_FORMAT_VERSION);

    writeLocked(cfg);
    return cfg;
}

void ConfigStore::writeLocked(const MonorepoConfig& config) const {
    checkUniqueNames(config, artifactPath());
    util::writeFileAtomic(artifactPath(), serialize(config));
    LogRegistry::config()->debug("[ConfigStore] Wrote {} ({} submodules)", artifactPath().string(), config.submodules.size());
}

MonorepoConfig ConfigStore::loadLegacy() const {
    const auto path = legacyArtifactPath();
    LogRegistry::config()->info("[ConfigStore] Importing legacy configuration {}", path.string());

    MonorepoConfig cfg;
    cfg.root_path = root_;

    try {
        const auto j = nlohmann::json::parse(util::readFileToString(path));
        for (const auto& entry : j.value("submodules", nlohmann::json::array())) {
            Submodule s;
            s.name = entry.at("name").get<std::string>();
            if (const auto p = entry.value("path", s.name); p != s.name)
                LogRegistry::config()->warn("[ConfigStore] Legacy entry '{}' used path '{}'; the submodule directory is now always '{}'",
                                            s.name, p, s.name);
            for (const auto& inc : entry.value("include", std::vector<std::string>{})) s.rules.push_back(SyncRule::include(inc));
            for (const auto& exc : entry.value("exclude", std::vector<std::string>{})) s.rules.push_back(SyncRule::exclude(exc));
            cfg.submodules.push_back(std::move(s));
        }
    } catch (const nlohmann::json::exception& e) {
        throw Error(ErrorKind::ConfigCorrupt, path.string() + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw Error(ErrorKind::ConfigCorrupt, path.string() + ": " + e.what());
    }

    checkUniqueNames(cfg, path);
    return cfg;
}
