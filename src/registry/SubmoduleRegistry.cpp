#include "registry/SubmoduleRegistry.hpp"
#include "config/ConfigStore.hpp"
#include "paths/PathResolver.hpp"
#include "sync/RuleEngine.hpp"
#include "types/Error.hpp"
#include "vcs/Client.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace ms::registry;
using namespace ms::types;
using namespace ms::logging;

static void validateRules(const std::vector<SyncRule>& rules, const std::string& name) {
    for (const auto& r : rules) ms::sync::RuleEngine::validate(r, name);
}

static Submodule& requireEntry(MonorepoConfig& cfg, const std::string& name) {
    auto* s = cfg.find(name);
    if (!s) throw Error(ErrorKind::UnknownSubmodule, "not a registered submodule", name);
    return *s;
}

SubmoduleRegistry::SubmoduleRegistry(std::shared_ptr<config::ConfigStore> store, std::shared_ptr<vcs::Client> vcs)
    : store_(std::move(store)), vcs_(std::move(vcs)) {
    if (!store_) throw std::invalid_argument("SubmoduleRegistry requires a ConfigStore");
}

const std::filesystem::path& SubmoduleRegistry::root() const { return store_->root(); }

Submodule SubmoduleRegistry::add(const std::string& name, const std::vector<SyncRule>& rules, const Strategy& strategy) {
    paths::validateName(name);
    validateRules(rules, name);

    // The sibling is not required to exist yet, but the name must map to a sane target.
    (void)paths::siblingPathFor(root(), name);

    Submodule entry{name, strategy, rules};

    store_->update([&](MonorepoConfig& cfg) {
        if (cfg.contains(name)) throw Error(ErrorKind::DuplicateSubmodule, "already registered", name);
        if (!paths::isImmediateChildDir(root(), name))
            throw Error(ErrorKind::NotASubdirectory,
                        "no directory named '" + name + "' directly under " + root().string(), name);
        cfg.submodules.push_back(entry);
    });

    LogRegistry::registry()->info("[SubmoduleRegistry] Added '{}' with {} rules", name, rules.size());
    recordConfigChange();
    return entry;
}

void SubmoduleRegistry::remove(const std::string& name) {
    store_->update([&](MonorepoConfig& cfg) {
        requireEntry(cfg, name);
        std::erase_if(cfg.submodules, [&](const Submodule& s) { return s.name == name; });
    });

    LogRegistry::registry()->info("[SubmoduleRegistry] Removed '{}'; sibling content left in place", name);
    recordConfigChange();
}

Submodule SubmoduleRegistry::update(const std::string& name, const std::vector<SyncRule>& rules) {
    validateRules(rules, name);

    Submodule result;
    store_->update([&](MonorepoConfig& cfg) {
        auto& s = requireEntry(cfg, name);
        s.rules = rules;
        result = s;
    });

    LogRegistry::registry()->info("[SubmoduleRegistry] Replaced rules of '{}' ({} rules)", name, rules.size());
    recordConfigChange();
    return result;
}

Submodule SubmoduleRegistry::update(const std::string& name, const std::function<void(Submodule&)>& mutate) {
    Submodule result;
    store_->update([&](MonorepoConfig& cfg) {
        auto& s = requireEntry(cfg, name);
        Submodule copy = s;
        mutate(copy);
        if (copy.name != name) throw std::logic_error("a submodule cannot be renamed");
        validateRules(copy.rules, name);
        s = copy;
        result = copy;
    });

    LogRegistry::registry()->info("[SubmoduleRegistry] Updated '{}'", name);
    recordConfigChange();
    return result;
}

std::vector<Submodule> SubmoduleRegistry::list() const {
    return store_->load().submodules;
}

Submodule SubmoduleRegistry::get(const std::string& name) const {
    const auto cfg = store_->load();
    const auto* s = cfg.find(name);
    if (!s) throw Error(ErrorKind::UnknownSubmodule, "not a registered submodule", name);
    return *s;
}

MonorepoConfig SubmoduleRegistry::snapshot() const { return store_->load(); }

void SubmoduleRegistry::recordConfigChange() const {
    if (!vcs_) return;
    try {
        vcs_->recordConfigChange(store_->artifactPath());
    } catch (const std::exception& e) {
        LogRegistry::registry()->warn("[SubmoduleRegistry] Config change not recorded in version control: {}", e.what());
    }
}
