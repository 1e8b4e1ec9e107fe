#pragma once

#include "paths/PathResolver.hpp"
#include "sync/RuleEngine.hpp"
#include "sync/SiblingLocks.hpp"
#include "sync/model/Outcome.hpp"
#include "types/MonorepoConfig.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace ms::registry { class SubmoduleRegistry; }

namespace ms::sync {

class Mirror;

struct SyncOptions {
    bool dryRun = false;
    unsigned int maxParallel = 1;
};

// Drives one sync run: resolve, compile, mirror, interpret. Never writes the configuration.
class Orchestrator {
public:
    Orchestrator(std::shared_ptr<registry::SubmoduleRegistry> registry,
                 std::shared_ptr<Mirror> mirror,
                 std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    // target is a submodule name, "all", or a comma separated list of names.
    // Throws UnknownSubmodule for an unregistered name before anything runs.
    model::Report sync(const std::string& target = "all", const SyncOptions& opts = {});

    // Registry order, filtered to the requested names.
    static std::vector<types::Submodule> selectTargets(const types::MonorepoConfig& cfg, const std::string& target);

    void cancel() const { interruptFlag_->store(true); }
    [[nodiscard]] bool cancelled() const { return interruptFlag_->load(); }

private:
    struct Plan {
        types::Submodule submodule;
        paths::SiblingBinding binding;
        RuleSet rules;
    };

    std::shared_ptr<registry::SubmoduleRegistry> registry_;
    std::shared_ptr<Mirror> mirror_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;
    SiblingLocks siblingLocks_;

    [[nodiscard]] std::variant<Plan, model::Outcome> prepare(const std::filesystem::path& root, const types::Submodule& sub) const;
    model::Outcome execute(const Plan& plan, const SyncOptions& opts);

    void runSequential(const std::vector<Plan*>& plans, std::vector<model::Outcome*>& slots, const SyncOptions& opts);
    void runParallel(const std::vector<Plan*>& plans, std::vector<model::Outcome*>& slots, const SyncOptions& opts);

    static bool siblingsDisjoint(const std::vector<Plan*>& plans);
};

}
