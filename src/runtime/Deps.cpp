#include "runtime/Deps.hpp"
#include "config/Config.hpp"
#include "config/ConfigStore.hpp"
#include "registry/SubmoduleRegistry.hpp"
#include "sync/Orchestrator.hpp"
#include "sync/RsyncMirror.hpp"
#include "vcs/Git.hpp"
#include "logging/LogRegistry.hpp"

using namespace ms::runtime;
using namespace ms::logging;

std::shared_ptr<Deps> Deps::make(const std::filesystem::path& root,
                                 const ms::config::Config& settings,
                                 std::shared_ptr<std::atomic<bool>> interruptFlag) {
    std::shared_ptr<ms::vcs::Client> vcs;
    if (settings.vcs.stage_config) vcs = std::make_shared<ms::vcs::Git>(root, settings.tools.git);
    else vcs = std::make_shared<ms::vcs::NullClient>();

    auto mirror = std::make_shared<ms::sync::RsyncMirror>(settings.tools.rsync, settings.tools.rsync_extra_args);
    return make(root, std::move(mirror), std::move(vcs), std::move(interruptFlag));
}

std::shared_ptr<Deps> Deps::make(const std::filesystem::path& root,
                                 std::shared_ptr<ms::sync::Mirror> mirror,
                                 std::shared_ptr<ms::vcs::Client> vcs,
                                 std::shared_ptr<std::atomic<bool>> interruptFlag) {
    auto deps = std::make_shared<Deps>();
    deps->interruptFlag = interruptFlag ? std::move(interruptFlag) : std::make_shared<std::atomic<bool>>(false);
    deps->store = std::make_shared<ms::config::ConfigStore>(root);
    deps->root = deps->store->root();
    deps->vcs = std::move(vcs);
    deps->registry = std::make_shared<ms::registry::SubmoduleRegistry>(deps->store, deps->vcs);
    deps->mirror = std::move(mirror);
    deps->orchestrator = std::make_shared<ms::sync::Orchestrator>(deps->registry, deps->mirror, deps->interruptFlag);

    LogRegistry::monosync()->debug("[Deps] Wired monorepo at {}", deps->root.string());
    return deps;
}
