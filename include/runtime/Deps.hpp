#pragma once

#include <atomic>
#include <filesystem>
#include <memory>

namespace ms::config { class ConfigStore; struct Config; }
namespace ms::registry { class SubmoduleRegistry; }
namespace ms::sync { class Mirror; class Orchestrator; }
namespace ms::vcs { class Client; }

namespace ms::runtime {

// The object graph of one monorepo, wired once per process and passed to the command handlers.
struct Deps {
    std::filesystem::path root;
    std::shared_ptr<ms::config::ConfigStore> store;
    std::shared_ptr<ms::vcs::Client> vcs;
    std::shared_ptr<ms::registry::SubmoduleRegistry> registry;
    std::shared_ptr<ms::sync::Mirror> mirror;
    std::shared_ptr<ms::sync::Orchestrator> orchestrator;
    std::shared_ptr<std::atomic<bool>> interruptFlag;

    static std::shared_ptr<Deps> make(const std::filesystem::path& root,
                                      const ms::config::Config& settings,
                                      std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    // Same graph with a caller-supplied mirroring collaborator.
    static std::shared_ptr<Deps> make(const std::filesystem::path& root,
                                      std::shared_ptr<ms::sync::Mirror> mirror,
                                      std::shared_ptr<ms::vcs::Client> vcs,
                                      std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);
};

}
