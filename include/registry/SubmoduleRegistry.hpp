#pragma once

#include "types/MonorepoConfig.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ms::config { class ConfigStore; }
namespace ms::vcs { class Client; }

namespace ms::registry {

// CRUD over the submodule entries of one monorepo. Every mutation is a single
// serialized load-modify-save cycle on the ConfigStore; a failed check leaves
// the persisted configuration untouched.
class SubmoduleRegistry {
public:
    SubmoduleRegistry(std::shared_ptr<config::ConfigStore> store,
                      std::shared_ptr<vcs::Client> vcs = nullptr);

    types::Submodule add(const std::string& name,
                         const std::vector<types::SyncRule>& rules,
                         const types::Strategy& strategy = types::strategy::Mirror{});

    // Registry-only: content already mirrored to the sibling is left alone.
    void remove(const std::string& name);

    // Replaces the whole rule sequence.
    types::Submodule update(const std::string& name, const std::vector<types::SyncRule>& rules);

    // Metadata changes (strategy options). The name cannot be changed.
    types::Submodule update(const std::string& name, const std::function<void(types::Submodule&)>& mutate);

    // Insertion order.
    [[nodiscard]] std::vector<types::Submodule> list() const;

    [[nodiscard]] types::Submodule get(const std::string& name) const;
    [[nodiscard]] types::MonorepoConfig snapshot() const;

    [[nodiscard]] const std::filesystem::path& root() const;
    [[nodiscard]] const std::shared_ptr<config::ConfigStore>& store() const { return store_; }

private:
    std::shared_ptr<config::ConfigStore> store_;
    std::shared_ptr<vcs::Client> vcs_;

    void recordConfigChange() const;
};

}
