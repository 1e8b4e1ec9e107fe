#include "protocols/shell/commands/all.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/ConfigStore.hpp"
#include "registry/SubmoduleRegistry.hpp"
#include "runtime/Deps.hpp"
#include "types/Error.hpp"

#include <algorithm>

using namespace ms::shell;
using namespace ms::types;
using namespace ms::config;

static CommandResult handle_init(const CommandCall& call) {
    if (!call.positionals.empty()) return invalid("init: unexpected argument '" + call.positionals[0] + "'");

    std::vector<std::string> names;
    if (hasKey(call, "submodules")) {
        const auto list = optVal(call, "submodules");
        if (!list || list->empty()) return invalid("init: --submodules requires a comma-separated list");
        names = splitList(*list);
        if (std::ranges::any_of(names, [](const auto& n) { return n.empty(); }))
            return invalid("init: submodule list cannot contain empty names");
    }

    const auto& deps = call.deps;
    std::string out, err;

    try {
        if (deps->store->init()) out += "Initialized monorepo configuration at " + deps->store->artifactPath().string() + "\n";
        else out += "Monorepo already initialized at " + deps->store->configDir().string() + "\n";
    } catch (const std::exception& e) {
        return fail("init", e);
    }

    const auto rules = ConfigRegistry::get().defaultRules();
    bool failed = false;

    for (const auto& name : names) {
        try {
            deps->registry->add(name, rules);
            out += "Added submodule: " + name + "\n";
        } catch (const Error& e) {
            if (e.kind() == ErrorKind::DuplicateSubmodule) {
                out += "Submodule " + name + " already configured.\n";
                continue;
            }
            if (!err.empty()) err += "\n";
            err += fail("init", e).stderr_text;
            failed = true;
        }
    }

    return {failed ? 1 : 0, out, err};
}

namespace ms::shell::commands {

void registerInitCommands(const std::shared_ptr<Router>& r) {
    r->registerCommand({"init", "[--submodules a,b,...]",
                        "Create .monorepo/ and optionally register submodules with the default rules", {}},
                       handle_init);
}

}
