#include "protocols/shell/commands/all.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/util/argsHelpers.hpp"

namespace ms::shell::commands {

void registerSystemCommands(const std::shared_ptr<Router>& r) {
    const Router* router = r.get();
    r->registerCommand({"help", "", "Show this help", {}},
                       [router](const CommandCall&) { return ok(router->helpText()); });
}

void registerAllCommands(const std::shared_ptr<Router>& r) {
    registerSystemCommands(r);
    registerInitCommands(r);
    registerSubmoduleCommands(r);
    registerSyncCommands(r);
}

}
