#pragma once

#include <memory>

namespace ms::shell {
class Router;
}

namespace ms::shell::commands {

void registerAllCommands(const std::shared_ptr<Router>& r);

void registerSystemCommands(const std::shared_ptr<Router>& r);
void registerInitCommands(const std::shared_ptr<Router>& r);
void registerSubmoduleCommands(const std::shared_ptr<Router>& r);
void registerSyncCommands(const std::shared_ptr<Router>& r);

}
