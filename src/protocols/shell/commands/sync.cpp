#include "protocols/shell/commands/all.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "config/ConfigRegistry.hpp"
#include "runtime/Deps.hpp"
#include "sync/Orchestrator.hpp"

#include <nlohmann/json.hpp>

using namespace ms::shell;
using namespace ms::sync;
using namespace ms::config;

static CommandResult handle_sync(const CommandCall& call) {
    if (call.positionals.size() > 1) return invalid("sync: too many arguments, use a comma-separated list");

    std::string target = "all";
    if (!call.positionals.empty()) target = call.positionals[0];
    else if (const auto list = optVal(call, "submodules")) target = *list;

    for (const auto& n : splitList(target))
        if (n.empty()) return invalid("sync: submodule list cannot contain empty names");

    SyncOptions opts;
    opts.dryRun = hasFlag(call, "dry-run");
    opts.maxParallel = ConfigRegistry::get().sync.max_parallel;
    if (const auto p = optVal(call, "parallel")) {
        const auto n = parseUInt(*p);
        if (!n || *n == 0) return invalid("sync: --parallel must be a positive integer");
        opts.maxParallel = *n;
    }

    model::Report report;
    try {
        report = call.deps->orchestrator->sync(target, opts);
    } catch (const std::exception& e) {
        return fail("sync", e);
    }

    const int code = report.ok() ? 0 : 1;

    if (hasFlag(call, "json")) {
        const nlohmann::json data = report;
        return {code, data.dump(2), "", data, true};
    }

    if (report.outcomes.empty()) return {1, "", "sync: no submodules configured, nothing to sync"};

    std::string out;
    for (const auto& o : report.outcomes) out += o.line() + "\n";
    out += report.summary() + "\n";

    std::string err;
    if (report.cancelled) err = "sync: cancelled";
    else if (!report.ok()) err = "sync: no submodule was synced successfully";

    return {code, out, err};
}

namespace ms::shell::commands {

void registerSyncCommands(const std::shared_ptr<Router>& r) {
    r->registerCommand({"sync", "[<name>|all|a,b,...] [--dry-run] [--json] [--parallel n]",
                        "Mirror submodules to their sibling directories", {}},
                       handle_sync);
}

}
