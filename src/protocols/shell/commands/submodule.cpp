#include "protocols/shell/commands/all.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "config/ConfigRegistry.hpp"
#include "paths/PathResolver.hpp"
#include "registry/SubmoduleRegistry.hpp"
#include "runtime/Deps.hpp"
#include "sync/RuleEngine.hpp"
#include "types/Error.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

using namespace ms::shell;
using namespace ms::types;
using namespace ms::config;
using namespace ms::logging;

static CommandResult requireOneName(const CommandCall& call, const std::string& cmd, std::string& name) {
    if (call.positionals.empty()) return invalid(cmd + ": missing <name>");
    if (call.positionals.size() > 1) return invalid(cmd + ": too many arguments");
    name = call.positionals[0];
    return ok("");
}

static CommandResult handle_add(const CommandCall& call) {
    std::string name;
    if (auto r = requireOneName(call, "add", name); r.exit_code != 0) return r;

    auto parsed = parseRuleFlags(call, "add");
    if (!parsed.ok) return invalid(parsed.error);

    const bool useDefaults = hasFlag(call, "defaults");
    if (useDefaults && parsed.given) return invalid("add: --defaults cannot be combined with --include/--exclude");
    if (useDefaults) parsed.rules = ConfigRegistry::get().defaultRules();

    const strategy::Mirror mirror{.checksum = hasFlag(call, "checksum")};

    try {
        const auto sub = call.deps->registry->add(name, parsed.rules, mirror);
        std::string out = "Added submodule:\n" + to_string(sub);
        if (sub.rules.empty())
            out += "Note: '" + name + "' has no rules and is skipped by sync until rules are added.\n";
        return ok(out);
    } catch (const std::exception& e) {
        return fail("add", e);
    }
}

static CommandResult handle_remove(const CommandCall& call) {
    std::string name;
    if (auto r = requireOneName(call, "remove", name); r.exit_code != 0) return r;

    try {
        call.deps->registry->remove(name);
        std::string out = "Removed submodule '" + name + "'.";
        try {
            out += " Files already mirrored to " + ms::paths::siblingPathFor(call.deps->root, name).string() + " were left in place.";
        } catch (const Error& e) {
            LogRegistry::shell()->debug("[remove] No sibling path for '{}': {}", name, e.what());
        }
        return ok(out);
    } catch (const std::exception& e) {
        return fail("remove", e);
    }
}

static CommandResult handle_update(const CommandCall& call) {
    std::string name;
    if (auto r = requireOneName(call, "update", name); r.exit_code != 0) return r;

    const auto parsed = parseRuleFlags(call, "update");
    if (!parsed.ok) return invalid(parsed.error);

    const bool checksumOn = hasFlag(call, "checksum");
    const bool checksumOff = hasFlag(call, "no-checksum");
    if (checksumOn && checksumOff) return invalid("update: --checksum and --no-checksum are mutually exclusive");
    if (!parsed.given && !checksumOn && !checksumOff)
        return invalid("update: nothing to change, pass --include/--exclude or --checksum/--no-checksum");

    try {
        const auto sub = call.deps->registry->update(name, [&](Submodule& s) {
            if (parsed.given) s.rules = parsed.rules;
            if (checksumOn || checksumOff)
                std::visit([&](auto& strat) { strat.checksum = checksumOn; }, s.strategy);
        });
        return ok("Updated submodule:\n" + to_string(sub));
    } catch (const std::exception& e) {
        return fail("update", e);
    }
}

static CommandResult handle_list(const CommandCall& call) {
    if (!call.positionals.empty()) return invalid("list: unexpected argument '" + call.positionals[0] + "'");

    try {
        const auto subs = call.deps->registry->list();

        if (hasFlag(call, "json")) {
            const nlohmann::json data = subs;
            return ok(data.dump(2), data);
        }

        if (subs.empty()) return ok("No submodules configured.");

        std::string out;
        for (const auto& s : subs)
            out += fmt::format("{:<24} {:<8} {} rule(s)\n", s.name, strategyName(s.strategy), s.rules.size());
        return ok(out);
    } catch (const std::exception& e) {
        return fail("list", e);
    }
}

static CommandResult handle_show(const CommandCall& call) {
    std::string name;
    if (auto r = requireOneName(call, "show", name); r.exit_code != 0) return r;

    try {
        const auto sub = call.deps->registry->get(name);
        std::string out = to_string(sub);

        try {
            const auto binding = ms::paths::resolve(call.deps->root, name);
            out += "sibling: " + binding.sibling.string() + "\n";
        } catch (const Error& e) {
            out += "sibling: unavailable [" + to_string(e.kind()) + "] " + e.reason() + "\n";
        }
        return ok(out);
    } catch (const std::exception& e) {
        return fail("show", e);
    }
}

static CommandResult handle_check(const CommandCall& call) {
    if (call.positionals.size() < 2) return invalid("check: usage: check <name> <path>...");
    const auto& name = call.positionals[0];

    try {
        const auto sub = call.deps->registry->get(name);
        const auto rules = ms::sync::RuleEngine::compile(sub.rules, name);
        const auto source = call.deps->root / name;

        std::string out;
        for (size_t i = 1; i < call.positionals.size(); ++i) {
            auto rel = call.positionals[i];
            bool isDir = false;
            while (rel.size() > 1 && rel.back() == '/') {
                rel.pop_back();
                isDir = true;
            }
            std::error_code ec;
            if (!isDir) isDir = fs::is_directory(source / rel, ec);

            const auto d = rules.decide(rel, isDir);
            std::string why;
            if (d.implicit) why = "implicit - *";
            else if (d.rule) why = fmt::format("rule {}: {}", *d.rule + 1, rules.rules()[*d.rule].str());
            if (d.decidedAt != rel) why += ", via " + d.decidedAt;

            out += fmt::format("{:<8} {}{} ({})\n", to_string(d.kind), rel, isDir ? "/" : "", why);
        }
        return ok(out);
    } catch (const std::exception& e) {
        return fail("check", e);
    }
}

namespace ms::shell::commands {

void registerSubmoduleCommands(const std::shared_ptr<Router>& r) {
    r->registerCommand({"add", "<name> [--include p]... [--exclude p]... [--defaults] [--checksum]",
                        "Register an immediate subdirectory as a submodule", {}},
                       handle_add);
    r->registerCommand({"remove", "<name>", "Unregister a submodule (mirrored files are kept)", {"rm"}},
                       handle_remove);
    r->registerCommand({"update", "<name> [--include p]... [--exclude p]... [--checksum|--no-checksum]",
                        "Replace a submodule's rules or change its strategy options", {}},
                       handle_update);
    r->registerCommand({"list", "[--json]", "List submodules in registration order", {"ls"}},
                       handle_list);
    r->registerCommand({"show", "<name>", "Show a submodule's rules and resolved sibling", {}},
                       handle_show);
    r->registerCommand({"check", "<name> <path>...", "Evaluate paths against a submodule's rules", {}},
                       handle_check);
}

}
