#include "sync/Orchestrator.hpp"
#include "sync/Mirror.hpp"
#include "registry/SubmoduleRegistry.hpp"
#include "concurrency/ThreadPool.hpp"
#include "types/Error.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::types;
using namespace ms::logging;

namespace {

std::string trimDiagnostics(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

std::vector<std::string> splitTargets(const std::string& target) {
    std::vector<std::string> out;
    std::stringstream ss(target);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto b = item.find_first_not_of(" \t");
        if (b == std::string::npos) continue;
        const auto e = item.find_last_not_of(" \t");
        out.push_back(item.substr(b, e - b + 1));
    }
    return out;
}

bool isWithin(const fs::path& inner, const fs::path& outer) {
    auto [o, i] = std::mismatch(outer.begin(), outer.end(), inner.begin(), inner.end());
    return o == outer.end();
}

// One struct per strategy alternative; adding a strategy without a handler fails to compile.
struct StrategyRunner {
    Mirror& mirror;
    MirrorRequest& req;

    MirrorResult operator()(const ms::types::strategy::Mirror& m) const {
        req.deleteExtraneous = true;
        req.checksum = m.checksum;
        return mirror.run(req);
    }
};

}

Orchestrator::Orchestrator(std::shared_ptr<registry::SubmoduleRegistry> registry,
                           std::shared_ptr<Mirror> mirror,
                           std::shared_ptr<std::atomic<bool>> interruptFlag)
    : registry_(std::move(registry)),
      mirror_(std::move(mirror)),
      interruptFlag_(interruptFlag ? std::move(interruptFlag) : std::make_shared<std::atomic<bool>>(false)) {
    if (!registry_) throw std::invalid_argument("Orchestrator requires a SubmoduleRegistry");
    if (!mirror_) throw std::invalid_argument("Orchestrator requires a Mirror");
}

std::vector<Submodule> Orchestrator::selectTargets(const MonorepoConfig& cfg, const std::string& target) {
    if (target.empty() || target == "all") return cfg.submodules;

    const auto names = splitTargets(target);
    if (names.empty()) throw Error(ErrorKind::UnknownSubmodule, "empty sync target '" + target + "'");

    std::set<std::string> wanted;
    for (const auto& n : names) {
        if (!cfg.contains(n)) throw Error(ErrorKind::UnknownSubmodule, "not a registered submodule", n);
        wanted.insert(n);
    }

    std::vector<Submodule> out;
    for (const auto& s : cfg.submodules)
        if (wanted.contains(s.name)) out.push_back(s);
    return out;
}

Report Orchestrator::sync(const std::string& target, const SyncOptions& opts) {
    const auto cfg = registry_->snapshot();
    const auto& root = registry_->root();
    const auto targets = selectTargets(cfg, target);

    LogRegistry::sync()->info("[Orchestrator] Syncing {} submodule(s) from {}{}", targets.size(), root.string(),
                              opts.dryRun ? " (dry run)" : "");

    Report report;
    report.outcomes.resize(targets.size());

    std::vector<std::optional<Plan>> plans(targets.size());
    std::vector<Plan*> runnable;
    std::vector<Outcome*> slots;

    for (size_t i = 0; i < targets.size(); ++i) {
        auto prepared = prepare(root, targets[i]);
        if (auto* skip = std::get_if<Outcome>(&prepared)) {
            LogRegistry::sync()->warn("[Orchestrator] {}", skip->line());
            report.outcomes[i] = std::move(*skip);
            continue;
        }
        plans[i] = std::move(std::get<Plan>(prepared));
        runnable.push_back(&*plans[i]);
        slots.push_back(&report.outcomes[i]);
    }

    if (opts.maxParallel > 1 && runnable.size() > 1 && siblingsDisjoint(runnable))
        runParallel(runnable, slots, opts);
    else
        runSequential(runnable, slots, opts);

    report.cancelled = cancelled();

    LogRegistry::sync()->info("[Orchestrator] {}", report.summary());
    return report;
}

std::variant<Orchestrator::Plan, Outcome> Orchestrator::prepare(const fs::path& root, const Submodule& sub) const {
    try {
        if (!paths::isImmediateChildDir(root, sub.name))
            return Outcome::skipped(sub.name, ErrorKind::NotASubdirectory,
                                    "source directory " + (root / sub.name).string() + " is missing");

        auto binding = paths::resolve(root, sub.name);
        auto rules = RuleEngine::compile(sub.rules, sub.name);
        return Plan{sub, std::move(binding), std::move(rules)};
    } catch (const Error& e) {
        return Outcome::skipped(sub.name, e.kind(), e.reason());
    }
}

Outcome Orchestrator::execute(const Plan& plan, const SyncOptions& opts) {
    const auto& name = plan.submodule.name;

    if (cancelled()) return Outcome::skipped(name, ErrorKind::SyncSkipped, "cancelled");

    auto guard = siblingLocks_.acquire(plan.binding.sibling);

    // the flag may have been raised while waiting for the sibling
    if (cancelled()) return Outcome::skipped(name, ErrorKind::SyncSkipped, "cancelled");

    MirrorRequest req{
        .submodule = name,
        .source = plan.binding.source,
        .destination = plan.binding.sibling,
        .rules = plan.rules,
        .dryRun = opts.dryRun,
    };

    LogRegistry::sync()->debug("[Orchestrator] {}: {} -> {} with {} rules", name, req.source.string(),
                               req.destination.string(), plan.rules.rules().size());

    try {
        const auto res = std::visit(StrategyRunner{*mirror_, req}, plan.submodule.strategy);
        if (res.ok()) {
            auto o = Outcome::succeeded(name, plan.binding.sibling);
            LogRegistry::sync()->info("[Orchestrator] {}", o.line());
            return o;
        }

        auto diag = trimDiagnostics(res.diagnostics);
        if (diag.empty()) diag = "mirroring tool exited with status " + std::to_string(res.exit_code);
        auto o = Outcome::failed(name, plan.binding.sibling, res.exit_code, std::move(diag));
        LogRegistry::sync()->error("[Orchestrator] {}", o.line());
        return o;
    } catch (const std::exception& e) {
        auto o = Outcome::failed(name, plan.binding.sibling, std::nullopt, e.what());
        LogRegistry::sync()->error("[Orchestrator] {}", o.line());
        return o;
    }
}

void Orchestrator::runSequential(const std::vector<Plan*>& plans, std::vector<Outcome*>& slots, const SyncOptions& opts) {
    for (size_t i = 0; i < plans.size(); ++i) *slots[i] = execute(*plans[i], opts);
}

void Orchestrator::runParallel(const std::vector<Plan*>& plans, std::vector<Outcome*>& slots, const SyncOptions& opts) {
    const auto workers = std::min<unsigned int>(opts.maxParallel, static_cast<unsigned int>(plans.size()));
    concurrency::ThreadPool pool(workers);
    LogRegistry::sync()->debug("[Orchestrator] Running {} submodules on {} workers", plans.size(), pool.workerCount());
    std::vector<std::future<void>> futures;
    futures.reserve(plans.size());

    for (size_t i = 0; i < plans.size(); ++i) {
        auto task = std::make_shared<concurrency::PromisedTask>([this, &plans, &slots, &opts, i] {
            *slots[i] = execute(*plans[i], opts);
        });
        futures.push_back(std::move(*task->getFuture()));
        pool.submit(task);
    }

    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            futures[i].get();
        } catch (const std::exception& e) {
            *slots[i] = Outcome::failed(plans[i]->submodule.name, plans[i]->binding.sibling, std::nullopt, e.what());
        }
    }
}

bool Orchestrator::siblingsDisjoint(const std::vector<Plan*>& plans) {
    std::vector<fs::path> canon;
    canon.reserve(plans.size());
    for (const auto* p : plans) {
        std::error_code ec;
        auto c = fs::weakly_canonical(p->binding.sibling, ec);
        canon.push_back(ec ? p->binding.sibling : c);
    }

    for (size_t i = 0; i < canon.size(); ++i)
        for (size_t j = i + 1; j < canon.size(); ++j)
            if (isWithin(canon[i], canon[j]) || isWithin(canon[j], canon[i])) {
                LogRegistry::sync()->info("[Orchestrator] {} and {} overlap on disk, running sequentially",
                                          plans[i]->submodule.name, plans[j]->submodule.name);
                return false;
            }
    return true;
}
