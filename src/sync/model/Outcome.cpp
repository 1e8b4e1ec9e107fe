#include "sync/model/Outcome.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace ms::sync::model;
using namespace ms::types;

namespace ms::sync::model {

std::string to_string(const OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Succeeded: return "succeeded";
        case OutcomeKind::Failed: return "failed";
        case OutcomeKind::Skipped: return "skipped";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const Outcome& o) {
    j = {
        {"submodule", o.submodule},
        {"outcome", to_string(o.kind)},
        {"reason", o.reason},
    };
    if (o.error) j["error"] = ms::types::to_string(*o.error);
    if (o.exit_code) j["exit_code"] = *o.exit_code;
    if (!o.sibling.empty()) j["sibling"] = o.sibling.string();
}

void to_json(nlohmann::json& j, const Report& r) {
    j = {
        {"outcomes", r.outcomes},
        {"succeeded", r.succeeded()},
        {"failed", r.failed()},
        {"skipped", r.skipped()},
        {"cancelled", r.cancelled},
        {"ok", r.ok()},
    };
}

}

Outcome Outcome::succeeded(const std::string& submodule, const std::filesystem::path& sibling) {
    Outcome o;
    o.submodule = submodule;
    o.kind = OutcomeKind::Succeeded;
    o.exit_code = 0;
    o.sibling = sibling;
    return o;
}

Outcome Outcome::failed(const std::string& submodule, const std::filesystem::path& sibling, const std::optional<int> exitCode, std::string diagnostics) {
    Outcome o;
    o.submodule = submodule;
    o.kind = OutcomeKind::Failed;
    o.error = ErrorKind::SyncFailed;
    o.exit_code = exitCode;
    o.reason = std::move(diagnostics);
    o.sibling = sibling;
    return o;
}

Outcome Outcome::skipped(const std::string& submodule, const std::optional<ErrorKind> cause, std::string reason) {
    Outcome o;
    o.submodule = submodule;
    o.kind = OutcomeKind::Skipped;
    o.error = cause;
    o.reason = std::move(reason);
    return o;
}

std::string Outcome::line() const {
    switch (kind) {
        case OutcomeKind::Succeeded:
            return fmt::format("{}: synced -> {}", submodule, sibling.string());
        case OutcomeKind::Failed:
            if (exit_code) return fmt::format("{}: FAILED (exit {}): {}", submodule, *exit_code, reason);
            return fmt::format("{}: FAILED: {}", submodule, reason);
        case OutcomeKind::Skipped:
            return fmt::format("{}: skipped ({}): {}", submodule, ms::types::to_string(error.value_or(ErrorKind::SyncSkipped)), reason);
    }
    return submodule;
}

size_t Report::succeeded() const {
    return std::ranges::count_if(outcomes, [](const Outcome& o) { return o.kind == OutcomeKind::Succeeded; });
}

size_t Report::failed() const {
    return std::ranges::count_if(outcomes, [](const Outcome& o) { return o.kind == OutcomeKind::Failed; });
}

size_t Report::skipped() const {
    return std::ranges::count_if(outcomes, [](const Outcome& o) { return o.kind == OutcomeKind::Skipped; });
}

bool Report::ok() const { return !cancelled && succeeded() > 0; }

std::string Report::summary() const {
    auto s = fmt::format("{} succeeded, {} failed, {} skipped", succeeded(), failed(), skipped());
    if (cancelled) s += " (cancelled)";
    return s;
}
