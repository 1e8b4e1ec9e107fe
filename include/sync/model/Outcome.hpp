#pragma once

#include "types/Error.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ms::sync::model {

enum class OutcomeKind { Succeeded, Failed, Skipped };

std::string to_string(OutcomeKind kind);

struct Outcome {
    std::string submodule;
    OutcomeKind kind{OutcomeKind::Skipped};
    std::optional<types::ErrorKind> error;  // SyncFailed, SyncSkipped cause, ...
    std::string reason;
    std::optional<int> exit_code;            // set once the collaborator ran
    std::filesystem::path sibling;

    static Outcome succeeded(const std::string& submodule, const std::filesystem::path& sibling);
    static Outcome failed(const std::string& submodule, const std::filesystem::path& sibling, std::optional<int> exitCode, std::string diagnostics);
    static Outcome skipped(const std::string& submodule, std::optional<types::ErrorKind> cause, std::string reason);

    // "user_app: synced -> /work/user_app"
    [[nodiscard]] std::string line() const;
};

struct Report {
    std::vector<Outcome> outcomes;  // registry order
    bool cancelled = false;

    [[nodiscard]] size_t succeeded() const;
    [[nodiscard]] size_t failed() const;
    [[nodiscard]] size_t skipped() const;

    // The run fails only when nothing succeeded, or when it was cancelled.
    [[nodiscard]] bool ok() const;

    // "2 succeeded, 0 failed, 1 skipped"
    [[nodiscard]] std::string summary() const;
};

void to_json(nlohmann::json& j, const Outcome& o);
void to_json(nlohmann::json& j, const Report& r);

}
