#include "vcs/Git.hpp"
#include "util/process.hpp"
#include "logging/LogRegistry.hpp"

#include <vector>

using namespace ms::vcs;
using namespace ms::util;
using namespace ms::logging;

Git::Git(std::filesystem::path root, std::string executable)
    : root_(std::move(root)), executable_(std::move(executable)) {}

bool Git::isWorkTree() const {
    try {
        const auto res = runProcess({executable_, "-C", root_.string(), "rev-parse", "--is-inside-work-tree"});
        return res.ok() && res.stdout_text.starts_with("true");
    } catch (const std::exception& e) {
        LogRegistry::vcs()->warn("[Git] Unable to run {}: {}", executable_, e.what());
        return false;
    }
}

void Git::recordConfigChange(const std::filesystem::path& artifact) {
    if (!isWorkTree()) {
        LogRegistry::vcs()->debug("[Git] {} is not a git work tree, not staging", root_.string());
        return;
    }

    const auto rel = artifact.lexically_relative(root_);
    const std::vector<std::string> argv{executable_, "-C", root_.string(), "add", "--", rel.string()};

    try {
        const auto res = runProcess(argv);
        if (!res.ok()) {
            LogRegistry::vcs()->warn("[Git] '{}' exited with {}: {}", quoteArgs(argv), res.exit_code, res.stderr_text);
            return;
        }
        LogRegistry::vcs()->info("[Git] Staged {}", rel.string());
    } catch (const std::exception& e) {
        LogRegistry::vcs()->warn("[Git] Failed to stage {}: {}", rel.string(), e.what());
    }
}
