#include "paths/PathResolver.hpp"
#include "config/ConfigStore.hpp"
#include "types/Error.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

namespace fs = std::filesystem;

using namespace ms::types;
using namespace ms::logging;

namespace ms::paths {

fs::path normalizeRoot(const fs::path& root) {
    auto p = fs::absolute(root).lexically_normal();
    if (p.has_relative_path() && p.filename().empty()) p = p.parent_path();
    return p;
}

void validateName(const std::string& name) {
    if (name.empty()) throw Error(ErrorKind::InvalidName, "submodule name is empty");
    if (name == "." || name == "..") throw Error(ErrorKind::InvalidName, "submodule name may not be '.' or '..'", name);
    if (std::ranges::any_of(name, [](const char c) { return c == '/' || c == '\\' || c == '\0'; }))
        throw Error(ErrorKind::InvalidName, "submodule name may not contain path separators", name);
    if (name == config::ConfigStore::CONFIG_DIR)
        throw Error(ErrorKind::InvalidName, "submodule name may not be the monorepo config directory", name);
}

fs::path siblingPathFor(const fs::path& root, const std::string& name) {
    validateName(name);

    const auto normRoot = normalizeRoot(root);
    if (!normRoot.has_relative_path())
        throw Error(ErrorKind::SiblingNotFound, "monorepo root " + normRoot.string() + " has no parent directory", name);

    const auto parent = normRoot.parent_path();
    const auto sibling = (parent / name).lexically_normal();

    if (sibling.parent_path() != parent)
        throw Error(ErrorKind::InvalidName, "resolves outside " + parent.string(), name);
    if (sibling == normRoot)
        throw Error(ErrorKind::InvalidName, "sibling target would be the monorepo root itself", name);

    return sibling;
}

SiblingBinding resolve(const fs::path& root, const std::string& name) {
    const auto sibling = siblingPathFor(root, name);

    std::error_code ec;
    const auto st = fs::status(sibling, ec);
    if (ec || !fs::exists(st))
        throw Error(ErrorKind::SiblingNotFound, "sibling directory " + sibling.string() + " does not exist", name);
    if (!fs::is_directory(st))
        throw Error(ErrorKind::SiblingNotFound, "sibling path " + sibling.string() + " is not a directory", name);

    LogRegistry::paths()->debug("[PathResolver] {} -> {}", name, sibling.string());
    return {name, normalizeRoot(root) / name, sibling};
}

bool isImmediateChildDir(const fs::path& root, const std::string& name) {
    validateName(name);
    std::error_code ec;
    return fs::is_directory(normalizeRoot(root) / name, ec);
}

std::optional<fs::path> findMonorepoRoot(const fs::path& start) {
    auto dir = normalizeRoot(start);
    while (true) {
        std::error_code ec;
        if (fs::is_directory(dir / config::ConfigStore::CONFIG_DIR, ec)) return dir;
        if (!dir.has_relative_path()) return std::nullopt;
        dir = dir.parent_path();
    }
}

}
