#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ms::paths {

// Resolved fresh for every sync; never persisted or cached between runs.
struct SiblingBinding {
    std::string submodule;
    std::filesystem::path source;   // <root>/<name>
    std::filesystem::path sibling;  // <parent of root>/<name>
};

// Throws InvalidName for empty names, "." / "..", and names with separators or NUL.
void validateName(const std::string& name);

// Pure path arithmetic: <parent of root>/<name>. Throws InvalidName when the result would
// escape the parent directory or coincide with the monorepo root itself.
std::filesystem::path siblingPathFor(const std::filesystem::path& root, const std::string& name);

// siblingPathFor() plus an existence check; throws SiblingNotFound when the target is
// missing or is not a directory.
SiblingBinding resolve(const std::filesystem::path& root, const std::string& name);

[[nodiscard]] bool isImmediateChildDir(const std::filesystem::path& root, const std::string& name);

// Nearest ancestor of start (inclusive) that holds a .monorepo directory.
std::optional<std::filesystem::path> findMonorepoRoot(const std::filesystem::path& start);

// Absolute, lexically normal, no trailing separator.
std::filesystem::path normalizeRoot(const std::filesystem::path& root);

}
