#pragma once

#include <stdexcept>
#include <string>

namespace ms::types {

enum class ErrorKind {
    NotInitialized,
    DuplicateSubmodule,
    UnknownSubmodule,
    NotASubdirectory,
    SiblingNotFound,
    InvalidName,
    InvalidRule,
    VacuousRuleSet,
    ConfigCorrupt,
    SyncFailed,
    SyncSkipped,
};

std::string to_string(ErrorKind kind);

// Every failure the core reports names its kind and, when one is involved, the submodule.
struct Error : std::runtime_error {
    Error(ErrorKind kind, const std::string& reason, const std::string& submodule = {});

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& submodule() const noexcept { return submodule_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

private:
    ErrorKind kind_;
    std::string submodule_;
    std::string reason_;
};

}
