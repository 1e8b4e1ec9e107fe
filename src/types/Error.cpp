#include "types/Error.hpp"

using namespace ms::types;

static std::string composeMessage(const std::string& reason, const std::string& submodule) {
    if (submodule.empty()) return reason;
    return submodule + ": " + reason;
}

namespace ms::types {

std::string to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotInitialized: return "NotInitialized";
        case ErrorKind::DuplicateSubmodule: return "DuplicateSubmodule";
        case ErrorKind::UnknownSubmodule: return "UnknownSubmodule";
        case ErrorKind::NotASubdirectory: return "NotASubdirectory";
        case ErrorKind::SiblingNotFound: return "SiblingNotFound";
        case ErrorKind::InvalidName: return "InvalidName";
        case ErrorKind::InvalidRule: return "InvalidRule";
        case ErrorKind::VacuousRuleSet: return "VacuousRuleSet";
        case ErrorKind::ConfigCorrupt: return "ConfigCorrupt";
        case ErrorKind::SyncFailed: return "SyncFailed";
        case ErrorKind::SyncSkipped: return "SyncSkipped";
    }
    return "Unknown";
}

}

Error::Error(const ErrorKind kind, const std::string& reason, const std::string& submodule)
    : std::runtime_error(composeMessage(reason, submodule)),
      kind_(kind),
      submodule_(submodule),
      reason_(reason) {}
