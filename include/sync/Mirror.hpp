#pragma once

#include "sync/RuleEngine.hpp"

#include <filesystem>
#include <string>

namespace ms::sync {

struct MirrorRequest {
    std::string submodule;
    std::filesystem::path source;
    std::filesystem::path destination;
    RuleSet rules;
    bool deleteExtraneous = true;
    bool checksum = false;
    bool dryRun = false;
};

struct MirrorResult {
    int exit_code = 0;
    std::string diagnostics;  // stderr of the collaborator, verbatim
    std::string output;

    [[nodiscard]] bool ok() const { return exit_code == 0; }
};

// The file-mirroring collaborator. Implementations block until the copy finishes
// and must tolerate concurrent calls for different destinations.
class Mirror {
public:
    virtual ~Mirror() = default;

    virtual MirrorResult run(const MirrorRequest& req) = 0;
};

}
