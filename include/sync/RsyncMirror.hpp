#pragma once

#include "sync/Mirror.hpp"

#include <string>
#include <vector>

namespace ms::sync {

class RsyncMirror final : public Mirror {
public:
    explicit RsyncMirror(std::string executable = "rsync", std::vector<std::string> extraArgs = {});

    MirrorResult run(const MirrorRequest& req) override;

    [[nodiscard]] std::vector<std::string> buildArgs(const MirrorRequest& req) const;

private:
    std::string executable_;
    std::vector<std::string> extraArgs_;
};

}
