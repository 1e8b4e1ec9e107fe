#pragma once

#include <filesystem>

namespace ms::vcs {

// Version-control side effects of configuration changes. Failures are never fatal.
class Client {
public:
    virtual ~Client() = default;

    // Stage the configuration artifact after a successful write.
    virtual void recordConfigChange(const std::filesystem::path& artifact) = 0;
};

// Used when staging is disabled.
class NullClient final : public Client {
public:
    void recordConfigChange(const std::filesystem::path&) override {}
};

}
