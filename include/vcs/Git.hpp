#pragma once

#include "vcs/Client.hpp"

#include <filesystem>
#include <string>

namespace ms::vcs {

class Git final : public Client {
public:
    Git(std::filesystem::path root, std::string executable = "git");

    [[nodiscard]] bool isWorkTree() const;

    void recordConfigChange(const std::filesystem::path& artifact) override;

private:
    std::filesystem::path root_;
    std::string executable_;
};

}
