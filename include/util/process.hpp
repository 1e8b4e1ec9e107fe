#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ms::util {

struct ProcessResult {
    int exit_code = 0;          // 128 + signal when the child was killed
    bool signaled = false;
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] bool ok() const { return exit_code == 0 && !signaled; }
};

// fork/exec/wait with stdout and stderr captured. A non-zero exit is a result, not an exception;
// only failing to create the child throws. An exec failure reports exit code 127.
ProcessResult runProcess(const std::vector<std::string>& argv,
                         const std::optional<std::filesystem::path>& cwd = std::nullopt);

std::string quoteArgs(const std::vector<std::string>& argv);

}
