#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>

namespace ms::sync {

// One mutex per destination directory, keyed by its canonical path so symlinked aliases share it.
class SiblingLocks {
public:
    [[nodiscard]] std::unique_lock<std::mutex> acquire(const std::filesystem::path& sibling);

private:
    std::mutex mapMutex_;
    std::map<std::filesystem::path, std::unique_ptr<std::mutex>> locks_;
};

}
