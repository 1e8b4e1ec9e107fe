#pragma once

#include <filesystem>

namespace ms::util {

// Exclusive advisory lock (flock) held for the object's lifetime.
class FileLock {
public:
    explicit FileLock(std::filesystem::path p);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    std::filesystem::path path_;
    int fd_{-1};
};

}
