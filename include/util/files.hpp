#pragma once

#include <filesystem>
#include <string>

namespace ms::util {

std::string readFileToString(const std::filesystem::path& path);

// Write-temp, fsync, rename over the target, fsync the directory.
// Either the previous file survives untouched or the new content is fully in place.
void writeFileAtomic(const std::filesystem::path& path, const std::string& content);

std::string generate_random_suffix(size_t length = 8);

}
