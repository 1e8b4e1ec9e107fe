#include "util/files.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ms::util {

std::string readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (size > 0 && !in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

std::string generate_random_suffix(const size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

static void syncDirectory(const fs::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) return;
    ::fsync(fd);
    ::close(fd);
}

void writeFileAtomic(const fs::path& path, const std::string& content) {
    const auto dir = path.parent_path().empty() ? fs::path(".") : path.parent_path();
    const auto tmp = dir / ("." + path.filename().string() + ".tmp." + generate_random_suffix());

    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) throw std::runtime_error("Failed to create temporary file " + tmp.string() + ": " + std::strerror(errno));

    const auto fail = [&](const std::string& what) {
        const int err = errno;
        ::close(fd);
        std::error_code ec;
        fs::remove(tmp, ec);
        throw std::runtime_error(what + " " + tmp.string() + ": " + std::strerror(err));
    };

    const char* p = content.data();
    size_t left = content.size();
    while (left) {
        const ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("Failed to write");
        }
        p += n;
        left -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) fail("Failed to fsync");
    if (::close(fd) != 0) {
        const int err = errno;
        std::error_code ec;
        fs::remove(tmp, ec);
        throw std::runtime_error("Failed to close " + tmp.string() + ": " + std::strerror(err));
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("Failed to replace " + path.string() + ": " + ec.message());
    }

    syncDirectory(dir);
}

}
