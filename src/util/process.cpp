#include "util/process.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <algorithm>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>

namespace ms::util {

static void writeAll(const int fd, const std::string& s) {
    const char* p = s.data();
    size_t left = s.size();
    while (left) {
        const ssize_t n = ::write(fd, p, left);
        if (n <= 0) return;
        p += n;
        left -= static_cast<size_t>(n);
    }
}

static void closePipe(int (&fds)[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

ProcessResult runProcess(const std::vector<std::string>& argv, const std::optional<std::filesystem::path>& cwd) {
    if (argv.empty()) throw std::invalid_argument("runProcess: empty argument vector");

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) == -1) throw std::runtime_error("Failed to create stdout pipe");
    if (::pipe2(errPipe, O_CLOEXEC) == -1) {
        closePipe(outPipe);
        throw std::runtime_error("Failed to create stderr pipe");
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    // the child of a multithreaded parent may not allocate, so its messages are built here
    const std::string chdirFailed = cwd ? fmt::format("chdir {}: no such directory or not accessible\n", cwd->string()) : "";
    const std::string execFailed = fmt::format("exec {}: not found or not executable\n", argv[0]);

    const pid_t pid = ::fork();
    if (pid < 0) {
        closePipe(outPipe);
        closePipe(errPipe);
        throw std::runtime_error(fmt::format("Failed to fork '{}': {}", argv[0], std::strerror(errno)));
    }

    if (pid == 0) {
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);

        if (cwd && ::chdir(cwd->c_str()) != 0) {
            writeAll(STDERR_FILENO, chdirFailed);
            _exit(127);
        }

        ::execvp(cargv[0], cargv.data());
        writeAll(STDERR_FILENO, execFailed);
        _exit(127);
    }

    ::close(outPipe[1]);
    ::close(errPipe[1]);

    ProcessResult result;
    std::array<pollfd, 2> fds{{{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}}};
    std::array<std::string*, 2> sinks{&result.stdout_text, &result.stderr_text};
    std::array<char, 4096> buf{};
    int open = 2;

    while (open > 0) {
        if (::poll(fds.data(), fds.size(), -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            const ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
            if (n > 0) {
                sinks[i]->append(buf.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --open;
            }
        }
    }
    for (const auto& p : fds) if (p.fd >= 0) ::close(p.fd);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error(fmt::format("waitpid failed for '{}': {}", argv[0], std::strerror(errno)));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.exit_code = 128 + WTERMSIG(status);
    }

    return result;
}

std::string quoteArgs(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        const bool needsQuotes = a.empty() || std::ranges::any_of(a, [](const char c) {
            return c == ' ' || c == '\t' || c == '"' || c == '\'' || c == '\\' || c == '*' || c == '?';
        });
        if (!needsQuotes) { out += a; continue; }
        out += '\'';
        for (const char c : a) {
            if (c == '\'') out += "'\\''";
            else out += c;
        }
        out += '\'';
    }
    return out;
}

}
