// process.cpp - fork/execvp with combined output capture.

#include "io/process.hpp"

#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string_view>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tzupdater {

namespace {

Result Errno(const std::string& what) {
    const int err = errno;
    return Result::Fail(ErrorKind::IoError, err, what + ": " + std::strerror(err));
}

// Child side; only async-signal-safe calls past fork().
[[noreturn]] void ExecChild(char* const* args, int out_fd, int status_fd) {
    if (::dup2(out_fd, STDOUT_FILENO) < 0 || ::dup2(out_fd, STDERR_FILENO) < 0) {
        const int err = errno;
        (void)!::write(status_fd, &err, sizeof(err));
        ::_exit(127);
    }

    ::execvp(args[0], args);

    const int err = errno;
    (void)!::write(status_fd, &err, sizeof(err));
    ::_exit(127);
}

} // namespace

Result RunProcess(const std::vector<std::string>& argv, ProcessOutput& out) {
    out = ProcessOutput{};
    if (argv.empty() || argv.front().empty())
        return Result::Fail(ErrorKind::InvalidArgument, "RunProcess: empty argv");

    Fd out_r, out_w;
    auto pr = Fd::MakePipe(out_r, out_w);
    if (!pr.is_ok()) return pr;

    // Closed on successful exec; carries errno otherwise.
    Fd status_r, status_w;
    auto sr = Fd::MakePipe(status_r, status_w);
    if (!sr.is_ok()) return sr;

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv)
        args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) return Errno("fork failed");

    if (pid == 0) {
        ExecChild(args.data(), out_w.Get(), status_w.Get());
    }

    out_w.Close();
    status_w.Close();

    char buf[4096];
    while (true) {
        const ssize_t n = ::read(out_r.Get(), buf, sizeof(buf));
        if (n > 0) {
            out.output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) break;
        if (errno == EINTR) continue;
        break;
    }

    int exec_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(status_r.Get(), &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);

    int status = 0;
    pid_t w = 0;
    do {
        w = ::waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w < 0) return Errno("waitpid failed");

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        return Result::Fail(ErrorKind::IoError, exec_errno,
                            "cannot execute " + argv.front() + ": " + std::strerror(exec_errno));
    }

    if (WIFEXITED(status)) {
        out.exit_status = WEXITSTATUS(status);
    } else {
        out.exit_status = -1;
    }
    return Result::Ok();
}

bool FindExecutable(const std::string& name, const std::string& search_path, std::string& out_path) {
    namespace fs = std::filesystem;

    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) {
            out_path = name;
            return true;
        }
        return false;
    }

    std::string_view sv(search_path);
    while (true) {
        const auto pos = sv.find(':');
        std::string_view dir = sv.substr(0, pos);
        if (dir.empty()) dir = ".";

        const fs::path candidate = fs::path(std::string(dir)) / name;
        struct stat st{};
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            ::access(candidate.c_str(), X_OK) == 0) {
            out_path = candidate.string();
            return true;
        }

        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos + 1);
    }
    return false;
}

} // namespace tzupdater
