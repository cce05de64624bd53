/**
 * @file process_utils.cpp
 * @brief fork/exec based command execution with deadline enforcement
 *
 * **Execution model**:
 * ```
 * parent                         child
 *   pipe2(stdout, stderr, exec-status)  (all O_CLOEXEC)
 *   fork ───────────────────────► setpgid(0, 0)
 *                                  dup2 pipes onto fd 1/2, /dev/null onto fd 0
 *                                  execvp(argv[0])  ── failure: errno → exec-status
 *   read exec-status (EOF = exec ok)
 *   poll stdout/stderr until exit or deadline
 *   deadline: kill(-pgid, SIGKILL), reap
 * ```
 *
 * Unlike popen() there is no shell between us and the program, so arguments
 * never need quoting and the deadline applies to the real process.
 *
 * @date 2025
 */

#include "renju/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace renju {
namespace utils {

namespace {

// ============================================================================
// FILE DESCRIPTOR HELPERS
// ============================================================================

class ScopedFd {
public:
    ScopedFd() = default;
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { Close(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int Get() const { return fd_; }
    void Reset(int fd) {
        Close();
        fd_ = fd;
    }
    void Close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

bool MakePipe(ScopedFd& read_end, ScopedFd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return true;
}

/**
 * @brief Read everything currently available from a non-blocking fd
 * @return false once the write side is closed (EOF or hard error)
 */
bool DrainFd(int fd, std::string& sink, bool& truncated, std::size_t cap) {
    std::array<char, 4096> buffer;
    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            std::size_t room = sink.size() < cap ? cap - sink.size() : 0;
            std::size_t keep = std::min(room, static_cast<std::size_t>(n));
            sink.append(buffer.data(), keep);
            if (keep < static_cast<std::size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout,
                         std::size_t max_output_bytes) {
    ProcessResult result;

    if (argv.empty()) {
        result.error = "empty command line";
        return result;
    }

    ScopedFd out_read, out_write, err_read, err_write, status_read, status_write;
    if (!MakePipe(out_read, out_write) || !MakePipe(err_read, err_write) ||
        !MakePipe(status_read, status_write)) {
        result.error = std::string("failed to create pipes: ") + std::strerror(errno);
        return result;
    }

    // Built before fork: the child may only call async-signal-safe functions
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    spdlog::debug("Executing: {}", FormatCommandLine(argv));

    auto start_time = std::chrono::steady_clock::now();
    auto deadline = start_time + timeout;

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_write.Get(), STDOUT_FILENO);
        ::dup2(err_write.Get(), STDERR_FILENO);
        ::execvp(args[0], args.data());
        int exec_errno = errno;
        ssize_t ignored = ::write(status_write.Get(), &exec_errno, sizeof(exec_errno));
        (void)ignored;
        ::_exit(127);
    }

    // Both sides call setpgid so the group exists before any kill below
    ::setpgid(pid, pid);

    out_write.Close();
    err_write.Close();
    status_write.Close();

    int exec_errno = 0;
    ssize_t status_bytes;
    do {
        status_bytes = ::read(status_read.Get(), &exec_errno, sizeof(exec_errno));
    } while (status_bytes < 0 && errno == EINTR);

    if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        result.error = "failed to execute " + argv[0] + ": " + std::strerror(exec_errno);
        spdlog::debug("{}", result.error);
        return result;
    }

    result.launched = true;

    ::fcntl(out_read.Get(), F_SETFL, O_NONBLOCK);
    ::fcntl(err_read.Get(), F_SETFL, O_NONBLOCK);

    bool out_open = true;
    bool err_open = true;
    int status = 0;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            // Kill the whole group so grandchildren cannot keep pipes alive
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            result.timed_out = true;
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int wait_ms = static_cast<int>(std::min<long long>(remaining.count() + 1, 50));

        if (out_open || err_open) {
            std::array<pollfd, 2> fds{};
            nfds_t count = 0;
            if (out_open) {
                fds[count++] = pollfd{out_read.Get(), POLLIN, 0};
            }
            if (err_open) {
                fds[count++] = pollfd{err_read.Get(), POLLIN, 0};
            }
            ::poll(fds.data(), count, wait_ms);
            if (out_open) {
                out_open = DrainFd(out_read.Get(), result.stdout_output,
                                   result.stdout_truncated, max_output_bytes);
            }
            if (err_open) {
                err_open = DrainFd(err_read.Get(), result.stderr_output,
                                   result.stderr_truncated, max_output_bytes);
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(wait_ms, 10)));
        }

        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            // Pick up whatever the child wrote right before exiting
            if (out_open) {
                DrainFd(out_read.Get(), result.stdout_output,
                        result.stdout_truncated, max_output_bytes);
            }
            if (err_open) {
                DrainFd(err_read.Get(), result.stderr_output,
                        result.stderr_truncated, max_output_bytes);
            }
            break;
        }
        if (waited < 0 && errno != EINTR) {
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
            break;
        }
    }

    result.exit_code = (result.timed_out || !result.error.empty()) ? -1 : DecodeWaitStatus(status);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (result.timed_out) {
        spdlog::debug("Command killed after {} ms: {}", result.duration.count(), argv[0]);
    }

    return result;
}

std::string FormatCommandLine(const std::vector<std::string>& argv) {
    std::ostringstream cmd;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            cmd << ' ';
        }
        const auto& arg = argv[i];
        if (arg.empty() || arg.find_first_of(" \t\"'$\\") != std::string::npos) {
            cmd << '"' << arg << '"';
        } else {
            cmd << arg;
        }
    }
    return cmd.str();
}

} // namespace utils
} // namespace renju
