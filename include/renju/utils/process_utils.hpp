/**
 * @file process_utils.hpp
 * @brief Deadline-bounded child process execution with output capture
 *
 * Runs an argument vector (no shell) in its own process group, captures
 * stdout and stderr separately and enforces a hard wall-clock deadline.
 * When the deadline passes the whole process group receives SIGKILL, so a
 * hung docker CLI call can never block its caller.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstddef>

namespace renju {
namespace utils {

/// Default cap on bytes kept per captured stream
constexpr std::size_t kDefaultMaxOutputBytes = 1024 * 1024;

/**
 * @struct ProcessResult
 * @brief Result of a child process run
 */
struct ProcessResult {
    bool launched{false};                   ///< Child was exec'd successfully
    bool timed_out{false};                  ///< Deadline reached, child killed
    int exit_code{-1};                      ///< Exit status (128 + signal when signaled)
    std::string stdout_output;              ///< Captured standard output
    std::string stderr_output;              ///< Captured standard error
    bool stdout_truncated{false};           ///< Stdout exceeded the cap
    bool stderr_truncated{false};           ///< Stderr exceeded the cap
    std::string error;                      ///< Launch error description
    std::chrono::milliseconds duration{0};  ///< Wall-clock runtime

    /// Launched, finished in time and exited zero
    bool Succeeded() const { return launched && !timed_out && exit_code == 0; }
};

/**
 * @brief Run a command and wait for it, bounded by a deadline
 *
 * @param argv Program and arguments; argv[0] is looked up in PATH
 * @param timeout Maximum wall-clock time before the process group is killed
 * @param max_output_bytes Bytes kept per stream; the rest is drained and dropped
 * @return ProcessResult; never throws for child failures
 *
 * **Example**:
 * @code
 * auto result = RunProcess({"docker", "--version"}, std::chrono::seconds(5));
 * if (result.Succeeded()) {
 *     spdlog::info("docker: {}", result.stdout_output);
 * }
 * @endcode
 */
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout,
                         std::size_t max_output_bytes = kDefaultMaxOutputBytes);

/**
 * @brief Render an argv as a shell-like string for logging
 */
std::string FormatCommandLine(const std::vector<std::string>& argv);

} // namespace utils
} // namespace renju
