/**
 * @file environment_provider.hpp
 * @brief Abstract execution backend used by the sandbox broker
 *
 * The broker never talks to a container runtime directly. It asks an
 * EnvironmentProvider to create an isolated environment for one artifact,
 * wait for it, collect its output and remove it. DockerProvider is the
 * production implementation; tests inject scripted fakes.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace renju {
namespace core {

/**
 * @struct Outcome
 * @brief Value-or-error result of a single sandbox step
 *
 * Steps report failure through the error string instead of throwing so
 * the broker can fold every failure into one report.
 */
template <typename T>
struct Outcome {
    std::optional<T> value;  ///< Set on success
    std::string error;       ///< Set on failure

    bool ok() const { return value.has_value(); }

    static Outcome Success(T v) {
        Outcome outcome;
        outcome.value = std::move(v);
        return outcome;
    }

    static Outcome Failure(std::string message) {
        Outcome outcome;
        outcome.error = std::move(message);
        return outcome;
    }
};

/**
 * @struct LaunchSpec
 * @brief Everything a provider needs to start one isolated run
 */
struct LaunchSpec {
    std::string name;                       ///< Unique environment name
    std::string image;                      ///< Runtime image
    std::vector<std::string> command;       ///< e.g. {"python", "user_code.py"}

    std::filesystem::path host_directory;   ///< Artifact directory on the host
    std::filesystem::path mount_point;      ///< Where it appears inside
    std::filesystem::path working_dir;      ///< Working directory inside

    // Mandatory constraints
    std::size_t memory_limit_mb{128};
    bool network_enabled{false};
    bool filesystem_writable{false};

    // Hardening
    int cpu_percent{50};
    int pids_limit{10};
    std::size_t tmpfs_size_mb{64};
    std::string user;                       ///< "uid:gid", empty = image default
};

/**
 * @struct SandboxHandle
 * @brief Opaque reference to a created environment
 */
struct SandboxHandle {
    std::string id;    ///< Runtime identifier
    std::string name;  ///< Name from LaunchSpec
};

/**
 * @struct WaitStatus
 * @brief How a wait on an environment ended
 */
struct WaitStatus {
    bool timed_out{false};  ///< Time limit elapsed before exit
    int exit_code{-1};      ///< Exit code when not timed out
    bool oom_killed{false}; ///< Runtime killed it for exceeding memory
};

/**
 * @struct CapturedOutput
 * @brief Output streams of a finished environment
 */
struct CapturedOutput {
    std::string stdout_output;
    std::string stderr_output;
    bool truncated{false};  ///< At least one stream hit the byte cap
};

/**
 * @class EnvironmentProvider
 * @brief Black-box execution backend
 *
 * Implementations must bound every call: Wait by its time limit, the other
 * calls by their own launch/teardown budgets.
 */
class EnvironmentProvider {
public:
    virtual ~EnvironmentProvider() = default;

    /**
     * @brief Create and start an environment
     *
     * If the environment was created but could not be started, the
     * implementation removes it before returning the failure.
     */
    virtual Outcome<SandboxHandle> Create(const LaunchSpec& spec) = 0;

    /**
     * @brief Wait for exit or the time limit, whichever comes first
     */
    virtual Outcome<WaitStatus> Wait(const SandboxHandle& handle,
                                     std::chrono::milliseconds time_limit) = 0;

    /**
     * @brief Collect stdout/stderr, each capped at max_bytes
     */
    virtual Outcome<CapturedOutput> CaptureOutput(const SandboxHandle& handle,
                                                  std::size_t max_bytes) = 0;

    /**
     * @brief Kill and remove the environment
     * @return true if removed or already gone
     */
    virtual bool ForceRemove(const SandboxHandle& handle) = 0;

    /**
     * @brief Whether the backend can run anything at all
     */
    virtual bool IsAvailable() { return true; }

    /**
     * @brief Make sure an image is present, pulling it if allowed
     */
    virtual Outcome<bool> EnsureImage(const std::string& image, bool pull_if_missing) {
        (void)image;
        (void)pull_if_missing;
        return Outcome<bool>::Success(true);
    }

    /**
     * @brief Short backend description for log lines
     */
    virtual std::string Describe() const { return "environment provider"; }
};

} // namespace core
} // namespace renju
