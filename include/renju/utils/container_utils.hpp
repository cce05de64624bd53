/**
 * @file container_utils.hpp
 * @brief Docker CLI driver for short-lived, locked-down sandbox containers
 *
 * Wraps the `docker` command line (create, start, wait, inspect, logs, rm,
 * image inspect/pull). Every call runs through RunProcess with a deadline,
 * so an unresponsive daemon surfaces as an error instead of a hang.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <chrono>
#include <cstddef>

namespace renju {
namespace utils {

/**
 * @enum ContainerState
 * @brief Container lifecycle states as reported by `docker inspect`
 */
enum class ContainerState {
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running
    PAUSED,    ///< Container paused
    EXITED,    ///< Container exited
    DEAD,      ///< Container is dead
    UNKNOWN    ///< Unknown state
};

/**
 * @enum NetworkMode
 * @brief Container network modes
 */
enum class NetworkMode {
    NONE,     ///< No network interfaces besides loopback
    BRIDGE    ///< Default bridge network (explicit opt-in only)
};

/**
 * @struct ContainerMount
 * @brief Bind mount of a host path into the container
 */
struct ContainerMount {
    std::filesystem::path host_path;       ///< Absolute host path
    std::filesystem::path container_path;  ///< Mount point inside the container
    bool read_only{true};                  ///< Mount with :ro
};

/**
 * @struct ContainerConfig
 * @brief Complete container configuration
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                        ///< Container name (must be unique)
    std::string image{"python:3.9-slim"};    ///< Image to run
    std::vector<std::string> command;        ///< Command and arguments

    // Resource Limits
    std::size_t memory_limit_mb{128};        ///< Memory limit
    std::size_t memory_swap_limit_mb{128};   ///< Memory + swap limit (== memory: no swap)
    int cpu_period_us{100000};               ///< CFS period
    int cpu_quota_us{50000};                 ///< CFS quota (50% of one core)
    int pids_limit{10};                      ///< Process limit

    // Network Settings
    NetworkMode network_mode{NetworkMode::NONE};

    // Security Settings
    bool read_only_rootfs{true};                          ///< Read-only root filesystem
    std::vector<std::string> capabilities_drop{"ALL"};    ///< Dropped capabilities
    bool no_new_privileges{true};                         ///< Block setuid escalation
    std::string user;                                     ///< "uid:gid", empty = image default

    // Filesystem Settings
    std::vector<ContainerMount> mounts;                   ///< Bind mounts
    std::map<std::string, std::string> tmpfs;             ///< tmpfs path -> mount options
    std::filesystem::path working_dir{"/code"};           ///< Working directory

    // Environment
    std::map<std::string, std::string> environment_vars;  ///< Environment variables
    std::map<std::string, std::string> labels;            ///< Container labels
};

/**
 * @struct ContainerInfo
 * @brief Subset of `docker inspect` state used for classification
 */
struct ContainerInfo {
    std::string id;                               ///< Container ID
    std::string name;                             ///< Container name
    std::string image;                            ///< Image name
    ContainerState state{ContainerState::UNKNOWN};
    int exit_code{0};                             ///< State.ExitCode
    bool oom_killed{false};                       ///< State.OOMKilled
    std::string error;                            ///< State.Error
};

/**
 * @struct ContainerExecResult
 * @brief Result of one docker CLI invocation
 */
struct ContainerExecResult {
    int exit_code{-1};                      ///< docker CLI exit code
    std::string stdout_output;              ///< Standard output
    std::string stderr_output;              ///< Standard error
    bool stdout_truncated{false};           ///< Stdout exceeded the byte cap
    bool stderr_truncated{false};           ///< Stderr exceeded the byte cap
    std::chrono::milliseconds duration{0};  ///< Execution duration
    bool launched{false};                   ///< docker binary could be executed
    bool timed_out{false};                  ///< Killed at the deadline
    bool success{false};                    ///< Launched, in time, exit 0
    std::string launch_error;               ///< Why the binary did not run
};

/**
 * @struct ContainerWaitResult
 * @brief Result of waiting for a container to exit
 */
struct ContainerWaitResult {
    bool timed_out{false};           ///< Deadline elapsed first
    std::optional<int> exit_code;    ///< Container exit code when it exited
    std::string error;               ///< CLI/daemon failure description
};

/**
 * @class ContainerUtils
 * @brief Docker container lifecycle helper
 *
 * **Usage Example**:
 * @code
 * ContainerUtils docker;
 *
 * ContainerConfig config = ContainerBuilder()
 *     .WithName(ContainerUtils::GenerateContainerName("renju"))
 *     .WithImage("python:3.9-slim")
 *     .WithMemoryLimit(128)
 *     .WithNetwork(NetworkMode::NONE)
 *     .WithMount("/tmp/renju_ab12cd", "/code", true)
 *     .WithCommand({"python", "user_code.py"})
 *     .Build();
 *
 * std::string error;
 * std::string id = docker.CreateContainer(config, error);
 * if (!id.empty() && docker.StartContainer(id, error)) {
 *     auto waited = docker.WaitForContainer(id, std::chrono::seconds(2));
 *     auto logs = docker.GetContainerLogs(id);
 * }
 * docker.RemoveContainer(id);
 * @endcode
 */
class ContainerUtils {
public:
    /**
     * @param docker_binary Name or path of the docker CLI
     * @param command_timeout Deadline for create/start/inspect/logs calls
     * @param teardown_timeout Deadline for rm calls
     */
    explicit ContainerUtils(std::string docker_binary = "docker",
                            std::chrono::milliseconds command_timeout = std::chrono::seconds(15),
                            std::chrono::milliseconds teardown_timeout = std::chrono::seconds(10));

    /**
     * @brief Check that the CLI runs and the daemon answers
     */
    bool IsRuntimeAvailable() const;

    /**
     * @brief Server version string, "unknown" when unavailable
     */
    std::string GetRuntimeVersion() const;

    bool ImageExists(const std::string& image) const;

    /**
     * @brief Pull an image from its registry
     * @param timeout Pull deadline (pulls can be slow)
     */
    bool PullImage(const std::string& image, std::chrono::milliseconds timeout) const;

    /**
     * @brief Create (but do not start) a container
     * @param config Container configuration
     * @param error Set to a description on failure
     * @return Container ID, empty on failure
     */
    std::string CreateContainer(const ContainerConfig& config, std::string& error) const;

    /**
     * @brief Start a created container (detached)
     */
    bool StartContainer(const std::string& container_id, std::string& error) const;

    /**
     * @brief Block until the container exits or the timeout elapses
     *
     * On timeout the `docker wait` client is killed; the container itself
     * keeps running until RemoveContainer().
     */
    ContainerWaitResult WaitForContainer(const std::string& container_id,
                                         std::chrono::milliseconds timeout) const;

    /**
     * @brief Inspect container state
     * @return Container info if the container exists and output parses
     */
    std::optional<ContainerInfo> InspectContainer(const std::string& container_id) const;

    /**
     * @brief Fetch container stdout/stderr (as separate streams)
     * @param max_bytes Cap per stream
     */
    ContainerExecResult GetContainerLogs(const std::string& container_id,
                                         std::size_t max_bytes = 1024 * 1024) const;

    /**
     * @brief Remove container (force kills it when running)
     * @return true if removed or already gone
     */
    bool RemoveContainer(const std::string& container_id, bool force = true) const;

    bool ContainerExists(const std::string& container_id) const;

    /**
     * @brief Arguments for `docker create` (without the binary)
     */
    std::vector<std::string> BuildCreateArgs(const ContainerConfig& config) const;

    /**
     * @brief Parse `docker inspect` JSON (array or single object)
     * @throws nlohmann::json::exception on malformed input
     */
    static ContainerInfo ParseInspectOutput(const std::string& json_str);

    static ContainerState ParseState(const std::string& state_str);
    static std::string StateToString(ContainerState state);

    /**
     * @brief Collision-free container name: prefix_pid_counter_random
     */
    static std::string GenerateContainerName(const std::string& prefix = "renju");

    const std::string& GetDockerBinary() const { return docker_binary_; }

private:
    std::string docker_binary_;                   ///< docker CLI
    std::chrono::milliseconds command_timeout_;   ///< Deadline for regular calls
    std::chrono::milliseconds teardown_timeout_;  ///< Deadline for rm

    ContainerExecResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                             std::chrono::milliseconds timeout,
                                             std::size_t max_output_bytes = 64 * 1024) const;
    static std::string DescribeFailure(const std::string& verb,
                                       const ContainerExecResult& result);
};

/**
 * @class ContainerBuilder
 * @brief Fluent API for building container configurations
 */
class ContainerBuilder {
public:
    ContainerBuilder& WithName(const std::string& name);
    ContainerBuilder& WithImage(const std::string& image);
    ContainerBuilder& WithCommand(const std::vector<std::string>& command);
    ContainerBuilder& WithMemoryLimit(std::size_t mb);
    ContainerBuilder& WithCpuPercent(int percent);
    ContainerBuilder& WithPidsLimit(int pids);
    ContainerBuilder& WithNetwork(NetworkMode mode);
    ContainerBuilder& WithMount(const std::filesystem::path& host,
                                const std::filesystem::path& container,
                                bool read_only = true);
    ContainerBuilder& WithTmpfs(const std::string& path, const std::string& options);
    ContainerBuilder& WithWorkingDir(const std::filesystem::path& dir);
    ContainerBuilder& WithEnvironment(const std::string& key, const std::string& value);
    ContainerBuilder& WithLabel(const std::string& key, const std::string& value);
    ContainerBuilder& WithReadOnlyRootfs(bool read_only = true);
    ContainerBuilder& WithUser(const std::string& user);
    ContainerBuilder& DropAllCapabilities();

    ContainerConfig Build() const;

private:
    ContainerConfig config_;  ///< Configuration being built
};

} // namespace utils
} // namespace renju
