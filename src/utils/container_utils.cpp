/**
 * @file container_utils.cpp
 * @brief Implementation of the docker CLI driver
 *
 * **Security Hardening Layers** (applied by BuildCreateArgs):
 * 1. Network Isolation: --network none unless explicitly relaxed
 * 2. Capability Dropping: --cap-drop ALL
 * 3. No New Privileges: --security-opt no-new-privileges
 * 4. Resource Limits: memory (swap pinned to memory), CPU quota, pids
 * 5. Read-only Rootfs: --read-only plus a small tmpfs for /tmp
 * 6. Read-only bind mounts for the code
 * 7. Non-root execution: --user with the host uid:gid
 *
 * **Container Lifecycle**:
 * ```
 * create → start → wait (deadline) → inspect → logs → rm --force
 * ```
 *
 * @date 2025
 */

#include "renju/utils/container_utils.hpp"
#include "renju/utils/process_utils.hpp"
#include "renju/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <iomanip>
#include <random>
#include <sstream>

#include <unistd.h>

using json = nlohmann::json;

namespace renju {
namespace utils {

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ContainerUtils::ContainerUtils(std::string docker_binary,
                               std::chrono::milliseconds command_timeout,
                               std::chrono::milliseconds teardown_timeout)
    : docker_binary_(std::move(docker_binary))
    , command_timeout_(command_timeout)
    , teardown_timeout_(teardown_timeout) {
    spdlog::debug("Container Utils using '{}' (command timeout {} ms)",
                  docker_binary_, command_timeout_.count());
}

// ============================================================================
// RUNTIME / IMAGE DETECTION
// ============================================================================

bool ContainerUtils::IsRuntimeAvailable() const {
    // `docker version` only succeeds when the daemon answers too
    auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"},
                                       command_timeout_);
    if (!result.success) {
        spdlog::debug("Docker runtime unavailable: {}", DescribeFailure("version", result));
    }
    return result.success;
}

std::string ContainerUtils::GetRuntimeVersion() const {
    auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"},
                                       command_timeout_);
    if (result.success) {
        return StringUtils::Trim(result.stdout_output);
    }
    return "unknown";
}

bool ContainerUtils::ImageExists(const std::string& image) const {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{.Id}}", image},
                                       command_timeout_);
    return result.success;
}

bool ContainerUtils::PullImage(const std::string& image,
                               std::chrono::milliseconds timeout) const {
    spdlog::info("Pulling image {} ...", image);

    auto result = ExecuteDockerCommand({"pull", image}, timeout);
    if (result.success) {
        spdlog::info("Image pulled: {}", image);
        return true;
    }

    spdlog::error("Failed to pull image {}: {}", image, DescribeFailure("pull", result));
    return false;
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::string ContainerUtils::CreateContainer(const ContainerConfig& config,
                                            std::string& error) const {
    spdlog::debug("Creating container: {}", config.name);

    if (config.image.empty()) {
        error = "container image not specified";
        return "";
    }
    if (config.command.empty()) {
        error = "container command not specified";
        return "";
    }

    auto result = ExecuteDockerCommand(BuildCreateArgs(config), command_timeout_);

    if (!result.success) {
        error = DescribeFailure("create", result);
        spdlog::error("Failed to create container {}: {}", config.name, error);
        return "";
    }

    std::string container_id = StringUtils::Trim(result.stdout_output);
    if (container_id.empty()) {
        error = "docker create returned no container id";
        return "";
    }

    spdlog::debug("Container created: {} ({})", config.name, container_id.substr(0, 12));
    return container_id;
}

bool ContainerUtils::StartContainer(const std::string& container_id,
                                    std::string& error) const {
    auto result = ExecuteDockerCommand({"start", container_id}, command_timeout_);

    if (result.success) {
        spdlog::debug("Container started: {}", container_id.substr(0, 12));
        return true;
    }

    error = DescribeFailure("start", result);
    spdlog::error("Failed to start container {}: {}", container_id.substr(0, 12), error);
    return false;
}

ContainerWaitResult ContainerUtils::WaitForContainer(const std::string& container_id,
                                                     std::chrono::milliseconds timeout) const {
    ContainerWaitResult wait_result;

    auto result = ExecuteDockerCommand({"wait", container_id}, timeout);

    if (result.timed_out) {
        wait_result.timed_out = true;
        return wait_result;
    }

    if (!result.success) {
        wait_result.error = DescribeFailure("wait", result);
        return wait_result;
    }

    try {
        wait_result.exit_code = std::stoi(StringUtils::Trim(result.stdout_output));
    }
    catch (const std::exception&) {
        wait_result.error = "unexpected docker wait output: '" +
                            StringUtils::Trim(result.stdout_output) + "'";
    }

    return wait_result;
}

std::optional<ContainerInfo> ContainerUtils::InspectContainer(const std::string& container_id) const {
    auto result = ExecuteDockerCommand({"inspect", container_id}, command_timeout_);

    if (result.success) {
        try {
            return ParseInspectOutput(result.stdout_output);
        }
        catch (const std::exception& e) {
            spdlog::error("Failed to parse inspect output: {}", e.what());
        }
    }

    return std::nullopt;
}

ContainerExecResult ContainerUtils::GetContainerLogs(const std::string& container_id,
                                                     std::size_t max_bytes) const {
    // docker logs replays the container's stdout on stdout and stderr on stderr
    return ExecuteDockerCommand({"logs", container_id}, command_timeout_, max_bytes);
}

bool ContainerUtils::RemoveContainer(const std::string& container_id, bool force) const {
    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args, teardown_timeout_);

    if (result.success) {
        spdlog::debug("Container removed: {}", container_id.substr(0, 12));
        return true;
    }

    if (result.stderr_output.find("No such container") != std::string::npos) {
        return true;
    }

    spdlog::warn("Failed to remove container {}: {}", container_id.substr(0, 12),
                 DescribeFailure("rm", result));
    return false;
}

bool ContainerUtils::ContainerExists(const std::string& container_id) const {
    auto result = ExecuteDockerCommand({"inspect", "--format", "{{.Id}}", container_id},
                                       command_timeout_);
    return result.success;
}

// ============================================================================
// COMMAND CONSTRUCTION
// ============================================================================

std::vector<std::string> ContainerUtils::BuildCreateArgs(const ContainerConfig& config) const {
    std::vector<std::string> args;

    args.push_back("create");

    // Container name
    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    // Network mode
    args.push_back("--network");
    switch (config.network_mode) {
        case NetworkMode::NONE:
            args.push_back("none");
            break;
        case NetworkMode::BRIDGE:
            args.push_back("bridge");
            break;
    }

    // Memory limit
    if (config.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
        args.push_back("--memory-swap");
        args.push_back(std::to_string(std::max(config.memory_swap_limit_mb,
                                               config.memory_limit_mb)) + "m");
    }

    // CPU limit
    if (config.cpu_quota_us > 0 && config.cpu_period_us > 0) {
        args.push_back("--cpu-period");
        args.push_back(std::to_string(config.cpu_period_us));
        args.push_back("--cpu-quota");
        args.push_back(std::to_string(config.cpu_quota_us));
    }

    // Process limit
    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    // Security: Drop capabilities
    for (const auto& cap : config.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }

    if (config.no_new_privileges) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges");
    }

    // User
    if (!config.user.empty()) {
        args.push_back("--user");
        args.push_back(config.user);
    }

    // Read-only root filesystem
    if (config.read_only_rootfs) {
        args.push_back("--read-only");
    }

    for (const auto& [path, options] : config.tmpfs) {
        args.push_back("--tmpfs");
        args.push_back(options.empty() ? path : path + ":" + options);
    }

    // Volume mounts
    for (const auto& mount : config.mounts) {
        args.push_back("-v");
        args.push_back(mount.host_path.string() + ":" + mount.container_path.string() +
                       (mount.read_only ? ":ro" : ""));
    }

    // Environment variables
    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    // Working directory
    if (!config.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(config.working_dir.string());
    }

    // Image (must be last before command)
    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

// ============================================================================
// PARSING
// ============================================================================

ContainerInfo ContainerUtils::ParseInspectOutput(const std::string& json_str) {
    json j = json::parse(json_str);

    // Docker inspect returns array with single object
    if (j.is_array()) {
        if (j.empty()) {
            throw std::runtime_error("empty inspect output");
        }
        j = j[0];
    }

    ContainerInfo info;
    info.id = j.value("Id", "");
    info.name = j.value("Name", "");
    if (!info.name.empty() && info.name.front() == '/') {
        info.name.erase(0, 1);
    }

    if (j.contains("Config") && j["Config"].is_object()) {
        info.image = j["Config"].value("Image", "");
    }

    if (j.contains("State") && j["State"].is_object()) {
        const auto& state = j["State"];
        info.state = ParseState(state.value("Status", ""));
        info.exit_code = state.value("ExitCode", 0);
        info.oom_killed = state.value("OOMKilled", false);
        info.error = state.value("Error", "");
    }

    return info;
}

ContainerState ContainerUtils::ParseState(const std::string& state_str) {
    if (state_str == "created") return ContainerState::CREATED;
    if (state_str == "running") return ContainerState::RUNNING;
    if (state_str == "paused") return ContainerState::PAUSED;
    if (state_str == "restarting") return ContainerState::RUNNING;
    if (state_str == "removing") return ContainerState::EXITED;
    if (state_str == "exited") return ContainerState::EXITED;
    if (state_str == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

std::string ContainerUtils::StateToString(ContainerState state) {
    switch (state) {
        case ContainerState::CREATED: return "created";
        case ContainerState::RUNNING: return "running";
        case ContainerState::PAUSED: return "paused";
        case ContainerState::EXITED: return "exited";
        case ContainerState::DEAD: return "dead";
        default: return "unknown";
    }
}

std::string ContainerUtils::GenerateContainerName(const std::string& prefix) {
    static std::atomic<unsigned long> counter{0};
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<unsigned int> dis(0, 0xffffff);

    std::ostringstream oss;
    oss << prefix << "_" << ::getpid() << "_" << counter.fetch_add(1) << "_"
        << std::hex << std::setw(6) << std::setfill('0') << dis(gen);
    return oss.str();
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                         std::chrono::milliseconds timeout,
                                                         std::size_t max_output_bytes) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(docker_binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    auto process = RunProcess(argv, timeout, max_output_bytes);

    ContainerExecResult exec_result;
    exec_result.exit_code = process.exit_code;
    exec_result.stdout_output = std::move(process.stdout_output);
    exec_result.stderr_output = std::move(process.stderr_output);
    exec_result.stdout_truncated = process.stdout_truncated;
    exec_result.stderr_truncated = process.stderr_truncated;
    exec_result.duration = process.duration;
    exec_result.launched = process.launched;
    exec_result.timed_out = process.timed_out;
    exec_result.launch_error = std::move(process.error);
    exec_result.success = process.Succeeded();

    return exec_result;
}

std::string ContainerUtils::DescribeFailure(const std::string& verb,
                                            const ContainerExecResult& result) {
    if (!result.launched) {
        return "docker CLI could not be executed (" + result.launch_error + ")";
    }
    if (result.timed_out) {
        return "docker " + verb + " did not finish within " +
               std::to_string(result.duration.count()) + " ms";
    }

    std::string detail = StringUtils::Trim(result.stderr_output);
    if (detail.empty()) {
        detail = StringUtils::Trim(result.stdout_output);
    }
    return "docker " + verb + " exited with code " + std::to_string(result.exit_code) +
           (detail.empty() ? "" : ": " + StringUtils::Truncate(detail, 512));
}

// ============================================================================
// CONTAINER BUILDER IMPLEMENTATION (FLUENT API)
// ============================================================================

ContainerBuilder& ContainerBuilder::WithName(const std::string& name) {
    config_.name = name;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithImage(const std::string& image) {
    config_.image = image;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCommand(const std::vector<std::string>& command) {
    config_.command = command;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMemoryLimit(std::size_t mb) {
    config_.memory_limit_mb = mb;
    config_.memory_swap_limit_mb = mb;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCpuPercent(int percent) {
    config_.cpu_quota_us = config_.cpu_period_us * percent / 100;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithPidsLimit(int pids) {
    config_.pids_limit = pids;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithNetwork(NetworkMode mode) {
    config_.network_mode = mode;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMount(const std::filesystem::path& host,
                                              const std::filesystem::path& container,
                                              bool read_only) {
    config_.mounts.push_back(ContainerMount{host, container, read_only});
    return *this;
}

ContainerBuilder& ContainerBuilder::WithTmpfs(const std::string& path,
                                              const std::string& options) {
    config_.tmpfs[path] = options;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithWorkingDir(const std::filesystem::path& dir) {
    config_.working_dir = dir;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithEnvironment(const std::string& key,
                                                    const std::string& value) {
    config_.environment_vars[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithLabel(const std::string& key,
                                              const std::string& value) {
    config_.labels[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithReadOnlyRootfs(bool read_only) {
    config_.read_only_rootfs = read_only;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithUser(const std::string& user) {
    config_.user = user;
    return *this;
}

ContainerBuilder& ContainerBuilder::DropAllCapabilities() {
    config_.capabilities_drop = {"ALL"};
    return *this;
}

ContainerConfig ContainerBuilder::Build() const {
    return config_;
}

} // namespace utils
} // namespace renju
