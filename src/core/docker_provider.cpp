/**
 * @file docker_provider.cpp
 * @brief Implementation of the docker-backed execution provider
 *
 * @date 2025
 */

#include "renju/core/docker_provider.hpp"

#include <spdlog/spdlog.h>

namespace renju {
namespace core {

DockerProvider::DockerProvider(std::string docker_binary,
                               std::chrono::milliseconds launch_timeout,
                               std::chrono::milliseconds teardown_timeout)
    : docker_(std::move(docker_binary), launch_timeout, teardown_timeout) {
}

// ============================================================================
// CONTAINER CONFIGURATION
// ============================================================================

utils::ContainerConfig DockerProvider::ToContainerConfig(const LaunchSpec& spec) {
    utils::ContainerBuilder builder;
    builder.WithName(spec.name)
           .WithImage(spec.image)
           .WithCommand(spec.command)
           .WithMemoryLimit(spec.memory_limit_mb)
           .WithCpuPercent(spec.cpu_percent)
           .WithPidsLimit(spec.pids_limit)
           .WithNetwork(spec.network_enabled ? utils::NetworkMode::BRIDGE
                                             : utils::NetworkMode::NONE)
           .WithReadOnlyRootfs(!spec.filesystem_writable)
           .WithMount(spec.host_directory, spec.mount_point, !spec.filesystem_writable)
           .WithWorkingDir(spec.working_dir)
           .WithEnvironment("PYTHONDONTWRITEBYTECODE", "1")
           .WithEnvironment("PYTHONUNBUFFERED", "1")
           .WithLabel("renju.sandbox", "1")
           .DropAllCapabilities();

    if (spec.tmpfs_size_mb > 0) {
        builder.WithTmpfs("/tmp", "rw,noexec,nosuid,size=" +
                                  std::to_string(spec.tmpfs_size_mb) + "m");
    }

    if (!spec.user.empty()) {
        builder.WithUser(spec.user);
    }

    return builder.Build();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

Outcome<SandboxHandle> DockerProvider::Create(const LaunchSpec& spec) {
    auto config = ToContainerConfig(spec);

    std::string error;
    std::string container_id = docker_.CreateContainer(config, error);
    if (container_id.empty()) {
        // The daemon may have created it even though the CLI failed or was killed
        if (!docker_.RemoveContainer(spec.name, true)) {
            spdlog::warn("Container {} may be left behind after failed create", spec.name);
        }
        return Outcome<SandboxHandle>::Failure(error);
    }

    SandboxHandle handle{container_id, spec.name};

    if (!docker_.StartContainer(container_id, error)) {
        if (!docker_.RemoveContainer(container_id)) {
            spdlog::warn("Container {} could not be removed after failed start", spec.name);
        }
        return Outcome<SandboxHandle>::Failure(error);
    }

    spdlog::debug("Sandbox {} running ({})", spec.name, container_id.substr(0, 12));
    return Outcome<SandboxHandle>::Success(std::move(handle));
}

Outcome<WaitStatus> DockerProvider::Wait(const SandboxHandle& handle,
                                         std::chrono::milliseconds time_limit) {
    WaitStatus status;

    auto waited = docker_.WaitForContainer(handle.id, time_limit);
    if (waited.timed_out) {
        spdlog::debug("Sandbox {} exceeded {} ms", handle.name, time_limit.count());
        status.timed_out = true;
        return Outcome<WaitStatus>::Success(status);
    }

    if (!waited.exit_code) {
        return Outcome<WaitStatus>::Failure(waited.error);
    }

    status.exit_code = *waited.exit_code;

    // OOM kills only show up in the container state
    if (status.exit_code != 0) {
        auto info = docker_.InspectContainer(handle.id);
        if (info) {
            status.oom_killed = info->oom_killed;
        } else {
            spdlog::debug("Could not inspect {} for OOM state", handle.name);
        }
    }

    return Outcome<WaitStatus>::Success(status);
}

Outcome<CapturedOutput> DockerProvider::CaptureOutput(const SandboxHandle& handle,
                                                      std::size_t max_bytes) {
    auto logs = docker_.GetContainerLogs(handle.id, max_bytes);

    if (!logs.success) {
        std::string detail = !logs.launch_error.empty() ? logs.launch_error
                             : logs.timed_out ? std::string("docker logs timed out")
                             : "docker logs exited with code " + std::to_string(logs.exit_code) +
                               ": " + logs.stderr_output;
        return Outcome<CapturedOutput>::Failure(detail);
    }

    CapturedOutput output;
    output.stdout_output = std::move(logs.stdout_output);
    output.stderr_output = std::move(logs.stderr_output);
    output.truncated = logs.stdout_truncated || logs.stderr_truncated;
    return Outcome<CapturedOutput>::Success(std::move(output));
}

bool DockerProvider::ForceRemove(const SandboxHandle& handle) {
    return docker_.RemoveContainer(handle.id, true);
}

// ============================================================================
// PREPARATION
// ============================================================================

bool DockerProvider::IsAvailable() {
    if (!docker_.IsRuntimeAvailable()) {
        return false;
    }
    spdlog::debug("Docker server version: {}", docker_.GetRuntimeVersion());
    return true;
}

Outcome<bool> DockerProvider::EnsureImage(const std::string& image, bool pull_if_missing) {
    if (docker_.ImageExists(image)) {
        return Outcome<bool>::Success(true);
    }

    if (!pull_if_missing) {
        return Outcome<bool>::Failure("image '" + image + "' is not available locally");
    }

    if (!docker_.PullImage(image, pull_timeout_)) {
        return Outcome<bool>::Failure("failed to pull image '" + image + "'");
    }

    return Outcome<bool>::Success(true);
}

std::string DockerProvider::Describe() const {
    return "docker (" + docker_.GetDockerBinary() + ")";
}

} // namespace core
} // namespace renju
