/**
 * @file docker_provider.hpp
 * @brief EnvironmentProvider backed by the docker CLI
 *
 * Translates a LaunchSpec into a hardened `docker create` invocation
 * (no network, read-only rootfs, capped memory with no swap headroom,
 * dropped capabilities, pids/CPU limits) and drives the container through
 * start, wait, inspect, logs and `rm --force`.
 *
 * @date 2025
 */

#pragma once

#include "renju/core/environment_provider.hpp"
#include "renju/utils/container_utils.hpp"

#include <chrono>
#include <string>

namespace renju {
namespace core {

/**
 * @class DockerProvider
 * @brief Production execution backend
 *
 * **Thread Safety**: Stateless apart from configuration; concurrent calls
 * for different handles are safe.
 */
class DockerProvider : public EnvironmentProvider {
public:
    /**
     * @param docker_binary docker CLI name or path
     * @param launch_timeout Budget for create/start/inspect/logs/pull calls
     * @param teardown_timeout Budget for `docker rm --force`
     */
    explicit DockerProvider(std::string docker_binary = "docker",
                            std::chrono::milliseconds launch_timeout = std::chrono::seconds(15),
                            std::chrono::milliseconds teardown_timeout = std::chrono::seconds(10));

    Outcome<SandboxHandle> Create(const LaunchSpec& spec) override;
    Outcome<WaitStatus> Wait(const SandboxHandle& handle,
                             std::chrono::milliseconds time_limit) override;
    Outcome<CapturedOutput> CaptureOutput(const SandboxHandle& handle,
                                          std::size_t max_bytes) override;
    bool ForceRemove(const SandboxHandle& handle) override;

    bool IsAvailable() override;
    Outcome<bool> EnsureImage(const std::string& image, bool pull_if_missing) override;
    std::string Describe() const override;

    /**
     * @brief Container configuration for a launch spec
     *
     * Exposed so the hardening flags can be checked without a daemon.
     */
    static utils::ContainerConfig ToContainerConfig(const LaunchSpec& spec);

private:
    utils::ContainerUtils docker_;
    std::chrono::milliseconds pull_timeout_{std::chrono::minutes(10)};
};

} // namespace core
} // namespace renju
