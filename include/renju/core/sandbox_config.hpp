/**
 * @file sandbox_config.hpp
 * @brief Sandbox limits and runtime settings
 *
 * The four mandatory constraints (time, memory, network, filesystem) live in
 * ResourceLimits; everything else describes how the runtime is driven.
 * Configuration can be loaded from a JSON file, built fluently, or both.
 *
 * @date 2025
 */

#pragma once

#include "renju/core/environment_provider.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace renju {
namespace core {

/// Smallest memory limit docker accepts for a container
constexpr std::size_t kMinimumMemoryLimitMb = 6;

/**
 * @struct ResourceLimits
 * @brief Mandatory constraints applied to every run
 */
struct ResourceLimits {
    std::chrono::seconds time_limit{2};   ///< Wall-clock limit from process start
    std::size_t memory_limit_mb{128};     ///< Memory ceiling (no swap headroom)
    bool network_enabled{false};          ///< Network access inside the sandbox
    bool filesystem_writable{false};      ///< Writable rootfs and code mount
};

/**
 * @struct SandboxConfig
 * @brief Complete broker configuration
 */
struct SandboxConfig {
    ResourceLimits limits;

    // Runtime
    std::string image{"python:3.9-slim"};              ///< Interpreter image
    std::string interpreter{"python"};                 ///< Command run on the artifact
    std::filesystem::path mount_point{"/code"};        ///< Artifact mount inside the sandbox
    std::string artifact_filename{"user_code.py"};     ///< Artifact file name
    std::filesystem::path artifact_root;               ///< Parent of artifact dirs (empty = temp dir)
    std::string docker_binary{"docker"};               ///< docker CLI

    // Hardening
    int cpu_percent{50};                               ///< CPU quota, % of one core
    int pids_limit{10};                                ///< Process limit
    std::size_t tmpfs_size_mb{64};                     ///< Size of the /tmp tmpfs
    bool run_as_host_user{true};                       ///< Run as the caller's uid:gid

    // Budgets
    std::chrono::seconds launch_timeout{15};           ///< create/start/inspect/logs
    std::chrono::seconds teardown_timeout{10};         ///< rm --force
    std::size_t max_output_bytes{1024 * 1024};         ///< Cap per output stream

    bool pull_missing_image{false};                    ///< Prepare() pulls absent images
};

/**
 * @brief Load a configuration file on top of the defaults
 *
 * Unknown keys are ignored. A key with the wrong type, a missing file or
 * invalid JSON is reported through Outcome::error.
 */
Outcome<SandboxConfig> LoadConfig(const std::filesystem::path& path);

/**
 * @brief Apply a parsed JSON object on top of a configuration
 */
Outcome<SandboxConfig> ConfigFromJson(const nlohmann::json& j,
                                      SandboxConfig base = SandboxConfig{});

/**
 * @brief Check limits and required settings
 * @return Human-readable problems, empty when the configuration is usable
 */
std::vector<std::string> ValidateConfig(const SandboxConfig& config);

/**
 * @brief Log a warning for every mandatory constraint that was relaxed
 */
void WarnRelaxedLimits(const SandboxConfig& config);

nlohmann::json ConfigToJson(const SandboxConfig& config);

/**
 * @class SandboxBuilder
 * @brief Fluent API for constructing sandbox configurations
 *
 * **Usage Example**:
 * @code
 * auto config = SandboxBuilder()
 *     .WithTimeLimit(std::chrono::seconds(2))
 *     .WithMemoryLimit(128)
 *     .WithImage("python:3.9-slim")
 *     .Build();
 * @endcode
 */
class SandboxBuilder {
public:
    SandboxBuilder() = default;
    explicit SandboxBuilder(SandboxConfig base) : config_(std::move(base)) {}

    SandboxBuilder& WithTimeLimit(std::chrono::seconds limit) {
        config_.limits.time_limit = limit;
        return *this;
    }

    SandboxBuilder& WithMemoryLimit(std::size_t mb) {
        config_.limits.memory_limit_mb = mb;
        return *this;
    }

    /**
     * @brief Allow network access (relaxes a mandatory constraint)
     */
    SandboxBuilder& EnableNetwork(bool enable = true) {
        config_.limits.network_enabled = enable;
        return *this;
    }

    /**
     * @brief Allow writes to the rootfs and code mount (relaxes a mandatory constraint)
     */
    SandboxBuilder& EnableWritableFilesystem(bool enable = true) {
        config_.limits.filesystem_writable = enable;
        return *this;
    }

    SandboxBuilder& WithImage(const std::string& image) {
        config_.image = image;
        return *this;
    }

    SandboxBuilder& WithInterpreter(const std::string& interpreter) {
        config_.interpreter = interpreter;
        return *this;
    }

    SandboxBuilder& WithArtifactRoot(const std::filesystem::path& root) {
        config_.artifact_root = root;
        return *this;
    }

    SandboxBuilder& WithDockerBinary(const std::string& binary) {
        config_.docker_binary = binary;
        return *this;
    }

    SandboxBuilder& WithMaxOutputBytes(std::size_t bytes) {
        config_.max_output_bytes = bytes;
        return *this;
    }

    SandboxBuilder& PullMissingImage(bool pull = true) {
        config_.pull_missing_image = pull;
        return *this;
    }

    SandboxConfig Build() const { return config_; }

private:
    SandboxConfig config_;
};

} // namespace core
} // namespace renju
