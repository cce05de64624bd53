/**
 * @file sandbox_config.cpp
 * @brief JSON loading and validation of sandbox configuration
 *
 * @date 2025
 */

#include "renju/core/sandbox_config.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace renju {
namespace core {

namespace {

template <typename T>
void ReadValue(const json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

// Integer keys that must not be negative
void ReadCount(const json& j, const char* key, std::size_t& out) {
    if (!j.contains(key)) {
        return;
    }
    auto value = j.at(key).get<std::int64_t>();
    if (value < 0) {
        throw std::invalid_argument(std::string("'") + key + "' must not be negative");
    }
    out = static_cast<std::size_t>(value);
}

// int keys, range-checked before narrowing
void ReadInt(const json& j, const char* key, int& out) {
    if (!j.contains(key)) {
        return;
    }
    auto value = j.at(key).get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(std::string("'") + key + "' is out of range");
    }
    out = static_cast<int>(value);
}

void ReadSeconds(const json& j, const char* key, std::chrono::seconds& out) {
    if (j.contains(key)) {
        out = std::chrono::seconds(j.at(key).get<std::int64_t>());
    }
}

void ReadPath(const json& j, const char* key, std::filesystem::path& out) {
    if (j.contains(key)) {
        out = j.at(key).get<std::string>();
    }
}

} // anonymous namespace

// ============================================================================
// LOADING
// ============================================================================

Outcome<SandboxConfig> ConfigFromJson(const json& j, SandboxConfig base) {
    if (!j.is_object()) {
        return Outcome<SandboxConfig>::Failure("configuration must be a JSON object");
    }

    try {
        ReadSeconds(j, "time_limit_seconds", base.limits.time_limit);
        ReadCount(j, "memory_limit_mb", base.limits.memory_limit_mb);
        ReadValue(j, "network_enabled", base.limits.network_enabled);
        ReadValue(j, "filesystem_writable", base.limits.filesystem_writable);

        ReadValue(j, "image", base.image);
        ReadValue(j, "interpreter", base.interpreter);
        ReadPath(j, "mount_point", base.mount_point);
        ReadValue(j, "artifact_filename", base.artifact_filename);
        ReadPath(j, "artifact_root", base.artifact_root);
        ReadValue(j, "docker_binary", base.docker_binary);

        ReadInt(j, "cpu_percent", base.cpu_percent);
        ReadInt(j, "pids_limit", base.pids_limit);
        ReadCount(j, "tmpfs_size_mb", base.tmpfs_size_mb);
        ReadValue(j, "run_as_host_user", base.run_as_host_user);

        ReadSeconds(j, "launch_timeout_seconds", base.launch_timeout);
        ReadSeconds(j, "teardown_timeout_seconds", base.teardown_timeout);
        ReadCount(j, "max_output_bytes", base.max_output_bytes);

        ReadValue(j, "pull_missing_image", base.pull_missing_image);
    }
    catch (const json::exception& e) {
        return Outcome<SandboxConfig>::Failure(std::string("invalid configuration value: ") +
                                               e.what());
    }
    catch (const std::invalid_argument& e) {
        return Outcome<SandboxConfig>::Failure(std::string("invalid configuration value: ") +
                                               e.what());
    }

    return Outcome<SandboxConfig>::Success(std::move(base));
}

Outcome<SandboxConfig> LoadConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Outcome<SandboxConfig>::Failure("cannot open configuration file: " +
                                               path.string());
    }

    json j;
    try {
        j = json::parse(file);
    }
    catch (const json::parse_error& e) {
        return Outcome<SandboxConfig>::Failure("failed to parse " + path.string() + ": " +
                                               e.what());
    }

    auto config = ConfigFromJson(j);
    if (config.ok()) {
        spdlog::debug("Configuration loaded from {}", path.string());
    }
    return config;
}

// ============================================================================
// VALIDATION
// ============================================================================

std::vector<std::string> ValidateConfig(const SandboxConfig& config) {
    std::vector<std::string> problems;

    if (config.limits.time_limit.count() <= 0) {
        problems.push_back("time limit must be positive");
    }
    if (config.limits.memory_limit_mb < kMinimumMemoryLimitMb) {
        problems.push_back("memory limit must be at least " +
                           std::to_string(kMinimumMemoryLimitMb) + " MB");
    }
    if (config.image.empty()) {
        problems.push_back("image must not be empty");
    }
    if (config.interpreter.empty()) {
        problems.push_back("interpreter must not be empty");
    }
    if (config.artifact_filename.empty() ||
        config.artifact_filename.find('/') != std::string::npos) {
        problems.push_back("artifact file name must be a plain file name");
    }
    if (!config.mount_point.is_absolute()) {
        problems.push_back("mount point must be an absolute path");
    }
    if (config.docker_binary.empty()) {
        problems.push_back("docker binary must not be empty");
    }
    if (config.cpu_percent <= 0) {
        problems.push_back("cpu percent must be positive");
    }
    if (config.pids_limit <= 0) {
        problems.push_back("pids limit must be positive");
    }
    if (config.launch_timeout.count() <= 0) {
        problems.push_back("launch timeout must be positive");
    }
    if (config.teardown_timeout.count() <= 0) {
        problems.push_back("teardown timeout must be positive");
    }
    if (config.max_output_bytes == 0) {
        problems.push_back("max output bytes must be positive");
    }

    return problems;
}

void WarnRelaxedLimits(const SandboxConfig& config) {
    const ResourceLimits defaults;

    if (config.limits.network_enabled) {
        spdlog::warn("Sandbox network access is ENABLED");
    }
    if (config.limits.filesystem_writable) {
        spdlog::warn("Sandbox filesystem is WRITABLE");
    }
    if (config.limits.time_limit > defaults.time_limit) {
        spdlog::warn("Sandbox time limit relaxed to {} s", config.limits.time_limit.count());
    }
    if (config.limits.memory_limit_mb > defaults.memory_limit_mb) {
        spdlog::warn("Sandbox memory limit relaxed to {} MB", config.limits.memory_limit_mb);
    }
}

json ConfigToJson(const SandboxConfig& config) {
    return json{
        {"time_limit_seconds", config.limits.time_limit.count()},
        {"memory_limit_mb", config.limits.memory_limit_mb},
        {"network_enabled", config.limits.network_enabled},
        {"filesystem_writable", config.limits.filesystem_writable},
        {"image", config.image},
        {"interpreter", config.interpreter},
        {"mount_point", config.mount_point.string()},
        {"artifact_filename", config.artifact_filename},
        {"artifact_root", config.artifact_root.string()},
        {"docker_binary", config.docker_binary},
        {"cpu_percent", config.cpu_percent},
        {"pids_limit", config.pids_limit},
        {"tmpfs_size_mb", config.tmpfs_size_mb},
        {"run_as_host_user", config.run_as_host_user},
        {"launch_timeout_seconds", config.launch_timeout.count()},
        {"teardown_timeout_seconds", config.teardown_timeout.count()},
        {"max_output_bytes", config.max_output_bytes},
        {"pull_missing_image", config.pull_missing_image}
    };
}

} // namespace core
} // namespace renju
