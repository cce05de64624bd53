/**
 * @file sandbox_broker.cpp
 * @brief Implementation of the untrusted code broker
 *
 * @date 2025
 */

#include "renju/core/sandbox_broker.hpp"
#include "renju/core/code_artifact.hpp"
#include "renju/core/docker_provider.hpp"
#include "renju/utils/container_utils.hpp"
#include "renju/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include <unistd.h>

namespace renju {
namespace core {

std::string StatusToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::COMPLETED: return "completed";
        case ExecutionStatus::RUNTIME_FAILURE: return "runtime_failure";
        case ExecutionStatus::TIMEOUT: return "timeout";
        case ExecutionStatus::INFRASTRUCTURE_ERROR: return "infrastructure_error";
        default: return "unknown";
    }
}

// ============================================================================
// SANDBOX GUARD
// ============================================================================

SandboxGuard::SandboxGuard(EnvironmentProvider& provider, SandboxHandle handle)
    : provider_(&provider)
    , handle_(std::move(handle)) {
}

SandboxGuard::~SandboxGuard() {
    if (auto error = Release()) {
        spdlog::warn("Sandbox teardown failed: {}", *error);
    }
}

SandboxGuard::SandboxGuard(SandboxGuard&& other) noexcept
    : provider_(other.provider_)
    , handle_(std::move(other.handle_))
    , active_(other.active_) {
    other.active_ = false;
}

std::optional<std::string> SandboxGuard::Release() {
    if (!active_) {
        return std::nullopt;
    }
    active_ = false;

    try {
        if (!provider_->ForceRemove(handle_)) {
            return "failed to remove sandbox " + handle_.name;
        }
    }
    catch (const std::exception& e) {
        return "failed to remove sandbox " + handle_.name + ": " + e.what();
    }

    spdlog::debug("Sandbox {} removed", handle_.name);
    return std::nullopt;
}

// ============================================================================
// BROKER
// ============================================================================

SandboxBroker::SandboxBroker(SandboxConfig config,
                             std::shared_ptr<EnvironmentProvider> provider)
    : config_(std::move(config))
    , provider_(std::move(provider)) {

    auto problems = ValidateConfig(config_);
    if (!problems.empty()) {
        throw std::invalid_argument("invalid sandbox configuration: " + problems.front());
    }

    if (!provider_) {
        provider_ = std::make_shared<DockerProvider>(config_.docker_binary,
                                                     config_.launch_timeout,
                                                     config_.teardown_timeout);
    }

    if (config_.artifact_root.empty()) {
        config_.artifact_root = std::filesystem::temp_directory_path();
    }

    WarnRelaxedLimits(config_);

    spdlog::debug("Sandbox broker: {} image={} time={}s memory={}MB",
                  provider_->Describe(), config_.image,
                  config_.limits.time_limit.count(), config_.limits.memory_limit_mb);
}

Outcome<bool> SandboxBroker::Prepare() {
    spdlog::info("Checking sandbox runtime: {}", provider_->Describe());

    if (!provider_->IsAvailable()) {
        return Outcome<bool>::Failure("sandbox runtime is not available");
    }

    auto image = provider_->EnsureImage(config_.image, config_.pull_missing_image);
    if (!image.ok()) {
        return image;
    }

    spdlog::info("Sandbox image ready: {}", config_.image);
    return Outcome<bool>::Success(true);
}

ExecutionResult SandboxBroker::ExecuteUntrusted(const std::string& code) {
    return Execute(code).ToResult();
}

ExecutionReport SandboxBroker::Execute(const std::string& code) {
    ExecutionReport report;
    report.start_time = std::chrono::system_clock::now();
    auto started = std::chrono::steady_clock::now();

    try {
        report.code_sha256 = utils::HashUtils::ComputeSHA256(code);
        spdlog::info("Executing snippet {} ({} bytes)",
                     utils::HashUtils::ShortDigest(report.code_sha256), code.size());

        auto artifact = CodeArtifact::Materialize(code, config_.artifact_root,
                                                  config_.artifact_filename);
        if (!artifact.ok()) {
            SetInfrastructureError(report, artifact.error);
        } else {
            RunInSandbox(*artifact.value, report);

            if (auto error = artifact.value->Release()) {
                RecordTeardownError(report, *error);
            }
        }
    }
    catch (const std::exception& e) {
        // Guards and the artifact have already been released by their destructors
        SetInfrastructureError(report, std::string("unexpected error: ") + e.what());
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (report.Succeeded()) {
        spdlog::info("Snippet {} completed in {} ms",
                     utils::HashUtils::ShortDigest(report.code_sha256), report.duration.count());
    } else {
        spdlog::info("Snippet {} {}: {}",
                     utils::HashUtils::ShortDigest(report.code_sha256),
                     StatusToString(report.status), report.diagnostic);
    }

    return report;
}

// ============================================================================
// EXECUTION
// ============================================================================

LaunchSpec SandboxBroker::BuildLaunchSpec(const CodeArtifact& artifact) const {
    LaunchSpec spec;
    spec.name = utils::ContainerUtils::GenerateContainerName("renju");
    spec.image = config_.image;
    spec.command = {config_.interpreter, artifact.FileName()};
    spec.host_directory = artifact.Directory();
    spec.mount_point = config_.mount_point;
    spec.working_dir = config_.mount_point;

    spec.memory_limit_mb = config_.limits.memory_limit_mb;
    spec.network_enabled = config_.limits.network_enabled;
    spec.filesystem_writable = config_.limits.filesystem_writable;

    spec.cpu_percent = config_.cpu_percent;
    spec.pids_limit = config_.pids_limit;
    spec.tmpfs_size_mb = config_.tmpfs_size_mb;

    // The artifact directory is 0700, so the sandbox must run as its owner
    if (config_.run_as_host_user) {
        spec.user = std::to_string(::getuid()) + ":" + std::to_string(::getgid());
    }

    return spec;
}

void SandboxBroker::RunInSandbox(const CodeArtifact& artifact, ExecutionReport& report) {
    LaunchSpec spec = BuildLaunchSpec(artifact);
    report.sandbox_name = spec.name;

    auto created = provider_->Create(spec);
    if (!created.ok()) {
        SetInfrastructureError(report, created.error);
        return;
    }

    SandboxGuard guard(*provider_, std::move(*created.value));

    auto waited = provider_->Wait(guard.Handle(),
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.limits.time_limit));

    if (!waited.ok()) {
        SetInfrastructureError(report, waited.error);
    } else if (waited.value->timed_out) {
        SetTimeout(report);
    } else {
        auto captured = provider_->CaptureOutput(guard.Handle(), config_.max_output_bytes);
        if (!captured.ok()) {
            SetInfrastructureError(report, "failed to collect output: " + captured.error);
        } else {
            Classify(*waited.value, std::move(*captured.value), report);
        }
    }

    if (auto error = guard.Release()) {
        RecordTeardownError(report, *error);
    }
}

void SandboxBroker::Classify(const WaitStatus& status, CapturedOutput captured,
                             ExecutionReport& report) const {
    report.exit_code = status.exit_code;
    report.oom_killed = status.oom_killed;
    report.stdout_output = std::move(captured.stdout_output);
    report.stderr_output = std::move(captured.stderr_output);
    report.output_truncated = captured.truncated;

    const std::string marker = report.output_truncated ? kTruncationMarker : "";

    if (status.exit_code == 0) {
        report.status = ExecutionStatus::COMPLETED;
        report.output = report.stdout_output + marker;
        return;
    }

    report.status = ExecutionStatus::RUNTIME_FAILURE;
    if (status.oom_killed) {
        report.diagnostic = "Memory limit exceeded (" +
                            std::to_string(config_.limits.memory_limit_mb) + " MB)";
    } else {
        report.diagnostic = "Execution failed (exit code: " +
                            std::to_string(status.exit_code) + ")";
    }
    report.output = report.diagnostic + "\n" + report.stdout_output +
                    report.stderr_output + marker;
}

void SandboxBroker::SetTimeout(ExecutionReport& report) const {
    report.status = ExecutionStatus::TIMEOUT;
    report.diagnostic = "Execution timed out (exceeded " +
                        std::to_string(config_.limits.time_limit.count()) + " seconds)";
    report.output = report.diagnostic;
}

void SandboxBroker::SetInfrastructureError(ExecutionReport& report,
                                           const std::string& detail) {
    spdlog::error("Sandbox infrastructure error: {}", detail);
    report.status = ExecutionStatus::INFRASTRUCTURE_ERROR;
    report.diagnostic = "Sandbox infrastructure error: " + detail;
    report.output = report.diagnostic;
}

void SandboxBroker::RecordTeardownError(ExecutionReport& report, const std::string& error) {
    spdlog::warn("Teardown problem: {}", error);
    report.teardown_errors.push_back(error);
}

} // namespace core
} // namespace renju
