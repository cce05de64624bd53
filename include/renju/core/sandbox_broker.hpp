/**
 * @file sandbox_broker.hpp
 * @brief Runs one untrusted snippet in an ephemeral, locked-down sandbox
 *
 * The broker is the only entry point for executing user strategy code. Per
 * call it materializes the code as a private artifact, launches a sandbox
 * with the configured limits, waits for exit or the time limit, collects the
 * output and tears down both the sandbox and the artifact on every path.
 *
 * **Execution Workflow**:
 * ```
 * code
 *  ├─ CodeArtifact::Materialize      (mkdtemp + O_EXCL file)
 *  ├─ EnvironmentProvider::Create    (no network, read-only, 128 MB)
 *  ├─ EnvironmentProvider::Wait      (2 s)
 *  ├─ EnvironmentProvider::CaptureOutput
 *  ├─ classify → ExecutionReport
 *  ├─ SandboxGuard::Release          (force remove)
 *  └─ CodeArtifact::Release          (delete)
 * ```
 *
 * @date 2025
 */

#pragma once

#include "renju/core/environment_provider.hpp"
#include "renju/core/sandbox_config.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace renju {
namespace core {

class CodeArtifact;

/**
 * @enum ExecutionStatus
 * @brief Classification of one run
 */
enum class ExecutionStatus {
    COMPLETED,              ///< Exited zero within the time limit
    RUNTIME_FAILURE,        ///< Exited non-zero (including OOM kill)
    TIMEOUT,                ///< Time limit elapsed; sandbox killed
    INFRASTRUCTURE_ERROR    ///< Sandbox could not be created, awaited or read
};

/**
 * @struct ExecutionResult
 * @brief What the caller of ExecuteUntrusted sees
 */
struct ExecutionResult {
    bool success{false};  ///< True only for COMPLETED
    std::string output;   ///< stdout on success, diagnostic otherwise
};

/**
 * @struct ExecutionReport
 * @brief Detailed record of one run
 */
struct ExecutionReport {
    ExecutionStatus status{ExecutionStatus::INFRASTRUCTURE_ERROR};
    int exit_code{-1};                 ///< Sandbox exit code (-1 when none)
    bool oom_killed{false};            ///< Killed for exceeding the memory limit
    std::string stdout_output;         ///< Captured stdout
    std::string stderr_output;         ///< Captured stderr
    bool output_truncated{false};      ///< Output hit the byte cap
    std::string diagnostic;            ///< One-line summary for failures
    std::string output;                ///< Text handed to the caller

    std::string code_sha256;           ///< Fingerprint of the snippet
    std::string sandbox_name;          ///< Sandbox name, empty if never launched
    std::chrono::system_clock::time_point start_time;
    std::chrono::milliseconds duration{0};

    std::vector<std::string> teardown_errors;  ///< Logged only; never change status

    bool Succeeded() const { return status == ExecutionStatus::COMPLETED; }

    ExecutionResult ToResult() const { return ExecutionResult{Succeeded(), output}; }
};

/// Appended to output that hit the byte cap
constexpr const char* kTruncationMarker = "\n[output truncated]";

std::string StatusToString(ExecutionStatus status);

/**
 * @class SandboxGuard
 * @brief Owns a sandbox handle and force-removes it exactly once
 */
class SandboxGuard {
public:
    SandboxGuard(EnvironmentProvider& provider, SandboxHandle handle);
    ~SandboxGuard();

    SandboxGuard(SandboxGuard&& other) noexcept;
    SandboxGuard& operator=(SandboxGuard&&) = delete;

    SandboxGuard(const SandboxGuard&) = delete;
    SandboxGuard& operator=(const SandboxGuard&) = delete;

    const SandboxHandle& Handle() const { return handle_; }

    /**
     * @brief Remove the sandbox now
     * @return Error description, or nullopt on success / when already released
     */
    std::optional<std::string> Release();

private:
    EnvironmentProvider* provider_;
    SandboxHandle handle_;
    bool active_{true};
};

/**
 * @class SandboxBroker
 * @brief Untrusted code execution with guaranteed teardown
 *
 * **Thread Safety**: Execute may be called concurrently; every call uses
 * its own artifact directory and sandbox name. Prepare is not thread-safe.
 *
 * **Usage Example**:
 * @code
 * SandboxBroker broker(SandboxBuilder().Build());
 * auto result = broker.ExecuteUntrusted("print('Hello, World!')");
 * if (result.success) {
 *     std::cout << result.output;
 * }
 * @endcode
 */
class SandboxBroker {
public:
    /**
     * @param config Limits and runtime settings
     * @param provider Execution backend; a DockerProvider built from config when null
     *
     * @throws std::invalid_argument if ValidateConfig reports a problem
     */
    explicit SandboxBroker(SandboxConfig config = SandboxConfig{},
                           std::shared_ptr<EnvironmentProvider> provider = nullptr);

    SandboxBroker(const SandboxBroker&) = delete;
    SandboxBroker& operator=(const SandboxBroker&) = delete;

    /**
     * @brief Check the backend and the image ahead of the first run
     *
     * Pulls a missing image only when pull_missing_image is set.
     */
    Outcome<bool> Prepare();

    /**
     * @brief Run code and return the full report
     *
     * Never throws. Teardown problems are recorded in teardown_errors.
     */
    ExecutionReport Execute(const std::string& code);

    /**
     * @brief Run code and return {success, output}
     */
    ExecutionResult ExecuteUntrusted(const std::string& code);

    const SandboxConfig& GetConfig() const { return config_; }

private:
    SandboxConfig config_;
    std::shared_ptr<EnvironmentProvider> provider_;

    LaunchSpec BuildLaunchSpec(const CodeArtifact& artifact) const;
    void RunInSandbox(const CodeArtifact& artifact, ExecutionReport& report);
    void Classify(const WaitStatus& status, CapturedOutput captured,
                  ExecutionReport& report) const;
    void SetTimeout(ExecutionReport& report) const;
    static void SetInfrastructureError(ExecutionReport& report, const std::string& detail);
    static void RecordTeardownError(ExecutionReport& report, const std::string& error);
};

} // namespace core
} // namespace renju
