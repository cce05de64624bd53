/**
 * @file json_reporter.hpp
 * @brief Machine-readable JSON reports of sandbox executions
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace renju {

// Forward declarations
namespace core {
    struct ExecutionReport;
}

namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Configuration for JSON report generation
 */
struct JsonReporterConfig {
    // Formatting
    bool pretty_print{true};              ///< Pretty print JSON
    int indent_size{2};                   ///< Indentation spaces
    bool include_streams{true};           ///< Include raw stdout/stderr

    // Output
    std::filesystem::path output_directory{"./reports"};       ///< Output directory
    std::string filename_pattern{"{hash}_{timestamp}.json"};    ///< Filename pattern
};

/**
 * @class JsonReporter
 * @brief ExecutionReport → JSON
 *
 * **Report Shape**:
 * ```json
 * {
 *   "schema_version": "1.0",
 *   "success": false,
 *   "status": "timeout",
 *   "output": "Execution timed out (exceeded 2 seconds)",
 *   "execution": {"exit_code": -1, "oom_killed": false, "duration_ms": 2143, ...},
 *   "code": {"sha256": "..."},
 *   "streams": {"stdout": "", "stderr": "", "truncated": false},
 *   "teardown_errors": []
 * }
 * ```
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    /**
     * @brief Generate JSON report and save to file
     * @return Path to generated JSON file, empty on failure
     */
    std::filesystem::path GenerateReport(const core::ExecutionReport& report);

    /**
     * @brief Generate JSON string without saving to file
     */
    std::string GenerateJsonString(const core::ExecutionReport& report) const;

    nlohmann::json ToJson(const core::ExecutionReport& report) const;

    const JsonReporterConfig& GetConfig() const { return config_; }

private:
    JsonReporterConfig config_;

    std::string GenerateFilename(const core::ExecutionReport& report) const;
    bool SaveJson(const std::string& json_content, const std::filesystem::path& output_path);
    static std::string FormatTimestamp(const std::chrono::system_clock::time_point& tp);
};

} // namespace reporters
} // namespace renju
