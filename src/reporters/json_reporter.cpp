/**
 * @file json_reporter.cpp
 * @brief Implementation of JSON report generation
 *
 * @date 2025
 */

#include "renju/reporters/json_reporter.hpp"
#include "renju/core/sandbox_broker.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>

using json = nlohmann::json;

namespace renju {
namespace reporters {

namespace {
constexpr const char* kSchemaVersion = "1.0";
}

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
    spdlog::debug("JSON Reporter output directory: {}", config_.output_directory.string());
}

// Generate report
std::filesystem::path JsonReporter::GenerateReport(const core::ExecutionReport& report) {
    try {
        if (!std::filesystem::exists(config_.output_directory)) {
            std::filesystem::create_directories(config_.output_directory);
        }

        std::filesystem::path output_path = config_.output_directory / GenerateFilename(report);

        if (!SaveJson(GenerateJsonString(report), output_path)) {
            spdlog::error("Failed to save JSON report");
            return {};
        }

        spdlog::info("JSON report saved: {} ({} bytes)", output_path.string(),
                     std::filesystem::file_size(output_path));
        return output_path;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to generate JSON report: {}", e.what());
        return {};
    }
}

std::string JsonReporter::GenerateJsonString(const core::ExecutionReport& report) const {
    json j = ToJson(report);
    // Sandbox output is arbitrary bytes; replace invalid UTF-8 instead of throwing
    return config_.pretty_print
        ? j.dump(config_.indent_size, ' ', false, json::error_handler_t::replace)
        : j.dump(-1, ' ', false, json::error_handler_t::replace);
}

json JsonReporter::ToJson(const core::ExecutionReport& report) const {
    json j;

    j["schema_version"] = kSchemaVersion;
    j["success"] = report.Succeeded();
    j["status"] = core::StatusToString(report.status);
    j["output"] = report.output;
    if (!report.diagnostic.empty()) {
        j["diagnostic"] = report.diagnostic;
    }

    j["execution"] = {
        {"exit_code", report.exit_code},
        {"oom_killed", report.oom_killed},
        {"sandbox", report.sandbox_name},
        {"started_at", FormatTimestamp(report.start_time)},
        {"duration_ms", report.duration.count()}
    };

    j["code"] = {
        {"sha256", report.code_sha256}
    };

    if (config_.include_streams) {
        j["streams"] = {
            {"stdout", report.stdout_output},
            {"stderr", report.stderr_output},
            {"truncated", report.output_truncated}
        };
    }

    j["teardown_errors"] = report.teardown_errors;

    return j;
}

std::string JsonReporter::GenerateFilename(const core::ExecutionReport& report) const {
    std::string filename = config_.filename_pattern;

    std::string hash = report.code_sha256.empty() ? "unknown" : report.code_sha256.substr(0, 16);
    filename = std::regex_replace(filename, std::regex("\\{hash\\}"), hash);

    auto t = std::chrono::system_clock::to_time_t(report.start_time);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    std::ostringstream timestamp;
    timestamp << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    filename = std::regex_replace(filename, std::regex("\\{timestamp\\}"), timestamp.str());

    filename = std::regex_replace(filename, std::regex("\\{status\\}"),
                                  core::StatusToString(report.status));

    return filename;
}

bool JsonReporter::SaveJson(const std::string& json_content,
                            const std::filesystem::path& output_path) {
    std::ofstream file(output_path);
    if (!file) {
        spdlog::error("Failed to open file for writing: {}", output_path.string());
        return false;
    }

    file << json_content;
    file.close();

    return static_cast<bool>(file);
}

std::string JsonReporter::FormatTimestamp(const std::chrono::system_clock::time_point& tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace reporters
} // namespace renju
