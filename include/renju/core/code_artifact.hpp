/**
 * @file code_artifact.hpp
 * @brief Ephemeral on-disk copy of one untrusted snippet
 *
 * @date 2025
 */

#pragma once

#include "renju/core/environment_provider.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace renju {
namespace core {

/**
 * @class CodeArtifact
 * @brief Private directory holding exactly one code file
 *
 * The directory comes from mkdtemp (mode 0700) and the file is created with
 * O_CREAT|O_EXCL, so no other invocation can share or pre-create it. The
 * artifact is deleted by Release() or, failing that, by the destructor.
 *
 * **Usage Example**:
 * @code
 * auto artifact = CodeArtifact::Materialize(code, std::filesystem::temp_directory_path(),
 *                                           "user_code.py");
 * if (!artifact.ok()) {
 *     spdlog::error("{}", artifact.error);
 *     return;
 * }
 * // ... mount artifact.value->Directory() ...
 * if (auto error = artifact.value->Release()) {
 *     spdlog::warn("{}", *error);
 * }
 * @endcode
 */
class CodeArtifact {
public:
    /**
     * @brief Write code verbatim into a fresh private directory
     * @param code Snippet text (written byte for byte)
     * @param root Parent directory for the private directory
     * @param filename File name inside the private directory
     */
    static Outcome<CodeArtifact> Materialize(const std::string& code,
                                             const std::filesystem::path& root,
                                             const std::string& filename);

    ~CodeArtifact();

    CodeArtifact(CodeArtifact&& other) noexcept;
    CodeArtifact& operator=(CodeArtifact&& other) noexcept;

    CodeArtifact(const CodeArtifact&) = delete;
    CodeArtifact& operator=(const CodeArtifact&) = delete;

    const std::filesystem::path& Directory() const { return directory_; }
    const std::filesystem::path& FilePath() const { return file_path_; }
    std::string FileName() const { return file_path_.filename().string(); }

    /**
     * @brief Whether the artifact still exists on disk (not yet released)
     */
    bool IsActive() const { return !directory_.empty(); }

    /**
     * @brief Delete the file and its directory
     * @return Error description, or nullopt when everything was removed
     *
     * Idempotent; after the first call the artifact is inactive.
     */
    std::optional<std::string> Release();

private:
    CodeArtifact(std::filesystem::path directory, std::filesystem::path file_path);

    std::filesystem::path directory_;
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace renju
