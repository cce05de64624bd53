/**
 * @file code_artifact.cpp
 * @brief Implementation of the ephemeral code artifact
 *
 * @date 2025
 */

#include "renju/core/code_artifact.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace renju {
namespace core {

namespace {

std::string ErrnoMessage(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

// Write the whole buffer, retrying on short writes and EINTR
bool WriteAll(int fd, const std::string& data) {
    const char* cursor = data.data();
    std::size_t remaining = data.size();

    while (remaining > 0) {
        ssize_t written = ::write(fd, cursor, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        cursor += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// CREATION
// ============================================================================

Outcome<CodeArtifact> CodeArtifact::Materialize(const std::string& code,
                                                const fs::path& root,
                                                const std::string& filename) {
    if (filename.empty() || filename.find('/') != std::string::npos) {
        return Outcome<CodeArtifact>::Failure("invalid artifact file name '" + filename + "'");
    }

    std::error_code ec;
    fs::path base = fs::absolute(root, ec);
    if (ec) {
        return Outcome<CodeArtifact>::Failure("invalid artifact root '" + root.string() +
                                              "': " + ec.message());
    }

    std::string pattern = (base / "renju_XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (::mkdtemp(buffer.data()) == nullptr) {
        return Outcome<CodeArtifact>::Failure(
            ErrnoMessage("failed to create artifact directory under " + base.string()));
    }

    // From here on the artifact owns the directory, so every failure path cleans up
    CodeArtifact artifact(fs::path(buffer.data()), fs::path(buffer.data()) / filename);

    int fd = ::open(artifact.file_path_.c_str(),
                    O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, 0600);
    if (fd < 0) {
        return Outcome<CodeArtifact>::Failure(
            ErrnoMessage("failed to create " + artifact.file_path_.string()));
    }

    bool written = WriteAll(fd, code);
    int write_errno = errno;
    if (::close(fd) != 0 && written) {
        return Outcome<CodeArtifact>::Failure(
            ErrnoMessage("failed to close " + artifact.file_path_.string()));
    }
    if (!written) {
        errno = write_errno;
        return Outcome<CodeArtifact>::Failure(
            ErrnoMessage("failed to write " + artifact.file_path_.string()));
    }

    spdlog::debug("Artifact materialized: {} ({} bytes)",
                  artifact.file_path_.string(), code.size());

    return Outcome<CodeArtifact>::Success(std::move(artifact));
}

CodeArtifact::CodeArtifact(fs::path directory, fs::path file_path)
    : directory_(std::move(directory))
    , file_path_(std::move(file_path)) {
}

// ============================================================================
// OWNERSHIP
// ============================================================================

CodeArtifact::~CodeArtifact() {
    if (auto error = Release()) {
        spdlog::warn("Artifact cleanup failed: {}", *error);
    }
}

CodeArtifact::CodeArtifact(CodeArtifact&& other) noexcept
    : directory_(std::move(other.directory_))
    , file_path_(std::move(other.file_path_)) {
    other.directory_.clear();
    other.file_path_.clear();
}

CodeArtifact& CodeArtifact::operator=(CodeArtifact&& other) noexcept {
    if (this != &other) {
        if (auto error = Release()) {
            spdlog::warn("Artifact cleanup failed: {}", *error);
        }
        directory_ = std::move(other.directory_);
        file_path_ = std::move(other.file_path_);
        other.directory_.clear();
        other.file_path_.clear();
    }
    return *this;
}

std::optional<std::string> CodeArtifact::Release() {
    if (directory_.empty()) {
        return std::nullopt;
    }

    fs::path directory = std::move(directory_);
    directory_.clear();

    std::error_code ec;
    fs::remove_all(directory, ec);
    if (ec) {
        return "failed to remove artifact " + directory.string() + ": " + ec.message();
    }

    spdlog::debug("Artifact removed: {}", directory.string());
    return std::nullopt;
}

} // namespace core
} // namespace renju
