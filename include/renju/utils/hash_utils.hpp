/**
 * @file hash_utils.hpp
 * @brief SHA-256 fingerprints for submitted strategy code
 *
 * Every snippet that enters the broker is fingerprinted so log lines and
 * reports can be correlated with the exact code that ran without logging
 * the code itself.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <filesystem>
#include <cstdint>
#include <cstddef>

namespace renju {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL EVP backed digests
 *
 * All methods are static and reentrant.
 *
 * **Usage Example**:
 * @code
 * std::string digest = HashUtils::ComputeSHA256(code);
 * spdlog::info("Executing snippet {}", HashUtils::ShortDigest(digest));
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of in-memory data as lowercase hex
     * @throws std::runtime_error on OpenSSL failure
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief SHA-256 of a file's contents as lowercase hex
     * @throws std::runtime_error if the file cannot be read
     */
    static std::string ComputeSHA256(const std::filesystem::path& file_path);

    /**
     * @brief First 12 hex characters, for log lines
     */
    static std::string ShortDigest(const std::string& hex_digest);

private:
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace renju
