/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 fingerprinting using OpenSSL EVP
 *
 * Files are streamed in 8KB chunks; in-memory data is hashed in one update.
 *
 * @date 2025
 */

#include "renju/utils/hash_utils.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace renju {
namespace utils {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewSha256Context() {
    DigestContext context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!context || EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
    return context;
}

} // anonymous namespace

// Compute SHA256 hash (string)
std::string HashUtils::ComputeSHA256(const std::string& data) {
    auto context = NewSha256Context();

    if (EVP_DigestUpdate(context.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context.get(), hash, &length) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }

    return BinaryToHex(hash, length);
}

// Compute SHA256 hash (file)
std::string HashUtils::ComputeSHA256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    auto context = NewSha256Context();

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(context.get(), buffer,
                             static_cast<std::size_t>(file.gcount())) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context.get(), hash, &length) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }

    return BinaryToHex(hash, length);
}

std::string HashUtils::ShortDigest(const std::string& hex_digest) {
    return hex_digest.substr(0, 12);
}

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace utils
} // namespace renju
