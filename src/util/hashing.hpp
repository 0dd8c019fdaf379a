#ifndef PIIGUARD_UTIL_HASHING_HPP
#define PIIGUARD_UTIL_HASHING_HPP

#include <string>
#include <string_view>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 digests used by the "hash" redaction method.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * USAGE:
 *   @code
 *   #include "util/hashing.hpp"
 *   using namespace piiguard::util::hashing;
 *
 *   std::string full = sha256Hex("john@example.com");      // 64 hex chars
 *   std::string tag  = sha256Hex("john@example.com", 16);  // first 16 hex chars
 *   @endcode
 */

namespace piiguard {
namespace util {
namespace hashing {

/**
 * @brief Lowercase hex encoding of a raw byte buffer.
 */
inline std::string toHex(const unsigned char *data, size_t length)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

/**
 * @brief Compute a SHA-256 hash of the input bytes, return as lowercase hex.
 * @param input The data to be hashed.
 * @param hexChars If non-zero, truncate the hex digest to this many characters.
 * @return The (possibly truncated) hex digest.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256Hex(std::string_view input, size_t hexChars = 0)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hashLen = 0;

    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256Hex: Failed to create EVP_MD_CTX.");
    }
    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1
        || EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1)
    {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256Hex: digest computation failed.");
    }
    EVP_MD_CTX_free(mdctx);

    std::string hex = toHex(hash, hashLen);
    if (hexChars != 0 && hexChars < hex.size()) {
        hex.resize(hexChars);
    }
    return hex;
}

} // namespace hashing
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_HASHING_HPP
