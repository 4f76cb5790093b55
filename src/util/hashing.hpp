#ifndef CLINSCRUB_UTIL_HASHING_HPP
#define CLINSCRUB_UTIL_HASHING_HPP

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 fingerprints for notes stored in the redaction archive.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto).
 *
 * USAGE:
 *   @code
 *   std::string fp = clinscrub::util::hashing::sha256Hex(originalNote);
 *   // fp is a 64-hex-character string
 *   @endcode
 */

namespace clinscrub {
namespace util {
namespace hashing {

/**
 * @brief Compute a SHA-256 hash of the input text, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256Hex(const std::string &input)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hashLen = 0;
    if (EVP_Digest(input.data(), input.size(), hash, &hashLen, EVP_sha256(), nullptr) != 1 ||
        hashLen != SHA256_DIGEST_LENGTH)
    {
        throw std::runtime_error("hashing::sha256Hex: EVP_Digest failed.");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hashLen; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(hash[i]);
    }
    return oss.str();
}

} // namespace hashing
} // namespace util
} // namespace clinscrub

#endif // CLINSCRUB_UTIL_HASHING_HPP
