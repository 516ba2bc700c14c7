#ifndef MEDIGUARD_UTIL_HASHING_HPP
#define MEDIGUARD_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <memory>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 helpers used for chain entry hashes and simulated anchor references.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto).
 *
 * USAGE:
 *   @code
 *   #include "util/hashing.hpp"
 *   using namespace mediguard::util::hashing;
 *
 *   std::string digest = sha256Hex(canonicalText);
 *   // digest is a 64-character lowercase hex string.
 *   @endcode
 */

namespace mediguard {
namespace util {
namespace hashing {

/// Length of a hex-encoded SHA-256 digest.
constexpr std::size_t kSha256HexLength = SHA256_DIGEST_LENGTH * 2;

/**
 * @brief Lowercase hex encoding of raw bytes.
 */
inline std::string toHex(const unsigned char *data, std::size_t len)
{
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(kHex[(data[i] >> 4) & 0x0F]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

/**
 * @brief Compute the SHA-256 digest of a byte string, returned as lowercase hex.
 * @param input The exact bytes to hash (no normalisation is applied).
 * @return A 64-character hex string.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256Hex(const std::string &input)
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("hashing::sha256Hex: failed to create EVP_MD_CTX.");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("hashing::sha256Hex: EVP_DigestInit_ex failed.");
    }
    if (EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
        throw std::runtime_error("hashing::sha256Hex: EVP_DigestUpdate failed.");
    }

    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1 || digestLen != SHA256_DIGEST_LENGTH) {
        throw std::runtime_error("hashing::sha256Hex: EVP_DigestFinal_ex failed.");
    }
    return toHex(digest, digestLen);
}

/**
 * @brief True if @p value looks like a hex SHA-256 digest (64 lowercase hex chars).
 */
inline bool isSha256Hex(const std::string &value)
{
    if (value.size() != kSha256HexLength) {
        return false;
    }
    for (char c : value) {
        const bool digit = (c >= '0' && c <= '9');
        const bool lowerHex = (c >= 'a' && c <= 'f');
        if (!digit && !lowerHex) {
            return false;
        }
    }
    return true;
}

} // namespace hashing
} // namespace util
} // namespace mediguard

#endif // MEDIGUARD_UTIL_HASHING_HPP
