#ifndef MEDIGUARD_UTIL_KECCAK_HPP
#define MEDIGUARD_UTIL_KECCAK_HPP

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include "util/hashing.hpp"

/**
 * @file keccak.hpp
 * @brief Keccak-256 as Ethereum uses it (original 0x01 padding, not SHA3-256).
 *
 * Needed for account addresses, transaction signing hashes and transaction
 * ids. OpenSSL 3.0 only ships the FIPS 202 variants, whose padding differs.
 *
 * USAGE:
 *   @code
 *   std::string id = "0x" + mediguard::util::hashing::keccak256Hex(rawTransactionBytes);
 *   @endcode
 */

namespace mediguard {
namespace util {
namespace hashing {

namespace detail {

constexpr uint64_t kKeccakRoundConstants[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL, 0x8000000080008000ULL,
    0x000000000000808BULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
    0x000000000000008AULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
    0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800AULL, 0x800000008000000AULL,
    0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

// Rotation offset of lane (x, y), indexed x + 5 * y.
constexpr int kKeccakRotations[25] = {
     0,  1, 62, 28, 27,
    36, 44,  6, 55, 20,
     3, 10, 43, 25, 39,
    41, 45, 15, 21,  8,
    18,  2, 61, 56, 14
};

inline uint64_t rotl64(uint64_t v, int n)
{
    return n == 0 ? v : (v << n) | (v >> (64 - n));
}

inline void keccakF1600(uint64_t state[25])
{
    for (int round = 0; round < 24; ++round) {
        // theta
        uint64_t c[5];
        for (int x = 0; x < 5; ++x) {
            c[x] = state[x] ^ state[x + 5] ^ state[x + 10] ^ state[x + 15] ^ state[x + 20];
        }
        for (int x = 0; x < 5; ++x) {
            const uint64_t d = c[(x + 4) % 5] ^ rotl64(c[(x + 1) % 5], 1);
            for (int y = 0; y < 5; ++y) {
                state[x + 5 * y] ^= d;
            }
        }

        // rho and pi
        uint64_t b[25];
        for (int x = 0; x < 5; ++x) {
            for (int y = 0; y < 5; ++y) {
                b[y + 5 * ((2 * x + 3 * y) % 5)] = rotl64(state[x + 5 * y], kKeccakRotations[x + 5 * y]);
            }
        }

        // chi
        for (int x = 0; x < 5; ++x) {
            for (int y = 0; y < 5; ++y) {
                state[x + 5 * y] = b[x + 5 * y] ^ (~b[(x + 1) % 5 + 5 * y] & b[(x + 2) % 5 + 5 * y]);
            }
        }

        // iota
        state[0] ^= kKeccakRoundConstants[round];
    }
}

inline void keccakAbsorb(uint64_t state[25], const unsigned char *block, std::size_t rate)
{
    for (std::size_t i = 0; i < rate; ++i) {
        state[i / 8] ^= static_cast<uint64_t>(block[i]) << (8 * (i % 8));
    }
    keccakF1600(state);
}

} // namespace detail

constexpr std::size_t kKeccak256Length = 32;

inline std::array<unsigned char, kKeccak256Length> keccak256(const unsigned char *data, std::size_t len)
{
    constexpr std::size_t kRate = 136;
    uint64_t state[25] = {0};

    while (len >= kRate) {
        detail::keccakAbsorb(state, data, kRate);
        data += kRate;
        len -= kRate;
    }

    unsigned char last[kRate] = {0};
    if (len > 0) {
        std::memcpy(last, data, len);
    }
    last[len] ^= 0x01;
    last[kRate - 1] ^= 0x80;
    detail::keccakAbsorb(state, last, kRate);

    std::array<unsigned char, kKeccak256Length> digest{};
    for (std::size_t i = 0; i < kKeccak256Length; ++i) {
        digest[i] = static_cast<unsigned char>(state[i / 8] >> (8 * (i % 8)));
    }
    return digest;
}

inline std::array<unsigned char, kKeccak256Length> keccak256(const std::string &bytes)
{
    return keccak256(reinterpret_cast<const unsigned char *>(bytes.data()), bytes.size());
}

/// Lowercase hex, no 0x prefix.
inline std::string keccak256Hex(const std::string &bytes)
{
    const auto digest = keccak256(bytes);
    return toHex(digest.data(), digest.size());
}

} // namespace hashing
} // namespace util
} // namespace mediguard

#endif // MEDIGUARD_UTIL_KECCAK_HPP
