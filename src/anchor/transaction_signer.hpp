#ifndef MEDIGUARD_ANCHOR_TRANSACTION_SIGNER_HPP
#define MEDIGUARD_ANCHOR_TRANSACTION_SIGNER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <openssl/bn.h>
#include <openssl/ec.h>

/**
 * @file transaction_signer.hpp
 * @brief Local signing of anchor transactions with a secp256k1 account key.
 *
 * Hosted JSON-RPC endpoints do not hold accounts, so the anchoring
 * transaction is built, RLP-encoded and signed here and handed to the node
 * with eth_sendRawTransaction.
 *
 * DESIGN:
 *   - Legacy transactions with EIP-155 replay protection:
 *       signing hash = keccak256(rlp([nonce, gasPrice, gas, to, value, data, chainId, 0, 0]))
 *       raw          = rlp([nonce, gasPrice, gas, to, value, data, v, r, s]),
 *       v = chainId * 2 + 35 + recovery id
 *   - ECDSA over secp256k1 through OpenSSL (EC_GROUP / EC_POINT / BIGNUM).
 *     The nonce k is derived deterministically (RFC 6979, HMAC-SHA256) and
 *     s is normalized to the lower half of the order, so the same transaction
 *     always signs to the same bytes.
 */

namespace mediguard {
namespace anchor {

struct LegacyTransaction
{
    uint64_t nonce{0};
    uint64_t gasPrice{0};
    uint64_t gasLimit{0};
    std::string to;        ///< 0x + 40 hex digits
    uint64_t value{0};
    std::string data;      ///< raw bytes
    uint64_t chainId{0};
};

struct SignedTransaction
{
    std::string rawHex;    ///< 0x-prefixed, ready for eth_sendRawTransaction
    std::string hash;      ///< 0x + keccak256 of the raw bytes
};

namespace rlp {

std::string encodeBytes(const std::string &bytes);

/// Minimal big-endian encoding; zero is the empty string.
std::string encodeUint(uint64_t value);

/// Big-endian integer given as bytes; leading zero bytes are dropped.
std::string encodeBigEndian(const std::string &bytes);

std::string encodeList(const std::vector<std::string> &encodedItems);

} // namespace rlp

/**
 * @brief Decode hex (optional 0x prefix, even length).
 * @throw std::invalid_argument on anything else.
 */
std::string decodeHex(const std::string &hex);

/// The RLP bytes the EIP-155 signature commits to.
std::string signingPayload(const LegacyTransaction &tx);

class TransactionSigner
{
public:
    /**
     * @param privateKeyHex 32-byte key as hex, with or without 0x.
     * @throw core::ConfigurationError if the key is malformed or out of range.
     */
    explicit TransactionSigner(const std::string &privateKeyHex);
    ~TransactionSigner();

    TransactionSigner(const TransactionSigner &) = delete;
    TransactionSigner &operator=(const TransactionSigner &) = delete;

    /// Lowercase 0x address derived from the key.
    const std::string &Address() const { return m_address; }

    /// Uncompressed public key (0x04 || X || Y).
    const std::string &PublicKey() const { return m_publicKey; }

    /**
     * @throw core::AnchorServiceFailure if the transaction is malformed or OpenSSL fails.
     */
    SignedTransaction Sign(const LegacyTransaction &tx) const;

private:
    struct Signature
    {
        std::string r;     ///< 32 bytes big-endian
        std::string s;     ///< 32 bytes big-endian, low-s
        int recoveryId{0};
    };

    Signature signDigest(const std::string &digest) const;

    EC_GROUP *m_group;
    BIGNUM *m_privateKey;
    std::string m_publicKey;
    std::string m_address;
};

} // namespace anchor
} // namespace mediguard

#endif // MEDIGUARD_ANCHOR_TRANSACTION_SIGNER_HPP
