#include "anchor/transaction_signer.hpp"

#include <cctype>
#include <limits>
#include <memory>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/obj_mac.h>
#include "core/errors.hpp"
#include "util/hashing.hpp"
#include "util/keccak.hpp"

namespace mediguard {
namespace anchor {

namespace {

using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using PointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

[[noreturn]] void signingFailed(const std::string &what)
{
    throw core::AnchorServiceFailure("transaction signing: " + what);
}

void check(int rc, const char *what)
{
    if (rc != 1) {
        signingFailed(std::string(what) + " failed");
    }
}

BnPtr newBn()
{
    BnPtr bn(BN_new(), &BN_clear_free);
    if (!bn) {
        signingFailed("BN_new failed");
    }
    return bn;
}

BnCtxPtr newBnCtx()
{
    BnCtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
    if (!ctx) {
        signingFailed("BN_CTX_new failed");
    }
    return ctx;
}

BnPtr bnFromBytes(const std::string &bytes)
{
    BnPtr bn = newBn();
    if (BN_bin2bn(reinterpret_cast<const unsigned char *>(bytes.data()), static_cast<int>(bytes.size()),
                  bn.get()) == nullptr) {
        signingFailed("BN_bin2bn failed");
    }
    return bn;
}

std::string bnToBytes32(const BIGNUM *bn)
{
    std::string out(32, '\0');
    if (BN_bn2binpad(bn, reinterpret_cast<unsigned char *>(&out[0]), 32) != 32) {
        signingFailed("value does not fit 32 bytes");
    }
    return out;
}

std::string hmacSha256(const std::string &key, const std::string &data)
{
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char *>(data.data()), data.size(), out, &outLen) == nullptr) {
        signingFailed("HMAC-SHA256 failed");
    }
    return std::string(reinterpret_cast<const char *>(out), outLen);
}

std::string keccakBytes(const std::string &bytes)
{
    const auto digest = util::hashing::keccak256(bytes);
    return std::string(reinterpret_cast<const char *>(digest.data()), digest.size());
}

std::string lengthPrefix(std::size_t length, unsigned char shortBase, unsigned char longBase)
{
    if (length <= 55) {
        return std::string(1, static_cast<char>(shortBase + length));
    }
    std::string lengthBytes;
    for (std::size_t n = length; n != 0; n >>= 8) {
        lengthBytes.insert(lengthBytes.begin(), static_cast<char>(n & 0xFF));
    }
    return std::string(1, static_cast<char>(longBase + lengthBytes.size())) + lengthBytes;
}

} // namespace

// -----------------------------------------------------------------------------
// RLP
// -----------------------------------------------------------------------------
namespace rlp {

std::string encodeBytes(const std::string &bytes)
{
    if (bytes.size() == 1 && static_cast<unsigned char>(bytes[0]) < 0x80) {
        return bytes;
    }
    return lengthPrefix(bytes.size(), 0x80, 0xb7) + bytes;
}

std::string encodeUint(uint64_t value)
{
    std::string bytes;
    for (; value != 0; value >>= 8) {
        bytes.insert(bytes.begin(), static_cast<char>(value & 0xFF));
    }
    return encodeBytes(bytes);
}

std::string encodeBigEndian(const std::string &bytes)
{
    const std::size_t first = bytes.find_first_not_of('\0');
    return encodeBytes(first == std::string::npos ? std::string() : bytes.substr(first));
}

std::string encodeList(const std::vector<std::string> &encodedItems)
{
    std::string payload;
    for (const auto &item : encodedItems) {
        payload += item;
    }
    return lengthPrefix(payload.size(), 0xc0, 0xf7) + payload;
}

} // namespace rlp

std::string decodeHex(const std::string &hex)
{
    std::size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }
    if ((hex.size() - start) % 2 != 0) {
        throw std::invalid_argument("hex string has an odd number of digits");
    }
    auto nibble = [](char ch) -> int {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument("invalid hex digit");
    };
    std::string out;
    out.reserve((hex.size() - start) / 2);
    for (std::size_t i = start; i < hex.size(); i += 2) {
        out.push_back(static_cast<char>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
    }
    return out;
}

namespace {

std::vector<std::string> transactionFields(const LegacyTransaction &tx)
{
    std::string to;
    try {
        to = decodeHex(tx.to);
    } catch (const std::invalid_argument &ex) {
        signingFailed("recipient '" + tx.to + "': " + ex.what());
    }
    if (to.size() != 20) {
        signingFailed("recipient '" + tx.to + "' is not a 20-byte address");
    }
    return {
        rlp::encodeUint(tx.nonce),
        rlp::encodeUint(tx.gasPrice),
        rlp::encodeUint(tx.gasLimit),
        rlp::encodeBytes(to),
        rlp::encodeUint(tx.value),
        rlp::encodeBytes(tx.data),
    };
}

} // namespace

std::string signingPayload(const LegacyTransaction &tx)
{
    std::vector<std::string> fields = transactionFields(tx);
    fields.push_back(rlp::encodeUint(tx.chainId));
    fields.push_back(rlp::encodeUint(0));
    fields.push_back(rlp::encodeUint(0));
    return rlp::encodeList(fields);
}

// -----------------------------------------------------------------------------
// TransactionSigner
// -----------------------------------------------------------------------------
TransactionSigner::TransactionSigner(const std::string &privateKeyHex)
    : m_group(nullptr), m_privateKey(nullptr)
{
    std::string keyBytes;
    try {
        keyBytes = decodeHex(privateKeyHex);
    } catch (const std::invalid_argument &ex) {
        throw core::ConfigurationError(std::string("private key is not hex: ") + ex.what());
    }
    if (keyBytes.size() != 32) {
        throw core::ConfigurationError("private key must be 32 bytes (64 hex digits)");
    }

    m_group = EC_GROUP_new_by_curve_name(NID_secp256k1);
    if (m_group == nullptr) {
        throw core::ConfigurationError("OpenSSL has no secp256k1 curve");
    }
    m_privateKey = BN_bin2bn(reinterpret_cast<const unsigned char *>(keyBytes.data()), 32, nullptr);
    if (m_privateKey == nullptr) {
        EC_GROUP_free(m_group);
        throw core::ConfigurationError("private key could not be loaded");
    }
    const BIGNUM *order = EC_GROUP_get0_order(m_group);
    if (BN_is_zero(m_privateKey) || BN_cmp(m_privateKey, order) >= 0) {
        BN_clear_free(m_privateKey);
        EC_GROUP_free(m_group);
        throw core::ConfigurationError("private key is outside the secp256k1 range");
    }

    try {
        BnCtxPtr ctx = newBnCtx();
        PointPtr pub(EC_POINT_new(m_group), &EC_POINT_free);
        if (!pub) {
            signingFailed("EC_POINT_new failed");
        }
        check(EC_POINT_mul(m_group, pub.get(), m_privateKey, nullptr, nullptr, ctx.get()), "EC_POINT_mul");

        unsigned char encoded[65];
        if (EC_POINT_point2oct(m_group, pub.get(), POINT_CONVERSION_UNCOMPRESSED, encoded, sizeof(encoded),
                               ctx.get()) != sizeof(encoded)) {
            signingFailed("public key encoding failed");
        }
        m_publicKey.assign(reinterpret_cast<const char *>(encoded), sizeof(encoded));

        const auto digest = util::hashing::keccak256(encoded + 1, 64);
        m_address = "0x" + util::hashing::toHex(digest.data() + 12, 20);
    } catch (const core::AnchorServiceFailure &ex) {
        BN_clear_free(m_privateKey);
        EC_GROUP_free(m_group);
        throw core::ConfigurationError(std::string("private key: ") + ex.what());
    }
}

TransactionSigner::~TransactionSigner()
{
    BN_clear_free(m_privateKey);
    EC_GROUP_free(m_group);
}

SignedTransaction TransactionSigner::Sign(const LegacyTransaction &tx) const
{
    if (tx.chainId == 0 || tx.chainId > (std::numeric_limits<uint64_t>::max() - 36) / 2) {
        signingFailed("chain id " + std::to_string(tx.chainId) + " cannot be replay-protected");
    }

    const Signature sig = signDigest(keccakBytes(signingPayload(tx)));
    if (sig.recoveryId > 1) {
        signingFailed("signature point is not representable in an EIP-155 v value");
    }

    std::vector<std::string> fields = transactionFields(tx);
    fields.push_back(rlp::encodeUint(tx.chainId * 2 + 35 + static_cast<uint64_t>(sig.recoveryId)));
    fields.push_back(rlp::encodeBigEndian(sig.r));
    fields.push_back(rlp::encodeBigEndian(sig.s));
    const std::string raw = rlp::encodeList(fields);

    SignedTransaction out;
    out.rawHex = "0x" + util::hashing::toHex(reinterpret_cast<const unsigned char *>(raw.data()), raw.size());
    out.hash = "0x" + util::hashing::keccak256Hex(raw);
    return out;
}

// RFC 6979 section 3.2 with HMAC-SHA256; qlen equals hlen (256 bits).
TransactionSigner::Signature TransactionSigner::signDigest(const std::string &digest) const
{
    BnCtxPtr ctx = newBnCtx();
    const BIGNUM *order = EC_GROUP_get0_order(m_group);

    BnPtr z = bnFromBytes(digest);
    check(BN_nnmod(z.get(), z.get(), order, ctx.get()), "BN_nnmod");

    BnPtr halfOrder = newBn();
    check(BN_rshift1(halfOrder.get(), order), "BN_rshift1");

    const std::string x = bnToBytes32(m_privateKey);
    const std::string h1 = bnToBytes32(z.get());

    std::string v(32, '\x01');
    std::string k(32, '\0');
    k = hmacSha256(k, v + std::string(1, '\0') + x + h1);
    v = hmacSha256(k, v);
    k = hmacSha256(k, v + std::string(1, '\x01') + x + h1);
    v = hmacSha256(k, v);

    for (;;) {
        v = hmacSha256(k, v);
        BnPtr nonce = bnFromBytes(v);

        if (!BN_is_zero(nonce.get()) && BN_cmp(nonce.get(), order) < 0) {
            PointPtr point(EC_POINT_new(m_group), &EC_POINT_free);
            if (!point) {
                signingFailed("EC_POINT_new failed");
            }
            check(EC_POINT_mul(m_group, point.get(), nonce.get(), nullptr, nullptr, ctx.get()), "EC_POINT_mul");

            BnPtr px = newBn();
            BnPtr py = newBn();
            check(EC_POINT_get_affine_coordinates(m_group, point.get(), px.get(), py.get(), ctx.get()),
                  "EC_POINT_get_affine_coordinates");

            BnPtr r = newBn();
            check(BN_nnmod(r.get(), px.get(), order, ctx.get()), "BN_nnmod");

            if (!BN_is_zero(r.get())) {
                // s = k^-1 * (z + r * d) mod n
                BnPtr nonceInverse = newBn();
                if (BN_mod_inverse(nonceInverse.get(), nonce.get(), order, ctx.get()) == nullptr) {
                    signingFailed("BN_mod_inverse failed");
                }
                BnPtr rd = newBn();
                check(BN_mod_mul(rd.get(), r.get(), m_privateKey, order, ctx.get()), "BN_mod_mul");
                BnPtr sum = newBn();
                check(BN_mod_add(sum.get(), z.get(), rd.get(), order, ctx.get()), "BN_mod_add");
                BnPtr s = newBn();
                check(BN_mod_mul(s.get(), nonceInverse.get(), sum.get(), order, ctx.get()), "BN_mod_mul");

                if (!BN_is_zero(s.get())) {
                    Signature sig;
                    sig.recoveryId = BN_is_odd(py.get()) ? 1 : 0;
                    if (BN_cmp(px.get(), order) >= 0) {
                        sig.recoveryId |= 2;
                    }
                    if (BN_cmp(s.get(), halfOrder.get()) > 0) {
                        check(BN_sub(s.get(), order, s.get()), "BN_sub");
                        sig.recoveryId ^= 1;
                    }
                    sig.r = bnToBytes32(r.get());
                    sig.s = bnToBytes32(s.get());
                    return sig;
                }
            }
        }

        k = hmacSha256(k, v + std::string(1, '\0'));
        v = hmacSha256(k, v);
    }
}

} // namespace anchor
} // namespace mediguard
