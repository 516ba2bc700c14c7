#ifndef MEDIGUARD_ANCHOR_RPC_ANCHOR_SERVICE_HPP
#define MEDIGUARD_ANCHOR_RPC_ANCHOR_SERVICE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "anchor/anchor_service.hpp"
#include "anchor/rpc_transport.hpp"
#include "anchor/transaction_signer.hpp"

/**
 * @file rpc_anchor_service.hpp
 * @brief Anchors chain heads on an Ethereum-compatible ledger over JSON-RPC.
 *
 * Every anchor is a zero-value self-transfer whose data field is the hex of
 * "MediGuardAI:<head>:<canonical metadata>". With a private key configured
 * the transaction is signed locally (TransactionSigner) and sent with
 * eth_sendRawTransaction, the nonce coming from eth_getTransactionCount
 * ("pending"). Without one, the node's own account signs it through
 * eth_sendTransaction. The receipt is polled until it appears or the receipt
 * timeout runs out.
 */

namespace mediguard {
namespace anchor {

struct RpcAnchorSettings
{
    std::string rpcUrl;
    std::string fromAddress;   ///< node-managed account; derived from privateKey when that is set
    std::string privateKey;    ///< hex secp256k1 key for local signing; empty to let the node sign
    uint64_t chainId{11155111};
    uint64_t gasLimit{100000};
    double gasPriceMultiplier{1.2};
    std::chrono::milliseconds receiptTimeout{std::chrono::seconds(120)};
    std::chrono::milliseconds receiptPoll{std::chrono::seconds(2)};
};

/// "0x" + lowercase hex without leading zeros ("0x0" for zero).
std::string toHexQuantity(uint64_t value);

/// @throw core::AnchorServiceFailure if text is not a 0x-prefixed hex quantity that fits 64 bits.
uint64_t parseHexQuantity(const std::string &text);

/// "0x" + hex of the raw bytes of text.
std::string hexEncodeText(const std::string &text);

struct AccountBalance
{
    std::string address;
    std::string wei;       ///< decimal
    double ether{0.0};
};

class RpcAnchorService : public IAnchorService
{
public:
    /**
     * @throw core::ConfigurationError without a transport or url, without an
     *        account, for a bad private key, or if fromAddress is not the key's address.
     */
    RpcAnchorService(RpcAnchorSettings settings, std::shared_ptr<IRpcTransport> transport);

    AnchorReceipt Commit(const std::string &headHash, const util::json::JsonValue &metadata) override;
    AnchorVerification Verify(const std::string &reference) override;
    std::string ModeName() const override { return "rpc"; }

    /// eth_chainId answered and matches the configured chain id.
    bool IsConnected() override;

    /**
     * @brief eth_getBalance of the sending account at the latest block.
     * @throw core::AnchorServiceFailure if the node does not answer with a quantity.
     */
    AccountBalance GetBalance();

    /// Lowercase 0x address transactions are sent from.
    const std::string &Address() const { return m_address; }

    bool SignsLocally() const { return m_signer != nullptr; }

    const RpcAnchorSettings &GetSettings() const { return m_settings; }

private:
    /**
     * @brief One JSON-RPC round trip.
     * @return the "result" member (null if absent).
     * @throw core::AnchorServiceFailure on transport errors, unparsable replies or an "error" member.
     */
    util::json::JsonValue call(const std::string &method, util::json::JsonValue params);

    /// Receipt object, or null JSON while the transaction is not mined yet.
    util::json::JsonValue fetchReceipt(const std::string &txHash);

    /// @return transaction hash reported by the node.
    std::string sendSigned(const std::string &data, uint64_t gasPrice);
    std::string sendThroughNode(const std::string &data, uint64_t gasPrice);

    RpcAnchorSettings m_settings;
    std::shared_ptr<IRpcTransport> m_transport;
    std::unique_ptr<TransactionSigner> m_signer;
    std::string m_address;
    std::atomic<int64_t> m_nextRequestId;
};

} // namespace anchor
} // namespace mediguard

#endif // MEDIGUARD_ANCHOR_RPC_ANCHOR_SERVICE_HPP
