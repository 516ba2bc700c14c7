#include "anchor/rpc_anchor_service.hpp"

#include <algorithm>
#include <cctype>
#include <thread>
#include <utility>
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include "core/errors.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace mediguard {
namespace anchor {

using util::json::JsonValue;

std::string toHexQuantity(uint64_t value)
{
    static const char kHex[] = "0123456789abcdef";
    if (value == 0) {
        return "0x0";
    }
    std::string digits;
    while (value != 0) {
        digits.insert(digits.begin(), kHex[value & 0x0F]);
        value >>= 4;
    }
    return "0x" + digits;
}

uint64_t parseHexQuantity(const std::string &text)
{
    if (text.size() < 3 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X') || text.size() > 18) {
        throw core::AnchorServiceFailure("malformed hex quantity '" + text + "'");
    }
    uint64_t value = 0;
    for (std::size_t i = 2; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        int digit;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (std::isxdigit(c)) {
            digit = std::tolower(c) - 'a' + 10;
        } else {
            throw core::AnchorServiceFailure("malformed hex quantity '" + text + "'");
        }
        value = (value << 4) | static_cast<uint64_t>(digit);
    }
    return value;
}

std::string hexEncodeText(const std::string &text)
{
    return "0x" + util::hashing::toHex(reinterpret_cast<const unsigned char *>(text.data()), text.size());
}

namespace {

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

RpcAnchorService::RpcAnchorService(RpcAnchorSettings settings, std::shared_ptr<IRpcTransport> transport)
    : m_settings(std::move(settings)),
      m_transport(std::move(transport)),
      m_nextRequestId(1)
{
    if (!m_transport) {
        throw core::ConfigurationError("RpcAnchorService: no transport");
    }
    if (m_settings.rpcUrl.empty()) {
        throw core::ConfigurationError("RpcAnchorService: rpc url is required");
    }

    if (!m_settings.privateKey.empty()) {
        m_signer = std::make_unique<TransactionSigner>(m_settings.privateKey);
        m_address = m_signer->Address();
        if (!m_settings.fromAddress.empty() && toLower(m_settings.fromAddress) != m_address) {
            throw core::ConfigurationError("RpcAnchorService: fromAddress " + m_settings.fromAddress +
                                           " is not the address of the private key (" + m_address + ")");
        }
    } else if (m_settings.fromAddress.empty()) {
        throw core::ConfigurationError("RpcAnchorService: a from address or a private key is required");
    } else {
        m_address = m_settings.fromAddress;
    }
}

JsonValue RpcAnchorService::call(const std::string &method, JsonValue params)
{
    JsonValue request = JsonValue::object();
    request.set("jsonrpc", "2.0");
    request.set("method", method);
    request.set("params", std::move(params));
    request.set("id", static_cast<int64_t>(m_nextRequestId++));

    const std::string responseText = m_transport->Post(m_settings.rpcUrl, util::json::canonicalEncode(request));

    JsonValue response;
    try {
        response = util::json::parse(responseText);
    } catch (const util::json::JsonError &ex) {
        throw core::AnchorServiceFailure(method + ": unparsable rpc response: " + ex.what());
    }
    if (!response.isObject()) {
        throw core::AnchorServiceFailure(method + ": rpc response is not an object");
    }

    if (const JsonValue *error = response.find("error")) {
        std::string message = "rpc error";
        if (error->isObject()) {
            if (const JsonValue *msg = error->find("message")) {
                if (msg->isString()) {
                    message = msg->asString();
                }
            }
        }
        throw core::AnchorServiceFailure(method + ": " + message);
    }

    const JsonValue *result = response.find("result");
    return result ? *result : JsonValue();
}

JsonValue RpcAnchorService::fetchReceipt(const std::string &txHash)
{
    JsonValue params = JsonValue::array();
    params.push(txHash);
    return call("eth_getTransactionReceipt", std::move(params));
}

AnchorReceipt RpcAnchorService::Commit(const std::string &headHash, const JsonValue &metadata)
{
    std::string data = "MediGuardAI:" + headHash;
    if (!metadata.isNull()) {
        data += ":" + util::json::canonicalEncode(metadata);
    }

    const JsonValue gasPriceResult = call("eth_gasPrice", JsonValue::array());
    if (!gasPriceResult.isString()) {
        throw core::AnchorServiceFailure("eth_gasPrice: unexpected result");
    }
    const uint64_t gasPrice = parseHexQuantity(gasPriceResult.asString());
    const auto adjustedGasPrice = static_cast<uint64_t>(
        static_cast<double>(gasPrice) * m_settings.gasPriceMultiplier);

    const std::string txHash = m_signer ? sendSigned(data, adjustedGasPrice)
                                        : sendThroughNode(data, adjustedGasPrice);
    util::logger::info("[RpcAnchorService] Sent anchor transaction " + txHash + " for head " + headHash);

    const auto deadline = std::chrono::steady_clock::now() + m_settings.receiptTimeout;
    JsonValue receipt = fetchReceipt(txHash);
    while (receipt.isNull()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw core::AnchorServiceFailure("no receipt for " + txHash + " within " +
                                             std::to_string(m_settings.receiptTimeout.count()) + " ms");
        }
        std::this_thread::sleep_for(m_settings.receiptPoll);
        receipt = fetchReceipt(txHash);
    }
    if (!receipt.isObject()) {
        throw core::AnchorServiceFailure("eth_getTransactionReceipt: unexpected result for " + txHash);
    }

    AnchorReceipt out;
    out.reference = txHash;
    if (const JsonValue *hash = receipt.find("transactionHash")) {
        if (hash->isString()) {
            out.reference = hash->asString();
        }
    }
    const JsonValue *status = receipt.find("status");
    out.status = (status && status->isString()) ? static_cast<int>(parseHexQuantity(status->asString())) : 1;
    if (out.status == 0) {
        throw core::AnchorServiceFailure("anchor transaction " + txHash + " failed on chain (status 0x0)");
    }
    const JsonValue *block = receipt.find("blockNumber");
    if (!block || !block->isString()) {
        throw core::AnchorServiceFailure("receipt for " + txHash + " has no block number");
    }
    out.position = static_cast<int64_t>(parseHexQuantity(block->asString()));
    if (const JsonValue *gasUsed = receipt.find("gasUsed")) {
        if (gasUsed->isString()) {
            out.gasUsed = parseHexQuantity(gasUsed->asString());
        }
    }

    util::logger::info("[RpcAnchorService] Anchor " + out.reference + " mined in block " +
                       std::to_string(out.position) + ", gas used " + std::to_string(out.gasUsed));
    return out;
}

std::string RpcAnchorService::sendThroughNode(const std::string &data, uint64_t gasPrice)
{
    JsonValue tx = JsonValue::object();
    tx.set("from", m_address);
    tx.set("to", m_address);
    tx.set("value", "0x0");
    tx.set("gas", toHexQuantity(m_settings.gasLimit));
    tx.set("gasPrice", toHexQuantity(gasPrice));
    tx.set("data", hexEncodeText(data));
    tx.set("chainId", toHexQuantity(m_settings.chainId));

    JsonValue params = JsonValue::array();
    params.push(tx);
    const JsonValue sent = call("eth_sendTransaction", std::move(params));
    if (!sent.isString() || sent.asString().empty()) {
        throw core::AnchorServiceFailure("eth_sendTransaction: no transaction hash returned");
    }
    return sent.asString();
}

std::string RpcAnchorService::sendSigned(const std::string &data, uint64_t gasPrice)
{
    JsonValue countParams = JsonValue::array();
    countParams.push(m_address);
    countParams.push("pending");
    const JsonValue count = call("eth_getTransactionCount", std::move(countParams));
    if (!count.isString()) {
        throw core::AnchorServiceFailure("eth_getTransactionCount: unexpected result");
    }

    LegacyTransaction tx;
    tx.nonce = parseHexQuantity(count.asString());
    tx.gasPrice = gasPrice;
    tx.gasLimit = m_settings.gasLimit;
    tx.to = m_address;
    tx.value = 0;
    tx.data = data;
    tx.chainId = m_settings.chainId;
    const SignedTransaction signedTx = m_signer->Sign(tx);

    JsonValue params = JsonValue::array();
    params.push(signedTx.rawHex);
    const JsonValue sent = call("eth_sendRawTransaction", std::move(params));
    if (!sent.isString() || sent.asString().empty()) {
        throw core::AnchorServiceFailure("eth_sendRawTransaction: no transaction hash returned");
    }
    if (toLower(sent.asString()) != signedTx.hash) {
        util::logger::warn("[RpcAnchorService] Node reported " + sent.asString() +
                           " for transaction " + signedTx.hash + " (nonce " + std::to_string(tx.nonce) + ")");
    }
    return sent.asString();
}

AccountBalance RpcAnchorService::GetBalance()
{
    JsonValue params = JsonValue::array();
    params.push(m_address);
    params.push("latest");
    const JsonValue result = call("eth_getBalance", std::move(params));
    if (!result.isString()) {
        throw core::AnchorServiceFailure("eth_getBalance: unexpected result");
    }

    const std::string &text = result.asString();
    if (text.size() < 3 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X') ||
        !std::all_of(text.begin() + 2, text.end(), [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        throw core::AnchorServiceFailure("eth_getBalance: malformed quantity '" + text + "'");
    }

    // Balances overflow 64 bits above ~18.4 ether.
    BIGNUM *wei = nullptr;
    if (BN_hex2bn(&wei, text.c_str() + 2) == 0 || wei == nullptr) {
        BN_free(wei);
        throw core::AnchorServiceFailure("eth_getBalance: cannot parse '" + text + "'");
    }
    char *decimal = BN_bn2dec(wei);
    BN_free(wei);
    if (decimal == nullptr) {
        throw core::AnchorServiceFailure("eth_getBalance: cannot convert '" + text + "'");
    }

    AccountBalance balance;
    balance.address = m_address;
    balance.wei = decimal;
    OPENSSL_free(decimal);

    double weiValue = 0.0;
    for (std::size_t i = 2; i < text.size(); ++i) {
        const int c = std::tolower(static_cast<unsigned char>(text[i]));
        weiValue = weiValue * 16.0 + static_cast<double>(std::isdigit(c) ? c - '0' : c - 'a' + 10);
    }
    balance.ether = weiValue / 1e18;

    util::logger::debug("[RpcAnchorService] Balance of " + m_address + ": " + balance.wei + " wei");
    return balance;
}

AnchorVerification RpcAnchorService::Verify(const std::string &reference)
{
    AnchorVerification result;
    result.reference = reference;
    try {
        JsonValue params = JsonValue::array();
        params.push(reference);
        const JsonValue tx = call("eth_getTransactionByHash", std::move(params));
        if (!tx.isObject()) {
            result.error = "transaction not found";
            return result;
        }
        const JsonValue receipt = fetchReceipt(reference);

        result.found = true;
        if (const JsonValue *input = tx.find("input")) {
            if (input->isString()) result.rawData = input->asString();
        }
        if (const JsonValue *from = tx.find("from")) {
            if (from->isString()) result.from = from->asString();
        }
        if (const JsonValue *to = tx.find("to")) {
            if (to->isString()) result.to = to->asString();
        }
        if (receipt.isObject()) {
            if (const JsonValue *block = receipt.find("blockNumber")) {
                if (block->isString()) result.position = static_cast<int64_t>(parseHexQuantity(block->asString()));
            }
            if (const JsonValue *status = receipt.find("status")) {
                if (status->isString()) result.status = static_cast<int>(parseHexQuantity(status->asString()));
            }
        }
    } catch (const core::AnchorServiceFailure &ex) {
        util::logger::warn("[RpcAnchorService] Verify " + reference + " failed: " + ex.what());
        result.found = false;
        result.error = ex.what();
    }
    return result;
}

bool RpcAnchorService::IsConnected()
{
    try {
        const JsonValue id = call("eth_chainId", JsonValue::array());
        if (!id.isString()) {
            return false;
        }
        const uint64_t chainId = parseHexQuantity(id.asString());
        if (chainId != m_settings.chainId) {
            util::logger::warn("[RpcAnchorService] Endpoint chain id " + std::to_string(chainId) +
                               " differs from configured " + std::to_string(m_settings.chainId));
            return false;
        }
        return true;
    } catch (const core::AnchorServiceFailure &ex) {
        util::logger::warn(std::string("[RpcAnchorService] Connectivity check failed: ") + ex.what());
        return false;
    }
}

} // namespace anchor
} // namespace mediguard
