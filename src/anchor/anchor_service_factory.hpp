#ifndef MEDIGUARD_ANCHOR_ANCHOR_SERVICE_FACTORY_HPP
#define MEDIGUARD_ANCHOR_ANCHOR_SERVICE_FACTORY_HPP

#include <chrono>
#include <memory>
#include "anchor/anchor_service.hpp"
#include "anchor/curl_rpc_transport.hpp"
#include "anchor/rpc_anchor_service.hpp"
#include "anchor/simulated_anchor_service.hpp"
#include "config/ledger_config.hpp"
#include "core/errors.hpp"
#include "core/hash_chain_store.hpp"
#include "util/logger.hpp"

namespace mediguard {
namespace anchor {

inline RpcAnchorSettings rpcSettingsFromConfig(const config::LedgerConfig &cfg)
{
    RpcAnchorSettings settings;
    settings.rpcUrl = cfg.rpcUrl;
    settings.fromAddress = cfg.fromAddress;
    settings.privateKey = cfg.privateKey;
    settings.chainId = cfg.chainId;
    settings.gasLimit = cfg.gasLimit;
    settings.gasPriceMultiplier = cfg.gasPriceMultiplier;
    settings.receiptTimeout = std::chrono::seconds(cfg.receiptTimeoutSeconds);
    settings.receiptPoll = std::chrono::milliseconds(cfg.receiptPollMillis);
    return settings;
}

/**
 * @brief Connect to the configured JSON-RPC node.
 *
 * The node must answer eth_chainId with the configured chain id. The service
 * signs locally when a private key is configured.
 *
 * @throw core::ConfigurationError if settings are missing or the endpoint is unusable.
 */
inline std::unique_ptr<RpcAnchorService> makeRpcAnchorService(const config::LedgerConfig &cfg)
{
    if (cfg.rpcUrl.empty() || (cfg.fromAddress.empty() && cfg.privateKey.empty())) {
        throw core::ConfigurationError("rpc anchor mode needs rpcUrl and either privateKey or fromAddress");
    }
    auto service = std::make_unique<RpcAnchorService>(rpcSettingsFromConfig(cfg),
                                                      std::make_shared<CurlRpcTransport>());
    if (!service->IsConnected()) {
        throw core::ConfigurationError("anchor rpc endpoint " + cfg.rpcUrl +
                                       " is unreachable or on the wrong chain (expected chain id " +
                                       std::to_string(cfg.chainId) + ")");
    }
    util::logger::info("[AnchorService] Using rpc anchor ledger at " + cfg.rpcUrl + " (chain id " +
                       std::to_string(cfg.chainId) + ", from " + service->Address() +
                       (service->SignsLocally() ? ", signing locally)" : ", node-managed account)"));
    return service;
}

/**
 * @brief Build the anchor service the configuration asks for.
 *
 * The simulated service is seeded from the anchors already in the store.
 *
 * @throw core::ConfigurationError if rpc mode lacks settings or the endpoint is unusable.
 */
inline std::unique_ptr<IAnchorService> makeAnchorService(const config::LedgerConfig &cfg,
                                                         const core::HashChainStore &store)
{
    if (cfg.anchorMode == config::AnchorMode::Simulated) {
        auto service = std::make_unique<SimulatedAnchorService>();
        service->Seed(store.ListAnchors());
        util::logger::info("[AnchorService] Using simulated anchor ledger.");
        return std::unique_ptr<IAnchorService>(std::move(service));
    }
    return std::unique_ptr<IAnchorService>(makeRpcAnchorService(cfg));
}

} // namespace anchor
} // namespace mediguard

#endif // MEDIGUARD_ANCHOR_ANCHOR_SERVICE_FACTORY_HPP
