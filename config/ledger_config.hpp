#ifndef MEDIGUARD_CONFIG_LEDGER_CONFIG_HPP
#define MEDIGUARD_CONFIG_LEDGER_CONFIG_HPP

#include <string>
#include <cstdint>

/**
 * @file ledger_config.hpp
 * @brief Configuration for one MediGuard chain deployment (datastore, anchoring, logging).
 *
 * USAGE:
 *   - Populated with defaults here, then by util/config_parser.hpp from a
 *     key=value file and a handful of environment overrides.
 *   - Call Validate() (via ConfigParser::validate) before wiring services.
 */

namespace mediguard {
namespace config {

/**
 * @brief Which implementation answers the anchor commit/verify contract.
 */
enum class AnchorMode {
    Simulated, ///< Local deterministic stand-in; no external ledger configured.
    Rpc        ///< Ethereum-style JSON-RPC node.
};

/**
 * @struct LedgerConfig
 * @brief Holds every tunable of the chain core:
 *   - databasePath: SQLite file holding predictions and the hash chain.
 *   - anchor*: which anchor service to use and how to reach it.
 *   - commitIntervalSeconds: period of the background anchor committer.
 *   - appendMaxAttempts: retries of an append that lost a race for the head.
 */
struct LedgerConfig
{
    LedgerConfig()
        : databasePath("./mediguard_data/mediguard.sqlite"),
          logLevel("info"),
          logFile(),
          anchorMode(AnchorMode::Simulated),
          rpcUrl(),
          fromAddress(),
          privateKey(),
          network("sepolia"),
          chainId(11155111),
          gasLimit(100000),
          gasPriceMultiplier(1.2),
          receiptTimeoutSeconds(120),
          receiptPollMillis(2000),
          commitIntervalSeconds(86400),
          anchorBatchSize(500),
          appendMaxAttempts(5)
    {
    }

    /// SQLite database file (created on first use).
    std::string databasePath;

    /// Minimal log level name: debug, info, warn, error, critical.
    std::string logLevel;

    /// Optional log file; empty means console only.
    std::string logFile;

    AnchorMode anchorMode;

    /// JSON-RPC endpoint, e.g. "http://127.0.0.1:8545". Required in Rpc mode.
    std::string rpcUrl;

    /// Node-managed account that sends the anchoring transaction, used when privateKey is empty.
    std::string fromAddress;

    /// Hex secp256k1 key; when set, anchoring transactions are signed locally. Never logged.
    std::string privateKey;

    /// Named network; selects chainId unless chainId is set explicitly.
    std::string network;
    uint64_t chainId;

    uint64_t gasLimit;
    double gasPriceMultiplier;

    /// How long to wait for a transaction receipt before the commit counts as failed.
    uint64_t receiptTimeoutSeconds;
    uint64_t receiptPollMillis;

    uint64_t commitIntervalSeconds;

    /// Page size used when collecting pending entries; all pages are anchored in one commit.
    uint64_t anchorBatchSize;

    uint64_t appendMaxAttempts;
};

} // namespace config
} // namespace mediguard

#endif // MEDIGUARD_CONFIG_LEDGER_CONFIG_HPP
