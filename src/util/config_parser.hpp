#ifndef MEDIGUARD_UTIL_CONFIG_PARSER_HPP
#define MEDIGUARD_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <cstdlib>
#include <cmath>
#include <algorithm>
#include <cctype>
#include <mutex>
#include "config/ledger_config.hpp"
#include "config/anchor_networks.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Parser for the chain service's key=value configuration.
 *
 * DESIGN GOALS:
 *   - Read a plain "key=value" file ('#' starts a comment line).
 *   - Populate mediguard::config::LedgerConfig fields.
 *   - Apply the deployment's environment overrides (BLOCKCHAIN_*, MEDIGUARD_*) on top.
 *   - Reject anything malformed with core::ConfigurationError: a bad config is
 *     fatal at startup and no chain operation may run with it.
 *
 * USAGE:
 *   @code
 *   mediguard::config::LedgerConfig cfg;
 *   mediguard::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("mediguard_chain.conf");
 *   parser.applyEnvironment();
 *   parser.validate();
 *   @endcode
 */

namespace mediguard {
namespace util {

/**
 * @class ConfigParser
 * @brief Reads key=value text and environment variables into a LedgerConfig.
 */
class ConfigParser
{
public:
    explicit ConfigParser(mediguard::config::LedgerConfig &ledgerConfig)
        : ledgerConfig_(ledgerConfig),
          chainIdExplicit_(false)
    {
    }

    /**
     * @brief Read the given file and apply every key it sets.
     *        A missing file keeps the defaults (a warning is logged).
     * @throw core::ConfigurationError on a malformed line, unknown enum value or bad number.
     */
    inline void loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("[ConfigParser] File not found, using defaults: " + filepath);
            return;
        }

        logger::info("[ConfigParser] Loading config from " + filepath);

        std::string line;
        std::size_t lineNo = 0;
        while (std::getline(inFile, line)) {
            ++lineNo;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw core::ConfigurationError("ConfigParser: line " + std::to_string(lineNo) +
                                               " has no '=': " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);
            if (key.empty()) {
                throw core::ConfigurationError("ConfigParser: line " + std::to_string(lineNo) +
                                               " has an empty key");
            }

            applyKeyValue(key, val);
        }

        logger::info("[ConfigParser] Config loaded.");
    }

    /**
     * @brief Overlay the environment variables the deployment uses.
     *
     *   BLOCKCHAIN_RPC_URL, BLOCKCHAIN_PRIVATE_KEY, BLOCKCHAIN_FROM_ADDRESS, BLOCKCHAIN_NETWORK,
     *   BLOCKCHAIN_SIMULATED (true/false), BLOCKCHAIN_GAS_LIMIT,
     *   BLOCKCHAIN_GAS_PRICE_MULTIPLIER, MEDIGUARD_DATABASE_PATH
     */
    inline void applyEnvironment()
    {
        std::lock_guard<std::mutex> lock(mutex_);

        struct EnvKey { const char *env; const char *key; };
        static const EnvKey kEnvKeys[] = {
            {"MEDIGUARD_DATABASE_PATH",         "databasePath"},
            {"BLOCKCHAIN_RPC_URL",              "rpcUrl"},
            {"BLOCKCHAIN_PRIVATE_KEY",          "privateKey"},
            {"BLOCKCHAIN_FROM_ADDRESS",         "fromAddress"},
            {"BLOCKCHAIN_NETWORK",              "network"},
            {"BLOCKCHAIN_GAS_LIMIT",            "gasLimit"},
            {"BLOCKCHAIN_GAS_PRICE_MULTIPLIER", "gasPriceMultiplier"},
        };
        for (const auto &entry : kEnvKeys) {
            const char *value = std::getenv(entry.env);
            if (value != nullptr && *value != '\0') {
                logger::debug(std::string("[ConfigParser] Environment override ") + entry.env);
                applyKeyValue(entry.key, value);
            }
        }

        const char *simulated = std::getenv("BLOCKCHAIN_SIMULATED");
        if (simulated != nullptr && *simulated != '\0') {
            applyKeyValue("anchorMode", parseBool(simulated) ? "simulated" : "rpc");
        }
    }

    /**
     * @brief Cross-field checks that individual keys cannot express.
     * @throw core::ConfigurationError describing the first problem found.
     */
    inline void validate() const
    {
        using mediguard::config::AnchorMode;

        if (ledgerConfig_.databasePath.empty()) {
            throw core::ConfigurationError("ConfigParser: databasePath must not be empty");
        }
        try {
            logger::parseLogLevel(ledgerConfig_.logLevel);
        } catch (const std::invalid_argument &ex) {
            throw core::ConfigurationError(std::string("ConfigParser: ") + ex.what());
        }
        if (ledgerConfig_.commitIntervalSeconds == 0) {
            throw core::ConfigurationError("ConfigParser: commitIntervalSeconds must be positive");
        }
        if (ledgerConfig_.anchorBatchSize == 0) {
            throw core::ConfigurationError("ConfigParser: anchorBatchSize must be positive");
        }
        if (ledgerConfig_.appendMaxAttempts == 0) {
            throw core::ConfigurationError("ConfigParser: appendMaxAttempts must be at least 1");
        }
        if (!(ledgerConfig_.gasPriceMultiplier > 0.0) || !std::isfinite(ledgerConfig_.gasPriceMultiplier)) {
            throw core::ConfigurationError("ConfigParser: gasPriceMultiplier must be a positive number");
        }

        if (ledgerConfig_.anchorMode == AnchorMode::Rpc) {
            const std::string &url = ledgerConfig_.rpcUrl;
            if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
                throw core::ConfigurationError("ConfigParser: rpc anchor mode needs an http(s) rpcUrl");
            }
            if (!ledgerConfig_.privateKey.empty()) {
                if (!isHexPrivateKey(ledgerConfig_.privateKey)) {
                    throw core::ConfigurationError(
                        "ConfigParser: privateKey must be 64 hex digits, optionally prefixed with 0x");
                }
                if (!ledgerConfig_.fromAddress.empty() && !isHexAddress(ledgerConfig_.fromAddress)) {
                    throw core::ConfigurationError(
                        "ConfigParser: fromAddress must be 0x followed by 40 hex digits");
                }
            } else if (!isHexAddress(ledgerConfig_.fromAddress)) {
                throw core::ConfigurationError(
                    "ConfigParser: rpc anchor mode needs privateKey, or fromAddress as 0x followed by 40 hex digits");
            }
            if (ledgerConfig_.gasLimit == 0) {
                throw core::ConfigurationError("ConfigParser: gasLimit must be positive");
            }
            if (ledgerConfig_.receiptTimeoutSeconds == 0) {
                throw core::ConfigurationError("ConfigParser: receiptTimeoutSeconds must be positive");
            }
        }
    }

private:
    mediguard::config::LedgerConfig &ledgerConfig_;
    bool chainIdExplicit_;
    std::mutex mutex_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        using mediguard::config::AnchorMode;

        if (key == "databasePath") {
            ledgerConfig_.databasePath = val;
        }
        else if (key == "logLevel") {
            ledgerConfig_.logLevel = val;
        }
        else if (key == "logFile") {
            ledgerConfig_.logFile = val;
        }
        else if (key == "anchorMode") {
            if (val == "simulated") {
                ledgerConfig_.anchorMode = AnchorMode::Simulated;
            } else if (val == "rpc") {
                ledgerConfig_.anchorMode = AnchorMode::Rpc;
            } else {
                throw core::ConfigurationError("ConfigParser: anchorMode must be 'simulated' or 'rpc', got '" + val + "'");
            }
        }
        else if (key == "rpcUrl") {
            ledgerConfig_.rpcUrl = val;
        }
        else if (key == "fromAddress") {
            ledgerConfig_.fromAddress = val;
        }
        else if (key == "privateKey") {
            ledgerConfig_.privateKey = val;
        }
        else if (key == "network") {
            ledgerConfig_.network = val;
            const auto *net = mediguard::config::findAnchorNetwork(val);
            if (net == nullptr) {
                logger::warn("[ConfigParser] Unknown network '" + val + "', defaulting chain id to " +
                             mediguard::config::defaultAnchorNetwork().name);
                net = &mediguard::config::defaultAnchorNetwork();
            }
            if (!chainIdExplicit_) {
                ledgerConfig_.chainId = net->chainId;
            }
        }
        else if (key == "chainId") {
            ledgerConfig_.chainId = parseUInt(key, val);
            chainIdExplicit_ = true;
        }
        else if (key == "gasLimit") {
            ledgerConfig_.gasLimit = parseUInt(key, val);
        }
        else if (key == "gasPriceMultiplier") {
            ledgerConfig_.gasPriceMultiplier = parseDouble(key, val);
        }
        else if (key == "receiptTimeoutSeconds") {
            ledgerConfig_.receiptTimeoutSeconds = parseUInt(key, val);
        }
        else if (key == "receiptPollMillis") {
            ledgerConfig_.receiptPollMillis = parseUInt(key, val);
        }
        else if (key == "commitIntervalSeconds") {
            ledgerConfig_.commitIntervalSeconds = parseUInt(key, val);
        }
        else if (key == "anchorBatchSize") {
            ledgerConfig_.anchorBatchSize = parseUInt(key, val);
        }
        else if (key == "appendMaxAttempts") {
            ledgerConfig_.appendMaxAttempts = parseUInt(key, val);
        }
        else {
            logger::warn("[ConfigParser] Unrecognized key '" + key + "' ignored");
            return;
        }
        logger::debug("[ConfigParser] " + key + " set");
    }

    inline void trim(std::string &s) const
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, pos);
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    inline uint64_t parseUInt(const std::string &key, const std::string &val) const
    {
        if (val.empty() || val[0] == '-' || val[0] == '+') {
            throw core::ConfigurationError("ConfigParser: " + key + " expects an unsigned integer, got '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::invalid_argument("non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw core::ConfigurationError("ConfigParser: " + key + " expects an unsigned integer, got '" +
                                           val + "': " + ex.what());
        }
    }

    inline double parseDouble(const std::string &key, const std::string &val) const
    {
        try {
            size_t idx = 0;
            double d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw std::invalid_argument("non-numeric suffix");
            }
            return d;
        }
        catch (const std::exception &ex) {
            throw core::ConfigurationError("ConfigParser: " + key + " expects a number, got '" +
                                           val + "': " + ex.what());
        }
    }

    static inline bool parseBool(const std::string &val)
    {
        std::string lower(val);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower == "true" || lower == "1" || lower == "yes";
    }

    static inline bool isHexPrivateKey(const std::string &key)
    {
        std::size_t start = 0;
        if (key.size() >= 2 && key[0] == '0' && (key[1] == 'x' || key[1] == 'X')) {
            start = 2;
        }
        if (key.size() - start != 64) {
            return false;
        }
        return std::all_of(key.begin() + static_cast<std::ptrdiff_t>(start), key.end(),
                           [](unsigned char c) { return std::isxdigit(c) != 0; });
    }

    static inline bool isHexAddress(const std::string &addr)
    {
        if (addr.size() != 42 || addr[0] != '0' || (addr[1] != 'x' && addr[1] != 'X')) {
            return false;
        }
        return std::all_of(addr.begin() + 2, addr.end(),
                           [](unsigned char c) { return std::isxdigit(c) != 0; });
    }
};

} // namespace util
} // namespace mediguard

#endif // MEDIGUARD_UTIL_CONFIG_PARSER_HPP
