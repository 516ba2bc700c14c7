#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include "config/anchor_networks.hpp"
#include "config/ledger_config.hpp"
#include "core/errors.hpp"
#include "util/config_parser.hpp"

using mediguard::config::AnchorMode;
using mediguard::config::LedgerConfig;
using mediguard::core::ConfigurationError;
using mediguard::util::ConfigParser;

namespace {

// Writes a config file and deletes it when the test ends.
class ConfigFile
{
public:
    ConfigFile(const std::string &name, const std::string &contents)
        : m_path(name)
    {
        std::ofstream out(m_path);
        out << contents;
    }
    ~ConfigFile() { std::remove(m_path.c_str()); }
    const std::string &path() const { return m_path; }

private:
    std::string m_path;
};

// Clears the BLOCKCHAIN_* / MEDIGUARD_* overrides around each test.
class ConfigParserTest : public ::testing::Test
{
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv()
    {
        for (const char *name : {"MEDIGUARD_DATABASE_PATH", "BLOCKCHAIN_RPC_URL", "BLOCKCHAIN_FROM_ADDRESS",
                                 "BLOCKCHAIN_PRIVATE_KEY",
                                 "BLOCKCHAIN_NETWORK", "BLOCKCHAIN_GAS_LIMIT",
                                 "BLOCKCHAIN_GAS_PRICE_MULTIPLIER", "BLOCKCHAIN_SIMULATED"}) {
            ::unsetenv(name);
        }
    }
};

const char *kAddress = "0x1111111111111111111111111111111111111111";
const char *kPrivateKey = "4646464646464646464646464646464646464646464646464646464646464646";

} // namespace

TEST_F(ConfigParserTest, MissingFileKeepsDefaults) {
    LedgerConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromFile("does_not_exist_mediguard.conf");
    parser.validate();

    EXPECT_EQ(cfg.anchorMode, AnchorMode::Simulated);
    EXPECT_EQ(cfg.commitIntervalSeconds, 86400u);
    EXPECT_EQ(cfg.anchorBatchSize, 500u);
    EXPECT_EQ(cfg.appendMaxAttempts, 5u);
    EXPECT_EQ(cfg.gasLimit, 100000u);
    EXPECT_DOUBLE_EQ(cfg.gasPriceMultiplier, 1.2);
    EXPECT_EQ(cfg.chainId, 11155111u);
}

TEST_F(ConfigParserTest, ReadsKeysAndComments) {
    ConfigFile file("mediguard_test_read.conf",
                    "# chain service\n"
                    "databasePath = /tmp/chain.sqlite\n"
                    "logLevel=debug\n"
                    "\n"
                    "commitIntervalSeconds=3600\n"
                    "anchorBatchSize=50\n"
                    "network=polygon\n");
    LedgerConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromFile(file.path());
    parser.validate();

    EXPECT_EQ(cfg.databasePath, "/tmp/chain.sqlite");
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.commitIntervalSeconds, 3600u);
    EXPECT_EQ(cfg.anchorBatchSize, 50u);
    EXPECT_EQ(cfg.network, "polygon");
    EXPECT_EQ(cfg.chainId, 137u);
}

TEST_F(ConfigParserTest, ExplicitChainIdWinsOverNetwork) {
    ConfigFile file("mediguard_test_chainid.conf", "chainId=31337\nnetwork=mainnet\n");
    LedgerConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromFile(file.path());
    EXPECT_EQ(cfg.chainId, 31337u);
}

TEST_F(ConfigParserTest, UnknownNetworkFallsBackToSepolia) {
    ConfigFile file("mediguard_test_network.conf", "network=nowhere\n");
    LedgerConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromFile(file.path());
    EXPECT_EQ(cfg.chainId, 11155111u);
}

TEST_F(ConfigParserTest, MalformedLinesAreFatal) {
    {
        ConfigFile file("mediguard_test_noeq.conf", "databasePath\n");
        LedgerConfig cfg;
        ConfigParser parser(cfg);
        EXPECT_THROW(parser.loadFromFile(file.path()), ConfigurationError);
    }
    {
        ConfigFile file("mediguard_test_badnum.conf", "anchorBatchSize=-4\n");
        LedgerConfig cfg;
        ConfigParser parser(cfg);
        EXPECT_THROW(parser.loadFromFile(file.path()), ConfigurationError);
    }
    {
        ConfigFile file("mediguard_test_badmode.conf", "anchorMode=ethereum\n");
        LedgerConfig cfg;
        ConfigParser parser(cfg);
        EXPECT_THROW(parser.loadFromFile(file.path()), ConfigurationError);
    }
}

TEST_F(ConfigParserTest, RpcModeNeedsConnectionDetails) {
    ConfigFile file("mediguard_test_rpc.conf", "anchorMode=rpc\n");
    LedgerConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromFile(file.path());
    EXPECT_THROW(parser.validate(), ConfigurationError);

    cfg.rpcUrl = "http://127.0.0.1:8545";
    EXPECT_THROW(parser.validate(), ConfigurationError);

    cfg.fromAddress = "0x1234";
    EXPECT_THROW(parser.validate(), ConfigurationError);

    cfg.fromAddress = kAddress;
    EXPECT_NO_THROW(parser.validate());
}

TEST_F(ConfigParserTest, PrivateKeyStandsInForFromAddress) {
    ConfigFile file("mediguard_test_key.conf",
                    "anchorMode=rpc\nrpcUrl=http://127.0.0.1:8545\nprivateKey=0x" + std::string(kPrivateKey) + "\n");
    LedgerConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromFile(file.path());
    EXPECT_EQ(cfg.privateKey, "0x" + std::string(kPrivateKey));
    EXPECT_TRUE(cfg.fromAddress.empty());
    EXPECT_NO_THROW(parser.validate());

    cfg.privateKey = kPrivateKey;
    EXPECT_NO_THROW(parser.validate());

    cfg.privateKey = "0x4646";
    EXPECT_THROW(parser.validate(), ConfigurationError);

    cfg.privateKey = std::string(kPrivateKey).replace(0, 1, "g");
    EXPECT_THROW(parser.validate(), ConfigurationError);

    cfg.privateKey = kPrivateKey;
    cfg.fromAddress = "0x1234";
    EXPECT_THROW(parser.validate(), ConfigurationError);
}

TEST_F(ConfigParserTest, ValidateRejectsZeroIntervalsAndBadLogLevel) {
    LedgerConfig cfg;
    ConfigParser parser(cfg);

    cfg.commitIntervalSeconds = 0;
    EXPECT_THROW(parser.validate(), ConfigurationError);
    cfg.commitIntervalSeconds = 60;

    cfg.appendMaxAttempts = 0;
    EXPECT_THROW(parser.validate(), ConfigurationError);
    cfg.appendMaxAttempts = 3;

    cfg.logLevel = "loud";
    EXPECT_THROW(parser.validate(), ConfigurationError);
    cfg.logLevel = "warn";
    EXPECT_NO_THROW(parser.validate());
}

TEST_F(ConfigParserTest, EnvironmentOverridesFile) {
    ConfigFile file("mediguard_test_env.conf", "databasePath=/from/file.sqlite\ngasLimit=5\n");
    ::setenv("MEDIGUARD_DATABASE_PATH", "/from/env.sqlite", 1);
    ::setenv("BLOCKCHAIN_GAS_LIMIT", "210000", 1);
    ::setenv("BLOCKCHAIN_SIMULATED", "false", 1);
    ::setenv("BLOCKCHAIN_RPC_URL", "https://rpc.example.org", 1);
    ::setenv("BLOCKCHAIN_FROM_ADDRESS", kAddress, 1);
    ::setenv("BLOCKCHAIN_NETWORK", "mumbai", 1);

    LedgerConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromFile(file.path());
    parser.applyEnvironment();
    parser.validate();

    EXPECT_EQ(cfg.databasePath, "/from/env.sqlite");
    EXPECT_EQ(cfg.gasLimit, 210000u);
    EXPECT_EQ(cfg.anchorMode, AnchorMode::Rpc);
    EXPECT_EQ(cfg.rpcUrl, "https://rpc.example.org");
    EXPECT_EQ(cfg.chainId, 80001u);
}

TEST_F(ConfigParserTest, PrivateKeyComesFromEnvironment) {
    ConfigFile file("mediguard_test_env_key.conf", "anchorMode=rpc\nrpcUrl=http://127.0.0.1:8545\n");
    ::setenv("BLOCKCHAIN_PRIVATE_KEY", kPrivateKey, 1);

    LedgerConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromFile(file.path());
    parser.applyEnvironment();
    EXPECT_NO_THROW(parser.validate());
    EXPECT_EQ(cfg.privateKey, kPrivateKey);
}

TEST(AnchorNetworksTest, LookupIsCaseInsensitive) {
    const auto *net = mediguard::config::findAnchorNetwork("Sepolia");
    ASSERT_NE(net, nullptr);
    EXPECT_EQ(net->chainId, 11155111u);
    EXPECT_TRUE(net->testnet);
    EXPECT_EQ(mediguard::config::findAnchorNetwork("unknown"), nullptr);
}
