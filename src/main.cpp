#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "anchor/anchor_committer.hpp"
#include "anchor/anchor_lookup.hpp"
#include "anchor/anchor_service_factory.hpp"
#include "config/ledger_config.hpp"
#include "core/chain_rebuilder.hpp"
#include "core/chain_verifier.hpp"
#include "core/errors.hpp"
#include "core/hash_chain_ledger.hpp"
#include "core/hash_chain_store.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

using namespace mediguard;

std::atomic<bool> g_stopRequested(false);

void onSignal(int)
{
    g_stopRequested = true;
}

void printUsage(const char *prog)
{
    std::cerr << "usage: " << prog << " <config-file> <command> [args]\n"
              << "commands:\n"
              << "  record <id> <user> <source> <timestamp> <features-json> <result-json>\n"
              << "  verify [--strict]\n"
              << "  list [offset] [limit]\n"
              << "  stats\n"
              << "  commit\n"
              << "  lookup <reference>\n"
              << "  rebuild [--yes]\n"
              << "  balance\n"
              << "  run\n";
}

std::size_t parseCount(const std::string &text, const char *what)
{
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        throw std::invalid_argument(std::string(what) + " must be a non-negative integer");
    }
    std::size_t idx = 0;
    const unsigned long long value = std::stoull(text, &idx, 10);
    if (idx != text.size()) {
        throw std::invalid_argument(std::string(what) + " must be a non-negative integer");
    }
    return static_cast<std::size_t>(value);
}

void printReport(const core::VerificationReport &report)
{
    std::cout << "valid: " << (report.valid ? "true" : "false") << "\n"
              << "total_entries: " << report.totalEntries << "\n"
              << "errors: " << report.errors.size() << "\n";
    for (const auto &err : report.errors) {
        std::cout << "  " << err << "\n";
    }
}

void printEntry(const core::ChainEntry &entry)
{
    std::cout << "#" << entry.sequence << " prediction=" << entry.predictionId
              << " timestamp=" << entry.entryTimestamp << "\n"
              << "    previous=" << entry.previousHash.value_or("null") << "\n"
              << "    current=" << entry.currentHash << "\n"
              << "    anchor=" << entry.anchorReference.value_or("pending");
    if (entry.anchorPosition) {
        std::cout << " position=" << *entry.anchorPosition;
    }
    std::cout << "\n";
}

int cmdRecord(core::HashChainLedger &ledger, const std::vector<std::string> &args)
{
    if (args.size() != 6) {
        throw std::invalid_argument("record needs <id> <user> <source> <timestamp> <features-json> <result-json>");
    }
    core::Prediction prediction;
    prediction.id = args[0];
    prediction.userId = args[1];
    prediction.source = core::parsePredictionSource(args[2]);
    prediction.timestamp = args[3];
    try {
        prediction.inputFeatures = util::json::parse(args[4]);
        prediction.predictionResult = util::json::parse(args[5]);
    } catch (const util::json::JsonError &ex) {
        throw core::InvalidPrediction(std::string("prediction JSON: ") + ex.what());
    }

    const core::ChainEntry entry = ledger.RecordPrediction(prediction);
    printEntry(entry);
    return 0;
}

int cmdVerify(const core::HashChainStore &store, const std::vector<std::string> &args)
{
    const bool strict = !args.empty() && args[0] == "--strict";
    const core::VerificationReport report = core::ChainVerifier(store).Verify();
    printReport(report);
    if (strict) {
        core::ChainVerifier::RequireValid(report);
    }
    return report.valid ? 0 : 3;
}

int cmdList(const core::HashChainLedger &ledger, const std::vector<std::string> &args)
{
    const std::size_t offset = args.size() > 0 ? parseCount(args[0], "offset") : 0;
    const std::size_t limit = args.size() > 1 ? parseCount(args[1], "limit") : 20;
    const core::ChainListing listing = ledger.ListChain(offset, limit);

    std::cout << "total_entries: " << listing.totalEntries << " (showing " << listing.items.size()
              << " from offset " << listing.offset << ")\n";
    for (const auto &item : listing.items) {
        printEntry(item.entry);
        if (item.prediction) {
            std::cout << "    user=" << item.prediction->userId
                      << " source=" << core::toString(item.prediction->source)
                      << " result=" << item.prediction->predictionResultJson << "\n";
        } else {
            std::cout << "    prediction missing\n";
        }
    }
    return 0;
}

int cmdStats(const core::HashChainLedger &ledger)
{
    const core::ChainStats stats = ledger.GetChainStats();
    std::cout << "total_entries: " << stats.totalEntries << "\n"
              << "anchored_entries: " << stats.anchoredEntries << "\n"
              << "pending_entries: " << stats.pendingEntries << "\n"
              << "total_predictions: " << stats.totalPredictions << "\n"
              << "head: " << stats.headHash.value_or("null") << "\n";
    return 0;
}

int cmdCommit(core::HashChainStore &store, const config::LedgerConfig &cfg)
{
    std::unique_ptr<anchor::IAnchorService> service = anchor::makeAnchorService(cfg, store);
    anchor::AnchorCommitter committer(store, *service, std::chrono::seconds(cfg.commitIntervalSeconds),
                                      static_cast<std::size_t>(cfg.anchorBatchSize));
    const anchor::CommitCycleResult result = committer.RunCommitCycle();
    switch (result.outcome) {
    case anchor::CycleOutcome::NothingPending:
        std::cout << "nothing pending\n";
        return 0;
    case anchor::CycleOutcome::Committed:
        std::cout << "anchored " << result.entriesAnchored << " entries\n"
                  << "head: " << result.headHash << "\n"
                  << "reference: " << result.receipt.reference << "\n"
                  << "position: " << result.receipt.position << "\n";
        return 0;
    case anchor::CycleOutcome::Failed:
        std::cout << "commit failed: " << result.error << "\n";
        return 1;
    }
    return 1;
}

int cmdLookup(core::HashChainStore &store, const config::LedgerConfig &cfg, const std::vector<std::string> &args)
{
    if (args.size() != 1) {
        throw std::invalid_argument("lookup needs <reference>");
    }
    std::unique_ptr<anchor::IAnchorService> service = anchor::makeAnchorService(cfg, store);
    const anchor::AnchorLookup lookup = anchor::lookupAnchor(store, *service, args[0]);

    std::cout << "reference: " << lookup.reference << "\n"
              << "entries: " << lookup.entries.size() << "\n";
    for (const auto &entry : lookup.entries) {
        printEntry(entry);
    }
    std::cout << "ledger_found: " << (lookup.verification.found ? "true" : "false") << "\n";
    if (lookup.verification.position) {
        std::cout << "ledger_position: " << *lookup.verification.position << "\n";
    }
    if (!lookup.verification.rawData.empty()) {
        std::cout << "ledger_data: " << lookup.verification.rawData << "\n";
    }
    if (!lookup.verification.error.empty()) {
        std::cout << "ledger_error: " << lookup.verification.error << "\n";
    }
    return lookup.entries.empty() && !lookup.verification.found ? 1 : 0;
}

int cmdBalance(const config::LedgerConfig &cfg)
{
    if (cfg.anchorMode != config::AnchorMode::Rpc) {
        std::cerr << "balance needs anchorMode rpc; the simulated ledger holds no funds.\n";
        return 1;
    }
    std::unique_ptr<anchor::RpcAnchorService> service = anchor::makeRpcAnchorService(cfg);
    const anchor::AccountBalance balance = service->GetBalance();
    std::cout << "address: " << balance.address << "\n"
              << "wei: " << balance.wei << "\n"
              << "ether: " << balance.ether << "\n";
    return 0;
}

int cmdRebuild(core::HashChainLedger &ledger, const std::vector<std::string> &args)
{
    const bool confirmed = !args.empty() && args[0] == "--yes";
    const core::ChainStats stats = ledger.GetChainStats();

    std::cout << "hash_chain entries: " << stats.totalEntries << "\n"
              << "predictions: " << stats.totalPredictions << "\n";
    if (!confirmed && stats.totalEntries > 0) {
        std::cout << "WARNING: " << stats.totalEntries
                  << " existing entries and their anchor assignments will be deleted and rebuilt.\n"
                  << "Type 'yes' to continue: " << std::flush;
        std::string answer;
        std::getline(std::cin, answer);
        if (answer != "yes" && answer != "YES" && answer != "Yes") {
            std::cout << "Rebuild cancelled.\n";
            return 1;
        }
    }

    const core::RebuildReport report = core::ChainRebuilder(ledger).Rebuild();
    std::cout << "deleted: " << report.entriesDeleted << "\n"
              << "replayed: " << report.predictionsReplayed << "\n";
    printReport(report.verification);
    std::cout << (report.success ? "Rebuild succeeded.\n"
                                 : "Rebuild FAILED verification; the previous chain was kept.\n");
    return report.success ? 0 : 3;
}

int cmdRun(core::HashChainStore &store, const config::LedgerConfig &cfg)
{
    std::unique_ptr<anchor::IAnchorService> service = anchor::makeAnchorService(cfg, store);
    anchor::AnchorCommitter committer(store, *service, std::chrono::seconds(cfg.commitIntervalSeconds),
                                      static_cast<std::size_t>(cfg.anchorBatchSize));

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    committer.Start();
    util::logger::info("[main] Anchor committer running; send SIGINT or SIGTERM to stop.");
    while (!g_stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    util::logger::info("[main] Stop requested, waiting for the committer.");
    committer.Stop();

    const anchor::CommitterStatus status = committer.GetStatus();
    util::logger::info("[main] Committer ran " + std::to_string(status.cyclesRun) + " cycle(s), " +
                       std::to_string(status.successfulCommits) + " commit(s).");
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    using namespace mediguard;

    util::logger::setLogLevel(util::logger::LogLevel::INFO);

    if (argc < 3) {
        printUsage(argv[0]);
        return 64;
    }
    const std::string configPath = argv[1];
    const std::string command = argv[2];
    const std::vector<std::string> args(argv + 3, argv + argc);

    try {
        // 1. Configuration: file, then environment, then cross-field checks
        config::LedgerConfig cfg;
        util::ConfigParser configParser(cfg);
        configParser.loadFromFile(configPath);
        configParser.applyEnvironment();
        configParser.validate();

        util::logger::setLogLevel(util::logger::parseLogLevel(cfg.logLevel));
        if (!cfg.logFile.empty() && !util::logger::enableFileOutput(cfg.logFile)) {
            util::logger::warn("[main] Could not open log file " + cfg.logFile);
        }

        // 2. Storage and ledger
        core::HashChainStore store(cfg.databasePath);
        store.Initialize();
        core::HashChainLedger ledger(store, static_cast<std::size_t>(cfg.appendMaxAttempts));

        // 3. Command
        if (command == "record")  return cmdRecord(ledger, args);
        if (command == "verify")  return cmdVerify(store, args);
        if (command == "list")    return cmdList(ledger, args);
        if (command == "stats")   return cmdStats(ledger);
        if (command == "commit")  return cmdCommit(store, cfg);
        if (command == "lookup")  return cmdLookup(store, cfg, args);
        if (command == "rebuild") return cmdRebuild(ledger, args);
        if (command == "run")     return cmdRun(store, cfg);
        if (command == "balance") return cmdBalance(cfg);

        std::cerr << "unknown command: " << command << "\n";
        printUsage(argv[0]);
        return 64;
    } catch (const core::ConfigurationError &ex) {
        util::logger::critical(std::string("[main] Configuration error: ") + ex.what());
        return 2;
    } catch (const core::IntegrityViolation &ex) {
        util::logger::error(std::string("[main] ") + ex.what());
        return 3;
    } catch (const std::invalid_argument &ex) {
        std::cerr << ex.what() << "\n";
        printUsage(argv[0]);
        return 64;
    } catch (const std::exception &ex) {
        util::logger::error(std::string("[main] ") + command + " failed: " + ex.what());
        return 1;
    }
}
