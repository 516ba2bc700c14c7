#include <gtest/gtest.h>

#include <set>
#include <string>
#include <thread>
#include <vector>

#include "core/chain_verifier.hpp"
#include "core/entry_hasher.hpp"
#include "core/errors.hpp"
#include "core/hash_chain_ledger.hpp"
#include "core/hash_chain_store.hpp"
#include "test_support.hpp"
#include "util/hashing.hpp"

using namespace mediguard;
using mediguard::test::TempDatabase;
using mediguard::test::makePrediction;
using mediguard::test::timestampFor;

TEST(HashChainLedgerTest, EmptyChainHasNoHead) {
    TempDatabase db("ledger_empty");
    core::HashChainStore store(db.path());
    store.Initialize();
    core::HashChainLedger ledger(store);

    EXPECT_FALSE(ledger.LatestHash().has_value());
    EXPECT_TRUE(ledger.EntriesMissingAnchor(10).empty());
    EXPECT_EQ(ledger.GetChainStats().totalEntries, 0u);
}

TEST(HashChainLedgerTest, TwoPredictionsLinkAsDocumented) {
    TempDatabase db("ledger_example");
    core::HashChainStore store(db.path());
    store.Initialize();
    core::HashChainLedger ledger(store);

    core::Prediction p1;
    p1.id = "p1";
    p1.userId = "u1";
    p1.timestamp = "2025-03-01T08:00:00.000000Z";
    p1.inputFeatures = util::json::JsonValue::object();
    p1.inputFeatures.set("glucose", 148.0);
    p1.predictionResult = util::json::JsonValue::object();
    p1.predictionResult.set("risk", "high");

    core::Prediction p2 = makePrediction("p2", "2025-03-01T09:00:00.000000Z", 85.0);

    const core::ChainEntry e1 = ledger.RecordPrediction(p1);
    const core::ChainEntry e2 = ledger.RecordPrediction(p2);

    // The exact bytes that are hashed for the genesis entry.
    const std::string expectedDoc =
        "{\"prediction_data\":{\"input_features\":{\"glucose\":148.000000},"
        "\"prediction_result\":{\"risk\":\"high\"}},"
        "\"prediction_id\":\"p1\",\"previous_hash\":null,"
        "\"timestamp\":\"2025-03-01T08:00:00.000000Z\",\"user_id\":\"u1\"}";

    EXPECT_FALSE(e1.previousHash.has_value());
    EXPECT_EQ(e1.currentHash, util::hashing::sha256Hex(expectedDoc));
    EXPECT_EQ(e1.currentHash, core::computeEntryHash(p1, p1.timestamp, std::nullopt));
    EXPECT_EQ(e1.entryTimestamp, p1.timestamp);

    ASSERT_TRUE(e2.previousHash.has_value());
    EXPECT_EQ(*e2.previousHash, e1.currentHash);
    EXPECT_EQ(e2.currentHash, core::computeEntryHash(p2, p2.timestamp, e1.currentHash));
    EXPECT_EQ(e2.sequence, e1.sequence + 1);

    EXPECT_EQ(ledger.LatestHash(), e2.currentHash);

    const core::VerificationReport report = core::ChainVerifier(store).Verify();
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.totalEntries, 2u);
    EXPECT_TRUE(report.errors.empty());
}

TEST(HashChainLedgerTest, SequentialAppendsFormOneUnbrokenChain) {
    TempDatabase db("ledger_sequential");
    core::HashChainStore store(db.path());
    store.Initialize();
    core::HashChainLedger ledger(store);

    const int n = 25;
    for (int i = 0; i < n; ++i) {
        ledger.RecordPrediction(makePrediction("p" + std::to_string(i), timestampFor(i), 100.0 + i));
    }

    const std::vector<core::ChainEntry> entries = store.LoadEntries();
    ASSERT_EQ(entries.size(), static_cast<std::size_t>(n));
    EXPECT_FALSE(entries[0].previousHash.has_value());
    for (std::size_t i = 1; i < entries.size(); ++i) {
        ASSERT_TRUE(entries[i].previousHash.has_value());
        EXPECT_EQ(*entries[i].previousHash, entries[i - 1].currentHash);
    }

    const core::VerificationReport report = core::ChainVerifier(store).Verify();
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.totalEntries, static_cast<std::size_t>(n));
}

TEST(HashChainLedgerTest, AppendChainsAnAlreadyStoredPrediction) {
    TempDatabase db("ledger_append");
    core::HashChainStore store(db.path());
    store.Initialize();
    core::HashChainLedger ledger(store);

    {
        core::HashChainStore::WriteTransaction txn = store.BeginWrite();
        txn.InsertPrediction(makePrediction("stored", timestampFor(1)));
        txn.Commit();
    }
    EXPECT_EQ(store.CountEntries(), 0u);

    const core::ChainEntry entry = ledger.Append("stored");
    EXPECT_EQ(entry.predictionId, "stored");
    EXPECT_EQ(store.CountEntries(), 1u);
}

TEST(HashChainLedgerTest, DuplicatePredictionIsRejectedWithoutRetry) {
    TempDatabase db("ledger_duplicate");
    core::HashChainStore store(db.path());
    store.Initialize();
    core::HashChainLedger ledger(store);

    const core::Prediction p = makePrediction("dup", timestampFor(1));
    ledger.RecordPrediction(p);

    EXPECT_THROW(ledger.RecordPrediction(p), core::DuplicateEntry);
    EXPECT_THROW(ledger.Append("dup"), core::DuplicateEntry);
    EXPECT_EQ(store.CountEntries(), 1u);
}

TEST(HashChainLedgerTest, MissingPredictionLeavesChainUntouched) {
    TempDatabase db("ledger_missing");
    core::HashChainStore store(db.path());
    store.Initialize();
    core::HashChainLedger ledger(store);
    ledger.RecordPrediction(makePrediction("p0", timestampFor(0)));
    const auto head = ledger.LatestHash();

    EXPECT_THROW(ledger.Append("ghost"), core::PredictionNotFound);
    EXPECT_EQ(store.CountEntries(), 1u);
    EXPECT_EQ(ledger.LatestHash(), head);
}

TEST(HashChainLedgerTest, InvalidPredictionIsNotStored) {
    TempDatabase db("ledger_invalid");
    core::HashChainStore store(db.path());
    store.Initialize();
    core::HashChainLedger ledger(store);

    core::Prediction noUser = makePrediction("bad1", timestampFor(1));
    noUser.userId.clear();
    EXPECT_THROW(ledger.RecordPrediction(noUser), core::InvalidPrediction);

    core::Prediction badFeatures = makePrediction("bad2", timestampFor(2));
    badFeatures.inputFeatures = util::json::JsonValue(5);
    EXPECT_THROW(ledger.RecordPrediction(badFeatures), core::InvalidPrediction);

    EXPECT_EQ(ledger.GetChainStats().totalPredictions, 0u);
    EXPECT_EQ(store.CountEntries(), 0u);
}

TEST(HashChainLedgerTest, FailedAppendRollsBackThePrediction) {
    TempDatabase db("ledger_rollback");
    core::HashChainStore store(db.path());
    store.Initialize();
    core::HashChainLedger ledger(store, 2);

    // Every chain insert is refused with a constraint error.
    db.exec("CREATE TRIGGER refuse_chain BEFORE INSERT ON hash_chain "
            "BEGIN SELECT RAISE(ABORT, 'refused'); END;");

    EXPECT_THROW(ledger.RecordPrediction(makePrediction("p0", timestampFor(0))), core::ConcurrencyConflict);
    EXPECT_EQ(ledger.GetChainStats().totalPredictions, 0u);
    EXPECT_FALSE(store.FindPrediction("p0").has_value());

    db.exec("DROP TRIGGER refuse_chain;");
    EXPECT_NO_THROW(ledger.RecordPrediction(makePrediction("p0", timestampFor(0))));
    EXPECT_EQ(store.CountEntries(), 1u);
}

TEST(HashChainLedgerTest, ConcurrentAppendsNeverFork) {
    TempDatabase db("ledger_concurrent");
    core::HashChainStore store(db.path());
    store.Initialize();

    // Two ledgers over one file behave like two processes: only SQLite serializes them.
    core::HashChainLedger ledgerA(store, 20);
    core::HashChainLedger ledgerB(store, 20);

    const int threads = 8;
    const int perThread = 10;
    std::vector<std::thread> workers;
    std::vector<std::string> failures(threads);
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            core::HashChainLedger &ledger = (t % 2 == 0) ? ledgerA : ledgerB;
            for (int i = 0; i < perThread; ++i) {
                const int n = t * perThread + i;
                try {
                    ledger.RecordPrediction(makePrediction("c" + std::to_string(n), timestampFor(n), n * 1.5));
                } catch (const std::exception &ex) {
                    failures[t] = ex.what();
                }
            }
        });
    }
    for (auto &w : workers) {
        w.join();
    }
    for (const auto &f : failures) {
        EXPECT_TRUE(f.empty()) << f;
    }

    const std::vector<core::ChainEntry> entries = store.LoadEntries();
    ASSERT_EQ(entries.size(), static_cast<std::size_t>(threads * perThread));

    std::set<std::string> parents;
    std::size_t genesisCount = 0;
    for (const auto &e : entries) {
        if (!e.previousHash) {
            ++genesisCount;
        } else {
            EXPECT_TRUE(parents.insert(*e.previousHash).second) << "two entries share a parent";
        }
    }
    EXPECT_EQ(genesisCount, 1u);

    const core::VerificationReport report = core::ChainVerifier(store).Verify();
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.totalEntries, static_cast<std::size_t>(threads * perThread));
}

TEST(HashChainLedgerTest, StoreRefusesASecondGenesisOrSharedParent) {
    TempDatabase db("ledger_indexes");
    core::HashChainStore store(db.path());
    store.Initialize();
    core::HashChainLedger ledger(store);
    const core::ChainEntry first = ledger.RecordPrediction(makePrediction("p0", timestampFor(0)));
    ledger.RecordPrediction(makePrediction("p1", timestampFor(1)));

    {
        core::HashChainStore::WriteTransaction txn = store.BeginWrite();
        txn.InsertPrediction(makePrediction("p2", timestampFor(2)));
        EXPECT_THROW(txn.InsertEntry("p2", std::nullopt, std::string(64, 'a'), timestampFor(2)),
                     core::ConcurrencyConflict);
        EXPECT_THROW(txn.InsertEntry("p2", first.currentHash, std::string(64, 'b'), timestampFor(2)),
                     core::ConcurrencyConflict);
    }
    EXPECT_EQ(store.CountEntries(), 2u);
    EXPECT_FALSE(store.FindPrediction("p2").has_value());
}

TEST(HashChainLedgerTest, EntriesMissingAnchorAreOrderedAndBounded) {
    TempDatabase db("ledger_pending");
    core::HashChainStore store(db.path());
    store.Initialize();
    core::HashChainLedger ledger(store);
    for (int i = 0; i < 6; ++i) {
        ledger.RecordPrediction(makePrediction("p" + std::to_string(i), timestampFor(i)));
    }

    const auto firstFour = ledger.EntriesMissingAnchor(4);
    ASSERT_EQ(firstFour.size(), 4u);
    for (std::size_t i = 1; i < firstFour.size(); ++i) {
        EXPECT_LT(firstFour[i - 1].sequence, firstFour[i].sequence);
    }
    EXPECT_EQ(firstFour.front().predictionId, "p0");
    EXPECT_EQ(ledger.EntriesMissingAnchor(100).size(), 6u);
}

TEST(HashChainLedgerTest, ListChainIsNewestFirstWithSummary) {
    TempDatabase db("ledger_list");
    core::HashChainStore store(db.path());
    store.Initialize();
    core::HashChainLedger ledger(store);
    for (int i = 0; i < 5; ++i) {
        core::Prediction p = makePrediction("p" + std::to_string(i), timestampFor(i), 100.0, "user-" + std::to_string(i));
        p.source = (i % 2 == 0) ? core::PredictionSource::Pdf : core::PredictionSource::Csv;
        ledger.RecordPrediction(p);
    }

    const core::ChainListing page = ledger.ListChain(1, 2);
    EXPECT_EQ(page.totalEntries, 5u);
    ASSERT_EQ(page.items.size(), 2u);
    EXPECT_EQ(page.items[0].entry.predictionId, "p3");
    EXPECT_EQ(page.items[1].entry.predictionId, "p2");
    ASSERT_TRUE(page.items[0].prediction.has_value());
    EXPECT_EQ(page.items[0].prediction->userId, "user-3");
    EXPECT_EQ(page.items[0].prediction->source, core::PredictionSource::Csv);
    EXPECT_EQ(util::json::parse(page.items[0].prediction->predictionResultJson).find("risk_level")->asString(), "high");

    EXPECT_TRUE(ledger.ListChain(10, 5).items.empty());
}

TEST(HashChainLedgerTest, StatsCountAnchoredAndPending) {
    TempDatabase db("ledger_stats");
    core::HashChainStore store(db.path());
    store.Initialize();
    core::HashChainLedger ledger(store);
    for (int i = 0; i < 4; ++i) {
        ledger.RecordPrediction(makePrediction("p" + std::to_string(i), timestampFor(i)));
    }
    {
        core::HashChainStore::WriteTransaction txn = store.BeginWrite();
        EXPECT_EQ(txn.MarkAnchored(2, "0xabc", 7), 2u);
        txn.Commit();
    }

    const core::ChainStats stats = ledger.GetChainStats();
    EXPECT_EQ(stats.totalEntries, 4u);
    EXPECT_EQ(stats.anchoredEntries, 2u);
    EXPECT_EQ(stats.pendingEntries, 2u);
    EXPECT_EQ(stats.totalPredictions, 4u);
    EXPECT_EQ(stats.headHash, ledger.LatestHash());

    const auto anchored = store.EntriesByAnchorReference("0xabc");
    ASSERT_EQ(anchored.size(), 2u);
    EXPECT_EQ(anchored[0].anchorPosition, 7);
}
