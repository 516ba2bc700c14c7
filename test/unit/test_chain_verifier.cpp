#include <gtest/gtest.h>

#include <string>

#include "core/chain_verifier.hpp"
#include "core/errors.hpp"
#include "core/hash_chain_ledger.hpp"
#include "core/hash_chain_store.hpp"
#include "test_support.hpp"

using namespace mediguard;
using mediguard::test::TempDatabase;
using mediguard::test::makePrediction;
using mediguard::test::timestampFor;

namespace {

// Five chained predictions p0..p4 with sequences 1..5.
class ChainVerifierTest : public ::testing::Test
{
protected:
    ChainVerifierTest()
        : m_db("verifier"), m_store(m_db.path()), m_ledger(m_store)
    {
    }

    void SetUp() override
    {
        m_store.Initialize();
        for (int i = 0; i < 5; ++i) {
            m_ledger.RecordPrediction(makePrediction("p" + std::to_string(i), timestampFor(i), 120.0 + i));
        }
    }

    core::VerificationReport verify(std::size_t pageSize = 500) const
    {
        return core::ChainVerifier(m_store, pageSize).Verify();
    }

    TempDatabase m_db;
    core::HashChainStore m_store;
    core::HashChainLedger m_ledger;
};

} // namespace

TEST(ChainVerifierEmptyTest, EmptyChainIsValid) {
    TempDatabase db("verifier_empty");
    core::HashChainStore store(db.path());
    store.Initialize();

    const core::VerificationReport report = core::ChainVerifier(store).Verify();
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.totalEntries, 0u);
    EXPECT_TRUE(report.errors.empty());
    EXPECT_NO_THROW(core::ChainVerifier::RequireValid(report));
}

TEST_F(ChainVerifierTest, IntactChainIsValid) {
    const core::VerificationReport report = verify();
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.totalEntries, 5u);
    EXPECT_TRUE(report.discrepancies.empty());
}

TEST_F(ChainVerifierTest, PagingDoesNotChangeTheResult) {
    const core::VerificationReport report = verify(2);
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.totalEntries, 5u);
}

TEST_F(ChainVerifierTest, TamperedPayloadGivesExactlyOneHashMismatch) {
    m_db.exec("UPDATE predictions SET input_features = '{\"age\":50,\"bmi\":33.600000,\"glucose\":999.000000}'"
              " WHERE id = 'p2';");

    const core::VerificationReport report = verify();
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.totalEntries, 5u);
    ASSERT_EQ(report.discrepancies.size(), 1u);
    ASSERT_EQ(report.errors.size(), 1u);

    const core::Discrepancy &d = report.discrepancies[0];
    EXPECT_EQ(d.kind, core::DiscrepancyKind::HashMismatch);
    EXPECT_EQ(d.position, 2u);
    EXPECT_EQ(d.sequence, 3);
    EXPECT_EQ(d.predictionId, "p2");
    EXPECT_NE(d.expected, d.actual);
    EXPECT_NE(report.errors[0].find("Hash mismatch"), std::string::npos);

    EXPECT_THROW(core::ChainVerifier::RequireValid(report), core::IntegrityViolation);
}

TEST_F(ChainVerifierTest, TamperedResultIsDetected) {
    m_db.exec("UPDATE predictions SET prediction_result = '{\"disease\":\"none\"}' WHERE id = 'p4';");

    const core::VerificationReport report = verify();
    ASSERT_EQ(report.discrepancies.size(), 1u);
    EXPECT_EQ(report.discrepancies[0].kind, core::DiscrepancyKind::HashMismatch);
    EXPECT_EQ(report.discrepancies[0].position, 4u);
}

TEST_F(ChainVerifierTest, RewrittenLinkIsReportedAtThatEntryOnly) {
    m_db.exec("UPDATE hash_chain SET previous_hash = 'forged' WHERE id = 3;");

    const core::VerificationReport report = verify();
    EXPECT_FALSE(report.valid);
    // The broken link, and the stored hash no longer matches the forged parent.
    ASSERT_EQ(report.discrepancies.size(), 2u);
    EXPECT_EQ(report.discrepancies[0].kind, core::DiscrepancyKind::LinkMismatch);
    EXPECT_EQ(report.discrepancies[0].position, 2u);
    EXPECT_EQ(report.discrepancies[0].actual, "forged");
    EXPECT_EQ(report.discrepancies[1].kind, core::DiscrepancyKind::HashMismatch);
    EXPECT_EQ(report.discrepancies[1].position, 2u);
}

TEST_F(ChainVerifierTest, DeletedEntryBreaksTheNextLink) {
    m_db.exec("DELETE FROM hash_chain WHERE id = 3;");

    const core::VerificationReport report = verify();
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.totalEntries, 4u);
    ASSERT_EQ(report.discrepancies.size(), 1u);
    EXPECT_EQ(report.discrepancies[0].kind, core::DiscrepancyKind::LinkMismatch);
    EXPECT_EQ(report.discrepancies[0].sequence, 4);
    EXPECT_EQ(report.discrepancies[0].position, 2u);
}

TEST_F(ChainVerifierTest, DeletedLeadingEntriesAreDetected) {
    const std::string genesisHash = m_store.LoadEntries().front().currentHash;
    const std::string secondHash = m_store.LoadEntries().at(1).currentHash;
    m_db.exec("DELETE FROM hash_chain WHERE id IN (1, 2);");

    const core::VerificationReport report = verify();
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.totalEntries, 3u);
    ASSERT_EQ(report.discrepancies.size(), 1u);
    EXPECT_EQ(report.discrepancies[0].kind, core::DiscrepancyKind::LinkMismatch);
    EXPECT_EQ(report.discrepancies[0].position, 0u);
    EXPECT_EQ(report.discrepancies[0].sequence, 3);
    EXPECT_EQ(report.discrepancies[0].expected, "null");
    EXPECT_EQ(report.discrepancies[0].actual, secondHash);
    EXPECT_NE(report.discrepancies[0].actual, genesisHash);
    EXPECT_THROW(core::ChainVerifier::RequireValid(report), core::IntegrityViolation);
}

TEST_F(ChainVerifierTest, DeletedGenesisAloneIsDetected) {
    m_db.exec("DELETE FROM hash_chain WHERE id = 1;");

    const core::VerificationReport report = verify(2);
    EXPECT_FALSE(report.valid);
    ASSERT_EQ(report.discrepancies.size(), 1u);
    EXPECT_EQ(report.discrepancies[0].position, 0u);
    EXPECT_EQ(report.discrepancies[0].sequence, 2);
}

TEST_F(ChainVerifierTest, MissingPredictionIsSkippedAsPredecessor) {
    m_db.exec("DELETE FROM predictions WHERE id = 'p1';");

    const core::VerificationReport report = verify();
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.totalEntries, 5u);
    ASSERT_EQ(report.discrepancies.size(), 2u);
    EXPECT_EQ(report.discrepancies[0].kind, core::DiscrepancyKind::MissingPrediction);
    EXPECT_EQ(report.discrepancies[0].position, 1u);
    EXPECT_NE(report.errors[0].find("p1 not found"), std::string::npos);
    // The next entry is compared against the last entry that could be checked.
    EXPECT_EQ(report.discrepancies[1].kind, core::DiscrepancyKind::LinkMismatch);
    EXPECT_EQ(report.discrepancies[1].position, 2u);
}

TEST_F(ChainVerifierTest, UnreadablePayloadIsAHashMismatch) {
    m_db.exec("UPDATE predictions SET input_features = 'not json' WHERE id = 'p0';");

    const core::VerificationReport report = verify();
    ASSERT_EQ(report.discrepancies.size(), 1u);
    EXPECT_EQ(report.discrepancies[0].kind, core::DiscrepancyKind::HashMismatch);
    EXPECT_EQ(report.discrepancies[0].position, 0u);
    EXPECT_NE(report.discrepancies[0].expected.find("unreadable"), std::string::npos);
}

TEST_F(ChainVerifierTest, VerificationDoesNotWrite) {
    m_db.exec("UPDATE predictions SET input_features = '{}' WHERE id = 'p3';");
    const core::ChainStats before = m_ledger.GetChainStats();
    verify();
    verify();
    const core::ChainStats after = m_ledger.GetChainStats();
    EXPECT_EQ(before.totalEntries, after.totalEntries);
    EXPECT_EQ(before.headHash, after.headHash);
    EXPECT_EQ(m_store.LoadEntries().size(), 5u);
}
