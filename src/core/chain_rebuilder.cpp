#include "core/chain_rebuilder.hpp"

#include <mutex>
#include "util/logger.hpp"

namespace mediguard {
namespace core {

ChainRebuilder::ChainRebuilder(HashChainLedger &ledger)
    : m_ledger(ledger)
{
}

RebuildReport ChainRebuilder::Rebuild()
{
    RebuildReport report;
    HashChainStore &store = m_ledger.GetStore();

    std::lock_guard<std::mutex> appendLock(m_ledger.AppendMutex());
    HashChainStore::WriteTransaction txn = store.BeginWrite();

    // Parse every payload before anything is deleted.
    const std::vector<Prediction> predictions = txn.ListPredictionsChronological();

    report.entriesDeleted = txn.DeleteAllEntries();
    util::logger::warn("[ChainRebuilder] Deleting " + std::to_string(report.entriesDeleted) +
                       " chain entries, replaying " + std::to_string(predictions.size()) + " predictions.");

    for (const auto &prediction : predictions) {
        m_ledger.AppendWithin(txn, prediction.id);
        ++report.predictionsReplayed;
        if (report.predictionsReplayed % 1000 == 0) {
            util::logger::info("[ChainRebuilder] " + std::to_string(report.predictionsReplayed) + "/" +
                               std::to_string(predictions.size()) + " replayed.");
        }
        if (m_progress) {
            m_progress(report.predictionsReplayed, predictions.size());
        }
    }

    report.verification = ChainVerifier(store).Verify(txn);
    if (!report.verification.valid || report.verification.totalEntries != predictions.size()) {
        util::logger::error("[ChainRebuilder] Replayed chain does not verify (" +
                            std::to_string(report.verification.errors.size()) +
                            " problem(s)); rolling back, previous chain kept.");
        return report;
    }

    txn.Commit();
    report.success = true;
    util::logger::info("[ChainRebuilder] Rebuild complete: " + std::to_string(report.predictionsReplayed) +
                       " entries, chain verified.");
    return report;
}

} // namespace core
} // namespace mediguard
