#include "core/hash_chain_ledger.hpp"

#include <chrono>
#include <thread>
#include "core/entry_hasher.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"

namespace mediguard {
namespace core {

namespace {
constexpr std::chrono::milliseconds kRetryBackoff(20);
}

HashChainLedger::HashChainLedger(HashChainStore &store, std::size_t maxAttempts)
    : m_store(store),
      m_maxAttempts(maxAttempts == 0 ? 1 : maxAttempts)
{
}

ChainEntry HashChainLedger::RecordPrediction(const Prediction &prediction)
{
    prediction.validate();
    return appendWithRetry(prediction.id, &prediction);
}

ChainEntry HashChainLedger::Append(const std::string &predictionId)
{
    return appendWithRetry(predictionId, nullptr);
}

std::optional<std::string> HashChainLedger::LatestHash() const
{
    return m_store.LatestHash();
}

std::vector<ChainEntry> HashChainLedger::EntriesMissingAnchor(std::size_t limit) const
{
    return m_store.EntriesMissingAnchor(limit);
}

ChainListing HashChainLedger::ListChain(std::size_t offset, std::size_t limit) const
{
    return m_store.ListChain(offset, limit);
}

ChainStats HashChainLedger::GetChainStats() const
{
    return m_store.GetStats();
}

// -----------------------------------------------------------------------------
// Retry only on ConcurrencyConflict. Each attempt is a fresh transaction, so a
// previous_hash read by a failed attempt is never reused.
// -----------------------------------------------------------------------------
ChainEntry HashChainLedger::appendWithRetry(const std::string &predictionId, const Prediction *newPrediction)
{
    for (std::size_t attempt = 1;; ++attempt) {
        try {
            return appendOnce(predictionId, newPrediction);
        } catch (const ConcurrencyConflict &ex) {
            if (attempt >= m_maxAttempts) {
                util::logger::error("[HashChainLedger] Append of " + predictionId + " gave up after " +
                                    std::to_string(attempt) + " attempts: " + ex.what());
                throw;
            }
            util::logger::warn("[HashChainLedger] Append of " + predictionId + " conflicted (attempt " +
                               std::to_string(attempt) + "), retrying: " + ex.what());
            std::this_thread::sleep_for(kRetryBackoff * static_cast<int>(attempt));
        }
    }
}

ChainEntry HashChainLedger::appendOnce(const std::string &predictionId, const Prediction *newPrediction)
{
    std::lock_guard<std::mutex> lock(m_appendMutex);

    HashChainStore::WriteTransaction txn = m_store.BeginWrite();
    if (newPrediction != nullptr) {
        if (txn.HasEntryForPrediction(predictionId)) {
            throw DuplicateEntry(predictionId);
        }
        txn.InsertPrediction(*newPrediction);
    }
    ChainEntry entry = AppendWithin(txn, predictionId);
    txn.Commit();
    return entry;
}

ChainEntry HashChainLedger::AppendWithin(HashChainStore::WriteTransaction &txn, const std::string &predictionId)
{
    if (txn.HasEntryForPrediction(predictionId)) {
        throw DuplicateEntry(predictionId);
    }

    // Hash the prediction as stored, not as submitted.
    std::optional<Prediction> prediction = txn.FindPrediction(predictionId);
    if (!prediction) {
        throw PredictionNotFound(predictionId);
    }

    const std::optional<std::string> head = txn.LatestHash();
    const std::string hash = computeEntryHash(*prediction, prediction->timestamp, head);

    ChainEntry entry = txn.InsertEntry(predictionId, head, hash, prediction->timestamp);

    util::logger::debug("[HashChainLedger] Appended #" + std::to_string(entry.sequence) +
                        " prediction=" + predictionId + " hash=" + hash);
    return entry;
}

} // namespace core
} // namespace mediguard
