#ifndef MEDIGUARD_CORE_HASH_CHAIN_LEDGER_HPP
#define MEDIGUARD_CORE_HASH_CHAIN_LEDGER_HPP

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/chain_entry.hpp"
#include "core/hash_chain_store.hpp"
#include "core/prediction.hpp"

/**
 * @file hash_chain_ledger.hpp
 * @brief The append-only hash chain over stored predictions.
 *
 * Every append reads the chain head and inserts the next entry inside one
 * BEGIN IMMEDIATE transaction, under an in-process mutex. Writers in other
 * processes are serialized by SQLite; a writer that still loses the race hits
 * the unique parent/genesis indexes, gets a ConcurrencyConflict and the whole
 * read-head/hash/insert sequence starts over with a fresh head.
 */

namespace mediguard {
namespace core {

class HashChainLedger
{
public:
    /**
     * @param store         Initialized store; must outlive the ledger.
     * @param maxAttempts   Attempts per append before a ConcurrencyConflict is rethrown.
     */
    explicit HashChainLedger(HashChainStore &store, std::size_t maxAttempts = 5);

    /**
     * @brief Store a new prediction and chain it, as one unit.
     *
     * If anything fails neither the prediction row nor the entry is written.
     * @throw InvalidPrediction, DuplicateEntry, ConcurrencyConflict (after retries), StorageError.
     */
    ChainEntry RecordPrediction(const Prediction &prediction);

    /**
     * @brief Chain a prediction that is already stored.
     * @throw PredictionNotFound, DuplicateEntry, ConcurrencyConflict (after retries), StorageError.
     */
    ChainEntry Append(const std::string &predictionId);

    /**
     * @brief Chain a stored prediction inside a transaction the caller owns.
     *
     * No lock is taken, nothing is retried and nothing is committed: the
     * caller holds AppendMutex() and the transaction for its whole procedure.
     * @throw PredictionNotFound, DuplicateEntry, ConcurrencyConflict, StorageError.
     */
    ChainEntry AppendWithin(HashChainStore::WriteTransaction &txn, const std::string &predictionId);

    /// Serializes appends from this process.
    std::mutex &AppendMutex() { return m_appendMutex; }

    /// current_hash of the newest entry, or nullopt for an empty chain.
    std::optional<std::string> LatestHash() const;

    /// Unanchored entries, ascending sequence, at most limit of them.
    std::vector<ChainEntry> EntriesMissingAnchor(std::size_t limit) const;

    ChainListing ListChain(std::size_t offset, std::size_t limit) const;
    ChainStats GetChainStats() const;

    HashChainStore &GetStore() { return m_store; }
    const HashChainStore &GetStore() const { return m_store; }

private:
    ChainEntry appendWithRetry(const std::string &predictionId, const Prediction *newPrediction);
    ChainEntry appendOnce(const std::string &predictionId, const Prediction *newPrediction);

    HashChainStore &m_store;
    std::size_t m_maxAttempts;
    std::mutex m_appendMutex;
};

} // namespace core
} // namespace mediguard

#endif // MEDIGUARD_CORE_HASH_CHAIN_LEDGER_HPP
