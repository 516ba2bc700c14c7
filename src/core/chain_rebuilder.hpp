#ifndef MEDIGUARD_CORE_CHAIN_REBUILDER_HPP
#define MEDIGUARD_CORE_CHAIN_REBUILDER_HPP

#include <cstddef>
#include <functional>
#include "core/chain_verifier.hpp"
#include "core/hash_chain_ledger.hpp"

namespace mediguard {
namespace core {

/**
 * @brief Outcome of a rebuild. success means the new chain verified and was
 *        committed; otherwise the previous chain is still in place.
 */
struct RebuildReport
{
    std::size_t entriesDeleted{0};
    std::size_t predictionsReplayed{0};
    VerificationReport verification;
    bool success{false};
};

/**
 * @class ChainRebuilder
 * @brief Regenerates the whole chain from the stored predictions.
 *
 * Destructive: every entry and every anchor assignment is dropped. Asking the
 * operator for confirmation is the caller's job.
 *
 * Everything runs in one BEGIN IMMEDIATE transaction while the ledger's
 * append lock is held: load every prediction by (timestamp, created_at, id),
 * delete all entries and reset the sequence, replay, verify, commit. Any
 * exception or a replayed chain that does not verify rolls the whole
 * procedure back. Writers from other processes wait for the commit.
 */
class ChainRebuilder
{
public:
    /// Called after each replayed prediction with (replayed, total). Must not write to the chain.
    using ProgressCallback = std::function<void(std::size_t, std::size_t)>;

    explicit ChainRebuilder(HashChainLedger &ledger);

    void SetProgressCallback(ProgressCallback callback) { m_progress = std::move(callback); }

    /**
     * @throw StorageError if a stored prediction is unreadable (nothing is deleted).
     * @throw ConcurrencyConflict if the write lock cannot be taken.
     */
    RebuildReport Rebuild();

private:
    HashChainLedger &m_ledger;
    ProgressCallback m_progress;
};

} // namespace core
} // namespace mediguard

#endif // MEDIGUARD_CORE_CHAIN_REBUILDER_HPP
