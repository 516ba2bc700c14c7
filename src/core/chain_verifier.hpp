#ifndef MEDIGUARD_CORE_CHAIN_VERIFIER_HPP
#define MEDIGUARD_CORE_CHAIN_VERIFIER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "core/hash_chain_store.hpp"

namespace mediguard {
namespace core {

enum class DiscrepancyKind {
    MissingPrediction,
    LinkMismatch,
    HashMismatch
};

std::string toString(DiscrepancyKind kind);

/**
 * @brief One problem found at one entry.
 *
 * position is the 0-based place in the walk; sequence is the stored entry id.
 * expected/actual hold the hashes involved (empty for a missing prediction).
 */
struct Discrepancy
{
    std::size_t position{0};
    int64_t sequence{0};
    DiscrepancyKind kind{DiscrepancyKind::HashMismatch};
    std::string predictionId;
    std::string expected;
    std::string actual;
};

struct VerificationReport
{
    bool valid{true};
    std::size_t totalEntries{0};
    std::vector<std::string> errors;           ///< human-readable, in walk order
    std::vector<Discrepancy> discrepancies;    ///< same findings, structured
};

/**
 * @class ChainVerifier
 * @brief Replays the chain from genesis and recomputes every hash.
 *
 * The walk starts from a null previous hash, so the first stored entry must
 * be a genesis entry: a chain whose leading entries were deleted does not
 * verify.
 *
 * Read-only. The upper sequence bound is fixed when Verify() starts, so
 * entries appended during the walk are not part of the report; pages of
 * pageSize entries are read one snapshot at a time.
 */
class ChainVerifier
{
public:
    explicit ChainVerifier(const HashChainStore &store, std::size_t pageSize = 500);

    VerificationReport Verify() const;

    /// Verify what the open transaction sees, its own uncommitted writes included.
    VerificationReport Verify(const HashChainStore::WriteTransaction &txn) const;

    /// @throw IntegrityViolation listing the report's errors if it is not valid.
    static void RequireValid(const VerificationReport &report);

private:
    using PageLoader = std::function<std::vector<VerificationRow>(int64_t, int64_t, std::size_t)>;

    VerificationReport walk(int64_t upTo, const PageLoader &loadPage) const;

    const HashChainStore &m_store;
    std::size_t m_pageSize;
};

} // namespace core
} // namespace mediguard

#endif // MEDIGUARD_CORE_CHAIN_VERIFIER_HPP
