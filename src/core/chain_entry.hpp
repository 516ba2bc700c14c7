#ifndef MEDIGUARD_CORE_CHAIN_ENTRY_HPP
#define MEDIGUARD_CORE_CHAIN_ENTRY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "core/prediction.hpp"

/**
 * @file chain_entry.hpp
 * @brief Records of the append-only hash chain and the read models built on them.
 */

namespace mediguard {
namespace core {

/**
 * @struct ChainEntry
 * @brief One link of the chain.
 *
 * Invariants maintained by HashChainLedger:
 *   - previousHash is empty only for the first entry and otherwise equals the
 *     currentHash of the entry immediately before it.
 *   - currentHash is unique across the chain.
 *   - anchorReference / anchorPosition go from empty to set exactly once.
 */
struct ChainEntry
{
    int64_t sequence{0};
    std::string predictionId;
    std::optional<std::string> previousHash;
    std::string currentHash;
    std::string entryTimestamp;
    std::optional<std::string> anchorReference;
    std::optional<int64_t> anchorPosition;
    std::string createdAt;

    bool isAnchored() const { return anchorReference.has_value(); }
};

/**
 * @brief Prediction fields shown next to an entry in chain listings.
 */
struct PredictionSummary
{
    std::string userId;
    PredictionSource source{PredictionSource::Manual};
    std::string timestamp;
    std::string predictionResultJson;
};

struct ChainListingItem
{
    ChainEntry entry;
    std::optional<PredictionSummary> prediction; ///< empty if the prediction row is gone
};

/**
 * @brief One page of the chain, newest entry first.
 */
struct ChainListing
{
    std::vector<ChainListingItem> items;
    std::size_t totalEntries{0};
    std::size_t offset{0};
    std::size_t limit{0};
};

struct ChainStats
{
    std::size_t totalEntries{0};
    std::size_t anchoredEntries{0};
    std::size_t pendingEntries{0};
    std::size_t totalPredictions{0};
    std::optional<std::string> headHash;
};

/**
 * @brief A distinct anchor already recorded in the store.
 */
struct AnchorRecord
{
    std::string reference;
    int64_t position{0};
    std::size_t entryCount{0};
};

} // namespace core
} // namespace mediguard

#endif // MEDIGUARD_CORE_CHAIN_ENTRY_HPP
