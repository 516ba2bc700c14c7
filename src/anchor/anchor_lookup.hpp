#ifndef MEDIGUARD_ANCHOR_ANCHOR_LOOKUP_HPP
#define MEDIGUARD_ANCHOR_ANCHOR_LOOKUP_HPP

#include <string>
#include <vector>
#include "anchor/anchor_service.hpp"
#include "core/chain_entry.hpp"
#include "core/hash_chain_store.hpp"

namespace mediguard {
namespace anchor {

/**
 * @brief What the store and the external ledger know about one anchor reference.
 */
struct AnchorLookup
{
    std::string reference;
    std::vector<core::ChainEntry> entries;  ///< entries carrying the reference, ascending
    AnchorVerification verification;
};

inline AnchorLookup lookupAnchor(const core::HashChainStore &store,
                                 IAnchorService &service,
                                 const std::string &reference)
{
    AnchorLookup lookup;
    lookup.reference = reference;
    lookup.entries = store.EntriesByAnchorReference(reference);
    lookup.verification = service.Verify(reference);
    return lookup;
}

} // namespace anchor
} // namespace mediguard

#endif // MEDIGUARD_ANCHOR_ANCHOR_LOOKUP_HPP
