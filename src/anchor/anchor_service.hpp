#ifndef MEDIGUARD_ANCHOR_ANCHOR_SERVICE_HPP
#define MEDIGUARD_ANCHOR_ANCHOR_SERVICE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "util/canonical_json.hpp"

/**
 * @file anchor_service.hpp
 * @brief The narrow commit/verify contract of the external anchor ledger.
 *
 * The committer and the lookup code only ever talk to IAnchorService; which
 * implementation answers (simulated or JSON-RPC) is decided once, from
 * configuration, by makeAnchorService().
 */

namespace mediguard {
namespace anchor {

/**
 * @brief Result of a successful commit.
 */
struct AnchorReceipt
{
    std::string reference;   ///< external transaction id
    int64_t position{0};     ///< external block / sequence number
    uint64_t gasUsed{0};
    int status{1};
};

/**
 * @brief Result of looking a reference up on the external ledger.
 */
struct AnchorVerification
{
    bool found{false};
    std::string reference;
    std::optional<int64_t> position;
    std::optional<int> status;
    std::string rawData;     ///< committed payload as the ledger returns it (hex for rpc)
    std::string from;
    std::string to;
    std::string error;       ///< why found is false, if known
};

/**
 * @class IAnchorService
 * @brief Commit a chain head to an external ledger and look commitments up again.
 */
class IAnchorService
{
public:
    virtual ~IAnchorService() = default;

    /**
     * @brief Commit the head hash together with metadata.
     * @throw core::AnchorServiceFailure if the ledger rejects the commit or does not confirm it in time.
     */
    virtual AnchorReceipt Commit(const std::string &headHash, const util::json::JsonValue &metadata) = 0;

    /**
     * @brief Look a reference up. Never throws for an unknown reference; found is false instead.
     */
    virtual AnchorVerification Verify(const std::string &reference) = 0;

    /// "simulated" or "rpc".
    virtual std::string ModeName() const = 0;

    virtual bool IsConnected() = 0;
};

} // namespace anchor
} // namespace mediguard

#endif // MEDIGUARD_ANCHOR_ANCHOR_SERVICE_HPP
