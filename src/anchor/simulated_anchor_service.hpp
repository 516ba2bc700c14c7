#ifndef MEDIGUARD_ANCHOR_SIMULATED_ANCHOR_SERVICE_HPP
#define MEDIGUARD_ANCHOR_SIMULATED_ANCHOR_SERVICE_HPP

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "anchor/anchor_service.hpp"
#include "core/chain_entry.hpp"
#include "util/clock.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace mediguard {
namespace anchor {

/**
 * @class SimulatedAnchorService
 * @brief Local stand-in used when no external ledger is configured.
 *
 * reference = "0x" + first 16 hex chars of
 *   sha256("MediGuardAI:" + head + ":" + timestamp + ":" + canonical(metadata))
 * position  = local counter, incremented per commit.
 *
 * Seed() loads the anchors already recorded in the store so that positions
 * keep increasing across restarts and Verify() still knows old references.
 * Verify() returns the committed payload text as rawData; references that
 * were only seeded have no payload.
 */
class SimulatedAnchorService : public IAnchorService
{
public:
    using Clock = std::function<std::string()>;

    SimulatedAnchorService()
        : m_clock(&util::utcNowIso8601), m_position(0)
    {
    }

    /// Fixed clock for reproducible references.
    explicit SimulatedAnchorService(Clock clock)
        : m_clock(std::move(clock)), m_position(0)
    {
    }

    void Seed(const std::vector<core::AnchorRecord> &anchors)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &record : anchors) {
            m_known[record.reference].position = record.position;
            if (record.position > m_position) {
                m_position = record.position;
            }
        }
        util::logger::debug("[SimulatedAnchorService] Seeded with " + std::to_string(anchors.size()) +
                            " anchor(s), position " + std::to_string(m_position));
    }

    AnchorReceipt Commit(const std::string &headHash, const util::json::JsonValue &metadata) override
    {
        const std::string timestamp = m_clock();
        std::string data = "MediGuardAI:" + headHash + ":" + timestamp;
        if (!metadata.isNull()) {
            data += ":" + util::json::canonicalEncode(metadata);
        }

        AnchorReceipt receipt;
        receipt.reference = "0x" + util::hashing::sha256Hex(data).substr(0, 16);
        receipt.gasUsed = 0;
        receipt.status = 1;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            receipt.position = ++m_position;
            m_known[receipt.reference] = Commitment{receipt.position, data};
        }

        util::logger::info("[SimulatedAnchorService] Committed head " + headHash + " as " +
                           receipt.reference + " at position " + std::to_string(receipt.position));
        return receipt;
    }

    AnchorVerification Verify(const std::string &reference) override
    {
        AnchorVerification result;
        result.reference = reference;

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_known.find(reference);
        if (it == m_known.end()) {
            result.error = "reference unknown to the simulated ledger";
            return result;
        }
        result.found = true;
        result.position = it->second.position;
        result.status = 1;
        result.rawData = it->second.data;
        return result;
    }

    std::string ModeName() const override { return "simulated"; }

    bool IsConnected() override { return true; }

    int64_t CurrentPosition() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_position;
    }

private:
    struct Commitment
    {
        int64_t position{0};
        std::string data;
    };

    Clock m_clock;
    mutable std::mutex m_mutex;
    int64_t m_position;
    std::unordered_map<std::string, Commitment> m_known;
};

} // namespace anchor
} // namespace mediguard

#endif // MEDIGUARD_ANCHOR_SIMULATED_ANCHOR_SERVICE_HPP
