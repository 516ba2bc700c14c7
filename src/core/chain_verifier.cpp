#include "core/chain_verifier.hpp"

#include <optional>
#include <sstream>
#include "core/entry_hasher.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"

namespace mediguard {
namespace core {

std::string toString(DiscrepancyKind kind)
{
    switch (kind) {
    case DiscrepancyKind::MissingPrediction: return "missing_prediction";
    case DiscrepancyKind::LinkMismatch:      return "link_mismatch";
    case DiscrepancyKind::HashMismatch:      return "hash_mismatch";
    }
    return "hash_mismatch";
}

namespace {

std::string label(std::size_t position, int64_t sequence)
{
    return "Entry " + std::to_string(position + 1) + " (sequence " + std::to_string(sequence) + ")";
}

void record(VerificationReport &report, Discrepancy d, const std::string &message)
{
    report.valid = false;
    report.errors.push_back(message);
    report.discrepancies.push_back(std::move(d));
}

} // namespace

ChainVerifier::ChainVerifier(const HashChainStore &store, std::size_t pageSize)
    : m_store(store),
      m_pageSize(pageSize == 0 ? 500 : pageSize)
{
}

VerificationReport ChainVerifier::Verify() const
{
    return walk(m_store.MaxSequence(),
                [this](int64_t after, int64_t upTo, std::size_t limit) {
                    return m_store.LoadVerificationPage(after, upTo, limit);
                });
}

VerificationReport ChainVerifier::Verify(const HashChainStore::WriteTransaction &txn) const
{
    return walk(txn.MaxSequence(),
                [&txn](int64_t after, int64_t upTo, std::size_t limit) {
                    return txn.LoadVerificationPage(after, upTo, limit);
                });
}

VerificationReport ChainVerifier::walk(int64_t upTo, const PageLoader &loadPage) const
{
    VerificationReport report;

    std::optional<std::string> previousHash;
    std::size_t position = 0;
    int64_t after = 0;

    for (;;) {
        std::vector<VerificationRow> page = loadPage(after, upTo, m_pageSize);
        if (page.empty()) {
            break;
        }

        for (const auto &row : page) {
            const ChainEntry &entry = row.entry;
            const std::string where = label(position, entry.sequence);

            if (!row.predictionFound) {
                Discrepancy d;
                d.position = position;
                d.sequence = entry.sequence;
                d.kind = DiscrepancyKind::MissingPrediction;
                d.predictionId = entry.predictionId;
                record(report, d, where + ": Prediction " + entry.predictionId + " not found");
                // Not a valid predecessor: the link check of the next entry
                // still compares against the last entry that had a prediction.
                ++position;
                continue;
            }

            // At position 0 previousHash is still null: a genesis check.
            if (entry.previousHash != previousHash) {
                Discrepancy d;
                d.position = position;
                d.sequence = entry.sequence;
                d.kind = DiscrepancyKind::LinkMismatch;
                d.predictionId = entry.predictionId;
                d.expected = previousHash.value_or("null");
                d.actual = entry.previousHash.value_or("null");
                record(report, d, where + ": Previous hash mismatch. Expected " + d.expected +
                                      ", got " + d.actual);
            }

            std::string expectedHash;
            if (row.payloadError.empty()) {
                try {
                    expectedHash = computeEntryHash(row.prediction, row.prediction.timestamp, entry.previousHash);
                } catch (const util::json::JsonError &ex) {
                    expectedHash = std::string("<unhashable: ") + ex.what() + ">";
                }
            } else {
                expectedHash = "<unreadable payload: " + row.payloadError + ">";
            }

            if (expectedHash != entry.currentHash) {
                Discrepancy d;
                d.position = position;
                d.sequence = entry.sequence;
                d.kind = DiscrepancyKind::HashMismatch;
                d.predictionId = entry.predictionId;
                d.expected = expectedHash;
                d.actual = entry.currentHash;
                record(report, d, where + ": Hash mismatch. Expected " + d.expected +
                                      ", got " + d.actual);
            }

            previousHash = entry.currentHash;
            ++position;
        }

        after = page.back().entry.sequence;
        if (page.size() < m_pageSize) {
            break;
        }
    }

    report.totalEntries = position;

    if (report.valid) {
        util::logger::info("[ChainVerifier] Chain valid, " + std::to_string(report.totalEntries) + " entries.");
    } else {
        util::logger::warn("[ChainVerifier] Chain INVALID: " + std::to_string(report.errors.size()) +
                           " problem(s) in " + std::to_string(report.totalEntries) + " entries.");
    }
    return report;
}

void ChainVerifier::RequireValid(const VerificationReport &report)
{
    if (report.valid) {
        return;
    }
    std::ostringstream oss;
    oss << "hash chain verification failed (" << report.errors.size() << " problem(s))";
    for (const auto &err : report.errors) {
        oss << "\n  " << err;
    }
    throw IntegrityViolation(oss.str());
}

} // namespace core
} // namespace mediguard
