#ifndef MEDIGUARD_ANCHOR_ANCHOR_COMMITTER_HPP
#define MEDIGUARD_ANCHOR_ANCHOR_COMMITTER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "anchor/anchor_service.hpp"
#include "core/hash_chain_store.hpp"

namespace mediguard {
namespace anchor {

enum class CommitterState {
    Stopped,
    Running,
    Stopping   ///< Stop() is waiting for the in-flight cycle
};

std::string toString(CommitterState state);

enum class CycleOutcome {
    NothingPending,
    Committed,
    Failed
};

struct CommitCycleResult
{
    CycleOutcome outcome{CycleOutcome::NothingPending};
    std::size_t entriesAnchored{0};
    std::string headHash;
    AnchorReceipt receipt;
    std::string error;
};

struct CommitterStatus
{
    CommitterState state{CommitterState::Stopped};
    std::string mode;
    uint64_t cyclesRun{0};
    uint64_t successfulCommits{0};
    std::string lastReference;
    std::optional<int64_t> lastPosition;
    std::string lastError;
    std::string lastCycleAt;
};

/**
 * @class AnchorCommitter
 * @brief Periodically anchors the chain head and marks the entries it covers.
 *
 * One cycle:
 *   1. read all unanchored entries and the head in one snapshot
 *   2. nothing pending: done
 *   3. Commit(head, {total_entries, first_sequence, last_sequence, timestamp})
 *   4. mark exactly the entries read in 1 with the returned reference, in one
 *      transaction; any other row count rolls the marking back
 *
 * A failing cycle leaves every entry pending, is logged and recorded in the
 * status, and never stops the scheduler. The first cycle runs on Start(),
 * then one per interval. Stop() waits for an in-flight cycle to finish.
 */
class AnchorCommitter
{
public:
    AnchorCommitter(core::HashChainStore &store,
                    IAnchorService &service,
                    std::chrono::seconds interval = std::chrono::seconds(86400),
                    std::size_t batchSize = 500);
    ~AnchorCommitter();

    AnchorCommitter(const AnchorCommitter &) = delete;
    AnchorCommitter &operator=(const AnchorCommitter &) = delete;

    /// Sets how frequently commits occur; picked up after the current wait.
    void ConfigureInterval(std::chrono::seconds interval);

    /// Start the background thread. Returns false if it was already running.
    bool Start();

    /**
     * @brief Stop scheduling and join the thread.
     * @return false if it was not running or another Stop() is already joining it.
     */
    bool Stop();

    /// Run one cycle now, on the calling thread. Never overlaps a scheduled cycle.
    CommitCycleResult RunCommitCycle();

    CommitterStatus GetStatus() const;

private:
    void schedulerLoop();
    CommitCycleResult performCycle();
    void recordCycle(const CommitCycleResult &result);

    core::HashChainStore &m_store;
    IAnchorService &m_service;
    std::size_t m_batchSize;

    std::chrono::seconds m_interval;
    CommitterState m_state;
    bool m_stopRequested;
    std::thread m_schedulerThread;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;

    std::mutex m_cycleMutex;

    mutable std::mutex m_statusMutex;
    CommitterStatus m_status;
};

} // namespace anchor
} // namespace mediguard

#endif // MEDIGUARD_ANCHOR_ANCHOR_COMMITTER_HPP
