#include "anchor/anchor_committer.hpp"

#include <stdexcept>
#include "core/errors.hpp"
#include "util/clock.hpp"
#include "util/logger.hpp"

namespace mediguard {
namespace anchor {

std::string toString(CommitterState state)
{
    switch (state) {
    case CommitterState::Running:  return "running";
    case CommitterState::Stopping: return "stopping";
    case CommitterState::Stopped:  return "stopped";
    }
    return "stopped";
}

AnchorCommitter::AnchorCommitter(core::HashChainStore &store,
                                 IAnchorService &service,
                                 std::chrono::seconds interval,
                                 std::size_t batchSize)
    : m_store(store),
      m_service(service),
      m_batchSize(batchSize == 0 ? 500 : batchSize),
      m_interval(interval),
      m_state(CommitterState::Stopped),
      m_stopRequested(false)
{
    m_status.mode = m_service.ModeName();
}

AnchorCommitter::~AnchorCommitter()
{
    Stop();
}

void AnchorCommitter::ConfigureInterval(std::chrono::seconds interval)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_interval = interval;
}

bool AnchorCommitter::Start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != CommitterState::Stopped) {
        util::logger::warn("[AnchorCommitter] Start called but the committer is " + toString(m_state) + ".");
        return false;
    }

    m_stopRequested = false;
    m_state = CommitterState::Running;
    m_schedulerThread = std::thread(&AnchorCommitter::schedulerLoop, this);

    util::logger::info("[AnchorCommitter] Started (" + m_service.ModeName() + " ledger, interval " +
                       std::to_string(m_interval.count()) + "s).");
    return true;
}

bool AnchorCommitter::Stop()
{
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != CommitterState::Running) {
            return false;
        }
        m_state = CommitterState::Stopping;
        m_stopRequested = true;
        worker = std::move(m_schedulerThread);
        m_cv.notify_all();
    }

    if (worker.joinable()) {
        worker.join();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = CommitterState::Stopped;
    }
    util::logger::info("[AnchorCommitter] Stopped.");
    return true;
}

CommitCycleResult AnchorCommitter::RunCommitCycle()
{
    std::lock_guard<std::mutex> cycleLock(m_cycleMutex);
    CommitCycleResult result = performCycle();
    recordCycle(result);
    return result;
}

CommitterStatus AnchorCommitter::GetStatus() const
{
    CommitterStatus status;
    {
        std::lock_guard<std::mutex> lock(m_statusMutex);
        status = m_status;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    status.state = m_state;
    return status;
}

// -----------------------------------------------------------------------------
// Background loop: one cycle, then sleep until the next interval or a stop.
// -----------------------------------------------------------------------------
void AnchorCommitter::schedulerLoop()
{
    util::logger::debug("[AnchorCommitter] Entering scheduling loop.");

    while (true) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopRequested) {
                break;
            }
        }

        RunCommitCycle();

        std::unique_lock<std::mutex> lock(m_mutex);
        const auto nextWake = std::chrono::steady_clock::now() + m_interval;
        m_cv.wait_until(lock, nextWake, [this] { return m_stopRequested; });
        if (m_stopRequested) {
            break;
        }
    }

    util::logger::debug("[AnchorCommitter] Exiting scheduling loop.");
}

CommitCycleResult AnchorCommitter::performCycle()
{
    CommitCycleResult result;
    try {
        core::PendingSnapshot snapshot = m_store.LoadPendingSnapshot(m_batchSize);
        if (snapshot.pending.empty() || !snapshot.head) {
            util::logger::info("[AnchorCommitter] No pending entries to anchor.");
            result.outcome = CycleOutcome::NothingPending;
            return result;
        }

        const auto &first = snapshot.pending.front();
        const auto &last = snapshot.pending.back();
        result.headHash = *snapshot.head;

        util::json::JsonValue metadata = util::json::JsonValue::object();
        metadata.set("total_entries", static_cast<int64_t>(snapshot.pending.size()));
        metadata.set("first_sequence", first.sequence);
        metadata.set("last_sequence", last.sequence);
        metadata.set("timestamp", util::utcNowIso8601());

        util::logger::info("[AnchorCommitter] Anchoring head " + result.headHash + " covering " +
                           std::to_string(snapshot.pending.size()) + " entries (#" +
                           std::to_string(first.sequence) + "..#" + std::to_string(last.sequence) +
                           ") on the " + m_service.ModeName() + " ledger.");

        result.receipt = m_service.Commit(result.headHash, metadata);

        core::HashChainStore::WriteTransaction txn = m_store.BeginWrite();
        const std::size_t marked = txn.MarkAnchored(last.sequence, result.receipt.reference, result.receipt.position);
        if (marked != snapshot.pending.size()) {
            throw core::ConcurrencyConflict("anchor " + result.receipt.reference + " would mark " +
                                            std::to_string(marked) + " entries, expected " +
                                            std::to_string(snapshot.pending.size()));
        }
        txn.Commit();

        result.outcome = CycleOutcome::Committed;
        result.entriesAnchored = marked;
        util::logger::info("[AnchorCommitter] Anchored " + std::to_string(marked) + " entries. Reference: " +
                           result.receipt.reference + ", position: " + std::to_string(result.receipt.position));
    } catch (const std::exception &ex) {
        result.outcome = CycleOutcome::Failed;
        result.entriesAnchored = 0;
        result.error = ex.what();
        util::logger::error(std::string("[AnchorCommitter] Commit cycle failed, entries stay pending: ") + ex.what());
    }
    return result;
}

void AnchorCommitter::recordCycle(const CommitCycleResult &result)
{
    std::lock_guard<std::mutex> lock(m_statusMutex);
    ++m_status.cyclesRun;
    m_status.lastCycleAt = util::utcNowIso8601();
    if (result.outcome == CycleOutcome::Committed) {
        ++m_status.successfulCommits;
        m_status.lastReference = result.receipt.reference;
        m_status.lastPosition = result.receipt.position;
        m_status.lastError.clear();
    } else if (result.outcome == CycleOutcome::Failed) {
        m_status.lastError = result.error;
    }
}

} // namespace anchor
} // namespace mediguard
