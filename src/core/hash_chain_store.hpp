#ifndef MEDIGUARD_CORE_HASH_CHAIN_STORE_HPP
#define MEDIGUARD_CORE_HASH_CHAIN_STORE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/chain_entry.hpp"
#include "core/prediction.hpp"

struct sqlite3;

namespace mediguard {
namespace core {

/**
 * @brief A chain entry read for verification, together with its prediction.
 *
 * The prediction is parsed from the stored columns. If the row is gone,
 * predictionFound is false; if the stored payload no longer parses,
 * payloadError carries the parser message and prediction holds only the ids.
 */
struct VerificationRow
{
    ChainEntry entry;
    bool predictionFound{false};
    Prediction prediction;
    std::string payloadError;
};

/**
 * @brief Everything the committer needs from one consistent read.
 */
struct PendingSnapshot
{
    std::vector<ChainEntry> pending;   ///< ascending sequence
    std::optional<std::string> head;   ///< latest_hash() in the same snapshot
};

/**
 * @class HashChainStore
 * @brief SQLite3 persistence for predictions and the hash chain.
 *
 * Every call opens its own connection (WAL journal, busy timeout), so readers
 * see a snapshot and never wait on the append critical section. Writes go
 * through WriteTransaction, which holds a BEGIN IMMEDIATE transaction and
 * rolls back unless Commit() is reached.
 *
 * Failures are thrown: SQLITE_BUSY/LOCKED and UNIQUE violations on the chain
 * become ConcurrencyConflict, anything else StorageError.
 */
class HashChainStore
{
public:
    class Connection;

    /**
     * @class WriteTransaction
     * @brief One BEGIN IMMEDIATE transaction on a private connection.
     */
    class WriteTransaction
    {
    public:
        WriteTransaction(WriteTransaction &&other) noexcept;
        WriteTransaction &operator=(WriteTransaction &&) = delete;
        WriteTransaction(const WriteTransaction &) = delete;
        WriteTransaction &operator=(const WriteTransaction &) = delete;
        ~WriteTransaction();

        /// @throw InvalidPrediction if a prediction with this id is already stored.
        void InsertPrediction(const Prediction &prediction);

        std::optional<Prediction> FindPrediction(const std::string &predictionId) const;
        bool HasEntryForPrediction(const std::string &predictionId) const;
        std::optional<std::string> LatestHash() const;

        /**
         * @brief Predictions in replay order: timestamp, created_at, id.
         * @throw StorageError if any stored payload no longer parses.
         */
        std::vector<Prediction> ListPredictionsChronological() const;

        int64_t MaxSequence() const;

        /// Same as HashChainStore::LoadVerificationPage, seeing this transaction's own writes.
        std::vector<VerificationRow> LoadVerificationPage(int64_t afterSequence,
                                                          int64_t upToSequence,
                                                          std::size_t limit) const;

        /**
         * @brief Insert the next chain entry.
         * @throw ConcurrencyConflict if the parent or hash is already taken.
         */
        ChainEntry InsertEntry(const std::string &predictionId,
                               const std::optional<std::string> &previousHash,
                               const std::string &currentHash,
                               const std::string &entryTimestamp);

        /// @return number of rows updated.
        std::size_t MarkAnchored(int64_t lastSequence, const std::string &reference, int64_t position);

        /// Delete every entry and restart the sequence. @return rows deleted.
        std::size_t DeleteAllEntries();

        void Commit();

    private:
        friend class HashChainStore;
        explicit WriteTransaction(std::unique_ptr<Connection> conn);

        std::unique_ptr<Connection> m_conn;
        bool m_open;
    };

    explicit HashChainStore(const std::string &dbFilePath);
    ~HashChainStore();

    /**
     * @brief Create the schema and indexes if missing and switch the file to WAL.
     * @throw StorageError if the database cannot be opened or the DDL fails.
     */
    void Initialize();

    const std::string &GetPath() const { return m_dbFilePath; }

    WriteTransaction BeginWrite() const;

    std::optional<std::string> LatestHash() const;
    std::optional<Prediction> FindPrediction(const std::string &predictionId) const;

    std::size_t CountEntries() const;
    int64_t MaxSequence() const;

    std::vector<ChainEntry> EntriesMissingAnchor(std::size_t limit) const;

    /// Pending entries (all of them, read page by page) and the head, in one read transaction.
    PendingSnapshot LoadPendingSnapshot(std::size_t pageSize) const;

    /// Entries with afterSequence < id <= upToSequence, ascending, at most limit rows.
    std::vector<VerificationRow> LoadVerificationPage(int64_t afterSequence,
                                                      int64_t upToSequence,
                                                      std::size_t limit) const;

    std::vector<ChainEntry> LoadEntries() const;

    ChainListing ListChain(std::size_t offset, std::size_t limit) const;
    std::vector<ChainEntry> EntriesByAnchorReference(const std::string &reference) const;
    std::vector<AnchorRecord> ListAnchors() const;
    ChainStats GetStats() const;

private:
    std::unique_ptr<Connection> open() const;

    std::string m_dbFilePath;
};

} // namespace core
} // namespace mediguard

#endif // MEDIGUARD_CORE_HASH_CHAIN_STORE_HPP
