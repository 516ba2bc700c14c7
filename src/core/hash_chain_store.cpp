#include "core/hash_chain_store.hpp"

#include <sqlite3.h>
#include <utility>
#include "core/errors.hpp"
#include "util/clock.hpp"
#include "util/logger.hpp"

namespace mediguard {
namespace core {

namespace {

constexpr int kBusyTimeoutMillis = 5000;

const char *kSchemaDdl =
    "CREATE TABLE IF NOT EXISTS predictions ("
    "  id TEXT PRIMARY KEY,"
    "  user_id TEXT NOT NULL,"
    "  timestamp TEXT NOT NULL,"
    "  source TEXT NOT NULL CHECK(source IN ('manual','pdf','csv','image')),"
    "  input_features TEXT NOT NULL,"
    "  prediction_result TEXT NOT NULL,"
    "  created_at TEXT NOT NULL"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_predictions_timeline ON predictions(timestamp, created_at);"
    "CREATE TABLE IF NOT EXISTS hash_chain ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  prediction_id TEXT NOT NULL UNIQUE REFERENCES predictions(id),"
    "  previous_hash TEXT,"
    "  current_hash TEXT NOT NULL UNIQUE,"
    "  block_timestamp TEXT NOT NULL,"
    "  blockchain_tx_hash TEXT,"
    "  blockchain_block_number INTEGER,"
    "  created_at TEXT NOT NULL"
    ");"
    // No two entries may share a parent, and only one entry may be the genesis.
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_hash_chain_previous ON hash_chain(previous_hash);"
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_hash_chain_genesis"
    "  ON hash_chain(coalesce(previous_hash, '')) WHERE previous_hash IS NULL;"
    "CREATE INDEX IF NOT EXISTS idx_hash_chain_anchor ON hash_chain(blockchain_tx_hash);";

const char *kEntryColumns =
    "h.id, h.prediction_id, h.previous_hash, h.current_hash, h.block_timestamp,"
    " h.blockchain_tx_hash, h.blockchain_block_number, h.created_at";

const char *kPredictionColumns =
    "p.id, p.user_id, p.timestamp, p.source, p.input_features, p.prediction_result, p.created_at";

bool isConflictCode(int rc)
{
    const int primary = rc & 0xFF;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

} // namespace

// -----------------------------------------------------------------------------
// Connection / Statement: RAII over sqlite3* and sqlite3_stmt*
// -----------------------------------------------------------------------------
class HashChainStore::Connection
{
public:
    explicit Connection(const std::string &path)
        : m_db(nullptr), m_path(path)
    {
        int rc = sqlite3_open_v2(path.c_str(), &m_db,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
            if (m_db) {
                sqlite3_close(m_db);
                m_db = nullptr;
            }
            throw StorageError("cannot open database " + path + ": " + msg);
        }
        sqlite3_busy_timeout(m_db, kBusyTimeoutMillis);
        exec("PRAGMA foreign_keys = ON;");
    }

    ~Connection()
    {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    sqlite3 *handle() const { return m_db; }

    void exec(const std::string &sql)
    {
        char *errMsg = nullptr;
        int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            std::string msg = errMsg ? errMsg : sqlite3_errstr(rc);
            sqlite3_free(errMsg);
            fail(rc, msg, sql);
        }
    }

    [[noreturn]] void fail(int rc, const std::string &msg, const std::string &context) const
    {
        if (isConflictCode(rc)) {
            throw ConcurrencyConflict("database busy (" + context + "): " + msg);
        }
        throw StorageError("sqlite error " + std::to_string(rc) + " (" + context + "): " + msg);
    }

    int changes() const { return sqlite3_changes(m_db); }

private:
    sqlite3 *m_db;
    std::string m_path;
};

namespace {

class Statement
{
public:
    Statement(HashChainStore::Connection &conn, const std::string &sql)
        : m_conn(conn), m_stmt(nullptr), m_sql(sql)
    {
        int rc = sqlite3_prepare_v2(conn.handle(), sql.c_str(), -1, &m_stmt, nullptr);
        if (rc != SQLITE_OK) {
            conn.fail(rc, sqlite3_errmsg(conn.handle()), "prepare");
        }
    }

    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    void bind(int idx, const std::string &value)
    {
        check(sqlite3_bind_text(m_stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void bind(int idx, const std::optional<std::string> &value)
    {
        if (value) {
            bind(idx, *value);
        } else {
            check(sqlite3_bind_null(m_stmt, idx));
        }
    }

    void bind(int idx, int64_t value)
    {
        check(sqlite3_bind_int64(m_stmt, idx, static_cast<sqlite3_int64>(value)));
    }

    /// @return true while a row is available.
    bool step()
    {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        m_conn.fail(rc, sqlite3_errmsg(m_conn.handle()), m_sql);
    }

    /// Step a statement that must not produce rows; returns the raw code for constraint checks.
    int execute()
    {
        return sqlite3_step(m_stmt);
    }

    std::string text(int col) const
    {
        const unsigned char *value = sqlite3_column_text(m_stmt, col);
        return value ? reinterpret_cast<const char *>(value) : std::string();
    }

    std::optional<std::string> optText(int col) const
    {
        if (sqlite3_column_type(m_stmt, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        return text(col);
    }

    int64_t integer(int col) const
    {
        return static_cast<int64_t>(sqlite3_column_int64(m_stmt, col));
    }

    std::optional<int64_t> optInteger(int col) const
    {
        if (sqlite3_column_type(m_stmt, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        return integer(col);
    }

    bool isNull(int col) const
    {
        return sqlite3_column_type(m_stmt, col) == SQLITE_NULL;
    }

    const std::string &sql() const { return m_sql; }

private:
    void check(int rc)
    {
        if (rc != SQLITE_OK) {
            m_conn.fail(rc, sqlite3_errmsg(m_conn.handle()), "bind");
        }
    }

    HashChainStore::Connection &m_conn;
    sqlite3_stmt *m_stmt;
    std::string m_sql;
};

/**
 * Deferred read transaction: every SELECT issued while it is alive sees the
 * same WAL snapshot. Ends with COMMIT; a failure while ending is only logged
 * because nothing was written.
 */
class ReadSnapshot
{
public:
    explicit ReadSnapshot(HashChainStore::Connection &conn)
        : m_conn(conn)
    {
        m_conn.exec("BEGIN DEFERRED;");
    }

    ~ReadSnapshot()
    {
        if (sqlite3_exec(m_conn.handle(), "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            util::logger::warn(std::string("[HashChainStore] Ending read snapshot failed: ") +
                               sqlite3_errmsg(m_conn.handle()));
        }
    }

    ReadSnapshot(const ReadSnapshot &) = delete;
    ReadSnapshot &operator=(const ReadSnapshot &) = delete;

private:
    HashChainStore::Connection &m_conn;
};

ChainEntry readEntry(const Statement &stmt, int first = 0)
{
    ChainEntry entry;
    entry.sequence = stmt.integer(first + 0);
    entry.predictionId = stmt.text(first + 1);
    entry.previousHash = stmt.optText(first + 2);
    entry.currentHash = stmt.text(first + 3);
    entry.entryTimestamp = stmt.text(first + 4);
    entry.anchorReference = stmt.optText(first + 5);
    entry.anchorPosition = stmt.optInteger(first + 6);
    entry.createdAt = stmt.text(first + 7);
    return entry;
}

/// Ids, timestamps and source are always filled; the JSON columns throw on corruption.
void readPredictionIdentity(const Statement &stmt, int first, Prediction &out)
{
    out.id = stmt.text(first + 0);
    out.userId = stmt.text(first + 1);
    out.timestamp = stmt.text(first + 2);
    out.source = parsePredictionSource(stmt.text(first + 3));
    out.createdAt = stmt.text(first + 6);
}

void readPredictionPayload(const Statement &stmt, int first, Prediction &out)
{
    out.inputFeatures = util::json::parse(stmt.text(first + 4));
    out.predictionResult = util::json::parse(stmt.text(first + 5));
}

Prediction readPrediction(const Statement &stmt, int first = 0)
{
    Prediction prediction;
    try {
        readPredictionIdentity(stmt, first, prediction);
        readPredictionPayload(stmt, first, prediction);
    } catch (const util::json::JsonError &ex) {
        throw StorageError("stored prediction " + prediction.id + " is unreadable: " + ex.what());
    } catch (const InvalidPrediction &ex) {
        throw StorageError("stored prediction " + stmt.text(first) + " is unreadable: " + ex.what());
    }
    return prediction;
}

std::optional<std::string> selectLatestHash(HashChainStore::Connection &conn)
{
    Statement stmt(conn, "SELECT current_hash FROM hash_chain ORDER BY id DESC LIMIT 1;");
    if (stmt.step()) {
        return stmt.text(0);
    }
    return std::nullopt;
}

std::optional<Prediction> selectPrediction(HashChainStore::Connection &conn, const std::string &predictionId)
{
    Statement stmt(conn, std::string("SELECT ") + kPredictionColumns +
                             " FROM predictions p WHERE p.id = ?1;");
    stmt.bind(1, predictionId);
    if (stmt.step()) {
        return readPrediction(stmt);
    }
    return std::nullopt;
}

std::size_t selectCount(HashChainStore::Connection &conn, const std::string &sql)
{
    Statement stmt(conn, sql);
    if (stmt.step()) {
        return static_cast<std::size_t>(stmt.integer(0));
    }
    return 0;
}

int64_t selectMaxSequence(HashChainStore::Connection &conn)
{
    Statement stmt(conn, "SELECT COALESCE(MAX(id), 0) FROM hash_chain;");
    return stmt.step() ? stmt.integer(0) : 0;
}

std::vector<Prediction> selectPredictionsChronological(HashChainStore::Connection &conn)
{
    Statement stmt(conn, std::string("SELECT ") + kPredictionColumns +
                             " FROM predictions p ORDER BY p.timestamp ASC, p.created_at ASC, p.id ASC;");
    std::vector<Prediction> predictions;
    while (stmt.step()) {
        predictions.push_back(readPrediction(stmt));
    }
    return predictions;
}

std::vector<VerificationRow> selectVerificationPage(HashChainStore::Connection &conn,
                                                    int64_t afterSequence,
                                                    int64_t upToSequence,
                                                    std::size_t limit)
{
    Statement stmt(conn, std::string("SELECT ") + kEntryColumns + ", " + kPredictionColumns +
                             " FROM hash_chain h LEFT JOIN predictions p ON p.id = h.prediction_id"
                             " WHERE h.id > ?1 AND h.id <= ?2 ORDER BY h.id ASC LIMIT ?3;");
    stmt.bind(1, afterSequence);
    stmt.bind(2, upToSequence);
    stmt.bind(3, static_cast<int64_t>(limit));

    std::vector<VerificationRow> rows;
    while (stmt.step()) {
        VerificationRow row;
        row.entry = readEntry(stmt);
        row.predictionFound = !stmt.isNull(8);
        if (row.predictionFound) {
            try {
                readPredictionIdentity(stmt, 8, row.prediction);
                readPredictionPayload(stmt, 8, row.prediction);
            } catch (const util::json::JsonError &ex) {
                row.payloadError = ex.what();
            } catch (const InvalidPrediction &ex) {
                row.payloadError = ex.what();
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace

// -----------------------------------------------------------------------------
// WriteTransaction
// -----------------------------------------------------------------------------
HashChainStore::WriteTransaction::WriteTransaction(std::unique_ptr<Connection> conn)
    : m_conn(std::move(conn)), m_open(false)
{
    m_conn->exec("BEGIN IMMEDIATE;");
    m_open = true;
}

HashChainStore::WriteTransaction::WriteTransaction(WriteTransaction &&other) noexcept
    : m_conn(std::move(other.m_conn)), m_open(other.m_open)
{
    other.m_open = false;
}

HashChainStore::WriteTransaction::~WriteTransaction()
{
    if (m_open && m_conn) {
        if (sqlite3_exec(m_conn->handle(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            util::logger::error(std::string("[HashChainStore] Rollback failed: ") +
                                sqlite3_errmsg(m_conn->handle()));
        }
    }
}

void HashChainStore::WriteTransaction::InsertPrediction(const Prediction &prediction)
{
    Statement stmt(*m_conn,
                   "INSERT INTO predictions (id, user_id, timestamp, source, input_features,"
                   " prediction_result, created_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7);");
    stmt.bind(1, prediction.id);
    stmt.bind(2, prediction.userId);
    stmt.bind(3, prediction.timestamp);
    stmt.bind(4, toString(prediction.source));
    stmt.bind(5, util::json::canonicalEncode(prediction.inputFeatures));
    stmt.bind(6, util::json::canonicalEncode(prediction.predictionResult));
    stmt.bind(7, prediction.createdAt.empty() ? util::utcNowIso8601() : prediction.createdAt);

    int rc = stmt.execute();
    if (rc == SQLITE_DONE) {
        return;
    }
    if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
        throw InvalidPrediction("prediction id already stored: " + prediction.id);
    }
    m_conn->fail(rc, sqlite3_errmsg(m_conn->handle()), "insert prediction");
}

std::optional<Prediction>
HashChainStore::WriteTransaction::FindPrediction(const std::string &predictionId) const
{
    return selectPrediction(*m_conn, predictionId);
}

bool HashChainStore::WriteTransaction::HasEntryForPrediction(const std::string &predictionId) const
{
    Statement stmt(*m_conn, "SELECT 1 FROM hash_chain WHERE prediction_id = ?1 LIMIT 1;");
    stmt.bind(1, predictionId);
    return stmt.step();
}

std::optional<std::string> HashChainStore::WriteTransaction::LatestHash() const
{
    return selectLatestHash(*m_conn);
}

std::vector<Prediction> HashChainStore::WriteTransaction::ListPredictionsChronological() const
{
    return selectPredictionsChronological(*m_conn);
}

int64_t HashChainStore::WriteTransaction::MaxSequence() const
{
    return selectMaxSequence(*m_conn);
}

std::vector<VerificationRow>
HashChainStore::WriteTransaction::LoadVerificationPage(int64_t afterSequence,
                                                       int64_t upToSequence,
                                                       std::size_t limit) const
{
    return selectVerificationPage(*m_conn, afterSequence, upToSequence, limit);
}

ChainEntry HashChainStore::WriteTransaction::InsertEntry(const std::string &predictionId,
                                                         const std::optional<std::string> &previousHash,
                                                         const std::string &currentHash,
                                                         const std::string &entryTimestamp)
{
    ChainEntry entry;
    entry.predictionId = predictionId;
    entry.previousHash = previousHash;
    entry.currentHash = currentHash;
    entry.entryTimestamp = entryTimestamp;
    entry.createdAt = util::utcNowIso8601();

    Statement stmt(*m_conn,
                   "INSERT INTO hash_chain (prediction_id, previous_hash, current_hash,"
                   " block_timestamp, created_at) VALUES (?1, ?2, ?3, ?4, ?5);");
    stmt.bind(1, entry.predictionId);
    stmt.bind(2, entry.previousHash);
    stmt.bind(3, entry.currentHash);
    stmt.bind(4, entry.entryTimestamp);
    stmt.bind(5, entry.createdAt);

    int rc = stmt.execute();
    if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
        throw ConcurrencyConflict("chain position already taken: " +
                                  std::string(sqlite3_errmsg(m_conn->handle())));
    }
    if (rc != SQLITE_DONE) {
        m_conn->fail(rc, sqlite3_errmsg(m_conn->handle()), "insert chain entry");
    }

    entry.sequence = static_cast<int64_t>(sqlite3_last_insert_rowid(m_conn->handle()));
    return entry;
}

std::size_t HashChainStore::WriteTransaction::MarkAnchored(int64_t lastSequence,
                                                          const std::string &reference,
                                                          int64_t position)
{
    Statement stmt(*m_conn,
                   "UPDATE hash_chain SET blockchain_tx_hash = ?1, blockchain_block_number = ?2"
                   " WHERE id <= ?3 AND blockchain_tx_hash IS NULL;");
    stmt.bind(1, reference);
    stmt.bind(2, position);
    stmt.bind(3, lastSequence);
    if (stmt.step()) {
        throw StorageError("unexpected row from anchor update");
    }
    return static_cast<std::size_t>(m_conn->changes());
}

std::size_t HashChainStore::WriteTransaction::DeleteAllEntries()
{
    Statement del(*m_conn, "DELETE FROM hash_chain;");
    if (del.step()) {
        throw StorageError("unexpected row from chain delete");
    }
    const auto deleted = static_cast<std::size_t>(m_conn->changes());
    m_conn->exec("DELETE FROM sqlite_sequence WHERE name = 'hash_chain';");
    return deleted;
}

void HashChainStore::WriteTransaction::Commit()
{
    if (!m_open) {
        throw StorageError("commit on a closed transaction");
    }
    m_conn->exec("COMMIT;");
    m_open = false;
}

// -----------------------------------------------------------------------------
// HashChainStore
// -----------------------------------------------------------------------------
HashChainStore::HashChainStore(const std::string &dbFilePath)
    : m_dbFilePath(dbFilePath)
{
}

HashChainStore::~HashChainStore() = default;

std::unique_ptr<HashChainStore::Connection> HashChainStore::open() const
{
    return std::make_unique<Connection>(m_dbFilePath);
}

void HashChainStore::Initialize()
{
    auto conn = open();

    {
        Statement wal(*conn, "PRAGMA journal_mode = WAL;");
        if (!wal.step() || wal.text(0) != "wal") {
            util::logger::warn("[HashChainStore] WAL journal mode unavailable for " + m_dbFilePath);
        }
    }

    conn->exec(kSchemaDdl);
    util::logger::info("[HashChainStore] Schema ready at " + m_dbFilePath);
}

HashChainStore::WriteTransaction HashChainStore::BeginWrite() const
{
    return WriteTransaction(open());
}

std::optional<std::string> HashChainStore::LatestHash() const
{
    auto conn = open();
    return selectLatestHash(*conn);
}

std::optional<Prediction> HashChainStore::FindPrediction(const std::string &predictionId) const
{
    auto conn = open();
    return selectPrediction(*conn, predictionId);
}

std::size_t HashChainStore::CountEntries() const
{
    auto conn = open();
    return selectCount(*conn, "SELECT COUNT(*) FROM hash_chain;");
}

int64_t HashChainStore::MaxSequence() const
{
    auto conn = open();
    return selectMaxSequence(*conn);
}

std::vector<ChainEntry> HashChainStore::EntriesMissingAnchor(std::size_t limit) const
{
    auto conn = open();
    Statement stmt(*conn, std::string("SELECT ") + kEntryColumns +
                              " FROM hash_chain h WHERE h.blockchain_tx_hash IS NULL"
                              " ORDER BY h.id ASC LIMIT ?1;");
    stmt.bind(1, static_cast<int64_t>(limit));
    std::vector<ChainEntry> entries;
    while (stmt.step()) {
        entries.push_back(readEntry(stmt));
    }
    return entries;
}

PendingSnapshot HashChainStore::LoadPendingSnapshot(std::size_t pageSize) const
{
    auto conn = open();
    ReadSnapshot snapshot(*conn);

    PendingSnapshot result;
    int64_t after = 0;
    for (;;) {
        Statement stmt(*conn, std::string("SELECT ") + kEntryColumns +
                                  " FROM hash_chain h WHERE h.blockchain_tx_hash IS NULL AND h.id > ?1"
                                  " ORDER BY h.id ASC LIMIT ?2;");
        stmt.bind(1, after);
        stmt.bind(2, static_cast<int64_t>(pageSize));
        std::size_t rows = 0;
        while (stmt.step()) {
            result.pending.push_back(readEntry(stmt));
            ++rows;
        }
        if (rows < pageSize) {
            break;
        }
        after = result.pending.back().sequence;
    }

    result.head = selectLatestHash(*conn);
    return result;
}

std::vector<VerificationRow> HashChainStore::LoadVerificationPage(int64_t afterSequence,
                                                                  int64_t upToSequence,
                                                                  std::size_t limit) const
{
    auto conn = open();
    return selectVerificationPage(*conn, afterSequence, upToSequence, limit);
}

std::vector<ChainEntry> HashChainStore::LoadEntries() const
{
    auto conn = open();
    Statement stmt(*conn, std::string("SELECT ") + kEntryColumns + " FROM hash_chain h ORDER BY h.id ASC;");
    std::vector<ChainEntry> entries;
    while (stmt.step()) {
        entries.push_back(readEntry(stmt));
    }
    return entries;
}

ChainListing HashChainStore::ListChain(std::size_t offset, std::size_t limit) const
{
    auto conn = open();
    ReadSnapshot snapshot(*conn);

    ChainListing listing;
    listing.offset = offset;
    listing.limit = limit;
    listing.totalEntries = selectCount(*conn, "SELECT COUNT(*) FROM hash_chain;");

    Statement stmt(*conn, std::string("SELECT ") + kEntryColumns +
                              ", p.user_id, p.source, p.timestamp, p.prediction_result"
                              " FROM hash_chain h LEFT JOIN predictions p ON p.id = h.prediction_id"
                              " ORDER BY h.id DESC LIMIT ?1 OFFSET ?2;");
    stmt.bind(1, static_cast<int64_t>(limit));
    stmt.bind(2, static_cast<int64_t>(offset));
    while (stmt.step()) {
        ChainListingItem item;
        item.entry = readEntry(stmt);
        if (!stmt.isNull(8)) {
            PredictionSummary summary;
            summary.userId = stmt.text(8);
            summary.source = parsePredictionSource(stmt.text(9));
            summary.timestamp = stmt.text(10);
            summary.predictionResultJson = stmt.text(11);
            item.prediction = summary;
        }
        listing.items.push_back(std::move(item));
    }
    return listing;
}

std::vector<ChainEntry> HashChainStore::EntriesByAnchorReference(const std::string &reference) const
{
    auto conn = open();
    Statement stmt(*conn, std::string("SELECT ") + kEntryColumns +
                              " FROM hash_chain h WHERE h.blockchain_tx_hash = ?1 ORDER BY h.id ASC;");
    stmt.bind(1, reference);
    std::vector<ChainEntry> entries;
    while (stmt.step()) {
        entries.push_back(readEntry(stmt));
    }
    return entries;
}

std::vector<AnchorRecord> HashChainStore::ListAnchors() const
{
    auto conn = open();
    Statement stmt(*conn,
                   "SELECT blockchain_tx_hash, MAX(blockchain_block_number), COUNT(*) FROM hash_chain"
                   " WHERE blockchain_tx_hash IS NOT NULL"
                   " GROUP BY blockchain_tx_hash ORDER BY MIN(id) ASC;");
    std::vector<AnchorRecord> anchors;
    while (stmt.step()) {
        AnchorRecord record;
        record.reference = stmt.text(0);
        record.position = stmt.integer(1);
        record.entryCount = static_cast<std::size_t>(stmt.integer(2));
        anchors.push_back(record);
    }
    return anchors;
}

ChainStats HashChainStore::GetStats() const
{
    auto conn = open();
    ReadSnapshot snapshot(*conn);

    ChainStats stats;
    stats.totalEntries = selectCount(*conn, "SELECT COUNT(*) FROM hash_chain;");
    stats.anchoredEntries = selectCount(*conn,
        "SELECT COUNT(*) FROM hash_chain WHERE blockchain_tx_hash IS NOT NULL;");
    stats.pendingEntries = stats.totalEntries - stats.anchoredEntries;
    stats.totalPredictions = selectCount(*conn, "SELECT COUNT(*) FROM predictions;");
    stats.headHash = selectLatestHash(*conn);
    return stats;
}

} // namespace core
} // namespace mediguard
