#ifndef MEDIGUARD_TEST_UNIT_TEST_SUPPORT_HPP
#define MEDIGUARD_TEST_UNIT_TEST_SUPPORT_HPP

#include <atomic>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <sqlite3.h>

#include "core/hash_chain_store.hpp"
#include "core/prediction.hpp"
#include "util/canonical_json.hpp"

namespace mediguard {
namespace test {

/**
 * @brief A uniquely named SQLite file in the working directory, removed
 *        (with its WAL and shared-memory files) on destruction.
 */
class TempDatabase
{
public:
    explicit TempDatabase(const std::string &tag)
    {
        static std::atomic<int> counter(0);
        m_path = "mediguard_test_" + tag + "_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter++) + ".sqlite";
        removeFiles();
    }

    ~TempDatabase() { removeFiles(); }

    TempDatabase(const TempDatabase &) = delete;
    TempDatabase &operator=(const TempDatabase &) = delete;

    const std::string &path() const { return m_path; }

    /// Run raw SQL on a separate connection, for tampering with stored rows.
    void exec(const std::string &sql) const
    {
        sqlite3 *db = nullptr;
        if (sqlite3_open(m_path.c_str(), &db) != SQLITE_OK) {
            sqlite3_close(db);
            throw std::runtime_error("cannot open " + m_path);
        }
        sqlite3_busy_timeout(db, 5000);
        char *errMsg = nullptr;
        const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errMsg);
        std::string msg = errMsg ? errMsg : "";
        sqlite3_free(errMsg);
        sqlite3_close(db);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("sql failed: " + msg);
        }
    }

private:
    void removeFiles() const
    {
        std::remove(m_path.c_str());
        std::remove((m_path + "-wal").c_str());
        std::remove((m_path + "-shm").c_str());
        std::remove((m_path + "-journal").c_str());
    }

    std::string m_path;
};

/**
 * @brief A prediction with a couple of clinical features and a classifier result.
 */
inline core::Prediction makePrediction(const std::string &id,
                                       const std::string &timestamp,
                                       double glucose = 148.0,
                                       const std::string &userId = "user-1")
{
    core::Prediction p;
    p.id = id;
    p.userId = userId;
    p.timestamp = timestamp;
    p.source = core::PredictionSource::Manual;

    p.inputFeatures = util::json::JsonValue::object();
    p.inputFeatures.set("glucose", glucose);
    p.inputFeatures.set("bmi", 33.6);
    p.inputFeatures.set("age", 50);

    p.predictionResult = util::json::JsonValue::object();
    p.predictionResult.set("disease", "diabetes");
    p.predictionResult.set("risk_level", "high");
    p.predictionResult.set("confidence", 0.87);
    return p;
}

/// "2025-01-01T00:00:NN.000000Z" for small n, so that lexical order is insertion order.
inline std::string timestampFor(int n)
{
    char buf[40];
    std::snprintf(buf, sizeof(buf), "2025-01-01T%02d:%02d:%02d.000000Z", (n / 3600) % 24, (n / 60) % 60, n % 60);
    return buf;
}

} // namespace test
} // namespace mediguard

#endif // MEDIGUARD_TEST_UNIT_TEST_SUPPORT_HPP
