#ifndef MEDIGUARD_CORE_ENTRY_HASHER_HPP
#define MEDIGUARD_CORE_ENTRY_HASHER_HPP

#include <optional>
#include <string>
#include "core/prediction.hpp"
#include "util/canonical_json.hpp"
#include "util/hashing.hpp"

namespace mediguard {
namespace core {

/**
 * @brief The logical document an entry hash commits to.
 *
 * {"prediction_id", "user_id", "prediction_data": {"input_features", "prediction_result"},
 *  "timestamp", "previous_hash"} with previous_hash null for the first entry.
 */
inline util::json::JsonValue buildHashDocument(const Prediction &prediction,
                                               const std::string &entryTimestamp,
                                               const std::optional<std::string> &previousHash)
{
    util::json::JsonValue doc = util::json::JsonValue::object();
    doc.set("prediction_id", prediction.id);
    doc.set("user_id", prediction.userId);
    doc.set("prediction_data", prediction.payload());
    doc.set("timestamp", entryTimestamp);
    doc.set("previous_hash", previousHash ? util::json::JsonValue(*previousHash)
                                          : util::json::JsonValue(nullptr));
    return doc;
}

/**
 * @brief SHA-256 hex of the canonical encoding of buildHashDocument().
 * @throw util::json::JsonError if the payload holds a non-finite number.
 */
inline std::string computeEntryHash(const Prediction &prediction,
                                    const std::string &entryTimestamp,
                                    const std::optional<std::string> &previousHash)
{
    return util::hashing::sha256Hex(
        util::json::canonicalEncode(buildHashDocument(prediction, entryTimestamp, previousHash)));
}

} // namespace core
} // namespace mediguard

#endif // MEDIGUARD_CORE_ENTRY_HASHER_HPP
