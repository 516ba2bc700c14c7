#ifndef MEDIGUARD_CORE_PREDICTION_HPP
#define MEDIGUARD_CORE_PREDICTION_HPP

#include <string>
#include "core/errors.hpp"
#include "util/canonical_json.hpp"

/**
 * @file prediction.hpp
 * @brief The immutable prediction record the hash chain commits to.
 *
 * Predictions are produced by the (external) classification pipeline. The
 * chain only reads them: once written, neither features nor result change,
 * and any change is exactly what the verifier exists to detect.
 */

namespace mediguard {
namespace core {

/**
 * @brief Where the input features of a prediction came from.
 */
enum class PredictionSource {
    Manual,
    Pdf,
    Csv,
    Image
};

inline std::string toString(PredictionSource source)
{
    switch (source) {
    case PredictionSource::Manual: return "manual";
    case PredictionSource::Pdf:    return "pdf";
    case PredictionSource::Csv:    return "csv";
    case PredictionSource::Image:  return "image";
    }
    return "manual";
}

/**
 * @throw InvalidPrediction for anything but manual, pdf, csv or image.
 */
inline PredictionSource parsePredictionSource(const std::string &text)
{
    if (text == "manual") return PredictionSource::Manual;
    if (text == "pdf")    return PredictionSource::Pdf;
    if (text == "csv")    return PredictionSource::Csv;
    if (text == "image")  return PredictionSource::Image;
    throw InvalidPrediction("unknown prediction source '" + text + "'");
}

/**
 * @struct Prediction
 * @brief One stored prediction.
 *
 * Fields:
 *   - id: opaque unique identifier (a UUID upstream).
 *   - userId: owning user.
 *   - timestamp: ISO-8601 time of the prediction; also the chain entry timestamp.
 *   - inputFeatures: measurement name -> value (JSON object).
 *   - predictionResult: the classifier's response, stored verbatim.
 *   - createdAt: when the row was written; filled in by the store if empty.
 */
struct Prediction
{
    std::string id;
    std::string userId;
    std::string timestamp;
    PredictionSource source{PredictionSource::Manual};
    util::json::JsonValue inputFeatures;
    util::json::JsonValue predictionResult;
    std::string createdAt;

    /**
     * @brief The hashed payload: {"input_features": ..., "prediction_result": ...}.
     */
    util::json::JsonValue payload() const
    {
        util::json::JsonValue data = util::json::JsonValue::object();
        data.set("input_features", inputFeatures);
        data.set("prediction_result", predictionResult);
        return data;
    }

    /**
     * @brief Reject records that could never be chained reproducibly.
     * @throw InvalidPrediction naming the offending field.
     */
    void validate() const
    {
        if (id.empty()) {
            throw InvalidPrediction("prediction id must not be empty");
        }
        if (userId.empty()) {
            throw InvalidPrediction("prediction " + id + ": user id must not be empty");
        }
        if (timestamp.empty()) {
            throw InvalidPrediction("prediction " + id + ": timestamp must not be empty");
        }
        if (!inputFeatures.isObject()) {
            throw InvalidPrediction("prediction " + id + ": input features must be a JSON object");
        }
        if (predictionResult.isNull()) {
            throw InvalidPrediction("prediction " + id + ": prediction result is missing");
        }
        try {
            util::json::canonicalEncode(payload());
        } catch (const util::json::JsonError &ex) {
            throw InvalidPrediction("prediction " + id + ": " + ex.what());
        }
    }
};

} // namespace core
} // namespace mediguard

#endif // MEDIGUARD_CORE_PREDICTION_HPP
