#ifndef MEDIGUARD_CORE_ERRORS_HPP
#define MEDIGUARD_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Typed failures raised by the hash chain, its store and the anchor services.
 *
 * All of them derive from std::runtime_error so callers that only care about
 * "did it work" can catch one type, while the ledger and committer branch on
 * the concrete kind (a ConcurrencyConflict is retried, a StorageError is not).
 */

namespace mediguard {
namespace core {

/// Missing or invalid connection details / settings. Fatal at startup.
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string &what) : std::runtime_error(what) {}
};

/// A concurrent writer won the race for the chain head. Recovered by a full retry.
class ConcurrencyConflict : public std::runtime_error
{
public:
    explicit ConcurrencyConflict(const std::string &what) : std::runtime_error(what) {}
};

/// The verifier found the chain broken. Only an operator rebuild repairs it.
class IntegrityViolation : public std::runtime_error
{
public:
    explicit IntegrityViolation(const std::string &what) : std::runtime_error(what) {}
};

/// The external anchor service failed or timed out. Entries stay pending.
class AnchorServiceFailure : public std::runtime_error
{
public:
    explicit AnchorServiceFailure(const std::string &what) : std::runtime_error(what) {}
};

/// The datastore is unreachable or rejected a statement for a non-race reason.
class StorageError : public std::runtime_error
{
public:
    explicit StorageError(const std::string &what) : std::runtime_error(what) {}
};

class PredictionNotFound : public std::runtime_error
{
public:
    explicit PredictionNotFound(const std::string &predictionId)
        : std::runtime_error("prediction not found: " + predictionId)
    {
    }
};

/// A prediction that already owns a chain entry was submitted again.
class DuplicateEntry : public std::runtime_error
{
public:
    explicit DuplicateEntry(const std::string &predictionId)
        : std::runtime_error("prediction already chained: " + predictionId)
    {
    }
};

class InvalidPrediction : public std::runtime_error
{
public:
    explicit InvalidPrediction(const std::string &what) : std::runtime_error(what) {}
};

} // namespace core
} // namespace mediguard

#endif // MEDIGUARD_CORE_ERRORS_HPP
