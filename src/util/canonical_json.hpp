#ifndef MEDIGUARD_UTIL_CANONICAL_JSON_HPP
#define MEDIGUARD_UTIL_CANONICAL_JSON_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @file canonical_json.hpp
 * @brief A small JSON value type with a canonical (byte-stable) encoder and a strict parser.
 *
 * CANONICAL FORM:
 *   - Object keys sorted by byte order at every depth; duplicate keys collapse (last write wins).
 *   - Compact separators: no whitespace anywhere.
 *   - Integers printed as integers, other numbers with exactly six decimals ("%.6f").
 *     Negative zero prints as zero; NaN and infinities are rejected.
 *   - Strings escaped per RFC 8259, control characters as \u00XX, other bytes verbatim.
 *
 * Two logically equal values always encode to identical bytes, whatever the
 * order in which object members were inserted.
 *
 * USAGE:
 *   @code
 *   using namespace mediguard::util::json;
 *   JsonValue features = JsonValue::object();
 *   features.set("glucose", 148.0);
 *   features.set("age", 50);
 *   std::string text = canonicalEncode(features); // {"age":50,"glucose":148.000000}
 *   JsonValue again = parse(text);
 *   @endcode
 */

namespace mediguard {
namespace util {
namespace json {

class JsonError : public std::runtime_error
{
public:
    explicit JsonError(const std::string &what) : std::runtime_error(what) {}
};

class JsonValue
{
public:
    enum class Type { Null, Bool, Integer, Number, String, Array, Object };

    using Array  = std::vector<JsonValue>;
    using Member = std::pair<std::string, JsonValue>;
    using Object = std::vector<Member>;

    JsonValue();
    JsonValue(std::nullptr_t);
    JsonValue(bool value);
    JsonValue(int value);
    JsonValue(std::int64_t value);
    JsonValue(double value);
    JsonValue(const char *value);
    JsonValue(std::string value);

    static JsonValue array();
    static JsonValue object();

    Type type() const { return m_type; }
    bool isNull() const    { return m_type == Type::Null; }
    bool isBool() const    { return m_type == Type::Bool; }
    bool isInteger() const { return m_type == Type::Integer; }
    bool isNumber() const  { return m_type == Type::Number || m_type == Type::Integer; }
    bool isString() const  { return m_type == Type::String; }
    bool isArray() const   { return m_type == Type::Array; }
    bool isObject() const  { return m_type == Type::Object; }

    bool asBool() const;
    std::int64_t asInteger() const;
    /// Integers widen to double.
    double asNumber() const;
    const std::string& asString() const;
    const Array& asArray() const;
    const Object& asObject() const;

    /// Insert or replace an object member. Turns a null value into an object.
    JsonValue& set(const std::string &key, JsonValue value);
    /// Append to an array. Turns a null value into an array.
    void push(JsonValue value);

    const JsonValue* find(const std::string &key) const;
    bool contains(const std::string &key) const { return find(key) != nullptr; }
    std::size_t size() const;

    /// Logical equality: member order of objects is irrelevant.
    bool operator==(const JsonValue &other) const;
    bool operator!=(const JsonValue &other) const { return !(*this == other); }

private:
    void requireType(Type expected, const char *what) const;

    Type m_type;
    bool m_bool;
    std::int64_t m_integer;
    double m_number;
    std::string m_string;
    Array m_array;
    Object m_object;
};

/**
 * @brief Fixed decimal rendering used for every non-integer number.
 * @throw JsonError for NaN or infinity.
 */
std::string formatNumber(double value);

/**
 * @brief Deterministic serialisation, see the file comment for the exact rules.
 * @throw JsonError if the value contains a non-finite number.
 */
std::string canonicalEncode(const JsonValue &value);

/**
 * @brief Strict RFC 8259 parser (single top-level value, trailing whitespace only).
 * @throw JsonError with the byte offset of the first problem.
 */
JsonValue parse(const std::string &text);

} // namespace json
} // namespace util
} // namespace mediguard

#endif // MEDIGUARD_UTIL_CANONICAL_JSON_HPP
