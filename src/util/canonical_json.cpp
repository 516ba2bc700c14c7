#include "util/canonical_json.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <locale>
#include <sstream>
#include <limits>

namespace mediguard {
namespace util {
namespace json {

namespace {

const char* typeName(JsonValue::Type type)
{
    switch (type) {
    case JsonValue::Type::Null:    return "null";
    case JsonValue::Type::Bool:    return "bool";
    case JsonValue::Type::Integer: return "integer";
    case JsonValue::Type::Number:  return "number";
    case JsonValue::Type::String:  return "string";
    case JsonValue::Type::Array:   return "array";
    case JsonValue::Type::Object:  return "object";
    }
    return "unknown";
}

void encodeString(const std::string &value, std::string &out)
{
    static const char kHex[] = "0123456789abcdef";
    out.push_back('"');
    for (char ch : value) {
        const unsigned char c = static_cast<unsigned char>(ch);
        switch (c) {
        case '"':  out.append("\\\""); break;
        case '\\': out.append("\\\\"); break;
        case '\b': out.append("\\b"); break;
        case '\f': out.append("\\f"); break;
        case '\n': out.append("\\n"); break;
        case '\r': out.append("\\r"); break;
        case '\t': out.append("\\t"); break;
        default:
            if (c < 0x20) {
                out.append("\\u00");
                out.push_back(kHex[(c >> 4) & 0x0F]);
                out.push_back(kHex[c & 0x0F]);
            } else {
                out.push_back(ch);
            }
        }
    }
    out.push_back('"');
}

void encodeValue(const JsonValue &value, std::string &out)
{
    switch (value.type()) {
    case JsonValue::Type::Null:
        out.append("null");
        break;
    case JsonValue::Type::Bool:
        out.append(value.asBool() ? "true" : "false");
        break;
    case JsonValue::Type::Integer:
        out.append(std::to_string(value.asInteger()));
        break;
    case JsonValue::Type::Number:
        out.append(formatNumber(value.asNumber()));
        break;
    case JsonValue::Type::String:
        encodeString(value.asString(), out);
        break;
    case JsonValue::Type::Array: {
        out.push_back('[');
        bool first = true;
        for (const auto &item : value.asArray()) {
            if (!first) {
                out.push_back(',');
            }
            first = false;
            encodeValue(item, out);
        }
        out.push_back(']');
        break;
    }
    case JsonValue::Type::Object: {
        std::vector<const JsonValue::Member*> members;
        members.reserve(value.asObject().size());
        for (const auto &member : value.asObject()) {
            members.push_back(&member);
        }
        std::sort(members.begin(), members.end(),
                  [](const JsonValue::Member *a, const JsonValue::Member *b) {
                      return a->first < b->first;
                  });
        out.push_back('{');
        bool first = true;
        for (const auto *member : members) {
            if (!first) {
                out.push_back(',');
            }
            first = false;
            encodeString(member->first, out);
            out.push_back(':');
            encodeValue(member->second, out);
        }
        out.push_back('}');
        break;
    }
    }
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------
class Parser
{
public:
    explicit Parser(const std::string &text) : m_text(text), m_pos(0), m_depth(0) {}

    JsonValue parseDocument()
    {
        skipWhitespace();
        JsonValue value = parseValue();
        skipWhitespace();
        if (m_pos != m_text.size()) {
            fail("unexpected trailing characters");
        }
        return value;
    }

private:
    static constexpr int kMaxDepth = 128;

    [[noreturn]] void fail(const std::string &why) const
    {
        throw JsonError("json: " + why + " at offset " + std::to_string(m_pos));
    }

    void skipWhitespace()
    {
        while (m_pos < m_text.size()) {
            const char c = m_text[m_pos];
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                ++m_pos;
            } else {
                break;
            }
        }
    }

    bool consumeLiteral(const char *literal)
    {
        const std::string lit(literal);
        if (m_text.compare(m_pos, lit.size(), lit) == 0) {
            m_pos += lit.size();
            return true;
        }
        return false;
    }

    JsonValue parseValue()
    {
        if (m_pos >= m_text.size()) {
            fail("unexpected end of input");
        }
        const char c = m_text[m_pos];
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == '"') return JsonValue(parseString());
        if (c == '-' || (c >= '0' && c <= '9')) return parseNumber();
        if (consumeLiteral("true"))  return JsonValue(true);
        if (consumeLiteral("false")) return JsonValue(false);
        if (consumeLiteral("null"))  return JsonValue();
        fail("unexpected character");
    }

    JsonValue parseObject()
    {
        if (++m_depth > kMaxDepth) {
            fail("nesting too deep");
        }
        ++m_pos; // '{'
        JsonValue obj = JsonValue::object();
        skipWhitespace();
        if (m_pos < m_text.size() && m_text[m_pos] == '}') {
            ++m_pos;
            --m_depth;
            return obj;
        }
        while (true) {
            skipWhitespace();
            if (m_pos >= m_text.size() || m_text[m_pos] != '"') {
                fail("expected object key");
            }
            std::string key = parseString();
            skipWhitespace();
            if (m_pos >= m_text.size() || m_text[m_pos] != ':') {
                fail("expected ':'");
            }
            ++m_pos;
            skipWhitespace();
            obj.set(key, parseValue());
            skipWhitespace();
            if (m_pos >= m_text.size()) {
                fail("unterminated object");
            }
            if (m_text[m_pos] == ',') {
                ++m_pos;
                continue;
            }
            if (m_text[m_pos] == '}') {
                ++m_pos;
                break;
            }
            fail("expected ',' or '}'");
        }
        --m_depth;
        return obj;
    }

    JsonValue parseArray()
    {
        if (++m_depth > kMaxDepth) {
            fail("nesting too deep");
        }
        ++m_pos; // '['
        JsonValue arr = JsonValue::array();
        skipWhitespace();
        if (m_pos < m_text.size() && m_text[m_pos] == ']') {
            ++m_pos;
            --m_depth;
            return arr;
        }
        while (true) {
            skipWhitespace();
            arr.push(parseValue());
            skipWhitespace();
            if (m_pos >= m_text.size()) {
                fail("unterminated array");
            }
            if (m_text[m_pos] == ',') {
                ++m_pos;
                continue;
            }
            if (m_text[m_pos] == ']') {
                ++m_pos;
                break;
            }
            fail("expected ',' or ']'");
        }
        --m_depth;
        return arr;
    }

    unsigned parseHex4()
    {
        if (m_pos + 4 > m_text.size()) {
            fail("truncated \\u escape");
        }
        unsigned code = 0;
        for (int i = 0; i < 4; ++i) {
            const char c = m_text[m_pos++];
            code <<= 4;
            if (c >= '0' && c <= '9')      code |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') code |= static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') code |= static_cast<unsigned>(c - 'A' + 10);
            else fail("invalid hex digit in \\u escape");
        }
        return code;
    }

    static void appendUtf8(unsigned code, std::string &out)
    {
        if (code < 0x80) {
            out.push_back(static_cast<char>(code));
        } else if (code < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (code >> 6)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (code >> 12)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (code >> 18)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString()
    {
        ++m_pos; // opening quote
        std::string out;
        while (true) {
            if (m_pos >= m_text.size()) {
                fail("unterminated string");
            }
            const char c = m_text[m_pos++];
            if (c == '"') {
                break;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("unescaped control character in string");
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (m_pos >= m_text.size()) {
                fail("unterminated escape");
            }
            const char esc = m_text[m_pos++];
            switch (esc) {
            case '"':  out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/':  out.push_back('/'); break;
            case 'b':  out.push_back('\b'); break;
            case 'f':  out.push_back('\f'); break;
            case 'n':  out.push_back('\n'); break;
            case 'r':  out.push_back('\r'); break;
            case 't':  out.push_back('\t'); break;
            case 'u': {
                unsigned code = parseHex4();
                if (code >= 0xD800 && code <= 0xDBFF) {
                    if (m_text.compare(m_pos, 2, "\\u") != 0) {
                        fail("unpaired high surrogate");
                    }
                    m_pos += 2;
                    const unsigned low = parseHex4();
                    if (low < 0xDC00 || low > 0xDFFF) {
                        fail("invalid low surrogate");
                    }
                    code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                } else if (code >= 0xDC00 && code <= 0xDFFF) {
                    fail("unpaired low surrogate");
                }
                appendUtf8(code, out);
                break;
            }
            default:
                fail("invalid escape character");
            }
        }
        return out;
    }

    JsonValue parseNumber()
    {
        const std::size_t start = m_pos;
        bool isFloat = false;
        if (m_text[m_pos] == '-') {
            ++m_pos;
        }
        if (m_pos >= m_text.size() || !std::isdigit(static_cast<unsigned char>(m_text[m_pos]))) {
            fail("invalid number");
        }
        if (m_text[m_pos] == '0') {
            ++m_pos;
        } else {
            while (m_pos < m_text.size() && std::isdigit(static_cast<unsigned char>(m_text[m_pos]))) {
                ++m_pos;
            }
        }
        if (m_pos < m_text.size() && m_text[m_pos] == '.') {
            isFloat = true;
            ++m_pos;
            if (m_pos >= m_text.size() || !std::isdigit(static_cast<unsigned char>(m_text[m_pos]))) {
                fail("digit expected after decimal point");
            }
            while (m_pos < m_text.size() && std::isdigit(static_cast<unsigned char>(m_text[m_pos]))) {
                ++m_pos;
            }
        }
        if (m_pos < m_text.size() && (m_text[m_pos] == 'e' || m_text[m_pos] == 'E')) {
            isFloat = true;
            ++m_pos;
            if (m_pos < m_text.size() && (m_text[m_pos] == '+' || m_text[m_pos] == '-')) {
                ++m_pos;
            }
            if (m_pos >= m_text.size() || !std::isdigit(static_cast<unsigned char>(m_text[m_pos]))) {
                fail("digit expected in exponent");
            }
            while (m_pos < m_text.size() && std::isdigit(static_cast<unsigned char>(m_text[m_pos]))) {
                ++m_pos;
            }
        }

        const std::string literal = m_text.substr(start, m_pos - start);
        if (!isFloat) {
            errno = 0;
            char *end = nullptr;
            const long long parsed = std::strtoll(literal.c_str(), &end, 10);
            if (errno == 0 && end != nullptr && *end == '\0') {
                return JsonValue(static_cast<std::int64_t>(parsed));
            }
            // Out of int64 range: fall through to a double.
        }
        std::istringstream iss(literal);
        iss.imbue(std::locale::classic());
        double parsed = 0.0;
        iss >> parsed;
        if (iss.fail() || iss.peek() != std::char_traits<char>::eof() || !std::isfinite(parsed)) {
            fail("number out of range");
        }
        return JsonValue(parsed);
    }

    const std::string &m_text;
    std::size_t m_pos;
    int m_depth;
};

} // namespace

// ---------------------------------------------------------------------------
// JsonValue
// ---------------------------------------------------------------------------
JsonValue::JsonValue()
    : m_type(Type::Null), m_bool(false), m_integer(0), m_number(0.0)
{
}

JsonValue::JsonValue(std::nullptr_t) : JsonValue() {}

JsonValue::JsonValue(bool value) : JsonValue()
{
    m_type = Type::Bool;
    m_bool = value;
}

JsonValue::JsonValue(int value) : JsonValue(static_cast<std::int64_t>(value)) {}

JsonValue::JsonValue(std::int64_t value) : JsonValue()
{
    m_type = Type::Integer;
    m_integer = value;
}

JsonValue::JsonValue(double value) : JsonValue()
{
    m_type = Type::Number;
    m_number = value;
}

JsonValue::JsonValue(const char *value) : JsonValue(std::string(value ? value : "")) {}

JsonValue::JsonValue(std::string value) : JsonValue()
{
    m_type = Type::String;
    m_string = std::move(value);
}

JsonValue JsonValue::array()
{
    JsonValue v;
    v.m_type = Type::Array;
    return v;
}

JsonValue JsonValue::object()
{
    JsonValue v;
    v.m_type = Type::Object;
    return v;
}

void JsonValue::requireType(Type expected, const char *what) const
{
    if (m_type != expected) {
        throw JsonError(std::string("json: ") + what + " called on " + typeName(m_type) + " value");
    }
}

bool JsonValue::asBool() const
{
    requireType(Type::Bool, "asBool");
    return m_bool;
}

std::int64_t JsonValue::asInteger() const
{
    requireType(Type::Integer, "asInteger");
    return m_integer;
}

double JsonValue::asNumber() const
{
    if (m_type == Type::Integer) {
        return static_cast<double>(m_integer);
    }
    requireType(Type::Number, "asNumber");
    return m_number;
}

const std::string& JsonValue::asString() const
{
    requireType(Type::String, "asString");
    return m_string;
}

const JsonValue::Array& JsonValue::asArray() const
{
    requireType(Type::Array, "asArray");
    return m_array;
}

const JsonValue::Object& JsonValue::asObject() const
{
    requireType(Type::Object, "asObject");
    return m_object;
}

JsonValue& JsonValue::set(const std::string &key, JsonValue value)
{
    if (m_type == Type::Null) {
        m_type = Type::Object;
    }
    requireType(Type::Object, "set");
    for (auto &member : m_object) {
        if (member.first == key) {
            member.second = std::move(value);
            return member.second;
        }
    }
    m_object.emplace_back(key, std::move(value));
    return m_object.back().second;
}

void JsonValue::push(JsonValue value)
{
    if (m_type == Type::Null) {
        m_type = Type::Array;
    }
    requireType(Type::Array, "push");
    m_array.push_back(std::move(value));
}

const JsonValue* JsonValue::find(const std::string &key) const
{
    if (m_type != Type::Object) {
        return nullptr;
    }
    for (const auto &member : m_object) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

std::size_t JsonValue::size() const
{
    if (m_type == Type::Array)  return m_array.size();
    if (m_type == Type::Object) return m_object.size();
    return 0;
}

bool JsonValue::operator==(const JsonValue &other) const
{
    if (m_type != other.m_type) {
        return false;
    }
    switch (m_type) {
    case Type::Null:    return true;
    case Type::Bool:    return m_bool == other.m_bool;
    case Type::Integer: return m_integer == other.m_integer;
    case Type::Number:  return formatNumber(m_number) == formatNumber(other.m_number);
    case Type::String:  return m_string == other.m_string;
    case Type::Array:   return m_array == other.m_array;
    case Type::Object:
        if (m_object.size() != other.m_object.size()) {
            return false;
        }
        for (const auto &member : m_object) {
            const JsonValue *theirs = other.find(member.first);
            if (!theirs || *theirs != member.second) {
                return false;
            }
        }
        return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------
std::string formatNumber(double value)
{
    if (!std::isfinite(value)) {
        throw JsonError("json: non-finite number cannot be encoded");
    }
    if (value == 0.0) {
        value = 0.0; // drops the sign of -0.0
    }
    // Hashes depend on this text: never let the process locale pick the decimal point.
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(6) << value;
    std::string out = oss.str();
    if (out == "-0.000000") {
        out = "0.000000";
    }
    return out;
}

std::string canonicalEncode(const JsonValue &value)
{
    std::string out;
    encodeValue(value, out);
    return out;
}

JsonValue parse(const std::string &text)
{
    Parser parser(text);
    return parser.parseDocument();
}

} // namespace json
} // namespace util
} // namespace mediguard
