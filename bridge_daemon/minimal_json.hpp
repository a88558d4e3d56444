#ifndef MINIMAL_JSON_HPP
#define MINIMAL_JSON_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/**
 * MiniJsonValue - self-contained JSON value for encoding only
 *
 * Covers object, array, string, number, boolean and null. Object members
 * keep insertion order. Serialization is compact (no whitespace).
 */
struct MiniJsonValue {
    enum class Type { Null, Bool, Integer, Number, String, Array, Object };

    Type type = Type::Null;
    bool boolValue = false;
    int64_t intValue = 0;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<MiniJsonValue> arrayValue;
    std::vector<std::pair<std::string, MiniJsonValue>> objectValue;

    static MiniJsonValue null();
    static MiniJsonValue boolean(bool v);
    static MiniJsonValue integer(int64_t v);
    static MiniJsonValue number(double v);
    static MiniJsonValue string(const std::string &v);
    static MiniJsonValue array();
    static MiniJsonValue object();

    /**
     * Append a member (object) and return a reference to it.
     */
    MiniJsonValue &set(const std::string &key, const MiniJsonValue &value);

    /**
     * Append an element (array).
     */
    void push(const MiniJsonValue &value);

    std::string dump() const;
};

/**
 * Quote and escape a string: quote, backslash and control characters.
 */
std::string miniJsonQuote(const std::string &s);

/**
 * Shortest round-trip decimal for a double, "null" if not finite.
 */
std::string miniJsonNumber(double v);

#endif // MINIMAL_JSON_HPP
