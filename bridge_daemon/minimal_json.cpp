/**
 * MiniJsonValue Implementation
 */

#include "minimal_json.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>

MiniJsonValue MiniJsonValue::null() {
    return MiniJsonValue();
}

MiniJsonValue MiniJsonValue::boolean(bool v) {
    MiniJsonValue j;
    j.type = Type::Bool;
    j.boolValue = v;
    return j;
}

MiniJsonValue MiniJsonValue::integer(int64_t v) {
    MiniJsonValue j;
    j.type = Type::Integer;
    j.intValue = v;
    return j;
}

MiniJsonValue MiniJsonValue::number(double v) {
    MiniJsonValue j;
    j.type = Type::Number;
    j.numberValue = v;
    return j;
}

MiniJsonValue MiniJsonValue::string(const std::string &v) {
    MiniJsonValue j;
    j.type = Type::String;
    j.stringValue = v;
    return j;
}

MiniJsonValue MiniJsonValue::array() {
    MiniJsonValue j;
    j.type = Type::Array;
    return j;
}

MiniJsonValue MiniJsonValue::object() {
    MiniJsonValue j;
    j.type = Type::Object;
    return j;
}

MiniJsonValue &MiniJsonValue::set(const std::string &key, const MiniJsonValue &value) {
    objectValue.emplace_back(key, value);
    return objectValue.back().second;
}

void MiniJsonValue::push(const MiniJsonValue &value) {
    arrayValue.push_back(value);
}

std::string miniJsonQuote(const std::string &s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char ch : s) {
        unsigned char c = (unsigned char)ch;
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += ch;
                }
                break;
        }
    }
    out += '"';
    return out;
}

std::string miniJsonNumber(double v) {
    if (!std::isfinite(v)) {
        return "null";
    }
    // to_chars is locale-independent and gives the shortest round-trip form
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    std::string out(buf, res.ptr);
    if (out.find_first_of(".eE") == std::string::npos) {
        out += ".0";
    }
    return out;
}

static void writeValue(const MiniJsonValue &v, std::string &out) {
    switch (v.type) {
        case MiniJsonValue::Type::Null:
            out += "null";
            break;
        case MiniJsonValue::Type::Bool:
            out += v.boolValue ? "true" : "false";
            break;
        case MiniJsonValue::Type::Integer: {
            char buf[32];
            auto res = std::to_chars(buf, buf + sizeof(buf), v.intValue);
            out.append(buf, res.ptr);
            break;
        }
        case MiniJsonValue::Type::Number:
            out += miniJsonNumber(v.numberValue);
            break;
        case MiniJsonValue::Type::String:
            out += miniJsonQuote(v.stringValue);
            break;
        case MiniJsonValue::Type::Array: {
            out += '[';
            bool first = true;
            for (const auto &item : v.arrayValue) {
                if (!first) out += ',';
                first = false;
                writeValue(item, out);
            }
            out += ']';
            break;
        }
        case MiniJsonValue::Type::Object: {
            out += '{';
            bool first = true;
            for (const auto &[key, item] : v.objectValue) {
                if (!first) out += ',';
                first = false;
                out += miniJsonQuote(key);
                out += ':';
                writeValue(item, out);
            }
            out += '}';
            break;
        }
    }
}

std::string MiniJsonValue::dump() const {
    std::string out;
    writeValue(*this, out);
    return out;
}
