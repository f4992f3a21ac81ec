#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <charconv>
#include <cmath>


namespace lcr {
namespace json {

// Escape a string for embedding inside a JSON string literal (quotes not included)
inline void escape_to(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                }
                else {
                    out += c;
                }
        }
    }
}

inline std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    escape_to(out, s);
    return out;
}

// Quoted, escaped string value
inline void append_string(std::string& out, std::string_view s) {
    out += '"';
    escape_to(out, s);
    out += '"';
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value) {
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = '0' + (value % 10);
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

// Shortest round-trip representation. JSON has no NaN/Inf, those are written as 0.
inline void append(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out += '0';
        return;
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        out += '0';
        return;
    }
    out.append(buf, ptr);
}

inline void append(std::string& out, bool value) {
    out += value ? "true" : "false";
}

// "key":
inline void append_key(std::string& out, std::string_view key) {
    append_string(out, key);
    out += ':';
}

} // namespace json
} // namespace lcr
