#pragma once

#include <string>
#include <string_view>
#include <cstdint>


namespace lcr {
namespace json {

// Appends `s` escaped for use inside a JSON string literal (no surrounding quotes).
// Escapes quote, backslash, control characters and the HTML-sensitive
// characters <, > and & so the output is safe to embed anywhere.
inline void append_escaped(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    for (char c : s) {
        const auto u = static_cast<unsigned char>(c);
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '<':
            case '>':
            case '&':
                out += "\\u00";
                out += hex[u >> 4];
                out += hex[u & 0x0F];
                break;
            default:
                if (u < 0x20) {
                    out += "\\u00";
                    out += hex[u >> 4];
                    out += hex[u & 0x0F];
                }
                else {
                    out += c;
                }
        }
    }
}

// Escape helper (allocating)
inline std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    append_escaped(out, s);
    return out;
}

// Appends a quoted JSON string
inline void append_string(std::string& out, std::string_view s) {
    out += '\"';
    append_escaped(out, s);
    out += '\"';
}

// Appends `"key":`
inline void append_key(std::string& out, std::string_view key) {
    append_string(out, key);
    out += ':';
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value)
{
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

inline void append(std::string& out, std::int64_t value)
{
    if (value < 0) {
        out += '-';
        // two's complement safe negation (INT64_MIN included)
        append(out, static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(value));
        return;
    }
    append(out, static_cast<std::uint64_t>(value));
}

} // namespace json
} // namespace lcr
