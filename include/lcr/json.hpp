#pragma once

#include <string>
#include <string_view>
#include <cstdint>


namespace lcr {
namespace json {

// Append `s` to `out` as the body of a JSON string literal (no surrounding
// quotes). Quotes, backslashes and control characters are escaped; bytes
// >= 0x80 are copied as-is (UTF-8 passes through).
inline void escape(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    out.reserve(out.size() + s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(static_cast<unsigned char>(c) >> 4) & 0x0F];
                    out += hex[static_cast<unsigned char>(c) & 0x0F];
                }
                else {
                    out += c;
                }
        }
    }
}

[[nodiscard]]
inline std::string escape(std::string_view s) {
    std::string out;
    escape(out, s);
    return out;
}

// Append a quoted, escaped JSON string
inline void append_string(std::string& out, std::string_view s) {
    out += '\"';
    escape(out, s);
    out += '\"';
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

} // namespace json
} // namespace lcr
