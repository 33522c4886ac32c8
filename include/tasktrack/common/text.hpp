#pragma once

#include <cstdio>
#include <string>
#include <string_view>

namespace tasktrack {

    /// Strip surrounding ASCII whitespace (space, tab, CR, LF, VT, FF)
    inline std::string trim(std::string_view text) {
        constexpr std::string_view ws = " \t\r\n\v\f";
        auto first = text.find_first_not_of(ws);
        if (first == std::string_view::npos)
            return std::string();
        auto last = text.find_last_not_of(ws);
        return std::string(text.substr(first, last - first + 1));
    }

    inline bool isBlank(std::string_view text) { return text.find_first_not_of(" \t\r\n\v\f") == std::string_view::npos; }

    /// Quote and escape a string for embedding in a JSON document
    inline std::string jsonQuote(std::string_view text) {
        std::string out;
        out.reserve(text.size() + 2);
        out += '"';
        for (char c : text) {
            switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
            }
        }
        out += '"';
        return out;
    }

} // namespace tasktrack
