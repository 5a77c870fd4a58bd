/**
 * @file unicode.hpp
 * @brief UTF-8 helpers for statement text fields
 */

#pragma once

#include <cstdint>
#include <string>

namespace Meisai {

/**
 * @brief Decode UTF-8 into code points.
 *
 * Each malformed or truncated sequence yields one U+FFFD and decoding
 * resumes at the next byte, so edit distances stay defined for bad input.
 */
inline std::u32string utf8_to_utf32(const std::string& s) {
    constexpr char32_t kReplacement = 0xFFFD;

    std::u32string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const uint8_t lead = static_cast<uint8_t>(s[i]);
        size_t extra;
        char32_t cp;
        if (lead < 0x80)                { out.push_back(lead); ++i; continue; }
        else if ((lead & 0xE0) == 0xC0) { extra = 1; cp = lead & 0x1F; }
        else if ((lead & 0xF0) == 0xE0) { extra = 2; cp = lead & 0x0F; }
        else if ((lead & 0xF8) == 0xF0) { extra = 3; cp = lead & 0x07; }
        else                            { out.push_back(kReplacement); ++i; continue; }

        if (i + extra >= s.size()) {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        bool ok = true;
        for (size_t k = 1; k <= extra; ++k) {
            const uint8_t cont = static_cast<uint8_t>(s[i + k]);
            if ((cont & 0xC0) != 0x80) { ok = false; break; }
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (!ok) {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

/**
 * @brief Trim ASCII whitespace from both ends.
 */
inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

/**
 * @brief Canonical form for free-text fields (IC names, vehicle numbers).
 *
 * The ideographic space U+3000, tab and ASCII space all count as blanks.
 * Runs of blanks collapse to one ASCII space; leading and trailing blanks go.
 */
inline std::string normalize_text(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_blank = false;
    for (size_t i = 0; i < s.size();) {
        bool blank = false;
        size_t width = 1;
        if (s[i] == ' ' || s[i] == '\t') {
            blank = true;
        } else if (s.compare(i, 3, "\xE3\x80\x80") == 0) {
            blank = true;
            width = 3;
        }

        if (blank) {
            pending_blank = !out.empty();
        } else {
            if (pending_blank) out.push_back(' ');
            pending_blank = false;
            out.push_back(s[i]);
        }
        i += width;
    }
    return trim(out);
}

} // namespace Meisai
