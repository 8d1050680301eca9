#pragma once

#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>
#include <unicode/utypes.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace wikisent {
namespace unicode {

/**
 * Convert std::string (assumed UTF-8) to ICU UnicodeString
 */
inline icu::UnicodeString to_unicode_string(const std::string& utf8_str) {
    return icu::UnicodeString::fromUTF8(icu::StringPiece(utf8_str.c_str(), static_cast<int32_t>(utf8_str.length())));
}

/**
 * Convert ICU UnicodeString to std::string (UTF-8)
 */
inline std::string from_unicode_string(const icu::UnicodeString& ustr) {
    std::string result;
    ustr.toUTF8String(result);
    return result;
}

/**
 * Decode the code points of a UTF-8 string. Invalid sequences decode as U+FFFD.
 */
inline std::vector<UChar32> code_points(const std::string& utf8_str) {
    std::vector<UChar32> result;
    result.reserve(utf8_str.size());
    const auto* bytes = reinterpret_cast<const uint8_t*>(utf8_str.data());
    int32_t length = static_cast<int32_t>(utf8_str.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        result.push_back(c < 0 ? 0xFFFD : c);
    }
    return result;
}

inline bool is_space(UChar32 c) {
    return u_isUWhiteSpace(c) != 0;
}

inline bool is_letter(UChar32 c) {
    return u_isUAlphabetic(c) != 0;
}

inline bool is_line_break(UChar32 c) {
    return c == 0x0A || c == 0x0D || c == 0x0B || c == 0x0C || c == 0x85 || c == 0x2028 || c == 0x2029;
}

inline bool is_quotation_mark(UChar32 c) {
    return u_hasBinaryProperty(c, UCHAR_QUOTATION_MARK) != 0;
}

// Marks that end a sentence: the splitter's '.', '?', '!' plus ':' and the ellipsis
inline bool is_sentence_end(UChar32 c) {
    return c == '.' || c == '?' || c == '!' || c == ':' || c == 0x2026;
}

// Closing brackets and quotes that may follow the end of a sentence
inline bool is_closing_mark(UChar32 c) {
    return u_charType(c) == U_END_PUNCTUATION || u_charType(c) == U_FINAL_PUNCTUATION || is_quotation_mark(c);
}

/**
 * Byte range [first, last) of s[begin, end) without leading and trailing
 * Unicode white space. Returns an empty range at `end` if nothing remains.
 */
inline std::pair<size_t, size_t> trimmed_range(const std::string& s, size_t begin, size_t end) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
    int32_t i = static_cast<int32_t>(begin);
    int32_t stop = static_cast<int32_t>(end);
    size_t first = end;
    size_t last = end;
    bool seen = false;
    while (i < stop) {
        int32_t start = i;
        UChar32 c;
        U8_NEXT(bytes, i, stop, c);
        if (c >= 0 && is_space(c)) {
            continue;
        }
        if (!seen) {
            first = static_cast<size_t>(start);
            seen = true;
        }
        last = static_cast<size_t>(i);
    }
    if (!seen) {
        return {end, end};
    }
    return {first, last};
}

inline std::string trim(const std::string& s) {
    auto range = trimmed_range(s, 0, s.size());
    return s.substr(range.first, range.second - range.first);
}

/**
 * Split on runs of Unicode white space
 */
inline std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> tokens;
    const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
    int32_t length = static_cast<int32_t>(s.size());
    int32_t i = 0;
    int32_t token_start = -1;
    while (i < length) {
        int32_t start = i;
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        bool space = c >= 0 && is_space(c);
        if (space && token_start >= 0) {
            tokens.push_back(s.substr(token_start, start - token_start));
            token_start = -1;
        } else if (!space && token_start < 0) {
            token_start = start;
        }
    }
    if (token_start >= 0) {
        tokens.push_back(s.substr(token_start));
    }
    return tokens;
}

/**
 * Strip every non-letter character from both ends ("blerg," -> "blerg")
 */
inline std::string trim_non_letters(const std::string& word) {
    icu::UnicodeString ustr = to_unicode_string(word);
    int32_t start = 0;
    int32_t end = ustr.length();
    while (start < end && !is_letter(ustr.char32At(start))) {
        start = ustr.moveIndex32(start, 1);
    }
    while (end > start) {
        int32_t prev = ustr.moveIndex32(end, -1);
        if (is_letter(ustr.char32At(prev))) {
            break;
        }
        end = prev;
    }
    return from_unicode_string(ustr.tempSubStringBetween(start, end));
}

/**
 * Convert string to lowercase (Unicode-aware)
 */
inline std::string to_lower(const std::string& utf8_str) {
    if (utf8_str.empty()) {
        return utf8_str;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    ustr.toLower();
    return from_unicode_string(ustr);
}

/**
 * Replace all (non-overlapping, left to right) occurrences of a literal string
 */
inline std::string replace_all(const std::string& utf8_str, const std::string& from, const std::string& to) {
    if (utf8_str.empty() || from.empty()) {
        return utf8_str;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    ustr.findAndReplace(to_unicode_string(from), to_unicode_string(to));
    return from_unicode_string(ustr);
}

/**
 * Count non-overlapping occurrences of a literal string
 */
inline size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return 0;
    }
    size_t count = 0;
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        ++count;
        pos = haystack.find(needle, pos + needle.size());
    }
    return count;
}

/**
 * Sanitize a string to ensure it's valid UTF-8
 * Replaces invalid sequences with replacement character (U+FFFD)
 */
inline std::string sanitize_utf8(const std::string& str) {
    if (str.empty()) {
        return str;
    }
    return from_unicode_string(to_unicode_string(str));
}

}  // namespace unicode
}  // namespace wikisent
