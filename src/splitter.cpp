#include "wikisent/splitter.h"
#include "wikisent/unicode_utils.h"

#include <unicode/regex.h>

#include <memory>
#include <stdexcept>
#include <utility>

namespace wikisent {

namespace {

using unicode::is_closing_mark;
using unicode::is_space;
using unicode::to_unicode_string;

bool is_boundary_mark(UChar32 c) {
    return c == '.' || c == '?' || c == '!';
}

UChar32 peek(const std::string& text, int32_t pos, int32_t* next) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    int32_t length = static_cast<int32_t>(text.size());
    UChar32 c;
    U8_NEXT(bytes, pos, length, c);
    *next = pos;
    return c;
}

void emit(const std::string& text, size_t begin, size_t end, std::vector<Candidate>& out) {
    auto range = unicode::trimmed_range(text, begin, end);
    if (range.first >= range.second) {
        return;
    }
    Candidate candidate;
    candidate.text = text.substr(range.first, range.second - range.first);
    candidate.offset = range.first;
    candidate.ordinal = out.size();
    out.push_back(std::move(candidate));
}

} // namespace

BoundarySplitter::BoundarySplitter(const RuleSet* rules) : rules_(rules) {
    if (!rules_) {
        throw std::invalid_argument("BoundarySplitter needs a rule set");
    }
}

std::vector<Candidate> BoundarySplitter::split(const std::string& text) const {
    std::vector<Candidate> candidates;
    const int32_t length = static_cast<int32_t>(text.size());

    size_t span_start = 0;
    size_t token_start = 0;
    size_t previous_token_start = 0;
    bool in_token = false;
    int32_t i = 0;
    while (i < length) {
        const int32_t mark_pos = i;
        int32_t next = i;
        UChar32 c = peek(text, i, &next);
        i = next;
        if (c >= 0 && is_space(c)) {
            if (in_token) {
                previous_token_start = token_start;
                in_token = false;
            }
            token_start = static_cast<size_t>(i);
            continue;
        }
        in_token = true;
        if (!is_boundary_mark(c)) {
            continue;
        }

        // "?!", "..." and closing quotes or brackets directly after them form one boundary
        int32_t run_end = i;
        while (run_end < length) {
            UChar32 d = peek(text, run_end, &next);
            if (!is_boundary_mark(d)) {
                break;
            }
            run_end = next;
        }
        while (run_end < length) {
            UChar32 d = peek(text, run_end, &next);
            if (d < 0 || !is_closing_mark(d)) {
                break;
            }
            run_end = next;
        }
        i = run_end;

        if (run_end >= length) {
            break;
        }
        UChar32 after = peek(text, run_end, &next);
        if (after < 0 || !is_space(after)) {
            continue;
        }
        if (is_abbreviation(text, previous_token_start, static_cast<size_t>(mark_pos), static_cast<size_t>(run_end))) {
            continue;
        }

        emit(text, span_start, static_cast<size_t>(run_end), candidates);
        span_start = static_cast<size_t>(run_end);
    }
    emit(text, span_start, text.size(), candidates);
    return candidates;
}

bool BoundarySplitter::is_abbreviation(const std::string& text, size_t context_start, size_t mark_pos, size_t run_end) const {
    if (rules_->abbreviation_patterns.empty()) {
        return false;
    }

    // Trailing window: following white space and the next token
    const int32_t length = static_cast<int32_t>(text.size());
    int32_t window_end = static_cast<int32_t>(run_end);
    int32_t next = window_end;
    while (window_end < length) {
        UChar32 c = peek(text, window_end, &next);
        if (c < 0 || !is_space(c)) {
            break;
        }
        window_end = next;
    }
    while (window_end < length) {
        UChar32 c = peek(text, window_end, &next);
        if (c >= 0 && is_space(c)) {
            break;
        }
        window_end = next;
    }

    icu::UnicodeString context = to_unicode_string(text.substr(context_start, window_end - context_start));
    const int32_t mark_index = to_unicode_string(text.substr(context_start, mark_pos - context_start)).length();

    for (const auto& pattern : rules_->abbreviation_patterns) {
        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<icu::RegexMatcher> matcher(pattern.regex->matcher(context, status));
        if (U_FAILURE(status)) {
            throw std::runtime_error("Failed to create matcher for pattern: " + pattern.source);
        }
        while (matcher->find(status) && U_SUCCESS(status)) {
            int32_t start = matcher->start(status);
            int32_t end = matcher->end(status);
            if (U_FAILURE(status)) {
                break;
            }
            if (start <= mark_index && mark_index < end) {
                return true;
            }
            if (start > mark_index) {
                break;
            }
        }
    }
    return false;
}

} // namespace wikisent
