#include "wikisent/validator.h"
#include "wikisent/unicode_utils.h"

#include <unicode/regex.h>

#include <memory>
#include <stdexcept>
#include <vector>

namespace wikisent {

namespace {

using unicode::code_points;
using unicode::is_letter;

// Tests a pattern against one character at a time
class CharMatcher {
public:
    explicit CharMatcher(const CompiledPattern& pattern) {
        UErrorCode status = U_ZERO_ERROR;
        matcher_.reset(pattern.regex->matcher(status));
        if (U_FAILURE(status) || !matcher_) {
            throw std::runtime_error("Failed to create matcher for pattern: " + pattern.source);
        }
    }

    bool matches(UChar32 c) {
        current_ = icu::UnicodeString(c);
        matcher_->reset(current_);
        UErrorCode status = U_ZERO_ERROR;
        bool found = matcher_->find(status);
        return found && U_SUCCESS(status);
    }

private:
    std::unique_ptr<icu::RegexMatcher> matcher_;
    icu::UnicodeString current_;
};

bool is_lowercase(UChar32 c) {
    return u_hasBinaryProperty(c, UCHAR_LOWERCASE) != 0;
}

// Closing quotes and brackets after the final mark are skipped ("Ja." and (So.))
bool ends_with_punctuation(const std::vector<UChar32>& chars) {
    auto it = chars.rbegin();
    while (it != chars.rend() && unicode::is_closing_mark(*it)) {
        ++it;
    }
    return it != chars.rend() && unicode::is_sentence_end(*it);
}

bool symbols_admissible(const std::vector<UChar32>& chars, const RuleSet& rules) {
    if (rules.allowed_symbols_regex) {
        CharMatcher allowed(*rules.allowed_symbols_regex);
        for (UChar32 c : chars) {
            if (!allowed.matches(c)) {
                return false;
            }
        }
        return true;
    }
    if (rules.disallowed_symbols.empty()) {
        return true;
    }
    for (UChar32 c : chars) {
        if (rules.disallowed_symbols.count(c) > 0) {
            return false;
        }
    }
    return true;
}

std::size_t counted_characters(const std::vector<UChar32>& chars, const RuleSet& rules) {
    std::size_t count = 0;
    if (rules.counted_characters_regex) {
        CharMatcher counted(*rules.counted_characters_regex);
        for (UChar32 c : chars) {
            if (counted.matches(c)) {
                ++count;
            }
        }
        return count;
    }
    for (UChar32 c : chars) {
        if (is_letter(c)) {
            ++count;
        }
    }
    return count;
}

} // namespace

ValidationOutcome validate(const std::string& text, const RuleSet& rules) {
    const std::string trimmed = unicode::trim(text);
    const std::vector<UChar32> chars = code_points(trimmed);

    if (chars.size() < rules.min_trimmed_length) {
        return ValidationOutcome::reject(RejectReason::MinTrimmedLength);
    }

    const std::vector<std::string> words = unicode::split_whitespace(trimmed);
    if (words.size() < rules.min_word_count || words.size() > rules.max_word_count) {
        return ValidationOutcome::reject(RejectReason::WordCount);
    }

    if (rules.needs_letter_start && (chars.empty() || !is_letter(chars.front()))) {
        return ValidationOutcome::reject(RejectReason::LetterStart);
    }

    if (rules.needs_uppercase_start) {
        for (UChar32 c : chars) {
            if (!is_letter(c)) {
                continue;
            }
            if (is_lowercase(c)) {
                return ValidationOutcome::reject(RejectReason::UppercaseStart);
            }
            break;
        }
    }

    if (rules.quote_start_with_letter && !chars.empty() && unicode::is_quotation_mark(chars.front())) {
        if (chars.size() < 2 || !is_letter(chars[1])) {
            return ValidationOutcome::reject(RejectReason::QuoteStart);
        }
    }

    if (rules.needs_punctuation_end && !ends_with_punctuation(chars)) {
        return ValidationOutcome::reject(RejectReason::PunctuationEnd);
    }

    if (!rules.may_end_with_colon && !chars.empty() && chars.back() == ':') {
        return ValidationOutcome::reject(RejectReason::EndsWithColon);
    }

    if (!symbols_admissible(chars, rules)) {
        return ValidationOutcome::reject(RejectReason::Symbols);
    }

    for (const auto& broken : rules.broken_whitespace) {
        if (!broken.empty() && trimmed.find(broken) != std::string::npos) {
            return ValidationOutcome::reject(RejectReason::BrokenWhitespace);
        }
    }

    if (rules.min_characters > 0 && counted_characters(chars, rules) < rules.min_characters) {
        return ValidationOutcome::reject(RejectReason::MinCharacters);
    }

    for (const auto& symbol : rules.even_symbols) {
        if (unicode::count_occurrences(trimmed, symbol) % 2 != 0) {
            return ValidationOutcome::reject(RejectReason::UnevenSymbols);
        }
    }

    if (!rules.disallowed_words.empty()) {
        for (const auto& word : words) {
            if (rules.disallowed_words.count(rules.word_key(word)) > 0) {
                return ValidationOutcome::reject(RejectReason::DisallowedWord);
            }
        }
    }

    if (!rules.disallowed_patterns.empty()) {
        icu::UnicodeString utext = unicode::to_unicode_string(trimmed);
        for (const auto& pattern : rules.disallowed_patterns) {
            if (pattern_found(pattern, utext)) {
                return ValidationOutcome::reject(RejectReason::DisallowedPattern);
            }
        }
    }

    if (!rules.may_contain_digits) {
        for (UChar32 c : chars) {
            if (u_isdigit(c)) {
                return ValidationOutcome::reject(RejectReason::ContainsDigit);
            }
        }
    }

    for (UChar32 c : chars) {
        if (unicode::is_line_break(c)) {
            return ValidationOutcome::reject(RejectReason::ContainsLineBreak);
        }
    }

    return ValidationOutcome::accept();
}

} // namespace wikisent
