#include "wikisent/types.h"

#include <stdexcept>

namespace wikisent {

std::string Article::describe() const {
    std::string result = source;
    if (line > 0) {
        result += ":" + std::to_string(line);
    }
    if (!title.empty()) {
        result += " (" + title + ")";
    }
    return result;
}

const char* reject_reason_name(RejectReason reason) {
    switch (reason) {
        case RejectReason::None: return "accepted";
        case RejectReason::MinTrimmedLength: return "min_trimmed_length";
        case RejectReason::WordCount: return "word_count";
        case RejectReason::LetterStart: return "needs_letter_start";
        case RejectReason::UppercaseStart: return "needs_uppercase_start";
        case RejectReason::QuoteStart: return "quote_start_with_letter";
        case RejectReason::PunctuationEnd: return "needs_punctuation_end";
        case RejectReason::EndsWithColon: return "may_end_with_colon";
        case RejectReason::Symbols: return "symbols";
        case RejectReason::BrokenWhitespace: return "broken_whitespace";
        case RejectReason::MinCharacters: return "min_characters";
        case RejectReason::UnevenSymbols: return "even_symbols";
        case RejectReason::DisallowedWord: return "disallowed_words";
        case RejectReason::DisallowedPattern: return "disallowed_patterns";
        case RejectReason::ContainsDigit: return "digits";
        case RejectReason::ContainsLineBreak: return "line_break";
    }
    return "unknown";
}

InputFormat parse_input_format(const std::string& name) {
    if (name.empty() || name == "auto") {
        return InputFormat::Auto;
    }
    if (name == "json") {
        return InputFormat::Json;
    }
    if (name == "doc") {
        return InputFormat::Doc;
    }
    if (name == "text" || name == "txt") {
        return InputFormat::PlainText;
    }
    throw std::runtime_error("Unknown input format: " + name);
}

} // namespace wikisent
