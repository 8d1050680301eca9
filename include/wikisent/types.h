#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace wikisent {

struct Article {
    std::string source;   // file the article was read from
    std::size_t line = 0; // 1-based line (json format) or ordinal (doc format)
    std::string id;
    std::string title;
    std::string text;

    // "file:line" plus the title when known, for diagnostics
    std::string describe() const;
};

struct Candidate {
    std::string text;          // trimmed
    std::size_t offset = 0;    // byte offset of the span in the article text
    std::size_t ordinal = 0;   // position among the article's candidates
};

enum class RejectReason {
    None,
    MinTrimmedLength,
    WordCount,
    LetterStart,
    UppercaseStart,
    QuoteStart,
    PunctuationEnd,
    EndsWithColon,
    Symbols,
    BrokenWhitespace,
    MinCharacters,
    UnevenSymbols,
    DisallowedWord,
    DisallowedPattern,
    ContainsDigit,
    ContainsLineBreak
};

const char* reject_reason_name(RejectReason reason);

struct ValidationOutcome {
    RejectReason reason = RejectReason::None;

    bool accepted() const { return reason == RejectReason::None; }

    static ValidationOutcome accept() { return {}; }
    static ValidationOutcome reject(RejectReason why) { return ValidationOutcome{why}; }
};

enum class InputFormat {
    Auto,
    Json,
    Doc,
    PlainText
};

InputFormat parse_input_format(const std::string& name);

} // namespace wikisent
