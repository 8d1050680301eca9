#pragma once

#include <unicode/regex.h>
#include <unicode/uchar.h>

#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace wikisent {

struct CompiledPattern {
    std::string source;
    std::shared_ptr<const icu::RegexPattern> regex;
};

// Compile an ICU regular expression; throws ConfigError naming language and field.
CompiledPattern compile_pattern(const std::string& source,
                                const std::string& field,
                                const std::string& language = "");

// True if the pattern is found anywhere in text.
bool pattern_found(const CompiledPattern& pattern, const icu::UnicodeString& text);

struct Replacement {
    std::string search;
    std::string replacement;
};

struct RuleSet {
    std::string language;

    // Boundary splitter
    std::vector<CompiledPattern> abbreviation_patterns;

    // Replacement engine
    std::vector<Replacement> replacements;

    // Validator
    std::size_t min_trimmed_length = 0;
    std::size_t min_word_count = 0;
    std::size_t max_word_count = std::numeric_limits<std::size_t>::max();
    bool needs_letter_start = false;
    bool needs_uppercase_start = false;
    bool quote_start_with_letter = false;
    bool needs_punctuation_end = false;
    bool may_end_with_colon = true;
    std::optional<CompiledPattern> allowed_symbols_regex;
    std::unordered_set<UChar32> disallowed_symbols;
    std::vector<std::string> broken_whitespace;
    std::size_t min_characters = 0;
    std::optional<CompiledPattern> counted_characters_regex;  // letters when unset
    std::vector<std::string> even_symbols;
    std::unordered_set<std::string> disallowed_words;
    bool disallowed_words_case_sensitive = false;
    std::vector<CompiledPattern> disallowed_patterns;
    bool may_contain_digits = false;

    // Normalize a word the way disallowed_words entries are stored
    std::string word_key(const std::string& word) const;
};

struct RuleSource {
    std::string language;
    std::string rules_dir;
    std::string word_list;  // explicit word list, optional
};

// Build a RuleSet from a JSON document. Absent fields keep their defaults.
RuleSet parse_rules(const std::string& json_text, const std::string& language);

// Load <rules_dir>/<language>.json (defaults if absent) and merge the word list:
// source.word_list if given, else <rules_dir>/disallowed_words/<language>.txt if present.
std::shared_ptr<const RuleSet> load_rules(const RuleSource& source, bool verbose = false);

// Add one word per line to rules.disallowed_words. Returns the number of words read.
std::size_t merge_word_list(RuleSet& rules, const std::string& path);

std::string default_rules_dir();

} // namespace wikisent
