#include "wikisent/rules.h"
#include "wikisent/errors.h"
#include "wikisent/unicode_utils.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace wikisent {

namespace {

using nlohmann::json;

const json* find_field(const json& root, const char* field) {
    auto it = root.find(field);
    if (it == root.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

bool read_bool(const json& root, const char* field, bool fallback, const std::string& language) {
    const json* value = find_field(root, field);
    if (!value) {
        return fallback;
    }
    if (!value->is_boolean()) {
        throw ConfigError(language, field, "expected true or false");
    }
    return value->get<bool>();
}

std::size_t read_count(const json& root, const char* field, std::size_t fallback, const std::string& language) {
    const json* value = find_field(root, field);
    if (!value) {
        return fallback;
    }
    if (value->is_number_unsigned()) {
        return value->get<std::size_t>();
    }
    if (value->is_number_integer()) {
        throw ConfigError(language, field, "expected a non-negative integer, got " + value->dump());
    }
    throw ConfigError(language, field, "expected an integer");
}

std::string read_string(const json& value, const char* field, const std::string& language) {
    if (!value.is_string()) {
        throw ConfigError(language, field, "expected a string, got " + value.dump());
    }
    return value.get<std::string>();
}

std::vector<std::string> read_string_list(const json& root, const char* field, const std::string& language) {
    std::vector<std::string> result;
    const json* value = find_field(root, field);
    if (!value) {
        return result;
    }
    if (!value->is_array()) {
        throw ConfigError(language, field, "expected a list of strings");
    }
    for (const auto& item : *value) {
        result.push_back(read_string(item, field, language));
    }
    return result;
}

std::vector<CompiledPattern> read_pattern_list(const json& root, const char* field, const std::string& language) {
    std::vector<CompiledPattern> patterns;
    for (const auto& source : read_string_list(root, field, language)) {
        patterns.push_back(compile_pattern(source, field, language));
    }
    return patterns;
}

std::optional<CompiledPattern> read_optional_pattern(const json& root, const char* field, const std::string& language) {
    const json* value = find_field(root, field);
    if (!value) {
        return std::nullopt;
    }
    std::string source = read_string(*value, field, language);
    // An empty string means "not configured"
    if (source.empty()) {
        return std::nullopt;
    }
    return compile_pattern(source, field, language);
}

std::vector<Replacement> read_replacements(const json& root, const std::string& language) {
    std::vector<Replacement> replacements;
    const json* value = find_field(root, "replacements");
    if (!value) {
        return replacements;
    }
    if (!value->is_array()) {
        throw ConfigError(language, "replacements", "expected a list of [search, replacement] pairs");
    }
    for (const auto& pair : *value) {
        if (!pair.is_array() || pair.size() != 2) {
            throw ConfigError(language, "replacements",
                              "expected a [search, replacement] pair, got " + pair.dump());
        }
        Replacement replacement;
        replacement.search = read_string(pair[0], "replacements", language);
        replacement.replacement = read_string(pair[1], "replacements", language);
        replacements.push_back(std::move(replacement));
    }
    return replacements;
}

} // namespace

CompiledPattern compile_pattern(const std::string& source, const std::string& field, const std::string& language) {
    UParseError parse_error;
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexPattern> regex(
        icu::RegexPattern::compile(unicode::to_unicode_string(source), 0, parse_error, status));
    if (U_FAILURE(status) || !regex) {
        std::ostringstream problem;
        problem << "cannot compile pattern '" << source << "': " << u_errorName(status)
                << " at offset " << parse_error.offset;
        throw ConfigError(language, field, problem.str());
    }
    CompiledPattern pattern;
    pattern.source = source;
    pattern.regex = std::shared_ptr<const icu::RegexPattern>(std::move(regex));
    return pattern;
}

bool pattern_found(const CompiledPattern& pattern, const icu::UnicodeString& text) {
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher(pattern.regex->matcher(text, status));
    if (U_FAILURE(status)) {
        throw std::runtime_error("Failed to create matcher for pattern: " + pattern.source);
    }
    bool found = matcher->find(status);
    return found && U_SUCCESS(status);
}

std::string RuleSet::word_key(const std::string& word) const {
    std::string key = unicode::trim_non_letters(word);
    return disallowed_words_case_sensitive ? key : unicode::to_lower(key);
}

RuleSet parse_rules(const std::string& json_text, const std::string& language) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& ex) {
        throw ConfigError(language, "", std::string("invalid JSON: ") + ex.what());
    }
    if (!root.is_object()) {
        throw ConfigError(language, "", "rules document must be a JSON object");
    }

    RuleSet rules;
    rules.language = language;

    rules.abbreviation_patterns = read_pattern_list(root, "abbreviation_patterns", language);
    rules.replacements = read_replacements(root, language);

    rules.min_trimmed_length = read_count(root, "min_trimmed_length", rules.min_trimmed_length, language);
    rules.min_word_count = read_count(root, "min_word_count", rules.min_word_count, language);
    rules.max_word_count = read_count(root, "max_word_count", rules.max_word_count, language);
    rules.needs_letter_start = read_bool(root, "needs_letter_start", rules.needs_letter_start, language);
    rules.needs_uppercase_start = read_bool(root, "needs_uppercase_start", rules.needs_uppercase_start, language);
    rules.quote_start_with_letter = read_bool(root, "quote_start_with_letter", rules.quote_start_with_letter, language);
    rules.needs_punctuation_end = read_bool(root, "needs_punctuation_end", rules.needs_punctuation_end, language);
    rules.may_end_with_colon = read_bool(root, "may_end_with_colon", rules.may_end_with_colon, language);
    rules.allowed_symbols_regex = read_optional_pattern(root, "allowed_symbols_regex", language);

    for (const auto& symbol : read_string_list(root, "disallowed_symbols", language)) {
        std::vector<UChar32> chars = unicode::code_points(symbol);
        if (chars.size() != 1) {
            throw ConfigError(language, "disallowed_symbols",
                              "entries must be single characters, got '" + symbol + "'");
        }
        rules.disallowed_symbols.insert(chars.front());
    }

    rules.broken_whitespace = read_string_list(root, "broken_whitespace", language);
    rules.min_characters = read_count(root, "min_characters", rules.min_characters, language);
    rules.counted_characters_regex = read_optional_pattern(root, "counted_characters_regex", language);
    rules.even_symbols = read_string_list(root, "even_symbols", language);
    rules.disallowed_words_case_sensitive =
        read_bool(root, "disallowed_words_case_sensitive", rules.disallowed_words_case_sensitive, language);
    for (const auto& word : read_string_list(root, "disallowed_words", language)) {
        std::string key = rules.word_key(word);
        if (!key.empty()) {
            rules.disallowed_words.insert(std::move(key));
        }
    }
    rules.disallowed_patterns = read_pattern_list(root, "disallowed_patterns", language);
    rules.may_contain_digits = read_bool(root, "may_contain_digits", rules.may_contain_digits, language);

    if (rules.min_word_count > rules.max_word_count) {
        throw ConfigError(language, "min_word_count", "greater than max_word_count");
    }
    return rules;
}

std::size_t merge_word_list(RuleSet& rules, const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigError(rules.language, "disallowed_words", "cannot read word list: " + path);
    }
    std::size_t count = 0;
    std::string line;
    while (std::getline(input, line)) {
        std::string key = rules.word_key(unicode::trim(line));
        if (key.empty()) {
            continue;
        }
        rules.disallowed_words.insert(std::move(key));
        ++count;
    }
    return count;
}

std::shared_ptr<const RuleSet> load_rules(const RuleSource& source, bool verbose) {
    namespace fs = std::filesystem;

    if (source.language.empty()) {
        throw ConfigError(source.language, "", "no language given");
    }
    const fs::path rules_dir = source.rules_dir.empty() ? fs::path(default_rules_dir()) : fs::path(source.rules_dir);
    const fs::path rules_path = rules_dir / (source.language + ".json");

    RuleSet rules;
    std::error_code ec;
    if (fs::is_regular_file(rules_path, ec)) {
        std::ifstream input(rules_path);
        if (!input) {
            throw ConfigError(source.language, "", "cannot open rules file: " + rules_path.string());
        }
        std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
        rules = parse_rules(content, source.language);
        if (verbose) {
            std::cerr << "[wikisent] loaded rules from " << rules_path.string() << "\n";
        }
    } else {
        rules.language = source.language;
        if (verbose) {
            std::cerr << "[wikisent] no rules file at " << rules_path.string() << ", using defaults\n";
        }
    }

    std::string word_list = source.word_list;
    if (word_list.empty()) {
        fs::path bundled = rules_dir / "disallowed_words" / (source.language + ".txt");
        if (fs::is_regular_file(bundled, ec)) {
            word_list = bundled.string();
        }
    }
    if (!word_list.empty()) {
        std::size_t count = merge_word_list(rules, word_list);
        if (verbose) {
            std::cerr << "[wikisent] merged " << count << " disallowed words from " << word_list << "\n";
        }
    }

    return std::make_shared<const RuleSet>(std::move(rules));
}

std::string default_rules_dir() {
#ifdef WIKISENT_RULES_DIR
    return WIKISENT_RULES_DIR;
#else
    return "rules";
#endif
}

} // namespace wikisent
