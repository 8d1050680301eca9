// =============================================================================
// Rule set loading
// =============================================================================

#include <gtest/gtest.h>
#include "wikisent/rules.h"
#include "wikisent/errors.h"
#include "wikisent/unicode_utils.h"
#include "temp_dir.h"

#include <limits>

using namespace wikisent;
using wikisent::testing_util::TempDir;

class RulesTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(RulesTest, EmptyDocumentGivesDefaults) {
    RuleSet rules = parse_rules("{}", "xx");
    EXPECT_EQ(rules.language, "xx");
    EXPECT_TRUE(rules.abbreviation_patterns.empty());
    EXPECT_TRUE(rules.replacements.empty());
    EXPECT_EQ(rules.min_trimmed_length, 0u);
    EXPECT_EQ(rules.min_word_count, 0u);
    EXPECT_EQ(rules.max_word_count, std::numeric_limits<std::size_t>::max());
    EXPECT_FALSE(rules.needs_letter_start);
    EXPECT_FALSE(rules.needs_uppercase_start);
    EXPECT_FALSE(rules.quote_start_with_letter);
    EXPECT_FALSE(rules.needs_punctuation_end);
    EXPECT_TRUE(rules.may_end_with_colon);
    EXPECT_FALSE(rules.allowed_symbols_regex.has_value());
    EXPECT_TRUE(rules.disallowed_symbols.empty());
    EXPECT_FALSE(rules.counted_characters_regex.has_value());
    EXPECT_FALSE(rules.may_contain_digits);
}

TEST_F(RulesTest, PartialDocumentKeepsOtherDefaults) {
    RuleSet rules = parse_rules(R"({"max_word_count": 14, "needs_letter_start": true})", "en");
    EXPECT_EQ(rules.max_word_count, 14u);
    EXPECT_TRUE(rules.needs_letter_start);
    EXPECT_EQ(rules.min_word_count, 0u);
    EXPECT_TRUE(rules.may_end_with_colon);
}

TEST_F(RulesTest, ReplacementsKeepOrder) {
    RuleSet rules = parse_rules(R"({"replacements": [["etc.", "et cetera"], ["foo", ""]]})", "en");
    ASSERT_EQ(rules.replacements.size(), 2u);
    EXPECT_EQ(rules.replacements[0].search, "etc.");
    EXPECT_EQ(rules.replacements[0].replacement, "et cetera");
    EXPECT_EQ(rules.replacements[1].search, "foo");
    EXPECT_EQ(rules.replacements[1].replacement, "");
}

TEST_F(RulesTest, DisallowedWordsAreNormalized) {
    RuleSet rules = parse_rules(R"({"disallowed_words": ["Blerg,", "  "]})", "en");
    EXPECT_EQ(rules.disallowed_words.size(), 1u);
    EXPECT_EQ(rules.disallowed_words.count("blerg"), 1u);
}

TEST_F(RulesTest, CaseSensitiveWordsKeepCase) {
    RuleSet rules = parse_rules(R"({"disallowed_words_case_sensitive": true, "disallowed_words": ["Blerg"]})", "en");
    EXPECT_EQ(rules.disallowed_words.count("Blerg"), 1u);
    EXPECT_EQ(rules.disallowed_words.count("blerg"), 0u);
}

TEST_F(RulesTest, DisallowedSymbolsAreCodePoints) {
    RuleSet rules = parse_rules(R"({"disallowed_symbols": ["<", "«"]})", "fr");
    EXPECT_EQ(rules.disallowed_symbols.count('<'), 1u);
    EXPECT_EQ(rules.disallowed_symbols.count(0x00AB), 1u);
}

TEST_F(RulesTest, EmptyOptionalPatternMeansUnset) {
    RuleSet rules = parse_rules(R"({"allowed_symbols_regex": ""})", "en");
    EXPECT_FALSE(rules.allowed_symbols_regex.has_value());
}

TEST_F(RulesTest, WrongTypeNamesTheField) {
    try {
        parse_rules(R"({"min_word_count": "two"})", "en");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& ex) {
        EXPECT_EQ(ex.language(), "en");
        EXPECT_EQ(ex.field(), "min_word_count");
    }
}

TEST_F(RulesTest, NegativeCountIsRejected) {
    EXPECT_THROW(parse_rules(R"({"min_trimmed_length": -1})", "en"), ConfigError);
}

TEST_F(RulesTest, BadPatternIsConfigError) {
    try {
        parse_rules(R"({"abbreviation_patterns": ["(unclosed"]})", "de");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& ex) {
        EXPECT_EQ(ex.field(), "abbreviation_patterns");
        EXPECT_NE(std::string(ex.what()).find("(unclosed"), std::string::npos);
    }
}

TEST_F(RulesTest, MalformedReplacementPair) {
    EXPECT_THROW(parse_rules(R"({"replacements": [["only one"]]})", "en"), ConfigError);
}

TEST_F(RulesTest, MultiCharacterSymbolIsRejected) {
    EXPECT_THROW(parse_rules(R"({"disallowed_symbols": ["ab"]})", "en"), ConfigError);
}

TEST_F(RulesTest, InvalidJsonIsConfigError) {
    EXPECT_THROW(parse_rules("{not json", "en"), ConfigError);
    EXPECT_THROW(parse_rules("[]", "en"), ConfigError);
}

TEST_F(RulesTest, MinAboveMaxWordCount) {
    EXPECT_THROW(parse_rules(R"({"min_word_count": 5, "max_word_count": 2})", "en"), ConfigError);
}

TEST_F(RulesTest, MissingFileGivesDefaults) {
    TempDir dir;
    RuleSource source;
    source.language = "klingon";
    source.rules_dir = dir.path().string();
    auto rules = load_rules(source);
    ASSERT_TRUE(rules);
    EXPECT_EQ(rules->language, "klingon");
    EXPECT_TRUE(rules->disallowed_words.empty());
}

TEST_F(RulesTest, BundledWordListIsMerged) {
    TempDir dir;
    dir.write("xx.json", R"({"disallowed_words": ["one"]})");
    dir.write("disallowed_words/xx.txt", "Two\n\n  three  \n");
    RuleSource source;
    source.language = "xx";
    source.rules_dir = dir.path().string();
    auto rules = load_rules(source);
    EXPECT_EQ(rules->disallowed_words.size(), 3u);
    EXPECT_EQ(rules->disallowed_words.count("two"), 1u);
    EXPECT_EQ(rules->disallowed_words.count("three"), 1u);
}

TEST_F(RulesTest, ExplicitWordListWins) {
    TempDir dir;
    dir.write("disallowed_words/xx.txt", "bundled\n");
    std::string explicit_list = dir.write("mine.txt", "custom\n");
    RuleSource source;
    source.language = "xx";
    source.rules_dir = dir.path().string();
    source.word_list = explicit_list;
    auto rules = load_rules(source);
    EXPECT_EQ(rules->disallowed_words.count("custom"), 1u);
    EXPECT_EQ(rules->disallowed_words.count("bundled"), 0u);
}

TEST_F(RulesTest, UnreadableExplicitWordList) {
    TempDir dir;
    RuleSource source;
    source.language = "xx";
    source.rules_dir = dir.path().string();
    source.word_list = (dir.path() / "missing.txt").string();
    EXPECT_THROW(load_rules(source), ConfigError);
}

TEST_F(RulesTest, EmptyLanguageIsConfigError) {
    EXPECT_THROW(load_rules(RuleSource{}), ConfigError);
}

TEST_F(RulesTest, BundledRulesLoad) {
    for (const char* language : {"english", "french", "german"}) {
        RuleSource source;
        source.language = language;
        source.rules_dir = WIKISENT_RULES_DIR;
        std::shared_ptr<const RuleSet> rules;
        ASSERT_NO_THROW(rules = load_rules(source)) << language;
        EXPECT_TRUE(rules->allowed_symbols_regex.has_value()) << language;
        EXPECT_FALSE(rules->abbreviation_patterns.empty()) << language;
    }
}

TEST_F(RulesTest, GermanAllowedSymbolsUseEscapes) {
    RuleSource source;
    source.language = "german";
    source.rules_dir = WIKISENT_RULES_DIR;
    auto rules = load_rules(source);
    ASSERT_TRUE(rules->allowed_symbols_regex.has_value());
    const auto& pattern = *rules->allowed_symbols_regex;
    EXPECT_TRUE(pattern_found(pattern, unicode::to_unicode_string("a")));
    EXPECT_TRUE(pattern_found(pattern, unicode::to_unicode_string("ß")));
    EXPECT_TRUE(pattern_found(pattern, unicode::to_unicode_string("{")));
    EXPECT_FALSE(pattern_found(pattern, unicode::to_unicode_string("é")));
    EXPECT_FALSE(pattern_found(pattern, unicode::to_unicode_string("}")));
}
