#include "wikisent/extractor.h"
#include "wikisent/validator.h"
#include "wikisent/unicode_utils.h"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace wikisent {

std::size_t ExtractorStats::rejected() const {
    std::size_t total = 0;
    for (const auto& entry : rejections) {
        total += entry.second;
    }
    return total;
}

SentenceExtractor::SentenceExtractor() = default;

void SentenceExtractor::configure(const RunSettings& settings) {
    settings_ = settings;
}

void SentenceExtractor::set_rules(std::shared_ptr<const RuleSet> rules) {
    rules_ = std::move(rules);
    if (!rules_) {
        splitter_.reset();
        replacer_.reset();
        return;
    }
    splitter_ = std::make_unique<BoundarySplitter>(rules_.get());
    replacer_ = std::make_unique<Replacer>(rules_.get());
    if (settings_.debug) {
        std::cerr << "[wikisent] rules for '" << rules_->language << "': "
                  << rules_->abbreviation_patterns.size() << " abbreviation patterns, "
                  << rules_->replacements.size() << " replacements, "
                  << rules_->disallowed_words.size() << " disallowed words\n";
    }
}

std::size_t SentenceExtractor::cap() const {
    if (settings_.max_per_article) {
        return *settings_.max_per_article;
    }
    return settings_.no_check ? 0 : kDefaultMaxPerArticle;
}

std::vector<std::string> SentenceExtractor::extract(const Article& article, ExtractorStats* stats) const {
    if (!rules_) {
        throw std::runtime_error("Rules not loaded");
    }

    ExtractorStats local_stats;
    auto start_time = std::chrono::steady_clock::now();
    const std::size_t limit = cap();

    std::vector<std::string> accepted;
    std::vector<Candidate> candidates = splitter_->split(article.text);
    std::size_t examined = 0;
    for (const auto& candidate : candidates) {
        if (limit > 0 && accepted.size() >= limit) {
            break;
        }
        ++examined;

        std::string text = unicode::trim(replacer_->apply(candidate.text));
        if (text.empty()) {
            continue;
        }
        if (!settings_.no_check) {
            ValidationOutcome outcome = validate(text, *rules_);
            if (!outcome.accepted()) {
                local_stats.rejections[outcome.reason]++;
                if (settings_.debug) {
                    std::cerr << "[wikisent] reject (" << reject_reason_name(outcome.reason) << ") "
                              << article.describe() << ": " << text << "\n";
                }
                continue;
            }
        }
        accepted.push_back(std::move(text));
    }

    local_stats.articles = 1;
    local_stats.candidates = examined;
    local_stats.capped = candidates.size() - examined;
    local_stats.accepted = accepted.size();
    local_stats.elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();

    if (stats) {
        stats->articles += local_stats.articles;
        stats->candidates += local_stats.candidates;
        stats->capped += local_stats.capped;
        stats->accepted += local_stats.accepted;
        stats->elapsed_seconds += local_stats.elapsed_seconds;
        for (const auto& entry : local_stats.rejections) {
            stats->rejections[entry.first] += entry.second;
        }
    }
    return accepted;
}

std::size_t SentenceExtractor::process(const Article& article, std::ostream& out, ExtractorStats* stats) const {
    std::vector<std::string> sentences = extract(article, stats);
    for (const auto& sentence : sentences) {
        write_sentence(out, sentence);
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write sentences of " + article.describe());
    }
    return sentences.size();
}

void write_sentence(std::ostream& out, const std::string& text) {
    std::string line;
    line.reserve(text.size());
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());
    int32_t i = 0;
    UChar32 previous = 0;
    while (i < length) {
        int32_t start = i;
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c >= 0 && unicode::is_line_break(c)) {
            // CR LF is one break
            if (!(c == 0x0A && previous == 0x0D)) {
                line += ' ';
            }
        } else {
            line.append(text, start, i - start);
        }
        previous = c;
    }
    out << line << '\n';
}

} // namespace wikisent
