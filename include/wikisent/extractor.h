#pragma once

#include "types.h"
#include "settings.h"
#include "rules.h"
#include "splitter.h"
#include "replacer.h"

#include <cstddef>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace wikisent {

struct ExtractorStats {
    std::size_t articles = 0;
    std::size_t candidates = 0;   // candidates examined
    std::size_t accepted = 0;
    std::size_t capped = 0;       // candidates left unexamined once an article reached its cap
    std::map<RejectReason, std::size_t> rejections;
    double elapsed_seconds = 0.0;

    std::size_t rejected() const;
};

class SentenceExtractor {
public:
    static constexpr std::size_t kDefaultMaxPerArticle = 3;

    SentenceExtractor();

    void configure(const RunSettings& settings);
    void set_rules(std::shared_ptr<const RuleSet> rules);

    // Accepted sentences of one article, in text order, at most cap() of them
    std::vector<std::string> extract(const Article& article, ExtractorStats* stats = nullptr) const;

    // extract() and write one line per sentence, then flush
    std::size_t process(const Article& article, std::ostream& out, ExtractorStats* stats = nullptr) const;

    // Per-article limit; 0 means unlimited
    std::size_t cap() const;

private:
    RunSettings settings_;
    std::shared_ptr<const RuleSet> rules_;
    std::unique_ptr<BoundarySplitter> splitter_;
    std::unique_ptr<Replacer> replacer_;
};

// Write text as a single line; every line break becomes one space
void write_sentence(std::ostream& out, const std::string& text);

} // namespace wikisent
