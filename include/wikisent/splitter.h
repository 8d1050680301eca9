#pragma once

#include "rules.h"
#include "types.h"

#include <string>
#include <vector>

namespace wikisent {

class BoundarySplitter {
public:
    // Splits on '.', '?' and '!' unless an abbreviation pattern of the rules covers the mark
    explicit BoundarySplitter(const RuleSet* rules);

    // Candidates in text order, trimmed, never empty
    std::vector<Candidate> split(const std::string& text) const;

private:
    const RuleSet* rules_;

    // True if an abbreviation pattern matches across the punctuation at mark_pos.
    // The context runs from context_start (two tokens back) through the token after the mark.
    bool is_abbreviation(const std::string& text, size_t context_start, size_t mark_pos, size_t run_end) const;
};

} // namespace wikisent
