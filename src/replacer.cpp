#include "wikisent/replacer.h"
#include "wikisent/unicode_utils.h"

#include <stdexcept>

namespace wikisent {

Replacer::Replacer(const RuleSet* rules) : rules_(rules), enabled_(false) {
    if (!rules_) {
        throw std::invalid_argument("Replacer needs a rule set");
    }
    for (const auto& replacement : rules_->replacements) {
        if (!replacement.search.empty()) {
            enabled_ = true;
            break;
        }
    }
}

std::string Replacer::apply(const std::string& text) const {
    if (!enabled_) {
        return text;
    }
    std::string result = text;
    for (const auto& replacement : rules_->replacements) {
        result = unicode::replace_all(result, replacement.search, replacement.replacement);
    }
    return result;
}

Candidate Replacer::apply(const Candidate& candidate) const {
    Candidate result = candidate;
    result.text = apply(candidate.text);
    return result;
}

} // namespace wikisent
