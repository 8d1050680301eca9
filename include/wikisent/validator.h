#pragma once

#include "rules.h"
#include "types.h"

#include <string>

namespace wikisent {

// Run the rule set's checks over the trimmed text in fixed order.
// The first failing check determines the reject reason.
ValidationOutcome validate(const std::string& text, const RuleSet& rules);

inline ValidationOutcome validate(const Candidate& candidate, const RuleSet& rules) {
    return validate(candidate.text, rules);
}

} // namespace wikisent
