#pragma once

#include "rules.h"
#include "types.h"

#include <string>

namespace wikisent {

class Replacer {
public:
    explicit Replacer(const RuleSet* rules);

    // Only enabled if the rule set has replacements
    bool is_enabled() const { return enabled_; }

    // Apply every replacement in configured order, each as a literal replace-all.
    // Later replacements see the output of earlier ones.
    std::string apply(const std::string& text) const;

    Candidate apply(const Candidate& candidate) const;

private:
    const RuleSet* rules_;
    bool enabled_;
};

} // namespace wikisent
