#pragma once

#include <stdexcept>
#include <string>

namespace wikisent {

// Raised while loading rules or settings. Aborts the run.
class ConfigError : public std::runtime_error {
public:
    ConfigError(const std::string& language, const std::string& field, const std::string& problem);

    const std::string& language() const { return language_; }
    const std::string& field() const { return field_; }
    const std::string& problem() const { return problem_; }

private:
    std::string language_;
    std::string field_;
    std::string problem_;
};

// One article (or one input file) could not be read; the run continues.
class InputReadError : public std::runtime_error {
public:
    InputReadError(const std::string& source, const std::string& problem);

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

} // namespace wikisent
