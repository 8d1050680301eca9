#include "wikisent/errors.h"

namespace wikisent {

namespace {

std::string config_message(const std::string& language, const std::string& field, const std::string& problem) {
    std::string message = "rules for '" + language + "'";
    if (!field.empty()) {
        message += ", field '" + field + "'";
    }
    return message + ": " + problem;
}

} // namespace

ConfigError::ConfigError(const std::string& language, const std::string& field, const std::string& problem)
    : std::runtime_error(config_message(language, field, problem)),
      language_(language),
      field_(field),
      problem_(problem) {}

InputReadError::InputReadError(const std::string& source, const std::string& problem)
    : std::runtime_error(source + ": " + problem),
      source_(source) {}

} // namespace wikisent
