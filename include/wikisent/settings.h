#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace wikisent {

struct RunSettings {
    std::unordered_map<std::string, std::string> options;
    std::string command;        // first positional argument: extract or check
    std::string language;
    std::string input_dir;
    std::string rules_dir;
    std::string blocklist;
    std::string format;
    std::string outfile;
    std::string settings_file;
    std::optional<std::size_t> max_per_article;  // 0 means unlimited
    bool no_check = false;
    bool verbose = false;
    bool debug = false;

    std::string get(const std::string& key, const std::string& fallback = "") const;
    bool get_bool(const std::string& key, bool fallback) const;
};

RunSettings parse_arguments(int argc, char** argv);

// Fill options missing from base with the <item> of the settings file whose
// language matches, then with the attributes of its <languages> element.
RunSettings load_settings(const RunSettings& base);

} // namespace wikisent
