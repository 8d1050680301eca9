#include "wikisent/settings.h"
#include "wikisent/errors.h"

#include <pugixml.hpp>

#include <stdexcept>

namespace wikisent {

std::string RunSettings::get(const std::string& key, const std::string& fallback) const {
    auto it = options.find(key);
    return it == options.end() ? fallback : it->second;
}

bool RunSettings::get_bool(const std::string& key, bool fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    const std::string& val = it->second;
    return val == "1" || val == "true" || val == "TRUE" || val == "yes";
}

namespace {

bool is_true(const std::string& value) {
    return value == "1" || value == "true" || value == "TRUE" || value == "yes";
}

std::size_t parse_cap(const std::string& value) {
    std::size_t used = 0;
    long long parsed = -1;
    try {
        parsed = std::stoll(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != value.size() || parsed < 0) {
        throw std::runtime_error("Invalid value for max_per_article: '" + value + "'");
    }
    return static_cast<std::size_t>(parsed);
}

void push_option(RunSettings& settings, const std::string& key, const std::string& value) {
    settings.options[key] = value;
    if (key == "language") {
        settings.language = value;
    } else if (key == "dir") {
        settings.input_dir = value;
    } else if (key == "rules_dir") {
        settings.rules_dir = value;
    } else if (key == "blocklist") {
        settings.blocklist = value;
    } else if (key == "format") {
        settings.format = value;
    } else if (key == "outfile") {
        settings.outfile = value;
    } else if (key == "settings") {
        settings.settings_file = value;
    } else if (key == "max_per_article") {
        settings.max_per_article = parse_cap(value);
    } else if (key == "no_check") {
        settings.no_check = is_true(value);
    } else if (key == "verbose") {
        settings.verbose = is_true(value);
    } else if (key == "debug") {
        settings.debug = is_true(value);
    }
}

} // namespace

RunSettings parse_arguments(int argc, char** argv) {
    RunSettings settings;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            if (settings.command.empty()) {
                settings.command = arg;
            } else {
                throw std::runtime_error("Unexpected argument: " + arg);
            }
            continue;
        }
        std::size_t eq = arg.find('=');
        if (eq == std::string::npos) {
            std::string key = arg.substr(2);
            push_option(settings, key, "1");
        } else {
            std::string key = arg.substr(2, eq - 2);
            std::string value = arg.substr(eq + 1);
            push_option(settings, key, value);
        }
    }
    if (settings.debug) {
        settings.verbose = true;
    }
    return settings;
}

RunSettings load_settings(const RunSettings& base) {
    RunSettings combined = base;
    const std::string& settings_path = base.settings_file;
    if (settings_path.empty()) {
        throw ConfigError(base.language, "settings", "no settings file given");
    }
    if (base.language.empty()) {
        throw ConfigError(base.language, "settings", "a language is needed to select a settings item");
    }

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(settings_path.c_str());
    if (!result) {
        throw ConfigError(base.language, "settings",
                          "failed to load settings file " + settings_path + ": " + result.description());
    }

    pugi::xpath_node_set items = doc.select_nodes("/wikisent/languages/item");
    pugi::xml_node selected;
    for (const auto& node : items) {
        pugi::xml_node item = node.node();
        if (std::string(item.attribute("language").value()) == base.language) {
            selected = item;
            break;
        }
    }

    if (!selected) {
        throw ConfigError(base.language, "settings", "no matching language item in " + settings_path);
    }

    for (const auto& attr : selected.attributes()) {
        if (combined.options.count(attr.name()) > 0) {
            continue;
        }
        push_option(combined, attr.name(), attr.value());
    }
    pugi::xml_node languages = selected.parent();
    if (languages) {
        for (const auto& attr : languages.attributes()) {
            if (combined.options.count(attr.name()) > 0) {
                continue;
            }
            push_option(combined, attr.name(), attr.value());
        }
    }

    if (combined.debug) {
        combined.verbose = true;
    }
    return combined;
}

} // namespace wikisent
