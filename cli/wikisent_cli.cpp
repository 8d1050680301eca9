#include "wikisent/settings.h"
#include "wikisent/rules.h"
#include "wikisent/corpus_reader.h"
#include "wikisent/extractor.h"
#include "wikisent/validator.h"
#include "wikisent/replacer.h"
#include "wikisent/unicode_utils.h"

#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace wikisent;

namespace {

void print_usage() {
    std::cerr << "Usage:\n"
              << "  wikisent extract --language=<lang> --dir=<input_dir> [--rules_dir=<dir>] [--blocklist=<file>]\n"
              << "                   [--no_check] [--max_per_article=<n>] [--format=auto|json|doc|text]\n"
              << "                   [--outfile=<file>] [--settings=<settings.xml>] [--verbose] [--debug]\n"
              << "  wikisent check --language=<lang> [--rules_dir=<dir>] [--blocklist=<file>] < sentences.txt\n";
}

std::shared_ptr<const RuleSet> load_run_rules(const RunSettings& settings) {
    RuleSource source;
    source.language = settings.language;
    source.rules_dir = settings.rules_dir;
    source.word_list = settings.blocklist;
    return load_rules(source, settings.verbose);
}

void print_stats(const ReaderStats& reader_stats, const ExtractorStats& stats, double elapsed) {
    double per_sec = elapsed > 0.0 ? reader_stats.articles / elapsed : 0.0;
    std::cerr << "[wikisent] " << reader_stats.files << " files, " << reader_stats.articles << " articles read, "
              << reader_stats.skipped << " skipped\n";
    std::cerr << "[wikisent] " << stats.candidates << " candidates, " << stats.accepted << " sentences accepted, "
              << stats.rejected() << " rejected, " << stats.capped << " over the per-article cap\n";
    for (const auto& entry : stats.rejections) {
        std::cerr << "[wikisent]   " << reject_reason_name(entry.first) << ": " << entry.second << "\n";
    }
    std::cerr << "[wikisent] " << elapsed << "s (" << per_sec << " articles/s)\n";
}

int run_extract(const RunSettings& settings) {
    if (settings.input_dir.empty()) {
        std::cerr << "--dir option is required" << std::endl;
        return 1;
    }

    auto rules = load_run_rules(settings);

    SentenceExtractor extractor;
    extractor.configure(settings);
    extractor.set_rules(rules);

    CorpusReader reader(settings.input_dir, parse_input_format(settings.format));
    reader.set_verbose(settings.debug);

    std::ofstream outfile;
    if (!settings.outfile.empty()) {
        outfile.open(settings.outfile, std::ios::out | std::ios::trunc);
        if (!outfile) {
            throw std::runtime_error("Cannot open output file: " + settings.outfile);
        }
    }
    std::ostream& out = settings.outfile.empty() ? std::cout : outfile;

    auto start_time = std::chrono::steady_clock::now();
    ReaderStats reader_stats;
    ExtractorStats stats;
    reader.read([&](const Article& article) { extractor.process(article, out, &stats); }, &reader_stats);

    if (settings.verbose) {
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
        print_stats(reader_stats, stats, elapsed);
    }
    return 0;
}

int run_check(const RunSettings& settings) {
    auto rules = load_run_rules(settings);
    Replacer replacer(rules.get());

    std::string line;
    while (std::getline(std::cin, line)) {
        std::string text = unicode::trim(replacer.apply(unicode::sanitize_utf8(line)));
        if (text.empty()) {
            continue;
        }
        ValidationOutcome outcome = validate(text, *rules);
        if (outcome.accepted()) {
            std::cout << "ACCEPT\t" << text << "\n";
        } else {
            std::cout << "REJECT\t" << reject_reason_name(outcome.reason) << "\t" << text << "\n";
        }
    }
    std::cout.flush();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto cli_settings = parse_arguments(argc, argv);
        RunSettings settings;

        if (!cli_settings.settings_file.empty()) {
            settings = load_settings(cli_settings);
        } else {
            settings = cli_settings;
        }

        if (settings.command.empty() || settings.get_bool("help", false)) {
            print_usage();
            return settings.command.empty() ? 1 : 0;
        }
        if (settings.language.empty()) {
            std::cerr << "--language option is required" << std::endl;
            return 1;
        }

        if (settings.command == "extract") {
            return run_extract(settings);
        }
        if (settings.command == "check") {
            return run_check(settings);
        }
        std::cerr << "Unknown command: " << settings.command << std::endl;
        print_usage();
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
