#pragma once

#include "types.h"

#include <cstddef>
#include <functional>
#include <istream>
#include <string>
#include <vector>

namespace wikisent {

struct ReaderStats {
    std::size_t files = 0;
    std::size_t articles = 0;
    std::size_t skipped = 0;   // articles or files that could not be read
};

using ArticleHandler = std::function<void(const Article&)>;

class CorpusReader {
public:
    // root may be a directory (read recursively) or a single file
    CorpusReader(std::string root, InputFormat format);

    void set_verbose(bool verbose) { verbose_ = verbose; }

    // Regular, non-hidden files below root in sorted path order
    std::vector<std::string> list_files() const;

    // Stream every article to handler. Unreadable articles and files are
    // reported on stderr and skipped.
    void read(const ArticleHandler& handler, ReaderStats* stats = nullptr) const;

    void read_file(const std::string& path, const ArticleHandler& handler, ReaderStats* stats = nullptr) const;

private:
    std::string root_;
    InputFormat format_;
    bool verbose_ = false;
};

// Decide json, doc or text from the first non-white-space characters of a file
InputFormat detect_format(const std::string& path);

// One WikiExtractor --json line; throws InputReadError
Article parse_json_article(const std::string& line, const std::string& source, std::size_t line_number);

// The <doc ...>...</doc> blocks of one WikiExtractor file, in order
std::vector<std::string> split_doc_blocks(const std::string& content);

// One <doc> block; ordinal is its 1-based position in the file. Throws InputReadError
Article parse_doc_article(const std::string& block, const std::string& source, std::size_t ordinal);

} // namespace wikisent
