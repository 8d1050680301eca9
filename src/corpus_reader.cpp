#include "wikisent/corpus_reader.h"
#include "wikisent/errors.h"
#include "wikisent/unicode_utils.h"

#include <nlohmann/json.hpp>
#include <pugixml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace wikisent {

namespace fs = std::filesystem;

namespace {

bool is_hidden(const fs::path& path) {
    std::string name = path.filename().string();
    return !name.empty() && name[0] == '.';
}

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string read_all(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw InputReadError(path, "cannot open file");
    }
    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw InputReadError(path, "read failed");
    }
    return content;
}

// Nested markup is flattened to its text
void collect_text(const pugi::xml_node& node, std::string& out) {
    for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
        if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
            out += child.value();
        } else if (child.type() == pugi::node_element) {
            collect_text(child, out);
        }
    }
}

void warn(const std::exception& ex) {
    std::cerr << "[wikisent] warning: skipping " << ex.what() << "\n";
}

} // namespace

Article parse_json_article(const std::string& line, const std::string& source, std::size_t line_number) {
    const std::string where = source + ":" + std::to_string(line_number);
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(unicode::sanitize_utf8(line));
    } catch (const nlohmann::json::parse_error& ex) {
        throw InputReadError(where, std::string("invalid JSON: ") + ex.what());
    }
    if (!root.is_object()) {
        throw InputReadError(where, "expected a JSON object");
    }
    auto text = root.find("text");
    if (text == root.end() || !text->is_string()) {
        throw InputReadError(where, "missing string field 'text'");
    }

    Article article;
    article.source = source;
    article.line = line_number;
    article.text = text->get<std::string>();
    auto id = root.find("id");
    if (id != root.end()) {
        article.id = id->is_string() ? id->get<std::string>() : id->dump();
    }
    auto title = root.find("title");
    if (title != root.end() && title->is_string()) {
        article.title = title->get<std::string>();
    }
    return article;
}

std::vector<std::string> split_doc_blocks(const std::string& content) {
    static const std::string open_tag = "<doc";
    static const std::string close_tag = "</doc>";
    std::vector<std::string> blocks;
    std::size_t pos = content.find(open_tag);
    while (pos != std::string::npos) {
        std::size_t after = pos + open_tag.size();
        if (after < content.size() && content[after] != '>' && content[after] != '/' &&
            !std::isspace(static_cast<unsigned char>(content[after]))) {
            pos = content.find(open_tag, after);
            continue;
        }
        // An unclosed block runs to the end of the file
        std::size_t close = content.find(close_tag, after);
        std::size_t end = close == std::string::npos ? content.size() : close + close_tag.size();
        blocks.push_back(content.substr(pos, end - pos));
        pos = content.find(open_tag, end);
    }
    return blocks;
}

Article parse_doc_article(const std::string& block, const std::string& source, std::size_t ordinal) {
    const std::string where = source + ":" + std::to_string(ordinal);
    pugi::xml_document doc;
    pugi::xml_parse_result result =
        doc.load_buffer(block.data(), block.size(), pugi::parse_default | pugi::parse_fragment, pugi::encoding_utf8);
    if (!result) {
        throw InputReadError(where, std::string("invalid doc markup: ") + result.description() + " at offset " +
                                        std::to_string(result.offset));
    }
    pugi::xml_node node = doc.child("doc");
    if (!node) {
        throw InputReadError(where, "no <doc> element");
    }

    Article article;
    article.source = source;
    article.line = ordinal;
    article.id = node.attribute("id").value();
    article.title = node.attribute("title").value();
    collect_text(node, article.text);
    return article;
}

InputFormat detect_format(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw InputReadError(path, "cannot open file");
    }
    char c = 0;
    while (input.get(c)) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            break;
        }
    }
    if (!input) {
        return InputFormat::PlainText;
    }
    if (c == '{') {
        return InputFormat::Json;
    }
    if (c == '<') {
        char rest[3] = {0, 0, 0};
        input.read(rest, 3);
        if (input.gcount() == 3 && std::string(rest, 3) == "doc") {
            return InputFormat::Doc;
        }
    }
    return InputFormat::PlainText;
}

CorpusReader::CorpusReader(std::string root, InputFormat format) : root_(std::move(root)), format_(format) {}

std::vector<std::string> CorpusReader::list_files() const {
    std::error_code ec;
    if (fs::is_regular_file(root_, ec)) {
        return {root_};
    }
    if (!fs::is_directory(root_, ec)) {
        throw std::runtime_error("Input directory does not exist: " + root_);
    }

    std::vector<std::string> files;
    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw std::runtime_error("Cannot read input directory " + root_ + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw std::runtime_error("Cannot read input directory " + root_ + ": " + ec.message());
        }
        if (is_hidden(it->path())) {
            if (it->is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (it->is_regular_file(ec)) {
            files.push_back(it->path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

void CorpusReader::read(const ArticleHandler& handler, ReaderStats* stats) const {
    for (const auto& path : list_files()) {
        read_file(path, handler, stats);
    }
}

void CorpusReader::read_file(const std::string& path, const ArticleHandler& handler, ReaderStats* stats) const {
    ReaderStats local_stats;
    ReaderStats& counts = stats ? *stats : local_stats;
    counts.files++;

    InputFormat format = format_;
    try {
        if (format == InputFormat::Auto) {
            format = detect_format(path);
        }
        if (verbose_) {
            std::cerr << "[wikisent] reading " << path << "\n";
        }

        if (format == InputFormat::Json) {
            std::ifstream input(path, std::ios::binary);
            if (!input) {
                throw InputReadError(path, "cannot open file");
            }
            std::string line;
            std::size_t line_number = 0;
            while (std::getline(input, line)) {
                ++line_number;
                if (is_blank(line)) {
                    continue;
                }
                Article article;
                try {
                    article = parse_json_article(line, path, line_number);
                } catch (const InputReadError& ex) {
                    warn(ex);
                    counts.skipped++;
                    continue;
                }
                counts.articles++;
                handler(article);
            }
            if (input.bad()) {
                throw InputReadError(path, "read failed after line " + std::to_string(line_number));
            }
        } else if (format == InputFormat::Doc) {
            const std::vector<std::string> blocks = split_doc_blocks(unicode::sanitize_utf8(read_all(path)));
            for (std::size_t i = 0; i < blocks.size(); ++i) {
                Article article;
                try {
                    article = parse_doc_article(blocks[i], path, i + 1);
                } catch (const InputReadError& ex) {
                    warn(ex);
                    counts.skipped++;
                    continue;
                }
                counts.articles++;
                handler(article);
            }
        } else {
            Article article;
            article.source = path;
            article.title = fs::path(path).stem().string();
            article.text = unicode::sanitize_utf8(read_all(path));
            counts.articles++;
            handler(article);
        }
    } catch (const InputReadError& ex) {
        warn(ex);
        counts.skipped++;
    }
}

} // namespace wikisent
