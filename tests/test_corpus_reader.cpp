// =============================================================================
// Corpus reader: WikiExtractor json/doc output and plain text
// =============================================================================

#include <gtest/gtest.h>
#include "wikisent/corpus_reader.h"
#include "wikisent/errors.h"
#include "temp_dir.h"

#include <string>
#include <vector>

using namespace wikisent;
using wikisent::testing_util::TempDir;

class CorpusReaderTest : public ::testing::Test {
protected:
    std::vector<Article> read_all(const std::string& root, InputFormat format, ReaderStats* stats = nullptr) {
        std::vector<Article> articles;
        CorpusReader reader(root, format);
        reader.read([&](const Article& article) { articles.push_back(article); }, stats);
        return articles;
    }

    TempDir dir_;
};

TEST_F(CorpusReaderTest, JsonLines) {
    dir_.write("AA/wiki_00",
               "{\"id\": \"12\", \"url\": \"u\", \"title\": \"First\", \"text\": \"Hello there.\"}\n"
               "\n"
               "{\"id\": 13, \"title\": \"Second\", \"text\": \"Goodbye now.\"}\n");
    ReaderStats stats;
    auto articles = read_all(dir_.path().string(), InputFormat::Json, &stats);
    ASSERT_EQ(articles.size(), 2u);
    EXPECT_EQ(articles[0].id, "12");
    EXPECT_EQ(articles[0].title, "First");
    EXPECT_EQ(articles[0].text, "Hello there.");
    EXPECT_EQ(articles[0].line, 1u);
    EXPECT_EQ(articles[1].id, "13");
    EXPECT_EQ(articles[1].line, 3u);
    EXPECT_EQ(stats.files, 1u);
    EXPECT_EQ(stats.articles, 2u);
    EXPECT_EQ(stats.skipped, 0u);
}

TEST_F(CorpusReaderTest, MalformedJsonLineIsSkipped) {
    dir_.write("wiki_00",
               "{\"text\": \"Before.\"}\n"
               "{broken\n"
               "{\"title\": \"no text\"}\n"
               "{\"text\": \"After.\"}\n");
    ReaderStats stats;
    auto articles = read_all(dir_.path().string(), InputFormat::Json, &stats);
    ASSERT_EQ(articles.size(), 2u);
    EXPECT_EQ(articles[0].text, "Before.");
    EXPECT_EQ(articles[1].text, "After.");
    EXPECT_EQ(stats.skipped, 2u);
}

TEST_F(CorpusReaderTest, ParseJsonArticleErrors) {
    EXPECT_THROW(parse_json_article("[1, 2]", "f", 1), InputReadError);
    EXPECT_THROW(parse_json_article("{\"text\": 5}", "f", 1), InputReadError);
    try {
        parse_json_article("{", "wiki_07", 9);
        FAIL() << "expected InputReadError";
    } catch (const InputReadError& ex) {
        EXPECT_EQ(ex.source(), "wiki_07:9");
    }
}

TEST_F(CorpusReaderTest, InvalidUtf8IsSanitized) {
    Article article = parse_json_article(std::string("{\"text\": \"Bad \xff byte.\"}"), "f", 1);
    EXPECT_EQ(article.text, "Bad \xEF\xBF\xBD byte.");
}

TEST_F(CorpusReaderTest, DocFormat) {
    dir_.write("wiki_00",
               "<doc id=\"1\" url=\"https://x\" title=\"Eins\">\nEins\n\nDer erste Text.\n</doc>\n"
               "<doc id=\"2\" url=\"https://y\" title=\"Zwei\">\nDer zweite Text.\n</doc>\n");
    auto articles = read_all(dir_.path().string(), InputFormat::Doc);
    ASSERT_EQ(articles.size(), 2u);
    EXPECT_EQ(articles[0].id, "1");
    EXPECT_EQ(articles[0].title, "Eins");
    EXPECT_NE(articles[0].text.find("Der erste Text."), std::string::npos);
    EXPECT_EQ(articles[1].line, 2u);
    EXPECT_NE(articles[1].text.find("Der zweite Text."), std::string::npos);
}

TEST_F(CorpusReaderTest, UnparsableDocFileIsSkipped) {
    dir_.write("a_bad", "<doc id=\"1\">unclosed");
    dir_.write("b_good", "<doc id=\"2\" title=\"Ok\">Fine.</doc>");
    ReaderStats stats;
    auto articles = read_all(dir_.path().string(), InputFormat::Doc, &stats);
    ASSERT_EQ(articles.size(), 1u);
    EXPECT_EQ(articles[0].text, "Fine.");
    EXPECT_EQ(stats.files, 2u);
    EXPECT_EQ(stats.skipped, 1u);
}

TEST_F(CorpusReaderTest, MalformedDocBlockSkipsOnlyThatArticle) {
    dir_.write("wiki_00",
               "<doc id=\"1\" title=\"A\">\nEins.\n</doc>\n"
               "<doc id=\"2\" title=\"B\">\nWenn x < y gilt.\n</doc>\n"
               "<doc id=\"3\" title=\"C\">\nDrei.\n</doc>\n");
    ReaderStats stats;
    auto articles = read_all(dir_.path().string(), InputFormat::Doc, &stats);
    ASSERT_EQ(articles.size(), 2u);
    EXPECT_EQ(articles[0].id, "1");
    EXPECT_EQ(articles[1].id, "3");
    EXPECT_EQ(articles[1].line, 3u);
    EXPECT_NE(articles[1].text.find("Drei."), std::string::npos);
    EXPECT_EQ(stats.articles, 2u);
    EXPECT_EQ(stats.skipped, 1u);
}

TEST_F(CorpusReaderTest, SplitDocBlocks) {
    auto blocks = split_doc_blocks("junk <doc id=\"1\">a</doc>\n<document/>\n<doc>b</doc><doc id=\"3\">open");
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0], "<doc id=\"1\">a</doc>");
    EXPECT_EQ(blocks[1], "<doc>b</doc>");
    EXPECT_EQ(blocks[2], "<doc id=\"3\">open");
    EXPECT_THROW(parse_doc_article(blocks[2], "wiki_00", 3), InputReadError);
    EXPECT_EQ(parse_doc_article(blocks[1], "wiki_00", 2).text, "b");
}

TEST_F(CorpusReaderTest, PlainTextIsOneArticle) {
    std::string path = dir_.write("notes.txt", "Line one.\nLine two.\n");
    auto articles = read_all(path, InputFormat::PlainText);
    ASSERT_EQ(articles.size(), 1u);
    EXPECT_EQ(articles[0].text, "Line one.\nLine two.\n");
    EXPECT_EQ(articles[0].title, "notes");
}

TEST_F(CorpusReaderTest, DetectFormat) {
    EXPECT_EQ(detect_format(dir_.write("j", "  \n{\"text\": \"x\"}\n")), InputFormat::Json);
    EXPECT_EQ(detect_format(dir_.write("d", "<doc id=\"1\">x</doc>")), InputFormat::Doc);
    EXPECT_EQ(detect_format(dir_.write("t", "Just text.")), InputFormat::PlainText);
    EXPECT_EQ(detect_format(dir_.write("e", "")), InputFormat::PlainText);
}

TEST_F(CorpusReaderTest, AutoFormatPerFile) {
    dir_.write("a", "{\"text\": \"From json.\"}\n");
    dir_.write("b", "<doc id=\"1\" title=\"T\">From doc.</doc>\n");
    dir_.write("c", "From text.");
    auto articles = read_all(dir_.path().string(), InputFormat::Auto);
    ASSERT_EQ(articles.size(), 3u);
    EXPECT_EQ(articles[0].text, "From json.");
    EXPECT_EQ(articles[1].text, "From doc.");
    EXPECT_EQ(articles[2].text, "From text.");
}

TEST_F(CorpusReaderTest, FilesSortedRecursiveAndHiddenSkipped) {
    dir_.write("BB/wiki_01", "x");
    dir_.write("AA/wiki_01", "x");
    dir_.write("AA/wiki_00", "x");
    dir_.write(".hidden", "x");
    dir_.write(".git/config", "x");
    CorpusReader reader(dir_.path().string(), InputFormat::Auto);
    auto files = reader.list_files();
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0], (dir_.path() / "AA" / "wiki_00").string());
    EXPECT_EQ(files[1], (dir_.path() / "AA" / "wiki_01").string());
    EXPECT_EQ(files[2], (dir_.path() / "BB" / "wiki_01").string());
}

TEST_F(CorpusReaderTest, MissingDirectoryThrows) {
    CorpusReader reader((dir_.path() / "nope").string(), InputFormat::Auto);
    EXPECT_THROW(reader.list_files(), std::runtime_error);
}
