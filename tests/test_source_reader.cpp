#include <gtest/gtest.h>
#include "errors.hpp"
#include "source_reader.hpp"
#include <sstream>

using namespace semsearch;

TEST(SourceReaderTest, ParsesQuestion) {
    Item item = SourceReader::parse_line(
        R"({"type": "question", "title": "How to sort?", "body": "details", "id": "7", "tags": ["c++"]})", 1);

    EXPECT_EQ(item.kind, ItemKind::Question);
    EXPECT_EQ(item.title, "How to sort?");
    EXPECT_EQ(item.body, "details");
    EXPECT_EQ(item.id, 0);
    EXPECT_FALSE(item.has_vector());
    EXPECT_EQ(item.metadata["id"], "7");
    EXPECT_EQ(item.metadata["tags"][0], "c++");
    EXPECT_FALSE(item.metadata.contains("type"));
    EXPECT_FALSE(item.metadata.contains("title"));
}

TEST(SourceReaderTest, TypeIsCaseInsensitive) {
    EXPECT_EQ(SourceReader::parse_line(R"({"type": "Question", "title": "t"})", 1).kind, ItemKind::Question);
    EXPECT_EQ(SourceReader::parse_line(R"({"type": "ANSWER", "body": "b"})", 1).kind, ItemKind::Answer);
}

TEST(SourceReaderTest, AnswerMayOmitTitle) {
    Item item = SourceReader::parse_line(R"({"type": "answer", "body": "b", "title": null})", 1);
    EXPECT_EQ(item.kind, ItemKind::Answer);
    EXPECT_TRUE(item.title.empty());
}

TEST(SourceReaderTest, MalformedLinesThrowWithLineNumber) {
    const char* bad[] = {
        "not json",
        "[1, 2, 3]",
        R"({"title": "no type"})",
        R"({"type": 3, "title": "t"})",
        R"({"type": "comment", "title": "t"})",
        R"({"type": "question", "title": 5})",
        R"({"type": "question", "title": "t", "body": {}})",
        R"({"type": "question", "body": "b"})",
        R"({"type": "question", "title": "   "})",
    };
    for (const char* line : bad) {
        try {
            SourceReader::parse_line(line, 12);
            ADD_FAILURE() << "accepted: " << line;
        } catch (const InputFormatError& e) {
            EXPECT_EQ(e.line(), 12u) << line;
        }
    }
}

TEST(SourceReaderTest, StreamSkipsBlankAndMalformedLines) {
    std::istringstream in(
        "{\"type\": \"question\", \"title\": \"a\"}\n"
        "\n"
        "garbage\n"
        "   \n"
        "{\"type\": \"answer\", \"body\": \"b\"}\n"
        "{\"type\": \"question\"}\n"
        "{\"type\": \"question\", \"title\": \"c\"}");
    SourceReader reader(in);

    std::vector<Item> items;
    Item item;
    while (reader.next(item)) items.push_back(item);

    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].title, "a");
    EXPECT_EQ(items[1].kind, ItemKind::Answer);
    EXPECT_EQ(items[2].title, "c");
    EXPECT_EQ(reader.lines_read(), 7u);
    EXPECT_EQ(reader.records_read(), 3u);
    EXPECT_EQ(reader.skipped(), 2u);
}

TEST(SourceReaderTest, MissingFileThrows) {
    EXPECT_THROW(SourceReader("/nonexistent/dir/records.jsonl"), std::runtime_error);
}
