#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "toon_errors.hpp"
#include "toon_io.hpp"
#include "toon_lexer.hpp"

using namespace toonpack;

namespace {

std::vector<TokenType> types_of(const std::vector<Token>& tokens) {
    std::vector<TokenType> out;
    for (const auto& t : tokens) out.push_back(t.type);
    return out;
}

std::vector<Token> lex_line(const std::string& line, const LexOptions& opts = LexOptions()) {
    LineLexer lexer(opts);
    return lexer.tokenize_line(line);
}

std::vector<std::string> read_all(LineSource& source) {
    std::vector<std::string> lines;
    std::string_view line;
    size_t line_no = 0;
    while (source.next_line(line, line_no)) {
        lines.emplace_back(line);
        EXPECT_EQ(line_no, lines.size());
    }
    return lines;
}

} // namespace

TEST(LineLexer, KeyValuePair) {
    auto tokens = lex_line("name: Alice");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::T_IDENTIFIER);
    EXPECT_EQ(tokens[0].text, "name");
    EXPECT_EQ(tokens[1].type, TokenType::T_COLON);
    EXPECT_EQ(tokens[2].type, TokenType::T_IDENTIFIER);
    EXPECT_EQ(tokens[2].text, "Alice");
}

TEST(LineLexer, BareTextKeepsInnerSpacesAndTrimsTrailing) {
    auto tokens = lex_line("title: hello big world   ");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].text, "hello big world");
}

TEST(LineLexer, ClassifiesLiterals) {
    auto tokens = lex_line("42,-7,3.14,1e5,true,false,null,12abc");
    std::vector<TokenType> values;
    for (const auto& t : tokens) {
        if (!t.is(TokenType::T_COMMA)) values.push_back(t.type);
    }
    std::vector<TokenType> expected = {
        TokenType::T_INTEGER, TokenType::T_INTEGER, TokenType::T_FLOAT, TokenType::T_FLOAT,
        TokenType::T_TRUE, TokenType::T_FALSE, TokenType::T_NULL, TokenType::T_IDENTIFIER};
    EXPECT_EQ(values, expected);
}

TEST(LineLexer, QuotedStringEscapes) {
    auto tokens = lex_line(R"("a\nb\t\"c\"\\")");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::T_QUOTED_STRING);
    EXPECT_EQ(tokens[0].text, "a\nb\t\"c\"\\");
}

TEST(LineLexer, UnterminatedQuoteReportsLine) {
    LineLexer lexer;
    try {
        lexer.tokenize_line("\"abc", 7);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 7u);
        EXPECT_NE(std::string(e.what()).find("line 7"), std::string::npos);
    }
}

TEST(LineLexer, RejectsUnknownEscape) {
    EXPECT_THROW(lex_line(R"("a\qb")"), ParseError);
}

TEST(LineLexer, TabularHeader) {
    auto tokens = lex_line("users[3]{id,name}:");
    std::vector<TokenType> expected = {
        TokenType::T_IDENTIFIER, TokenType::T_ARRAY_START, TokenType::T_INTEGER,
        TokenType::T_ARRAY_END, TokenType::T_BRACE_START, TokenType::T_IDENTIFIER,
        TokenType::T_COMMA, TokenType::T_IDENTIFIER, TokenType::T_BRACE_END,
        TokenType::T_COLON};
    EXPECT_EQ(types_of(tokens), expected);
    EXPECT_EQ(tokens[2].text, "3");
}

TEST(LineLexer, IndefiniteHeader) {
    auto tokens = lex_line("[*]:");
    std::vector<TokenType> expected = {
        TokenType::T_ARRAY_START, TokenType::T_STAR, TokenType::T_ARRAY_END, TokenType::T_COLON};
    EXPECT_EQ(types_of(tokens), expected);
}

TEST(LineLexer, LengthMarkerAndDelimiterMarker) {
    LexOptions opts;
    opts.delimiter = '|';
    auto tokens = lex_line("[#2|]: a|b", opts);
    std::vector<TokenType> expected = {
        TokenType::T_ARRAY_START, TokenType::T_INTEGER, TokenType::T_DELIMITER,
        TokenType::T_ARRAY_END, TokenType::T_COLON, TokenType::T_IDENTIFIER,
        TokenType::T_DELIMITER, TokenType::T_IDENTIFIER};
    EXPECT_EQ(types_of(tokens), expected);
    EXPECT_EQ(tokens[1].text, "2");
}

TEST(LineLexer, InvalidArrayLength) {
    EXPECT_THROW(lex_line("[x]:"), ParseError);
    EXPECT_THROW(lex_line("[2;]:"), ParseError);
    EXPECT_THROW(lex_line("[2"), ParseError);
}

TEST(LineLexer, DashOnlyBeforeSpaceOrEndOfLine) {
    auto item = lex_line("- a");
    ASSERT_EQ(item.size(), 2u);
    EXPECT_EQ(item[0].type, TokenType::T_DASH);

    auto bare = lex_line("-");
    ASSERT_EQ(bare.size(), 1u);
    EXPECT_EQ(bare[0].type, TokenType::T_DASH);

    auto negative = lex_line("-5");
    ASSERT_EQ(negative.size(), 1u);
    EXPECT_EQ(negative[0].type, TokenType::T_INTEGER);
    EXPECT_EQ(negative[0].text, "-5");
}

TEST(LineLexer, CommentsAtTokenBoundaryOnly) {
    auto tokens = lex_line("a: b # note");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[2].text, "b");
    EXPECT_EQ(tokens[3].type, TokenType::T_COMMENT);

    auto inside = lex_line("a: b#c");
    ASSERT_EQ(inside.size(), 3u);
    EXPECT_EQ(inside[2].text, "b#c");
}

TEST(LineLexer, CommentsDisabled) {
    LexOptions opts;
    opts.allow_comments = false;
    auto tokens = lex_line("a: b # note", opts);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].text, "b # note");
}

TEST(Tokenizer, IndentAndDedent) {
    Tokenizer tokenizer;
    auto tokens = tokenizer.tokenize("a:\n  b: 1\nc: 2");
    std::vector<TokenType> expected = {
        TokenType::T_IDENTIFIER, TokenType::T_COLON, TokenType::T_NEWLINE,
        TokenType::T_INDENT,
        TokenType::T_IDENTIFIER, TokenType::T_COLON, TokenType::T_INTEGER, TokenType::T_NEWLINE,
        TokenType::T_DEDENT,
        TokenType::T_IDENTIFIER, TokenType::T_COLON, TokenType::T_INTEGER, TokenType::T_NEWLINE,
        TokenType::T_EOF};
    EXPECT_EQ(types_of(tokens), expected);
    EXPECT_EQ(tokens[4].level, 1);
    EXPECT_EQ(tokens[9].level, 0);
}

TEST(Tokenizer, DedentsToZeroAtEnd) {
    Tokenizer tokenizer;
    auto tokens = tokenizer.tokenize("a:\n  b:\n    c: 1");
    size_t dedents = 0;
    for (const auto& t : tokens) {
        if (t.is(TokenType::T_DEDENT)) dedents++;
    }
    EXPECT_EQ(dedents, 2u);
    EXPECT_EQ(tokens.back().type, TokenType::T_EOF);
}

TEST(Tokenizer, SkipsBlankAndCommentLines) {
    Tokenizer tokenizer;
    auto tokens = tokenizer.tokenize("# header\n\na: 1\n   # stray comment\n");
    std::vector<TokenType> expected = {
        TokenType::T_IDENTIFIER, TokenType::T_COLON, TokenType::T_INTEGER,
        TokenType::T_NEWLINE, TokenType::T_EOF};
    EXPECT_EQ(types_of(tokens), expected);
}

TEST(Tokenizer, StrictIndentation) {
    Tokenizer tokenizer;
    EXPECT_THROW(tokenizer.tokenize("a:\n   b: 1"), ParseError);
    EXPECT_THROW(tokenizer.tokenize("a:\n\tb: 1"), ParseError);
}

TEST(Tokenizer, LenientIndentation) {
    LexOptions opts;
    opts.strict = false;
    Tokenizer tokenizer(opts);
    EXPECT_NO_THROW(tokenizer.tokenize("a:\n   b: 1"));
    EXPECT_NO_THROW(tokenizer.tokenize("a:\n\tb: 1"));
}

TEST(Tokenizer, CrLfLineEndings) {
    Tokenizer tokenizer;
    auto tokens = tokenizer.tokenize("a: 1\r\nb: 2\r\n");
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].text, "1");
}

TEST(StreamLexer, ReadsLinesOnDemand) {
    int produced = 0;
    CallbackLineSource source([&produced](std::string& line) {
        line = "- " + std::to_string(produced++);
        return true;
    });

    StreamLexer lexer(source);
    Token first = lexer.next();
    EXPECT_EQ(first.type, TokenType::T_DASH);
    EXPECT_EQ(produced, 1);

    lexer.next();  // value
    lexer.next();  // newline
    EXPECT_EQ(produced, 1);

    Token second = lexer.next();
    EXPECT_EQ(second.type, TokenType::T_DASH);
    EXPECT_EQ(produced, 2);
}

TEST(StreamLexer, EofRepeats) {
    StringLineSource source("a: 1");
    StreamLexer lexer(source);
    Token t;
    do {
        t = lexer.next();
    } while (!t.is(TokenType::T_EOF));
    EXPECT_EQ(lexer.next().type, TokenType::T_EOF);
    EXPECT_EQ(lexer.next().type, TokenType::T_EOF);
}

TEST(LineSources, MemorySplitsLines) {
    MemoryLineSource source("a: 1\r\n\nb: 2");
    std::vector<std::string> expected = {"a: 1", "", "b: 2"};
    EXPECT_EQ(read_all(source), expected);
}

TEST(LineSources, FileLinesAcrossChunks) {
    std::string path = ::testing::TempDir() + "toonpack_lexer_chunks.toon";
    {
        std::ofstream out(path, std::ios::binary);
        out << "short\nlonger line here\r\nx\n\nlast without newline";
    }
    FileLineSource source(path, 4);
    std::vector<std::string> expected = {
        "short", "longer line here", "x", "", "last without newline"};
    EXPECT_EQ(read_all(source), expected);
    EXPECT_EQ(source.lines_read(), 5u);
    EXPECT_EQ(source.filepath(), path);
    std::remove(path.c_str());
}

TEST(LineSources, MissingFileThrows) {
    std::string path = ::testing::TempDir() + "toonpack-no-such-file.toon";
    EXPECT_THROW({ FileLineSource source(path); }, IoError);
}
