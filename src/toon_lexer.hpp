#ifndef TOON_LEXER_HPP
#define TOON_LEXER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <deque>
#include <memory>
#include <cstddef>
#include "toon_errors.hpp"
#include "toon_io.hpp"

namespace toonpack {

enum class TokenType {
    T_IDENTIFIER,
    T_QUOTED_STRING,
    T_INTEGER,
    T_FLOAT,
    T_TRUE,
    T_FALSE,
    T_NULL,
    T_COLON,
    T_COMMA,
    T_DELIMITER,
    T_DASH,
    T_ARRAY_START,
    T_STAR,
    T_ARRAY_END,
    T_BRACE_START,
    T_BRACE_END,
    T_COMMENT,
    T_INDENT,
    T_DEDENT,
    T_NEWLINE,
    T_EOF
};

const char* token_type_name(TokenType type);

struct Token {
    TokenType type = TokenType::T_EOF;
    std::string text;     // unescaped for quoted strings
    size_t line = 0;      // 1-indexed
    size_t column = 0;    // 1-indexed, counted from the start of the raw line
    int level = 0;        // indentation level of the line the token sits on

    bool is(TokenType t) const { return type == t; }

    // Tokens that can name an object field
    bool is_key_like() const {
        switch (type) {
            case TokenType::T_IDENTIFIER:
            case TokenType::T_QUOTED_STRING:
            case TokenType::T_INTEGER:
            case TokenType::T_FLOAT:
            case TokenType::T_TRUE:
            case TokenType::T_FALSE:
            case TokenType::T_NULL:
                return true;
            default:
                return false;
        }
    }

    bool is_scalar() const { return is_key_like(); }

    bool ends_line() const {
        return type == TokenType::T_NEWLINE || type == TokenType::T_EOF;
    }
};

struct LexOptions {
    int indent = 2;
    char delimiter = ',';
    bool allow_comments = true;
    bool strict = true;
};

// Lexes the content of one line (indentation already removed)
class LineLexer {
public:
    explicit LineLexer(const LexOptions& opts = LexOptions());

    void reset(std::string_view content, size_t line_no, size_t column_offset, int level,
               const std::string* file = nullptr);

    // Returns false at end of line
    bool next(Token& out);

    // Convenience: all tokens of a single line
    std::vector<Token> tokenize_line(std::string_view content, size_t line_no = 1, int level = 0);

private:
    void skip_whitespace();
    bool at_token_boundary() const;
    void lex_quoted(Token& out);
    void lex_bare(Token& out);
    void lex_array_header();
    Token make(TokenType type, std::string text, size_t start) const;
    [[noreturn]] void error(const std::string& msg, size_t pos) const;

    LexOptions opts_;
    std::string_view content_;
    size_t pos_ = 0;
    size_t line_no_ = 0;
    size_t column_offset_ = 0;
    int level_ = 0;
    const std::string* file_ = nullptr;
    std::deque<Token> pending_;
};

// Pull-based token producer
class TokenSource {
public:
    virtual ~TokenSource() = default;

    // Yields T_EOF forever once input is exhausted
    virtual Token next() = 0;
};

// Streaming lexer: reads one line at a time from a LineSource and keeps
// only the current line in memory.  Emits INDENT/DEDENT on level changes,
// NEWLINE after every content line, and DEDENTs back to zero plus EOF at
// the end.  Blank and comment-only lines produce nothing.
class StreamLexer : public TokenSource {
public:
    StreamLexer(LineSource& source, const LexOptions& opts = LexOptions());
    StreamLexer(std::unique_ptr<LineSource> source, const LexOptions& opts = LexOptions());

    Token next() override;

private:
    bool load_line();
    Token structural(TokenType type, int level) const;

    std::unique_ptr<LineSource> owned_;
    LineSource& source_;
    LexOptions opts_;
    LineLexer lexer_;
    std::string line_;
    size_t line_no_ = 0;
    int current_level_ = 0;
    int pending_indents_ = 0;
    int pending_dedents_ = 0;
    bool has_first_ = false;
    Token first_;
    bool line_active_ = false;
    bool finished_ = false;
};

// Whole-document tokenizer built on the streaming lexer
class Tokenizer {
public:
    explicit Tokenizer(const LexOptions& opts = LexOptions()) : opts_(opts) {}

    std::vector<Token> tokenize(LineSource& source);
    std::vector<Token> tokenize(std::string_view text);

private:
    LexOptions opts_;
};

// Replays a finished token vector
class VectorTokenSource : public TokenSource {
public:
    explicit VectorTokenSource(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    Token next() override;

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

} // namespace toonpack

#endif // TOON_LEXER_HPP
