#ifndef TOON_GRAMMAR_HPP
#define TOON_GRAMMAR_HPP

#include <string>
#include <vector>
#include <unordered_set>
#include "toon_errors.hpp"
#include "toon_lexer.hpp"
#include "toon_value.hpp"

namespace toonpack {

// Parser options
struct ParseOptions {
    int indent = 2;
    char delimiter = ',';
    bool strict = true;
    bool type_inference = true;
    bool allow_comments = true;
    bool allow_duplicate_keys = true;
    bool expand_paths = false;
    bool warn = true;

    LexOptions lex_options() const {
        LexOptions lo;
        lo.indent = indent;
        lo.delimiter = delimiter;
        lo.allow_comments = allow_comments;
        lo.strict = strict;
        return lo;
    }
};

// Parsed array header: [N]{fields}: or [*]:
struct ArrayHeader {
    ArrayLength length;
    std::vector<std::string> fields;
    bool tabular = false;
    size_t line = 0;
    size_t column = 0;
};

std::string length_mismatch_message(size_t declared, size_t got);
std::string row_width_message(size_t declared, size_t got);

// Token-level productions shared by the materializing and the event decoder.
// Subclasses supply the cursor; INDENT/DEDENT never reach it.
class TokenGrammar {
public:
    virtual ~TokenGrammar() = default;

    // Get warnings accumulated during parsing
    const std::vector<Warning>& warnings() const { return warnings_; }

protected:
    explicit TokenGrammar(const ParseOptions& opts) : opts_(opts) {}

    virtual const Token& peek(size_t ahead = 0) = 0;
    virtual Token take() = 0;

    void expect_line_end(const char* context);
    bool is_separator(const Token& tok) const;
    bool starts_field(size_t ahead = 0);

    NodePtr scalar_from_token(const Token& tok);
    ArrayHeader parse_array_header();
    NodePtr parse_braced_object();
    void insert_field(const NodePtr& obj, std::unordered_set<std::string>& seen,
                      const Token& key, NodePtr value);

    // True when `key` is already in `seen`.  A repeat is an error when
    // duplicates are disallowed, otherwise a "duplicate_key" warning.
    bool repeated_key(std::unordered_set<std::string>& seen, const Token& key);

    void add_warning(const std::string& type, const std::string& message);

    [[noreturn]] void error(const std::string& msg, const Token& tok);
    [[noreturn]] void validation_error(const std::string& msg, size_t line, size_t col = 0);

    ParseOptions opts_;
    std::vector<Warning> warnings_;
    std::string current_file_;
};

} // namespace toonpack

#endif // TOON_GRAMMAR_HPP
