#ifndef TOON_PARSER_HPP
#define TOON_PARSER_HPP

#include <string>
#include <vector>
#include <memory>
#include <unordered_set>
#include <utility>
#include "toon_errors.hpp"
#include "toon_grammar.hpp"
#include "toon_io.hpp"
#include "toon_lexer.hpp"
#include "toon_value.hpp"

namespace toonpack {

// Recursive-descent decoder over the token vector of a whole document
class Parser : public TokenGrammar {
public:
    Parser(const ParseOptions& opts = ParseOptions());

    // Parse from string
    NodePtr parse_string(const std::string& text);
    NodePtr parse_string(const char* data, size_t len);

    // Parse from file
    NodePtr parse_file(const std::string& filepath);

    // Parse from any line source
    NodePtr parse_source(LineSource& source);

    // Parse an already tokenized document
    NodePtr parse_tokens(std::vector<Token> tokens);

    // Validate without throwing
    ValidationResult validate_string(const std::string& text);
    ValidationResult validate_file(const std::string& filepath);

protected:
    const Token& peek(size_t ahead = 0) override;
    Token take() override;

private:
    NodePtr run(std::vector<Token> tokens);

    NodePtr parse_document();
    NodePtr parse_object(int level);
    void parse_object_fields(const NodePtr& obj, int level, std::unordered_set<std::string>& seen);
    std::pair<Token, NodePtr> parse_field(int level);
    NodePtr parse_line_value();
    NodePtr parse_array(int body_level);
    void parse_inline_values(const NodePtr& arr);
    void parse_rows(const ArrayHeader& header, int body_level, const NodePtr& arr);
    void parse_list_items(int level, const NodePtr& arr);
    NodePtr parse_list_item(int dash_level);
    void check_length(const ArrayHeader& header, const NodePtr& arr);

    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

} // namespace toonpack

#endif // TOON_PARSER_HPP
