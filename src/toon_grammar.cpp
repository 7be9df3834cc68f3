#include "toon_grammar.hpp"
#include "toon_scalar.hpp"
#include <charconv>

namespace toonpack {

std::string length_mismatch_message(size_t declared, size_t got) {
    return "Array length mismatch: declared " + std::to_string(declared) +
           ", got " + std::to_string(got);
}

std::string row_width_message(size_t declared, size_t got) {
    return "Row width mismatch: declared " + std::to_string(declared) +
           " fields, got " + std::to_string(got) + " values";
}

void TokenGrammar::error(const std::string& msg, const Token& tok) {
    throw ParseError(msg, tok.line, tok.column, tok.text, current_file_);
}

void TokenGrammar::validation_error(const std::string& msg, size_t line, size_t col) {
    throw ValidationError(msg, line, col, "", current_file_);
}

void TokenGrammar::add_warning(const std::string& type, const std::string& message) {
    if (opts_.warn) {
        warnings_.emplace_back(type, message);
    }
}

void TokenGrammar::expect_line_end(const char* context) {
    const Token& t = peek();
    if (t.is(TokenType::T_NEWLINE)) {
        take();
        return;
    }
    if (t.is(TokenType::T_EOF)) {
        return;
    }
    error(std::string("Unexpected ") + token_type_name(t.type) + " after " + context, t);
}

bool TokenGrammar::is_separator(const Token& tok) const {
    if (opts_.delimiter == ',') {
        return tok.is(TokenType::T_COMMA);
    }
    return tok.is(TokenType::T_DELIMITER) && tok.text[0] == opts_.delimiter;
}

bool TokenGrammar::starts_field(size_t ahead) {
    if (!peek(ahead).is_key_like()) return false;
    const Token& next = peek(ahead + 1);
    return next.is(TokenType::T_COLON) || next.is(TokenType::T_ARRAY_START);
}

NodePtr TokenGrammar::scalar_from_token(const Token& tok) {
    switch (tok.type) {
        case TokenType::T_IDENTIFIER:
        case TokenType::T_QUOTED_STRING:
            return Node::make_string(tok.text);
        case TokenType::T_INTEGER:
        case TokenType::T_FLOAT: {
            if (!opts_.type_inference) {
                return Node::make_string(tok.text);
            }
            NodePtr n = parse_number_token(tok.text, tok.is(TokenType::T_FLOAT));
            if (!n) {
                error("Numeric literal out of range", tok);
            }
            return n;
        }
        case TokenType::T_TRUE:
            return Node::make_bool(true);
        case TokenType::T_FALSE:
            return Node::make_bool(false);
        case TokenType::T_NULL:
            return Node::make_null();
        default:
            error(std::string("Expected value, got ") + token_type_name(tok.type), tok);
    }
}

bool TokenGrammar::repeated_key(std::unordered_set<std::string>& seen, const Token& key) {
    if (seen.insert(key.text).second) {
        return false;
    }
    if (!opts_.allow_duplicate_keys) {
        error("Duplicate key '" + key.text + "'", key);
    }
    add_warning("duplicate_key", "Duplicate key '" + key.text + "' at line " +
                std::to_string(key.line) + "; last value wins");
    return true;
}

void TokenGrammar::insert_field(const NodePtr& obj, std::unordered_set<std::string>& seen,
                                const Token& key, NodePtr value) {
    if (repeated_key(seen, key)) {
        obj->set(key.text, std::move(value));
        return;
    }
    obj->object_items.emplace_back(key.text, std::move(value));
}

ArrayHeader TokenGrammar::parse_array_header() {
    Token open = take();  // '['
    ArrayHeader header;
    header.line = open.line;
    header.column = open.column;

    Token len = take();
    if (len.is(TokenType::T_STAR)) {
        header.length = ArrayLength::unknown();
    } else if (len.is(TokenType::T_INTEGER)) {
        size_t n = 0;
        auto res = std::from_chars(len.text.data(), len.text.data() + len.text.size(), n);
        if (res.ec != std::errc{}) {
            error("Array length out of range", len);
        }
        header.length = ArrayLength::known(n);
    } else {
        error("Invalid array length", len);
    }

    const Token& marker = peek();
    if (marker.is(TokenType::T_COMMA) || marker.is(TokenType::T_DELIMITER)) {
        if (marker.text[0] != opts_.delimiter) {
            error("Array header declares " + delimiter_name(marker.text[0]) +
                  " delimiter but decoder is configured for " + delimiter_name(opts_.delimiter),
                  marker);
        }
        take();
    }

    if (!peek().is(TokenType::T_ARRAY_END)) {
        error("Expected ']' in array header", peek());
    }
    take();

    if (peek().is(TokenType::T_BRACE_START)) {
        take();
        header.tabular = true;
        std::unordered_set<std::string> seen_fields;
        if (peek().is(TokenType::T_BRACE_END)) {
            error("Tabular array must declare at least one field", peek());
        }
        while (true) {
            Token field = take();
            if (!field.is_key_like()) {
                error(std::string("Expected field name, got ") + token_type_name(field.type), field);
            }
            // Rows set fields by name, so a repeated column keeps its last value
            repeated_key(seen_fields, field);
            header.fields.push_back(field.text);

            const Token& sep = peek();
            if (sep.is(TokenType::T_COMMA) || sep.is(TokenType::T_DELIMITER)) {
                take();
                continue;
            }
            if (sep.is(TokenType::T_BRACE_END)) {
                take();
                break;
            }
            error("Expected ',' or '}' in field list", sep);
        }
    }

    if (!peek().is(TokenType::T_COLON)) {
        error("Expected ':' after array header", peek());
    }
    take();
    return header;
}

// {k: v, k2: {..}} on a single line
NodePtr TokenGrammar::parse_braced_object() {
    take();  // '{'
    NodePtr obj = Node::make_object();
    std::unordered_set<std::string> seen;

    if (peek().is(TokenType::T_BRACE_END)) {
        take();
        return obj;
    }

    while (true) {
        Token key = take();
        if (!key.is_key_like()) {
            error(std::string("Expected key, got ") + token_type_name(key.type), key);
        }
        if (!peek().is(TokenType::T_COLON)) {
            error("Expected ':' after key", peek());
        }
        take();

        NodePtr value;
        if (peek().is(TokenType::T_BRACE_START)) {
            value = parse_braced_object();
        } else if (peek().is_scalar()) {
            value = scalar_from_token(take());
        } else {
            error(std::string("Expected value, got ") + token_type_name(peek().type), peek());
        }
        insert_field(obj, seen, key, std::move(value));

        const Token& sep = peek();
        if (sep.is(TokenType::T_COMMA) || sep.is(TokenType::T_DELIMITER)) {
            take();
            continue;
        }
        if (sep.is(TokenType::T_BRACE_END)) {
            take();
            break;
        }
        error("Expected ',' or '}' in inline object", sep);
    }
    return obj;
}

} // namespace toonpack
