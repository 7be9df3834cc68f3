#include "toon_parser.hpp"
#include "toon_scalar.hpp"

namespace toonpack {

// Parser implementation
Parser::Parser(const ParseOptions& opts) : TokenGrammar(opts) {}

const Token& Parser::peek(size_t ahead) {
    size_t idx = pos_ + ahead;
    if (idx >= tokens_.size()) {
        idx = tokens_.size() - 1;  // always the EOF token
    }
    return tokens_[idx];
}

Token Parser::take() {
    Token t = peek();
    if (pos_ < tokens_.size() - 1) {
        pos_++;
    }
    return t;
}

NodePtr Parser::parse_string(const std::string& text) {
    return parse_string(text.data(), text.size());
}

NodePtr Parser::parse_string(const char* data, size_t len) {
    MemoryLineSource reader(data, len);
    return parse_source(reader);
}

NodePtr Parser::parse_file(const std::string& filepath) {
    auto reader = open_file_source(filepath);
    return parse_source(*reader);
}

NodePtr Parser::parse_source(LineSource& source) {
    warnings_.clear();
    current_file_ = source.filepath();

    Tokenizer tokenizer(opts_.lex_options());
    return run(tokenizer.tokenize(source));
}

NodePtr Parser::parse_tokens(std::vector<Token> tokens) {
    warnings_.clear();
    current_file_.clear();
    return run(std::move(tokens));
}

NodePtr Parser::run(std::vector<Token> tokens) {
    tokens_.clear();
    tokens_.reserve(tokens.size() + 1);
    for (auto& t : tokens) {
        if (t.is(TokenType::T_INDENT) || t.is(TokenType::T_DEDENT)) continue;
        tokens_.push_back(std::move(t));
    }
    if (tokens_.empty() || !tokens_.back().is(TokenType::T_EOF)) {
        Token eof;
        eof.type = TokenType::T_EOF;
        tokens_.push_back(eof);
    }
    pos_ = 0;

    NodePtr root = parse_document();
    tokens_.clear();

    if (opts_.expand_paths) {
        root = expand_dotted_keys(root);
    }
    return root;
}

ValidationResult Parser::validate_string(const std::string& text) {
    try {
        parse_string(text);
        return ValidationResult::ok();
    } catch (const ParseError& e) {
        return ValidationResult::failed(e);
    }
}

ValidationResult Parser::validate_file(const std::string& filepath) {
    try {
        parse_file(filepath);
        return ValidationResult::ok();
    } catch (const ParseError& e) {
        return ValidationResult::failed(e);
    } catch (const IoError& e) {
        return ValidationResult::failed(e);
    }
}

NodePtr Parser::parse_document() {
    const Token& first = peek();

    if (first.is(TokenType::T_EOF)) {
        return Node::make_object();
    }
    if (first.level != 0 && opts_.strict) {
        error("Unexpected indentation at document start", first);
    }

    int level = first.level;
    NodePtr root;

    if (first.is(TokenType::T_ARRAY_START)) {
        root = parse_array(level + 1);
    } else if (first.is(TokenType::T_DASH)) {
        root = Node::make_array();
        parse_list_items(level, root);
    } else if (starts_field()) {
        root = parse_object(level);
    } else {
        root = parse_line_value();
    }

    const Token& rest = peek();
    if (!rest.is(TokenType::T_EOF)) {
        error(std::string("Unexpected ") + token_type_name(rest.type) + " at root", rest);
    }
    return root;
}

NodePtr Parser::parse_object(int level) {
    NodePtr obj = Node::make_object();
    std::unordered_set<std::string> seen;
    parse_object_fields(obj, level, seen);
    return obj;
}

void Parser::parse_object_fields(const NodePtr& obj, int level,
                                 std::unordered_set<std::string>& seen) {
    while (true) {
        const Token& t = peek();
        if (t.is(TokenType::T_EOF) || t.level < level) {
            break;
        }
        if (t.level > level) {
            error("Unexpected indentation", t);
        }
        auto field = parse_field(level);
        insert_field(obj, seen, field.first, std::move(field.second));
    }
}

// key: value | key: <nested block> | key[N]...: at logical level `level`
std::pair<Token, NodePtr> Parser::parse_field(int level) {
    Token key = take();
    if (!key.is_key_like()) {
        error(std::string("Expected key, got ") + token_type_name(key.type), key);
    }

    const Token& t = peek();
    NodePtr value;

    if (t.is(TokenType::T_ARRAY_START)) {
        value = parse_array(level + 1);
    } else if (t.is(TokenType::T_COLON)) {
        take();
        if (peek().ends_line()) {
            if (peek().is(TokenType::T_NEWLINE)) {
                take();
            }
            const Token& next = peek();
            if (!next.is(TokenType::T_EOF) && next.level > level) {
                if (next.is(TokenType::T_DASH)) {
                    value = Node::make_array();
                    parse_list_items(level + 1, value);
                } else {
                    value = parse_object(level + 1);
                }
            } else {
                value = Node::make_null();
            }
        } else {
            value = parse_line_value();
        }
    } else {
        error("Expected ':' after key", t);
    }

    return {std::move(key), std::move(value)};
}

// Single value that ends the line: scalar or {inline object}
NodePtr Parser::parse_line_value() {
    const Token& t = peek();
    NodePtr value;
    if (t.is(TokenType::T_BRACE_START)) {
        value = parse_braced_object();
    } else if (t.is_scalar()) {
        value = scalar_from_token(take());
    } else {
        error(std::string("Expected value, got ") + token_type_name(t.type), t);
    }
    expect_line_end("value");
    return value;
}

NodePtr Parser::parse_array(int body_level) {
    ArrayHeader header = parse_array_header();

    if (!header.length.is_known()) {
        throw ParseError("Indefinite length [*] requires the streaming decoder",
                         header.line, header.column, "[*]", current_file_);
    }

    NodePtr arr = Node::make_array();

    if (!peek().ends_line()) {
        if (header.tabular) {
            error("Tabular array header must be followed by rows", peek());
        }
        parse_inline_values(arr);
    } else {
        if (peek().is(TokenType::T_NEWLINE)) {
            take();
        }
        if (header.tabular) {
            parse_rows(header, body_level, arr);
        } else {
            parse_list_items(body_level, arr);
        }
    }

    check_length(header, arr);
    return arr;
}

void Parser::parse_inline_values(const NodePtr& arr) {
    while (true) {
        const Token& t = peek();
        if (!t.is_scalar()) {
            error(std::string("Expected value, got ") + token_type_name(t.type), t);
        }
        arr->array_items.push_back(scalar_from_token(take()));

        if (peek().ends_line()) {
            break;
        }
        if (!is_separator(peek())) {
            error("Expected " + delimiter_name(opts_.delimiter) + " between array values", peek());
        }
        take();
    }
    expect_line_end("array values");
}

void Parser::parse_rows(const ArrayHeader& header, int body_level, const NodePtr& arr) {
    const size_t width = header.fields.size();

    while (true) {
        const Token& t = peek();
        if (t.is(TokenType::T_EOF) || t.level < body_level) {
            break;
        }
        if (t.level > body_level) {
            error("Unexpected indentation", t);
        }
        size_t row_line = t.line;

        std::vector<NodePtr> values;
        values.reserve(width);
        while (true) {
            const Token& v = peek();
            if (!v.is_scalar()) {
                error(std::string("Expected value, got ") + token_type_name(v.type), v);
            }
            values.push_back(scalar_from_token(take()));
            if (peek().ends_line()) {
                break;
            }
            if (!is_separator(peek())) {
                error("Expected " + delimiter_name(opts_.delimiter) + " between row values", peek());
            }
            take();
        }
        expect_line_end("row");

        if (values.size() != width) {
            std::string msg = row_width_message(width, values.size());
            if (opts_.strict) {
                validation_error(msg, row_line);
            }
            add_warning("row_width", msg + " at line " + std::to_string(row_line));
            values.resize(width);
        }

        NodePtr row = Node::make_object();
        for (size_t i = 0; i < width; i++) {
            row->set(header.fields[i], values[i] ? values[i] : Node::make_null());
        }
        arr->array_items.push_back(row);
    }
}

void Parser::parse_list_items(int level, const NodePtr& arr) {
    while (true) {
        const Token& t = peek();
        if (t.is(TokenType::T_EOF) || t.level < level) {
            break;
        }
        if (t.level > level) {
            error("Unexpected indentation", t);
        }
        if (!t.is(TokenType::T_DASH)) {
            error("Expected list item '- '", t);
        }
        take();
        arr->array_items.push_back(parse_list_item(level));
    }
}

NodePtr Parser::parse_list_item(int dash_level) {
    const Token& t = peek();

    if (t.ends_line()) {
        if (t.is(TokenType::T_NEWLINE)) {
            take();
        }
        const Token& next = peek();
        if (!next.is(TokenType::T_EOF) && next.level > dash_level) {
            return parse_object(dash_level + 1);
        }
        return Node::make_object();
    }

    if (t.is(TokenType::T_ARRAY_START)) {
        return parse_array(dash_level + 1);
    }

    if (starts_field()) {
        // First field shares the dash line, the rest sit one level deeper
        NodePtr obj = Node::make_object();
        std::unordered_set<std::string> seen;
        auto first = parse_field(dash_level + 1);
        insert_field(obj, seen, first.first, std::move(first.second));
        parse_object_fields(obj, dash_level + 1, seen);
        return obj;
    }

    return parse_line_value();
}

void Parser::check_length(const ArrayHeader& header, const NodePtr& arr) {
    if (!header.length.is_known()) return;

    size_t declared = header.length.count;
    size_t got = arr->array_items.size();
    if (declared == got) return;

    std::string msg = length_mismatch_message(declared, got);
    if (opts_.strict) {
        validation_error(msg, header.line, header.column);
    }
    add_warning("n_mismatch", msg + " at line " + std::to_string(header.line));

    // Extras are dropped; a short array keeps what is present, so the header
    // alone never creates elements
    if (got > declared) {
        arr->array_items.resize(declared);
    }
}

} // namespace toonpack
