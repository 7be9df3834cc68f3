#include "toon_lexer.hpp"
#include "toon_scalar.hpp"

namespace toonpack {

const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::T_IDENTIFIER: return "identifier";
        case TokenType::T_QUOTED_STRING: return "quoted string";
        case TokenType::T_INTEGER: return "integer";
        case TokenType::T_FLOAT: return "float";
        case TokenType::T_TRUE: return "true";
        case TokenType::T_FALSE: return "false";
        case TokenType::T_NULL: return "null";
        case TokenType::T_COLON: return "':'";
        case TokenType::T_COMMA: return "','";
        case TokenType::T_DELIMITER: return "delimiter";
        case TokenType::T_DASH: return "'-'";
        case TokenType::T_ARRAY_START: return "'['";
        case TokenType::T_STAR: return "'*'";
        case TokenType::T_ARRAY_END: return "']'";
        case TokenType::T_BRACE_START: return "'{'";
        case TokenType::T_BRACE_END: return "'}'";
        case TokenType::T_COMMENT: return "comment";
        case TokenType::T_INDENT: return "indent";
        case TokenType::T_DEDENT: return "dedent";
        case TokenType::T_NEWLINE: return "end of line";
        case TokenType::T_EOF: return "end of input";
    }
    return "unknown";
}

LineLexer::LineLexer(const LexOptions& opts) : opts_(opts) {}

void LineLexer::reset(std::string_view content, size_t line_no, size_t column_offset, int level,
                      const std::string* file) {
    content_ = content;
    pos_ = 0;
    line_no_ = line_no;
    column_offset_ = column_offset;
    level_ = level;
    file_ = file;
    pending_.clear();
}

std::vector<Token> LineLexer::tokenize_line(std::string_view content, size_t line_no, int level) {
    reset(content, line_no, 0, level);
    std::vector<Token> tokens;
    Token t;
    while (next(t)) {
        tokens.push_back(std::move(t));
    }
    return tokens;
}

void LineLexer::error(const std::string& msg, size_t pos) const {
    std::string snippet(content_);
    if (snippet.length() > 60) {
        snippet = snippet.substr(0, 57) + "...";
    }
    throw ParseError(msg, line_no_, column_offset_ + pos + 1, snippet,
                     file_ ? *file_ : std::string());
}

Token LineLexer::make(TokenType type, std::string text, size_t start) const {
    Token t;
    t.type = type;
    t.text = std::move(text);
    t.line = line_no_;
    t.column = column_offset_ + start + 1;
    t.level = level_;
    return t;
}

void LineLexer::skip_whitespace() {
    while (pos_ < content_.size()) {
        char c = content_[pos_];
        if (c == ' ' || (c == '\t' && opts_.delimiter != '\t')) {
            pos_++;
        } else {
            break;
        }
    }
}

bool LineLexer::at_token_boundary() const {
    if (pos_ == 0) return true;
    char prev = content_[pos_ - 1];
    return prev == ' ' || prev == '\t';
}

bool LineLexer::next(Token& out) {
    if (!pending_.empty()) {
        out = std::move(pending_.front());
        pending_.pop_front();
        return true;
    }

    skip_whitespace();
    if (pos_ >= content_.size()) {
        return false;
    }

    size_t start = pos_;
    char c = content_[pos_];

    if (c == '#' && opts_.allow_comments && at_token_boundary()) {
        out = make(TokenType::T_COMMENT, std::string(content_.substr(pos_)), start);
        pos_ = content_.size();
        return true;
    }

    if (c == opts_.delimiter && c != ',') {
        pos_++;
        out = make(TokenType::T_DELIMITER, std::string(1, c), start);
        return true;
    }

    switch (c) {
        case ':':
            pos_++;
            out = make(TokenType::T_COLON, ":", start);
            return true;
        case ',':
            pos_++;
            out = make(TokenType::T_COMMA, ",", start);
            return true;
        case '{':
            pos_++;
            out = make(TokenType::T_BRACE_START, "{", start);
            return true;
        case '}':
            pos_++;
            out = make(TokenType::T_BRACE_END, "}", start);
            return true;
        case ']':
            pos_++;
            out = make(TokenType::T_ARRAY_END, "]", start);
            return true;
        case '[':
            lex_array_header();
            out = std::move(pending_.front());
            pending_.pop_front();
            return true;
        case '"':
            lex_quoted(out);
            return true;
        case '-':
            if (pos_ + 1 >= content_.size() || content_[pos_ + 1] == ' ' ||
                content_[pos_ + 1] == '\t') {
                pos_++;
                out = make(TokenType::T_DASH, "-", start);
                return true;
            }
            break;
        default:
            break;
    }

    lex_bare(out);
    return true;
}

void LineLexer::lex_quoted(Token& out) {
    size_t start = pos_;
    pos_++;  // opening quote

    std::string value;
    while (pos_ < content_.size()) {
        char c = content_[pos_];
        if (c == '"') {
            pos_++;
            out = make(TokenType::T_QUOTED_STRING, std::move(value), start);
            return;
        }
        if (c == '\\') {
            if (pos_ + 1 >= content_.size()) {
                break;
            }
            char esc = content_[pos_ + 1];
            switch (esc) {
                case '\\': value += '\\'; break;
                case '"':  value += '"'; break;
                case 'n':  value += '\n'; break;
                case 't':  value += '\t'; break;
                case 'r':  value += '\r'; break;
                default:
                    error(std::string("Invalid escape sequence '\\") + esc + "'", pos_);
            }
            pos_ += 2;
            continue;
        }
        value += c;
        pos_++;
    }

    error("Unterminated quoted string at line " + std::to_string(line_no_), start);
}

void LineLexer::lex_bare(Token& out) {
    size_t start = pos_;

    while (pos_ < content_.size()) {
        char c = content_[pos_];
        if (c == ':' || c == ',' || c == '[' || c == ']' || c == '{' || c == '}' ||
            c == opts_.delimiter) {
            break;
        }
        if (c == '#' && opts_.allow_comments && at_token_boundary()) {
            break;
        }
        pos_++;
    }

    size_t end = pos_;
    while (end > start && (content_[end - 1] == ' ' || content_[end - 1] == '\t')) {
        end--;
    }

    std::string text(content_.substr(start, end - start));

    TokenType type = TokenType::T_IDENTIFIER;
    if (text == "true") {
        type = TokenType::T_TRUE;
    } else if (text == "false") {
        type = TokenType::T_FALSE;
    } else if (text == "null") {
        type = TokenType::T_NULL;
    } else {
        switch (classify_number(text)) {
            case NumberClass::INTEGER: type = TokenType::T_INTEGER; break;
            case NumberClass::FLOAT: type = TokenType::T_FLOAT; break;
            case NumberClass::NOT_A_NUMBER: break;
        }
    }

    out = make(type, std::move(text), start);
}

// [N], [*], [#N], with an optional trailing delimiter marker: [N|]
void LineLexer::lex_array_header() {
    size_t start = pos_;
    size_t close = content_.find(']', pos_);
    if (close == std::string_view::npos) {
        error("Unterminated array header", start);
    }

    std::string_view inner = content_.substr(pos_ + 1, close - pos_ - 1);
    size_t i = 0;

    pending_.push_back(make(TokenType::T_ARRAY_START, "[", start));

    if (i < inner.size() && inner[i] == '#') {
        i++;
    }

    if (i < inner.size() && inner[i] == '*') {
        pending_.push_back(make(TokenType::T_STAR, "*", start + 1 + i));
        i++;
    } else {
        size_t digits = i;
        while (i < inner.size() && inner[i] >= '0' && inner[i] <= '9') {
            i++;
        }
        if (i == digits) {
            error("Invalid array length '[" + std::string(inner) + "]'", start);
        }
        pending_.push_back(make(TokenType::T_INTEGER,
                                std::string(inner.substr(digits, i - digits)),
                                start + 1 + digits));
    }

    if (i < inner.size()) {
        char marker = inner[i];
        if ((marker != ',' && marker != '|' && marker != '\t') || i + 1 != inner.size()) {
            error("Invalid array length '[" + std::string(inner) + "]'", start);
        }
        TokenType type = marker == ',' ? TokenType::T_COMMA : TokenType::T_DELIMITER;
        pending_.push_back(make(type, std::string(1, marker), start + 1 + i));
    }

    pending_.push_back(make(TokenType::T_ARRAY_END, "]", close));
    pos_ = close + 1;
}

// StreamLexer implementation
StreamLexer::StreamLexer(LineSource& source, const LexOptions& opts)
    : source_(source), opts_(opts), lexer_(opts) {}

StreamLexer::StreamLexer(std::unique_ptr<LineSource> source, const LexOptions& opts)
    : owned_(std::move(source)), source_(*owned_), opts_(opts), lexer_(opts) {}

Token StreamLexer::structural(TokenType type, int level) const {
    Token t;
    t.type = type;
    t.line = line_no_;
    t.level = level;
    return t;
}

bool StreamLexer::load_line() {
    std::string_view raw;
    size_t no = 0;

    while (source_.next_line(raw, no)) {
        size_t i = 0;
        bool has_tab = false;
        while (i < raw.size() && (raw[i] == ' ' || raw[i] == '\t')) {
            if (raw[i] == '\t') has_tab = true;
            i++;
        }
        if (i == raw.size()) {
            continue;  // blank
        }

        int width = opts_.indent > 0 ? opts_.indent : 2;
        int level = static_cast<int>(i) / width;

        lexer_.reset(raw.substr(i), no, i, level, &source_.filepath());
        Token t;
        if (!lexer_.next(t) || t.type == TokenType::T_COMMENT) {
            continue;  // comment-only line
        }

        if (opts_.strict) {
            if (has_tab) {
                throw ParseError("Tab characters not allowed in indentation (strict mode)",
                                 no, 1, "", source_.filepath());
            }
            if (i % static_cast<size_t>(width) != 0) {
                throw ParseError("Indentation of " + std::to_string(i) +
                                 " spaces is not a multiple of " + std::to_string(width),
                                 no, 1, "", source_.filepath());
            }
        }

        line_no_ = no;
        first_ = std::move(t);
        has_first_ = true;
        line_active_ = true;

        if (level > current_level_) {
            pending_indents_ = level - current_level_;
        } else {
            pending_dedents_ = current_level_ - level;
        }
        current_level_ = level;
        return true;
    }
    return false;
}

Token StreamLexer::next() {
    while (true) {
        if (pending_indents_ > 0) {
            pending_indents_--;
            return structural(TokenType::T_INDENT, current_level_);
        }
        if (pending_dedents_ > 0) {
            pending_dedents_--;
            return structural(TokenType::T_DEDENT, current_level_);
        }
        if (has_first_) {
            has_first_ = false;
            return std::move(first_);
        }
        if (line_active_) {
            Token t;
            if (lexer_.next(t)) {
                if (t.type == TokenType::T_COMMENT) continue;
                return t;
            }
            line_active_ = false;
            return structural(TokenType::T_NEWLINE, current_level_);
        }
        if (finished_) {
            return structural(TokenType::T_EOF, 0);
        }
        if (!load_line()) {
            finished_ = true;
            pending_dedents_ = current_level_;
            current_level_ = 0;
        }
    }
}

std::vector<Token> Tokenizer::tokenize(LineSource& source) {
    StreamLexer lexer(source, opts_);
    std::vector<Token> tokens;
    while (true) {
        Token t = lexer.next();
        bool eof = t.type == TokenType::T_EOF;
        tokens.push_back(std::move(t));
        if (eof) break;
    }
    return tokens;
}

std::vector<Token> Tokenizer::tokenize(std::string_view text) {
    MemoryLineSource reader(text);
    return tokenize(reader);
}

Token VectorTokenSource::next() {
    if (pos_ < tokens_.size()) {
        if (tokens_[pos_].type == TokenType::T_EOF) {
            return tokens_[pos_];
        }
        return std::move(tokens_[pos_++]);
    }
    Token eof;
    eof.type = TokenType::T_EOF;
    return eof;
}

} // namespace toonpack
