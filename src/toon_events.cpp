#include "toon_events.hpp"
#include "toon_scalar.hpp"

namespace toonpack {

const char* event_type_name(EventType type) {
    switch (type) {
        case EventType::START_DOCUMENT: return "start_document";
        case EventType::END_DOCUMENT: return "end_document";
        case EventType::START_OBJECT: return "start_object";
        case EventType::END_OBJECT: return "end_object";
        case EventType::START_ARRAY: return "start_array";
        case EventType::END_ARRAY: return "end_array";
        case EventType::KEY: return "key";
        case EventType::VALUE: return "value";
    }
    return "unknown";
}

EventParser::EventParser(TokenSource& source, const ParseOptions& opts)
    : TokenGrammar(opts), source_(source) {}

EventParser::EventParser(std::unique_ptr<TokenSource> source, const ParseOptions& opts)
    : TokenGrammar(opts), owned_(std::move(source)), source_(*owned_) {}

const Token& EventParser::peek(size_t ahead) {
    while (lookahead_.size() <= ahead) {
        Token t = source_.next();
        if (t.is(TokenType::T_INDENT) || t.is(TokenType::T_DEDENT)) continue;
        lookahead_.push_back(std::move(t));
    }
    return lookahead_[ahead];
}

Token EventParser::take() {
    peek();
    Token t = std::move(lookahead_.front());
    lookahead_.pop_front();
    return t;
}

std::optional<Event> EventParser::next() {
    while (pending_.empty()) {
        if (done_) {
            return std::nullopt;
        }
        step();
    }
    Event e = std::move(pending_.front());
    pending_.pop_front();
    return e;
}

void EventParser::emit(EventType type, size_t line) {
    Event e;
    e.type = type;
    e.line = line;
    pending_.push_back(std::move(e));
}

void EventParser::emit_key(const std::string& key, size_t line) {
    Event e;
    e.type = EventType::KEY;
    e.key = key;
    e.line = line;
    pending_.push_back(std::move(e));
}

void EventParser::emit_value(NodePtr value, size_t line) {
    Event e;
    e.type = EventType::VALUE;
    e.value = std::move(value);
    e.line = line;
    pending_.push_back(std::move(e));
}

void EventParser::emit_start_array(ArrayLength length, size_t line) {
    Event e;
    e.type = EventType::START_ARRAY;
    e.length = length;
    e.line = line;
    pending_.push_back(std::move(e));
}

void EventParser::push_frame(Frame frame) {
    stack_.push_back(std::move(frame));
}

void EventParser::step() {
    if (!started_) {
        started_ = true;
        emit(EventType::START_DOCUMENT, 0);
        Frame doc;
        doc.kind = FrameKind::DOC;
        push_frame(std::move(doc));
        return;
    }
    if (stack_.empty()) {
        done_ = true;
        return;
    }

    // Frames may be pushed or popped below; `f` is not used afterwards
    Frame& f = stack_.back();
    switch (f.kind) {
        case FrameKind::DOC: step_document(f); break;
        case FrameKind::OBJECT: step_object(f); break;
        case FrameKind::LIST: step_list(f); break;
        case FrameKind::TABULAR: step_tabular(f); break;
        case FrameKind::INLINE: step_inline(f); break;
    }
}

void EventParser::step_document(Frame& f) {
    if (!f.started) {
        f.started = true;
        const Token& t = peek();
        size_t line = t.line;

        if (t.is(TokenType::T_EOF)) {
            emit(EventType::START_OBJECT, line);
            emit(EventType::END_OBJECT, line);
            return;
        }
        if (t.level != 0 && opts_.strict) {
            error("Unexpected indentation at document start", t);
        }

        int level = t.level;
        if (t.is(TokenType::T_ARRAY_START)) {
            begin_array(level + 1);
        } else if (t.is(TokenType::T_DASH)) {
            emit_start_array(ArrayLength::unknown(), line);
            Frame list;
            list.kind = FrameKind::LIST;
            list.level = level;
            push_frame(std::move(list));
        } else if (starts_field()) {
            emit(EventType::START_OBJECT, line);
            Frame obj;
            obj.kind = FrameKind::OBJECT;
            obj.level = level;
            push_frame(std::move(obj));
        } else {
            emit_line_value();
        }
        return;
    }

    const Token& rest = peek();
    if (!rest.is(TokenType::T_EOF)) {
        error(std::string("Unexpected ") + token_type_name(rest.type) + " at root", rest);
    }
    emit(EventType::END_DOCUMENT, rest.line);
    stack_.pop_back();
    done_ = true;
}

void EventParser::step_object(Frame& f) {
    int level = f.level;

    if (f.first_inline) {
        f.first_inline = false;
        begin_field(level);
        return;
    }

    const Token& t = peek();
    if (t.is(TokenType::T_EOF) || t.level < level) {
        size_t line = t.line;
        stack_.pop_back();
        emit(EventType::END_OBJECT, line);
        return;
    }
    if (t.level > level) {
        error("Unexpected indentation", t);
    }
    begin_field(level);
}

void EventParser::begin_field(int level) {
    Token key = take();
    if (!key.is_key_like()) {
        error(std::string("Expected key, got ") + token_type_name(key.type), key);
    }
    // Still on top: nothing has been pushed for this field yet
    repeated_key(stack_.back().seen, key);
    emit_key(key.text, key.line);

    const Token& t = peek();
    if (t.is(TokenType::T_ARRAY_START)) {
        begin_array(level + 1);
        return;
    }
    if (!t.is(TokenType::T_COLON)) {
        error("Expected ':' after key", t);
    }
    take();

    if (!peek().ends_line()) {
        emit_line_value();
        return;
    }
    if (peek().is(TokenType::T_NEWLINE)) {
        take();
    }

    const Token& next = peek();
    if (!next.is(TokenType::T_EOF) && next.level > level) {
        size_t line = next.line;
        Frame child;
        child.level = level + 1;
        if (next.is(TokenType::T_DASH)) {
            emit_start_array(ArrayLength::unknown(), line);
            child.kind = FrameKind::LIST;
        } else {
            emit(EventType::START_OBJECT, line);
            child.kind = FrameKind::OBJECT;
        }
        push_frame(std::move(child));
        return;
    }
    emit_value(Node::make_null(), key.line);
}

void EventParser::begin_array(int body_level) {
    ArrayHeader header = parse_array_header();

    Frame frame;
    frame.level = body_level;
    frame.declared = header.length;
    frame.header_line = header.line;
    frame.header_column = header.column;

    if (!peek().ends_line()) {
        if (header.tabular) {
            error("Tabular array header must be followed by rows", peek());
        }
        if (!header.length.is_known()) {
            error("Indefinite length [*] is only valid for block lists", peek());
        }
        frame.kind = FrameKind::INLINE;
    } else {
        if (peek().is(TokenType::T_NEWLINE)) {
            take();
        }
        if (header.tabular) {
            if (!header.length.is_known()) {
                throw ParseError("Indefinite length [*] is only valid for block lists",
                                 header.line, header.column, "[*]", current_file_);
            }
            frame.kind = FrameKind::TABULAR;
            frame.fields = std::move(header.fields);
        } else {
            frame.kind = FrameKind::LIST;
        }
    }

    emit_start_array(header.length, header.line);
    push_frame(std::move(frame));
}

void EventParser::begin_list_item(int dash_level) {
    const Token& t = peek();
    size_t line = t.line;

    if (t.ends_line()) {
        if (t.is(TokenType::T_NEWLINE)) {
            take();
        }
        const Token& next = peek();
        emit(EventType::START_OBJECT, line);
        if (!next.is(TokenType::T_EOF) && next.level > dash_level) {
            Frame obj;
            obj.kind = FrameKind::OBJECT;
            obj.level = dash_level + 1;
            push_frame(std::move(obj));
        } else {
            emit(EventType::END_OBJECT, line);
        }
        return;
    }

    if (t.is(TokenType::T_ARRAY_START)) {
        begin_array(dash_level + 1);
        return;
    }

    if (starts_field()) {
        emit(EventType::START_OBJECT, line);
        Frame obj;
        obj.kind = FrameKind::OBJECT;
        obj.level = dash_level + 1;
        obj.first_inline = true;
        push_frame(std::move(obj));
        return;
    }

    emit_line_value();
}

void EventParser::emit_line_value() {
    const Token& t = peek();
    size_t line = t.line;

    if (t.is(TokenType::T_BRACE_START)) {
        emit_node(parse_braced_object(), line);
    } else if (t.is_scalar()) {
        Token value = take();
        emit_value(scalar_from_token(value), line);
    } else {
        error(std::string("Expected value, got ") + token_type_name(t.type), t);
    }
    expect_line_end("value");
}

// Events for a small finished node (inline braced objects)
void EventParser::emit_node(const NodePtr& node, size_t line) {
    if (node->kind != NodeKind::N_OBJECT) {
        emit_value(node, line);
        return;
    }
    emit(EventType::START_OBJECT, line);
    for (const auto& kv : node->object_items) {
        emit_key(kv.first, line);
        emit_node(kv.second, line);
    }
    emit(EventType::END_OBJECT, line);
}

void EventParser::step_list(Frame& f) {
    if (f.closing) {
        close_step(f);
        return;
    }

    const Token& t = peek();
    if (t.is(TokenType::T_EOF) || t.level < f.level) {
        start_close(f);
        close_step(f);
        return;
    }
    if (t.level > f.level) {
        error("Unexpected indentation", t);
    }
    if (!t.is(TokenType::T_DASH)) {
        error("Expected list item '- '", t);
    }
    take();

    f.count++;
    int level = f.level;
    if (overflowed(f)) {
        skip_subtree(level);
        return;
    }
    begin_list_item(level);
}

void EventParser::step_inline(Frame& f) {
    if (f.closing) {
        close_step(f);
        return;
    }

    const Token& t = peek();
    if (t.ends_line()) {
        if (t.is(TokenType::T_NEWLINE)) {
            take();
        }
        start_close(f);
        close_step(f);
        return;
    }

    if (f.count > 0) {
        if (!is_separator(t)) {
            error("Expected " + delimiter_name(opts_.delimiter) + " between array values", t);
        }
        take();
    }

    const Token& v = peek();
    if (!v.is_scalar()) {
        error(std::string("Expected value, got ") + token_type_name(v.type), v);
    }
    Token value = take();

    f.count++;
    if (overflowed(f)) {
        return;
    }
    emit_value(scalar_from_token(value), value.line);
}

void EventParser::step_tabular(Frame& f) {
    if (f.closing) {
        close_step(f);
        return;
    }

    const size_t width = f.fields.size();

    if (!f.in_row) {
        const Token& t = peek();
        if (t.is(TokenType::T_EOF) || t.level < f.level) {
            start_close(f);
            close_step(f);
            return;
        }
        if (t.level > f.level) {
            error("Unexpected indentation", t);
        }
        size_t line = t.line;

        f.count++;
        if (overflowed(f)) {
            skip_line();
            return;
        }
        f.in_row = true;
        f.field_index = 0;
        f.row_values = 0;
        f.row_line = line;
        emit(EventType::START_OBJECT, line);
        return;
    }

    const Token& t = peek();
    if (t.ends_line()) {
        if (f.row_values != width) {
            std::string msg = row_width_message(width, f.row_values);
            if (opts_.strict) {
                validation_error(msg, f.row_line);
            }
            if (f.field_index < width) {
                // Pad one missing field per step
                if (f.field_index == f.row_values) {
                    add_warning("row_width", msg + " at line " + std::to_string(f.row_line));
                }
                emit_key(f.fields[f.field_index], f.row_line);
                emit_value(Node::make_null(), f.row_line);
                f.field_index++;
                return;
            }
            if (f.row_values > width) {
                add_warning("row_width", msg + " at line " + std::to_string(f.row_line));
            }
        }
        if (t.is(TokenType::T_NEWLINE)) {
            take();
        }
        f.in_row = false;
        emit(EventType::END_OBJECT, f.row_line);
        return;
    }

    if (f.row_values > 0) {
        if (!is_separator(t)) {
            error("Expected " + delimiter_name(opts_.delimiter) + " between row values", t);
        }
        take();
    }

    const Token& v = peek();
    if (!v.is_scalar()) {
        error(std::string("Expected value, got ") + token_type_name(v.type), v);
    }
    Token value = take();
    f.row_values++;

    if (f.field_index < width) {
        emit_key(f.fields[f.field_index], value.line);
        emit_value(scalar_from_token(value), value.line);
        f.field_index++;
        return;
    }

    if (opts_.strict) {
        size_t got = f.row_values;
        while (!peek().ends_line()) {
            if (take().is_scalar()) got++;
        }
        validation_error(row_width_message(width, got), f.row_line);
    }
    // Lenient: extra value dropped, reported at end of row
}

bool EventParser::overflowed(Frame& f) {
    if (!f.declared.is_known() || f.count <= f.declared.count) {
        return false;
    }
    if (opts_.strict) {
        validation_error("Array length mismatch: declared " + std::to_string(f.declared.count) +
                         ", got more than " + std::to_string(f.declared.count),
                         f.header_line, f.header_column);
    }
    return true;
}

void EventParser::start_close(Frame& f) {
    f.closing = true;
    if (!f.declared.is_known() || f.count == f.declared.count) {
        return;
    }

    std::string msg = length_mismatch_message(f.declared.count, f.count);
    if (opts_.strict) {
        validation_error(msg, f.header_line, f.header_column);
    }
    // Short arrays keep what is present; the header alone never creates elements
    add_warning("n_mismatch", msg + " at line " + std::to_string(f.header_line));
}

void EventParser::close_step(Frame& f) {
    size_t line = f.header_line;
    stack_.pop_back();
    emit(EventType::END_ARRAY, line);
}

void EventParser::skip_line() {
    while (!peek().ends_line()) {
        take();
    }
    if (peek().is(TokenType::T_NEWLINE)) {
        take();
    }
}

void EventParser::skip_subtree(int level) {
    skip_line();
    while (!peek().is(TokenType::T_EOF) && peek().level > level) {
        take();
    }
}

// ItemReader implementation
ItemReader::ItemReader(std::unique_ptr<EventParser> events, bool expand_paths)
    : events_(std::move(events)), expand_paths_(expand_paths) {}

Event ItemReader::pull() {
    auto e = events_->next();
    if (!e) {
        throw InternalError("Event stream ended inside an item");
    }
    return std::move(*e);
}

NodePtr ItemReader::next() {
    if (finished_) {
        return nullptr;
    }

    if (!started_) {
        started_ = true;
        Event doc = pull();
        if (doc.type != EventType::START_DOCUMENT) {
            throw InternalError(std::string("Expected start_document, got ") +
                                event_type_name(doc.type));
        }
        Event root = pull();
        if (root.type == EventType::START_ARRAY) {
            in_array_ = true;
            root_length_ = root.length;
        } else {
            NodePtr item = build(std::move(root));
            pull();  // END_DOCUMENT
            finished_ = true;
            return expand_paths_ ? expand_dotted_keys(item) : item;
        }
    }

    Event e = pull();
    if (e.type == EventType::END_ARRAY) {
        pull();  // END_DOCUMENT
        finished_ = true;
        return nullptr;
    }
    NodePtr item = build(std::move(e));
    return expand_paths_ ? expand_dotted_keys(item) : item;
}

NodePtr ItemReader::build(Event first) {
    switch (first.type) {
        case EventType::VALUE:
            return first.value;
        case EventType::START_OBJECT: {
            NodePtr obj = Node::make_object();
            while (true) {
                Event e = pull();
                if (e.type == EventType::END_OBJECT) break;
                if (e.type != EventType::KEY) {
                    throw InternalError(std::string("Expected key event, got ") +
                                        event_type_name(e.type));
                }
                NodePtr value = build(pull());
                obj->set(e.key, std::move(value));
            }
            return obj;
        }
        case EventType::START_ARRAY: {
            NodePtr arr = Node::make_array();
            while (true) {
                Event e = pull();
                if (e.type == EventType::END_ARRAY) break;
                arr->array_items.push_back(build(std::move(e)));
            }
            return arr;
        }
        default:
            throw InternalError(std::string("Unexpected ") + event_type_name(first.type) +
                                " event inside an item");
    }
}

std::unique_ptr<EventParser> make_event_parser(LineSource& source, const ParseOptions& opts) {
    auto lexer = std::make_unique<StreamLexer>(source, opts.lex_options());
    auto parser = std::make_unique<EventParser>(std::move(lexer), opts);
    parser->set_filepath(source.filepath());
    return parser;
}

} // namespace toonpack
