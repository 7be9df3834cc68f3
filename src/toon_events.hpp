#ifndef TOON_EVENTS_HPP
#define TOON_EVENTS_HPP

#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <optional>
#include <unordered_set>
#include "toon_errors.hpp"
#include "toon_grammar.hpp"
#include "toon_io.hpp"
#include "toon_lexer.hpp"
#include "toon_value.hpp"

namespace toonpack {

enum class EventType {
    START_DOCUMENT,
    END_DOCUMENT,
    START_OBJECT,
    END_OBJECT,
    START_ARRAY,
    END_ARRAY,
    KEY,
    VALUE
};

const char* event_type_name(EventType type);

struct Event {
    EventType type = EventType::START_DOCUMENT;
    std::string key;                                // KEY
    NodePtr value;                                  // VALUE (always a scalar)
    ArrayLength length = ArrayLength::unknown();    // START_ARRAY
    size_t line = 0;
};

// Pull-based event decoder.  Holds the stack of open containers, a short
// token lookahead and nothing else, so it works on input of any length.
class EventParser : public TokenGrammar {
public:
    EventParser(TokenSource& source, const ParseOptions& opts = ParseOptions());
    EventParser(std::unique_ptr<TokenSource> source, const ParseOptions& opts = ParseOptions());

    // Next event; std::nullopt after END_DOCUMENT
    std::optional<Event> next();

    // File name reported in errors
    void set_filepath(const std::string& filepath) { current_file_ = filepath; }

    // Depth of open containers (0 outside any container)
    size_t depth() const { return stack_.empty() ? 0 : stack_.size() - 1; }

protected:
    const Token& peek(size_t ahead = 0) override;
    Token take() override;

private:
    enum class FrameKind { DOC, OBJECT, LIST, TABULAR, INLINE };

    struct Frame {
        FrameKind kind = FrameKind::DOC;
        int level = 0;
        bool started = false;         // DOC: root classified
        bool first_inline = false;    // OBJECT: first field sits on the dash line
        ArrayLength declared = ArrayLength::unknown();
        size_t count = 0;             // items or rows seen, discarded ones included
        size_t header_line = 0;
        size_t header_column = 0;
        bool closing = false;
        // OBJECT
        std::unordered_set<std::string> seen;
        // TABULAR
        std::vector<std::string> fields;
        bool in_row = false;
        size_t field_index = 0;
        size_t row_values = 0;
        size_t row_line = 0;
    };

    void step();
    void step_document(Frame& f);
    void step_object(Frame& f);
    void step_list(Frame& f);
    void step_tabular(Frame& f);
    void step_inline(Frame& f);

    void begin_field(int level);
    void begin_list_item(int dash_level);
    void begin_array(int body_level);
    void emit_line_value();
    void emit_node(const NodePtr& node, size_t line);

    bool overflowed(Frame& f);
    void start_close(Frame& f);
    void close_step(Frame& f);
    void skip_line();
    void skip_subtree(int level);

    void emit(EventType type, size_t line);
    void emit_key(const std::string& key, size_t line);
    void emit_value(NodePtr value, size_t line);
    void emit_start_array(ArrayLength length, size_t line);
    void push_frame(Frame frame);

    std::unique_ptr<TokenSource> owned_;
    TokenSource& source_;
    std::deque<Token> lookahead_;
    std::deque<Event> pending_;
    std::vector<Frame> stack_;
    bool started_ = false;
    bool done_ = false;
};

// Reconstructs whole items from the event stream: the elements of a root
// array one at a time, or the root object/primitive as a single item.
class ItemReader {
public:
    explicit ItemReader(std::unique_ptr<EventParser> events, bool expand_paths = false);

    // Next item; nullptr once the document is exhausted
    NodePtr next();

    const std::vector<Warning>& warnings() const { return events_->warnings(); }

    // Root array header; unknown for [*] and for root objects/primitives
    ArrayLength root_length() const { return root_length_; }

private:
    Event pull();
    NodePtr build(Event first);

    std::unique_ptr<EventParser> events_;
    bool expand_paths_ = false;
    bool started_ = false;
    bool in_array_ = false;
    bool finished_ = false;
    ArrayLength root_length_ = ArrayLength::unknown();
};

// Event decoder reading lines lazily from `source` (which must outlive it)
std::unique_ptr<EventParser> make_event_parser(LineSource& source,
                                               const ParseOptions& opts = ParseOptions());

} // namespace toonpack

#endif // TOON_EVENTS_HPP
