#ifndef TOON_VALUE_HPP
#define TOON_VALUE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <utility>

namespace toonpack {

// Forward declarations
struct Node;
using NodePtr = std::shared_ptr<Node>;

// Node kinds
enum class NodeKind {
    N_NULL,
    N_BOOL,
    N_INT,
    N_DOUBLE,
    N_STRING,
    N_ARRAY,
    N_OBJECT,
    N_STREAM
};

const char* node_kind_name(NodeKind kind);

// Declared length of an array: [N] or [*]
struct ArrayLength {
    enum class Kind { Known, Unknown };

    Kind kind = Kind::Known;
    size_t count = 0;

    static ArrayLength known(size_t n) { return ArrayLength{Kind::Known, n}; }
    static ArrayLength unknown() { return ArrayLength{Kind::Unknown, 0}; }

    bool is_known() const { return kind == Kind::Known; }

    bool operator==(const ArrayLength& other) const {
        return kind == other.kind && (kind == Kind::Unknown || count == other.count);
    }
    bool operator!=(const ArrayLength& other) const { return !(*this == other); }
};

// Pull source for an open-ended sequence; returns nullptr when exhausted
using StreamSource = std::function<NodePtr()>;

// DOM node for a TOON value
struct Node {
    NodeKind kind = NodeKind::N_NULL;

    // Value storage
    bool bool_val = false;
    int64_t int_val = 0;
    double double_val = 0.0;
    std::string string_val;

    // Children for array/object
    std::vector<NodePtr> array_items;
    std::vector<std::pair<std::string, NodePtr>> object_items;

    // Stream payload (N_STREAM only)
    StreamSource stream_source;
    ArrayLength stream_length = ArrayLength::unknown();

    bool is_primitive() const {
        return kind != NodeKind::N_ARRAY && kind != NodeKind::N_OBJECT &&
               kind != NodeKind::N_STREAM;
    }

    // Object lookup; nullptr when missing
    NodePtr get(std::string_view key) const;

    // Replace the value of an existing key or append a new one
    void set(const std::string& key, NodePtr value);

    // Factory methods
    static NodePtr make_null();
    static NodePtr make_bool(bool v);
    static NodePtr make_int(int64_t v);
    static NodePtr make_double(double v);
    static NodePtr make_string(const std::string& v);
    static NodePtr make_string(std::string_view v);
    static NodePtr make_string(const char* v);
    static NodePtr make_array();
    static NodePtr make_array(std::initializer_list<NodePtr> items);
    static NodePtr make_object();
    static NodePtr make_object(std::initializer_list<std::pair<std::string, NodePtr>> items);
    static NodePtr make_stream(StreamSource source,
                               ArrayLength length = ArrayLength::unknown());
};

// Stream over an already materialized vector
NodePtr make_vector_stream(std::vector<NodePtr> items, bool declare_length);

// Structural equality; int and double never compare equal, streams never do
bool node_equal(const NodePtr& a, const NodePtr& b);

// Deep copy of a finite tree
NodePtr node_clone(const NodePtr& node);

// Rewrite dotted keys (a.b.c) into nested objects, recursively
NodePtr expand_dotted_keys(const NodePtr& node);

// True for keys matching [A-Za-z_][A-Za-z0-9_]*
bool is_identifier_key(std::string_view key);

} // namespace toonpack

#endif // TOON_VALUE_HPP
