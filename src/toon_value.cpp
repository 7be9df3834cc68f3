#include "toon_value.hpp"
#include <cctype>
#include <cmath>

namespace toonpack {

const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::N_NULL: return "null";
        case NodeKind::N_BOOL: return "bool";
        case NodeKind::N_INT: return "int";
        case NodeKind::N_DOUBLE: return "double";
        case NodeKind::N_STRING: return "string";
        case NodeKind::N_ARRAY: return "array";
        case NodeKind::N_OBJECT: return "object";
        case NodeKind::N_STREAM: return "stream";
    }
    return "unknown";
}

NodePtr Node::get(std::string_view key) const {
    for (const auto& kv : object_items) {
        if (kv.first == key) return kv.second;
    }
    return nullptr;
}

void Node::set(const std::string& key, NodePtr value) {
    for (auto& kv : object_items) {
        if (kv.first == key) {
            kv.second = std::move(value);
            return;
        }
    }
    object_items.emplace_back(key, std::move(value));
}

namespace {

NodePtr node_of(NodeKind kind) {
    auto n = std::make_shared<Node>();
    n->kind = kind;
    return n;
}

} // namespace

NodePtr Node::make_null() { return node_of(NodeKind::N_NULL); }

NodePtr Node::make_bool(bool v) {
    NodePtr n = node_of(NodeKind::N_BOOL);
    n->bool_val = v;
    return n;
}

NodePtr Node::make_int(int64_t v) {
    NodePtr n = node_of(NodeKind::N_INT);
    n->int_val = v;
    return n;
}

NodePtr Node::make_double(double v) {
    NodePtr n = node_of(NodeKind::N_DOUBLE);
    n->double_val = v;
    return n;
}

NodePtr Node::make_string(const std::string& v) { return make_string(std::string_view(v)); }

NodePtr Node::make_string(const char* v) { return make_string(std::string_view(v)); }

NodePtr Node::make_string(std::string_view v) {
    NodePtr n = node_of(NodeKind::N_STRING);
    n->string_val.assign(v.data(), v.size());
    return n;
}

NodePtr Node::make_array() { return node_of(NodeKind::N_ARRAY); }

NodePtr Node::make_array(std::initializer_list<NodePtr> items) {
    NodePtr n = make_array();
    n->array_items.assign(items.begin(), items.end());
    return n;
}

NodePtr Node::make_object() { return node_of(NodeKind::N_OBJECT); }

// Later duplicates replace earlier values in place
NodePtr Node::make_object(std::initializer_list<std::pair<std::string, NodePtr>> items) {
    NodePtr n = make_object();
    for (const auto& field : items) {
        n->set(field.first, field.second);
    }
    return n;
}

NodePtr Node::make_stream(StreamSource source, ArrayLength length) {
    NodePtr n = node_of(NodeKind::N_STREAM);
    n->stream_source = std::move(source);
    n->stream_length = length;
    return n;
}

NodePtr make_vector_stream(std::vector<NodePtr> items, bool declare_length) {
    auto shared = std::make_shared<std::vector<NodePtr>>(std::move(items));
    auto pos = std::make_shared<size_t>(0);
    ArrayLength length = declare_length ? ArrayLength::known(shared->size())
                                        : ArrayLength::unknown();
    return Node::make_stream([shared, pos]() -> NodePtr {
        if (*pos >= shared->size()) return nullptr;
        return (*shared)[(*pos)++];
    }, length);
}

bool node_equal(const NodePtr& a, const NodePtr& b) {
    if (a == b) return a == nullptr || a->kind != NodeKind::N_STREAM;
    if (!a || !b) return false;
    if (a->kind != b->kind) return false;

    switch (a->kind) {
        case NodeKind::N_NULL:
            return true;
        case NodeKind::N_BOOL:
            return a->bool_val == b->bool_val;
        case NodeKind::N_INT:
            return a->int_val == b->int_val;
        case NodeKind::N_DOUBLE:
            if (std::isnan(a->double_val) && std::isnan(b->double_val)) return true;
            return a->double_val == b->double_val;
        case NodeKind::N_STRING:
            return a->string_val == b->string_val;
        case NodeKind::N_ARRAY:
            if (a->array_items.size() != b->array_items.size()) return false;
            for (size_t i = 0; i < a->array_items.size(); i++) {
                if (!node_equal(a->array_items[i], b->array_items[i])) return false;
            }
            return true;
        case NodeKind::N_OBJECT:
            if (a->object_items.size() != b->object_items.size()) return false;
            for (size_t i = 0; i < a->object_items.size(); i++) {
                if (a->object_items[i].first != b->object_items[i].first) return false;
                if (!node_equal(a->object_items[i].second, b->object_items[i].second)) {
                    return false;
                }
            }
            return true;
        case NodeKind::N_STREAM:
            return false;
    }
    return false;
}

NodePtr node_clone(const NodePtr& node) {
    if (!node) return nullptr;
    auto copy = std::make_shared<Node>(*node);
    for (auto& item : copy->array_items) {
        item = node_clone(item);
    }
    for (auto& kv : copy->object_items) {
        kv.second = node_clone(kv.second);
    }
    return copy;
}

bool is_identifier_key(std::string_view key) {
    if (key.empty()) return false;
    unsigned char first = static_cast<unsigned char>(key[0]);
    if (!std::isalpha(first) && first != '_') return false;
    for (char c : key) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && u != '_') return false;
    }
    return true;
}

namespace {

// Split "a.b.c" when every segment is an identifier
bool split_dotted(const std::string& key, std::vector<std::string>& segments) {
    segments.clear();
    if (key.find('.') == std::string::npos) return false;

    size_t start = 0;
    while (true) {
        size_t dot = key.find('.', start);
        std::string seg = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!is_identifier_key(seg)) return false;
        segments.push_back(std::move(seg));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return segments.size() > 1;
}

void merge_into(const NodePtr& target, const std::string& key, const NodePtr& value) {
    NodePtr existing = target->get(key);
    if (existing && existing->kind == NodeKind::N_OBJECT && value->kind == NodeKind::N_OBJECT) {
        for (const auto& kv : value->object_items) {
            merge_into(existing, kv.first, kv.second);
        }
        return;
    }
    target->set(key, value);
}

} // namespace

NodePtr expand_dotted_keys(const NodePtr& node) {
    if (!node) return node;

    if (node->kind == NodeKind::N_ARRAY) {
        auto out = Node::make_array();
        out->array_items.reserve(node->array_items.size());
        for (const auto& item : node->array_items) {
            out->array_items.push_back(expand_dotted_keys(item));
        }
        return out;
    }

    if (node->kind != NodeKind::N_OBJECT) return node;

    auto out = Node::make_object();
    std::vector<std::string> segments;
    for (const auto& kv : node->object_items) {
        NodePtr value = expand_dotted_keys(kv.second);
        if (!split_dotted(kv.first, segments)) {
            merge_into(out, kv.first, value);
            continue;
        }
        // Build the chain from the innermost segment outwards
        NodePtr nested = value;
        for (size_t i = segments.size() - 1; i > 0; i--) {
            auto wrapper = Node::make_object();
            wrapper->object_items.emplace_back(segments[i], nested);
            nested = wrapper;
        }
        merge_into(out, segments[0], nested);
    }
    return out;
}

} // namespace toonpack
