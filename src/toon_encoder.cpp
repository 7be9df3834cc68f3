#include "toon_encoder.hpp"
#include "toon_errors.hpp"
#include "toon_parallel.hpp"
#include "toon_scalar.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace toonpack {

namespace {

std::vector<std::string> object_keys(const NodePtr& obj, bool sort_keys) {
    std::vector<std::string> keys;
    keys.reserve(obj->object_items.size());
    for (const auto& kv : obj->object_items) {
        keys.push_back(kv.first);
    }
    if (sort_keys) {
        std::sort(keys.begin(), keys.end());
    }
    return keys;
}

std::string child_path(const std::string& path, const std::string& key) {
    return path + "." + key;
}

std::string index_path(const std::string& path, size_t i) {
    return path + "[" + std::to_string(i) + "]";
}

} // namespace

ArrayForm classify_array(const std::vector<NodePtr>& items, bool sort_keys,
                         std::vector<std::string>& fields) {
    fields.clear();

    bool all_primitive = true;
    for (const auto& item : items) {
        if (!item->is_primitive() || item->kind == NodeKind::N_NULL) {
            all_primitive = false;
            break;
        }
    }
    if (all_primitive) {
        return ArrayForm::INLINE;
    }

    if (items.front()->kind != NodeKind::N_OBJECT || items.front()->object_items.empty()) {
        return ArrayForm::BLOCK;
    }

    std::vector<std::string> header = object_keys(items.front(), sort_keys);
    for (const auto& item : items) {
        if (item->kind != NodeKind::N_OBJECT ||
            item->object_items.size() != header.size()) {
            return ArrayForm::BLOCK;
        }
        for (const auto& kv : item->object_items) {
            if (!kv.second->is_primitive()) {
                return ArrayForm::BLOCK;
            }
        }
        if (object_keys(item, sort_keys) != header) {
            return ArrayForm::BLOCK;
        }
    }

    fields = std::move(header);
    return ArrayForm::TABULAR;
}

bool contains_stream(const NodePtr& node) {
    switch (node->kind) {
        case NodeKind::N_STREAM:
            return true;
        case NodeKind::N_ARRAY:
            for (const auto& item : node->array_items) {
                if (contains_stream(item)) return true;
            }
            return false;
        case NodeKind::N_OBJECT:
            for (const auto& kv : node->object_items) {
                if (contains_stream(kv.second)) return true;
            }
            return false;
        default:
            return false;
    }
}

Encoder::Encoder(const EncodeOptions& opts) : opts_(opts) {
    if (opts_.indent < 1) {
        throw std::invalid_argument("indent must be at least 1, got " +
                                    std::to_string(opts_.indent));
    }
}

std::string Encoder::encode(const NodePtr& value) {
    buf_.clear();
    at_start_ = true;
    encode_root(value);
    return buf_.take();
}

void Encoder::encode_file(const NodePtr& value, const std::string& filepath) {
    buf_.clear();
    at_start_ = true;
    encode_root(value);
    if (!buf_.write_to_file(filepath)) {
        buf_.clear();
        throw IoError("Cannot write file: " + filepath, filepath);
    }
    buf_.clear();
}

void Encoder::encode_root(const NodePtr& value) {
    switch (value->kind) {
        case NodeKind::N_OBJECT:
            // The empty document decodes to {}
            write_fields(entries(value), 0, "$");
            break;
        case NodeKind::N_ARRAY:
            begin_line(0);
            write_array(value->array_items, 0, "$");
            break;
        case NodeKind::N_STREAM:
            unsupported(value, "$");
        default:
            begin_line(0);
            write_scalar(value, "$");
            break;
    }
}

void Encoder::begin_line(int depth) {
    if (!at_start_) {
        buf_.append_char('\n');
    }
    at_start_ = false;
    buf_.append_spaces(static_cast<size_t>(depth) * static_cast<size_t>(opts_.indent));
}

void Encoder::unsupported(const NodePtr& value, const std::string& path) const {
    if (value->kind == NodeKind::N_STREAM) {
        throw EncodeError("Unbounded sequence requires the streaming encoder", path);
    }
    throw EncodeError(std::string("Unsupported value of kind ") + node_kind_name(value->kind),
                      path);
}

std::vector<Encoder::Entry> Encoder::entries(const NodePtr& obj) const {
    std::vector<Entry> out(obj->object_items.begin(), obj->object_items.end());
    if (opts_.sort_keys) {
        std::stable_sort(out.begin(), out.end(),
                         [](const Entry& a, const Entry& b) { return a.first < b.first; });
    }
    if (!opts_.key_folding) {
        return out;
    }

    for (auto& entry : out) {
        if (!is_identifier_key(entry.first)) continue;

        std::string folded = entry.first;
        NodePtr value = entry.second;
        while (value->kind == NodeKind::N_OBJECT && value->object_items.size() == 1 &&
               is_identifier_key(value->object_items.front().first)) {
            folded += '.';
            folded += value->object_items.front().first;
            value = value->object_items.front().second;
        }

        // A sibling already named like the folded key keeps the nested form
        if (folded != entry.first && !obj->get(folded)) {
            entry.first = std::move(folded);
            entry.second = std::move(value);
        }
    }
    return out;
}

void Encoder::write_fields(const std::vector<Entry>& fields, int depth, const std::string& path) {
    for (const auto& field : fields) {
        write_field(field, depth, path);
    }
}

void Encoder::write_field(const Entry& field, int depth, const std::string& path) {
    begin_line(depth);
    write_field_body(field, depth, path);
}

void Encoder::write_field_body(const Entry& field, int depth, const std::string& path) {
    const NodePtr& value = field.second;
    std::string field_path = child_path(path, field.first);

    write_key(field.first);
    switch (value->kind) {
        case NodeKind::N_ARRAY:
            write_array(value->array_items, depth, field_path);
            break;
        case NodeKind::N_OBJECT:
            if (value->object_items.empty()) {
                buf_.append_char(':');
                write_value_separator();
                buf_.append("{}");
            } else {
                buf_.append_char(':');
                write_fields(entries(value), depth + 1, field_path);
            }
            break;
        case NodeKind::N_STREAM:
            unsupported(value, field_path);
        default:
            buf_.append_char(':');
            write_value_separator();
            write_scalar(value, field_path);
            break;
    }
}

void Encoder::write_key(const std::string& key) {
    if (needs_quoting(key, opts_.delimiter)) {
        buf_.append_escaped_string(key);
    } else {
        buf_.append(key);
    }
}

void Encoder::write_value_separator() {
    if (!opts_.compact) {
        buf_.append_char(' ');
    }
}

void Encoder::write_header(ArrayLength length, const std::vector<std::string>* fields) {
    buf_.append_char('[');
    if (opts_.length_marker) {
        buf_.append_char('#');
    }
    if (length.is_known()) {
        buf_.append(format_integer(static_cast<int64_t>(length.count)));
    } else {
        buf_.append_char('*');
    }
    if (opts_.delimiter != ',') {
        buf_.append_char(opts_.delimiter);
    }
    buf_.append_char(']');

    if (fields) {
        buf_.append_char('{');
        for (size_t i = 0; i < fields->size(); i++) {
            if (i > 0) buf_.append_char(opts_.delimiter);
            write_key((*fields)[i]);
        }
        buf_.append_char('}');
    }
    buf_.append_char(':');
}

// Header goes on the current line; the body sits at depth + 1
void Encoder::write_array(const std::vector<NodePtr>& items, int depth, const std::string& path) {
    std::vector<std::string> fields;
    ArrayForm form = classify_array(items, opts_.sort_keys, fields);
    ArrayLength length = ArrayLength::known(items.size());

    switch (form) {
        case ArrayForm::INLINE: {
            write_header(length, nullptr);
            if (items.empty()) {
                return;
            }
            write_value_separator();
            for (size_t i = 0; i < items.size(); i++) {
                if (i > 0) buf_.append_char(opts_.delimiter);
                write_scalar(items[i], index_path(path, i));
            }
            break;
        }
        case ArrayForm::TABULAR:
            write_header(length, &fields);
            write_tabular_rows(items, fields, depth + 1, path);
            break;
        case ArrayForm::BLOCK:
            write_header(length, nullptr);
            for (size_t i = 0; i < items.size(); i++) {
                write_list_item(items[i], depth + 1, index_path(path, i));
            }
            break;
    }
}

void Encoder::write_tabular_rows(const std::vector<NodePtr>& items,
                                 const std::vector<std::string>& fields,
                                 int depth, const std::string& path) {
    const size_t n = items.size();

    if (opts_.workers > 1 && n >= opts_.parallelism_threshold) {
        // Rows are independent once the header is fixed
        std::vector<std::string> rows(n);
        parallel_for_ranges(n, opts_.workers, [&](size_t begin, size_t end) {
            for (size_t i = begin; i < end; i++) {
                format_row(rows[i], items[i], fields, index_path(path, i));
            }
        });
        for (const auto& row : rows) {
            begin_line(depth);
            buf_.append(row);
        }
        return;
    }

    std::string row;
    for (size_t i = 0; i < n; i++) {
        row.clear();
        format_row(row, items[i], fields, index_path(path, i));
        begin_line(depth);
        buf_.append(row);
    }
}

void Encoder::format_row(std::string& out, const NodePtr& row,
                         const std::vector<std::string>& fields,
                         const std::string& row_path) const {
    for (size_t j = 0; j < fields.size(); j++) {
        if (j > 0) out += opts_.delimiter;
        const NodePtr& value = opts_.sort_keys ? row->get(fields[j]) : row->object_items[j].second;
        if (!append_scalar(out, value)) {
            throw EncodeError("Non-finite number not allowed in strict mode",
                              child_path(row_path, fields[j]));
        }
    }
}

void Encoder::write_list_item(const NodePtr& item, int depth, const std::string& path) {
    begin_line(depth);
    buf_.append_char('-');

    switch (item->kind) {
        case NodeKind::N_OBJECT: {
            if (item->object_items.empty()) {
                return;
            }
            buf_.append_char(' ');
            std::vector<Entry> fields = entries(item);
            // First field shares the dash line at the item's content level
            write_field_body(fields.front(), depth + 1, path);
            for (size_t i = 1; i < fields.size(); i++) {
                write_field(fields[i], depth + 1, path);
            }
            break;
        }
        case NodeKind::N_ARRAY:
            buf_.append_char(' ');
            write_array(item->array_items, depth, path);
            break;
        case NodeKind::N_STREAM:
            unsupported(item, path);
        default:
            buf_.append_char(' ');
            write_scalar(item, path);
            break;
    }
}

void Encoder::write_scalar(const NodePtr& value, const std::string& path) {
    std::string text;
    if (!append_scalar(text, value)) {
        throw EncodeError("Non-finite number not allowed in strict mode", path);
    }
    buf_.append(text);
}

bool Encoder::append_scalar(std::string& out, const NodePtr& value) const {
    switch (value->kind) {
        case NodeKind::N_NULL:
            out += "null";
            return true;
        case NodeKind::N_BOOL:
            out += value->bool_val ? "true" : "false";
            return true;
        case NodeKind::N_INT:
            out += format_integer(value->int_val);
            return true;
        case NodeKind::N_DOUBLE:
            if (!std::isfinite(value->double_val)) {
                if (opts_.strict) {
                    return false;
                }
                out += "null";
                return true;
            }
            out += format_double(value->double_val);
            return true;
        case NodeKind::N_STRING:
            if (needs_quoting(value->string_val, opts_.delimiter)) {
                out += '"';
                append_escaped(out, value->string_val);
                out += '"';
            } else {
                out += value->string_val;
            }
            return true;
        default:
            // Containers never reach here; callers check the kind first
            throw InternalError(std::string("Scalar expected, got ") +
                                node_kind_name(value->kind));
    }
}

} // namespace toonpack
