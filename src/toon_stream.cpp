#include "toon_stream.hpp"
#include <fstream>

namespace toonpack {

namespace {

std::string index_path(const std::string& path, size_t i) {
    return path + "[" + std::to_string(i) + "]";
}

} // namespace

StreamEncoder::StreamEncoder(NodePtr root, const EncodeOptions& opts)
    : enc_(opts), root_(std::move(root)) {}

std::optional<std::string> StreamEncoder::next() {
    while (!done_) {
        if (!started_) {
            started_ = true;
            start();
        } else if (stack_.empty()) {
            done_ = true;
        } else {
            step();
        }
        if (!enc_.buf_.empty()) {
            return enc_.buf_.take();
        }
    }
    return std::nullopt;
}

void StreamEncoder::start() {
    enc_.buf_.clear();
    enc_.at_start_ = true;

    if (!contains_stream(root_)) {
        enc_.encode_root(root_);
        return;
    }

    if (root_->kind == NodeKind::N_OBJECT) {
        push_container(root_, 0, "$", false);
    } else {
        enc_.begin_line(0);
        push_container(root_, 1, "$", false);
    }
}

// `value` holds a stream; its key or dash is already written.  Arrays and
// streams get their header here, list items or fields go at `depth`.
void StreamEncoder::push_container(const NodePtr& value, int depth, const std::string& path,
                                   bool first_inline) {
    Frame frame;
    frame.node = value;
    frame.depth = depth;
    frame.path = path;

    switch (value->kind) {
        case NodeKind::N_OBJECT:
            frame.kind = FrameKind::OBJECT;
            frame.fields = enc_.entries(value);
            frame.first_inline = first_inline;
            break;
        case NodeKind::N_ARRAY:
            // Holds a stream, so never inline or tabular
            enc_.write_header(ArrayLength::known(value->array_items.size()), nullptr);
            frame.kind = FrameKind::ARRAY;
            break;
        case NodeKind::N_STREAM:
            enc_.write_header(value->stream_length, nullptr);
            frame.kind = FrameKind::STREAM;
            break;
        default:
            throw InternalError(std::string("Container expected, got ") +
                                node_kind_name(value->kind));
    }
    stack_.push_back(std::move(frame));
}

void StreamEncoder::step() {
    // `f` is not touched after a push
    Frame& f = stack_.back();
    switch (f.kind) {
        case FrameKind::OBJECT: step_object(f); break;
        case FrameKind::ARRAY: step_array(f); break;
        case FrameKind::STREAM: step_stream(f); break;
    }
}

void StreamEncoder::step_object(Frame& f) {
    if (f.index == f.fields.size()) {
        stack_.pop_back();
        return;
    }

    Encoder::Entry field = f.fields[f.index++];
    bool on_dash_line = f.first_inline;
    f.first_inline = false;
    int depth = f.depth;
    std::string path = f.path;

    if (!on_dash_line) {
        enc_.begin_line(depth);
    }
    open_field(field, depth, path);
}

void StreamEncoder::step_array(Frame& f) {
    const auto& items = f.node->array_items;
    if (f.index == items.size()) {
        stack_.pop_back();
        return;
    }

    size_t i = f.index++;
    NodePtr item = items[i];
    int depth = f.depth;
    std::string path = index_path(f.path, i);
    open_item(item, depth, path);
}

void StreamEncoder::step_stream(Frame& f) {
    const ArrayLength declared = f.node->stream_length;
    NodePtr item = f.node->stream_source ? f.node->stream_source() : nullptr;

    if (!item) {
        if (declared.is_known() && f.count != declared.count && enc_.opts_.strict) {
            throw EncodeError("Stream length mismatch: declared " +
                              std::to_string(declared.count) + ", got " +
                              std::to_string(f.count), f.path);
        }
        stack_.pop_back();
        return;
    }

    items_pulled_++;
    size_t i = f.count++;
    if (declared.is_known() && f.count > declared.count && enc_.opts_.strict) {
        throw EncodeError("Stream length mismatch: declared " +
                          std::to_string(declared.count) + ", got more than " +
                          std::to_string(declared.count), f.path);
    }

    int depth = f.depth;
    std::string path = index_path(f.path, i);
    open_item(item, depth, path);
}

void StreamEncoder::open_field(const Encoder::Entry& field, int depth, const std::string& path) {
    const NodePtr& value = field.second;
    if (!contains_stream(value)) {
        enc_.write_field_body(field, depth, path);
        return;
    }

    enc_.write_key(field.first);
    if (value->kind == NodeKind::N_OBJECT) {
        enc_.buf_.append_char(':');
    }
    push_container(value, depth + 1, path + "." + field.first, false);
}

void StreamEncoder::open_item(const NodePtr& item, int depth, const std::string& path) {
    if (!contains_stream(item)) {
        enc_.write_list_item(item, depth, path);
        return;
    }

    enc_.begin_line(depth);
    enc_.buf_.append("- ");
    push_container(item, depth + 1, path, item->kind == NodeKind::N_OBJECT);
}

void StreamEncoder::write_to(std::ostream& out) {
    while (auto chunk = next()) {
        out.write(chunk->data(), static_cast<std::streamsize>(chunk->size()));
        if (!out) {
            throw IoError("Failed to write encoded output");
        }
    }
    out.flush();
    if (!out) {
        throw IoError("Failed to write encoded output");
    }
}

void StreamEncoder::write_file(const std::string& filepath) {
    std::ofstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Cannot open file for writing: " + filepath, filepath);
    }
    try {
        write_to(file);
    } catch (const IoError&) {
        throw IoError("Failed to write file: " + filepath, filepath);
    }
}

} // namespace toonpack
