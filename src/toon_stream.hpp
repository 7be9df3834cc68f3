#ifndef TOON_STREAM_HPP
#define TOON_STREAM_HPP

#include <string>
#include <vector>
#include <optional>
#include <ostream>
#include <cstddef>
#include "toon_encoder.hpp"
#include "toon_errors.hpp"
#include "toon_value.hpp"

namespace toonpack {

// Incremental encoder.  Finite subtrees are encoded whole; N_STREAM nodes
// become block lists whose items are pulled one at a time, so a consumer
// that stops early never forces the rest of the source.
class StreamEncoder {
public:
    StreamEncoder(NodePtr root, const EncodeOptions& opts = EncodeOptions());

    // Next chunk of text; std::nullopt when the document is complete
    std::optional<std::string> next();

    // Drain every remaining chunk into `out`; throws IoError on write failure
    void write_to(std::ostream& out);
    void write_file(const std::string& filepath);

    // Items pulled from stream sources so far
    size_t items_pulled() const { return items_pulled_; }

private:
    enum class FrameKind { OBJECT, ARRAY, STREAM };

    struct Frame {
        FrameKind kind = FrameKind::OBJECT;
        NodePtr node;
        int depth = 0;                 // level of fields or list items
        std::string path;
        size_t index = 0;
        bool first_inline = false;     // OBJECT: first field shares the dash line
        std::vector<Encoder::Entry> fields;
        size_t count = 0;              // STREAM: items emitted
    };

    void start();
    void step();
    void step_object(Frame& f);
    void step_array(Frame& f);
    void step_stream(Frame& f);

    void open_field(const Encoder::Entry& field, int depth, const std::string& path);
    void open_item(const NodePtr& item, int depth, const std::string& path);
    void push_container(const NodePtr& value, int depth, const std::string& path,
                        bool first_inline);

    Encoder enc_;
    NodePtr root_;
    std::vector<Frame> stack_;
    bool started_ = false;
    bool done_ = false;
    size_t items_pulled_ = 0;
};

} // namespace toonpack

#endif // TOON_STREAM_HPP
