#ifndef TOON_ENCODER_HPP
#define TOON_ENCODER_HPP

#include <string>
#include <vector>
#include <utility>
#include <cstddef>
#include "toon_io.hpp"
#include "toon_value.hpp"

namespace toonpack {

// Encoder options
struct EncodeOptions {
    int indent = 2;
    char delimiter = ',';
    bool compact = false;        // key:value instead of key: value
    bool sort_keys = false;      // stable key ordering
    bool length_marker = false;  // [#N] headers
    bool key_folding = false;    // a.b.c: v for single-key chains
    bool strict = true;          // NaN/Inf are errors
    size_t parallelism_threshold = 1000;
    size_t workers = 1;
};

enum class ArrayForm {
    INLINE,
    TABULAR,
    BLOCK
};

// Pick the array form from the content shape; `fields` receives the
// tabular header for TABULAR and is cleared otherwise.
ArrayForm classify_array(const std::vector<NodePtr>& items, bool sort_keys,
                         std::vector<std::string>& fields);

// True when the tree holds an N_STREAM node anywhere
bool contains_stream(const NodePtr& node);

// Encoder class
class Encoder {
public:
    explicit Encoder(const EncodeOptions& opts = EncodeOptions());

    // Encode a finite value tree to TOON text (no trailing newline)
    std::string encode(const NodePtr& value);

    // Encode straight to a file; throws IoError when it cannot be written
    void encode_file(const NodePtr& value, const std::string& filepath);

    const EncodeOptions& options() const { return opts_; }

private:
    friend class StreamEncoder;

    using Entry = std::pair<std::string, NodePtr>;

    void encode_root(const NodePtr& value);

    // Output order of an object's fields after sorting and folding
    std::vector<Entry> entries(const NodePtr& obj) const;

    void write_fields(const std::vector<Entry>& fields, int depth, const std::string& path);
    void write_field(const Entry& field, int depth, const std::string& path);
    void write_field_body(const Entry& field, int depth, const std::string& path);
    void write_array(const std::vector<NodePtr>& items, int depth, const std::string& path);
    void write_tabular_rows(const std::vector<NodePtr>& items,
                            const std::vector<std::string>& fields,
                            int depth, const std::string& path);
    void write_list_item(const NodePtr& item, int depth, const std::string& path);
    void write_header(ArrayLength length, const std::vector<std::string>* fields);
    void write_scalar(const NodePtr& value, const std::string& path);
    void write_key(const std::string& key);
    void write_value_separator();

    // Row text without indentation; safe to call from worker threads
    void format_row(std::string& out, const NodePtr& row,
                    const std::vector<std::string>& fields, const std::string& row_path) const;

    // False when `value` is a non-finite double in strict mode
    bool append_scalar(std::string& out, const NodePtr& value) const;

    void begin_line(int depth);

    [[noreturn]] void unsupported(const NodePtr& value, const std::string& path) const;

    EncodeOptions opts_;
    WriteBuffer buf_;
    bool at_start_ = true;
};

} // namespace toonpack

#endif // TOON_ENCODER_HPP
