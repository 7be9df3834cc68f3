#ifndef TOON_IO_HPP
#define TOON_IO_HPP

#include <string>
#include <string_view>
#include <fstream>
#include <istream>
#include <functional>
#include <cstddef>
#include <memory>

namespace toonpack {

// Pull source of text lines.  The view handed out stays valid until the
// next call.  Line terminators (\n, \r\n) are stripped.
class LineSource {
public:
    virtual ~LineSource() = default;

    // Returns false when no more lines available
    virtual bool next_line(std::string_view& out_line, size_t& out_line_no) = 0;

    // File path for error messages (empty for in-memory sources)
    virtual const std::string& filepath() const;
};

// Lines of a caller-owned buffer; nothing is copied
class MemoryLineSource : public LineSource {
public:
    explicit MemoryLineSource(std::string_view text) : text_(text) {}
    MemoryLineSource(const char* data, size_t length) : text_(data, length) {}

    bool next_line(std::string_view& out_line, size_t& out_line_no) override;

private:
    std::string_view text_;
    size_t pos_ = 0;
    size_t line_no_ = 0;
};

// Chunked reader over a file.  Lines are served straight out of the chunk
// unless they straddle a refill, in which case they are stitched in carry_.
class FileLineSource : public LineSource {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 4 * 1024 * 1024;

    // Throws IoError when the file cannot be opened
    explicit FileLineSource(const std::string& filepath, size_t chunk_size = DEFAULT_CHUNK_SIZE);

    bool next_line(std::string_view& out_line, size_t& out_line_no) override;

    const std::string& filepath() const override { return filepath_; }

    size_t lines_read() const { return line_no_; }

private:
    bool refill();

    std::ifstream file_;
    std::string filepath_;
    std::string chunk_;
    size_t chunk_size_;
    size_t pos_ = 0;
    size_t line_no_ = 0;
    bool exhausted_ = false;
    std::string carry_;
};

// Lines from a std::istream (socket wrappers, std::cin, ...)
class IstreamLineSource : public LineSource {
public:
    explicit IstreamLineSource(std::istream& in) : in_(in) {}

    bool next_line(std::string_view& out_line, size_t& out_line_no) override;

private:
    std::istream& in_;
    std::string line_;
    size_t line_no_ = 0;
};

// Lines produced by a callback; the callback returns false at end of input
class CallbackLineSource : public LineSource {
public:
    using Producer = std::function<bool(std::string&)>;

    explicit CallbackLineSource(Producer producer) : producer_(std::move(producer)) {}

    bool next_line(std::string_view& out_line, size_t& out_line_no) override;

private:
    Producer producer_;
    std::string line_;
    size_t line_no_ = 0;
    bool done_ = false;
};

// Owns a copy of the text, for sources that outlive the caller's buffer
class StringLineSource : public LineSource {
public:
    explicit StringLineSource(std::string text)
        : text_(std::move(text)), lines_(text_) {}

    StringLineSource(const StringLineSource&) = delete;
    StringLineSource& operator=(const StringLineSource&) = delete;

    bool next_line(std::string_view& out_line, size_t& out_line_no) override {
        return lines_.next_line(out_line, out_line_no);
    }

private:
    std::string text_;
    MemoryLineSource lines_;
};

std::unique_ptr<FileLineSource> open_file_source(const std::string& filepath);

// Output accumulator for the encoders
class WriteBuffer {
public:
    static constexpr size_t DEFAULT_CAPACITY = 64 * 1024;

    explicit WriteBuffer(size_t initial_capacity = DEFAULT_CAPACITY) {
        data_.reserve(initial_capacity);
    }

    void append(std::string_view sv) { data_.append(sv.data(), sv.size()); }
    void append_char(char c) { data_.push_back(c); }
    void append_spaces(size_t n) { data_.append(n, ' '); }

    // Quoted, with TOON escapes applied
    void append_escaped_string(std::string_view s);

    // Hand the content over and leave the buffer empty
    std::string take();

    // False when the file cannot be written
    bool write_to_file(const std::string& filepath) const;

    void clear() { data_.clear(); }
    bool empty() const { return data_.empty(); }

private:
    std::string data_;
};

} // namespace toonpack

#endif // TOON_IO_HPP
