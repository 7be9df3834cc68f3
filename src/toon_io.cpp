#include "toon_io.hpp"
#include "toon_errors.hpp"
#include "toon_scalar.hpp"

namespace toonpack {

namespace {

std::string_view without_cr(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

} // namespace

const std::string& LineSource::filepath() const {
    static const std::string empty;
    return empty;
}

bool MemoryLineSource::next_line(std::string_view& out_line, size_t& out_line_no) {
    if (pos_ >= text_.size()) return false;

    size_t nl = text_.find('\n', pos_);
    size_t stop = nl == std::string_view::npos ? text_.size() : nl;
    out_line = without_cr(text_.substr(pos_, stop - pos_));
    pos_ = nl == std::string_view::npos ? text_.size() : nl + 1;
    out_line_no = ++line_no_;
    return true;
}

FileLineSource::FileLineSource(const std::string& filepath, size_t chunk_size)
    : filepath_(filepath), chunk_size_(chunk_size) {
    file_.open(filepath, std::ios::binary);
    if (!file_.is_open()) {
        throw IoError("Cannot open file: " + filepath, filepath);
    }
}

bool FileLineSource::refill() {
    if (exhausted_) return false;

    chunk_.resize(chunk_size_);
    file_.read(&chunk_[0], static_cast<std::streamsize>(chunk_size_));
    size_t got = static_cast<size_t>(file_.gcount());
    if (file_.bad()) {
        throw IoError("Error reading file: " + filepath_, filepath_);
    }
    chunk_.resize(got);
    pos_ = 0;
    if (got < chunk_size_) exhausted_ = true;
    return got > 0;
}

bool FileLineSource::next_line(std::string_view& out_line, size_t& out_line_no) {
    carry_.clear();

    while (true) {
        if (pos_ >= chunk_.size() && !refill()) {
            if (carry_.empty()) return false;
            // Final line without a terminator
            out_line = without_cr(carry_);
            out_line_no = ++line_no_;
            return true;
        }

        size_t nl = chunk_.find('\n', pos_);
        if (nl == std::string::npos) {
            carry_.append(chunk_, pos_, std::string::npos);
            pos_ = chunk_.size();
            continue;
        }

        std::string_view piece(chunk_.data() + pos_, nl - pos_);
        pos_ = nl + 1;
        if (carry_.empty()) {
            out_line = without_cr(piece);
        } else {
            carry_.append(piece.data(), piece.size());
            out_line = without_cr(carry_);
        }
        out_line_no = ++line_no_;
        return true;
    }
}

bool IstreamLineSource::next_line(std::string_view& out_line, size_t& out_line_no) {
    if (!std::getline(in_, line_)) {
        if (in_.bad()) {
            throw IoError("Error reading input stream");
        }
        return false;
    }
    out_line = without_cr(line_);
    out_line_no = ++line_no_;
    return true;
}

bool CallbackLineSource::next_line(std::string_view& out_line, size_t& out_line_no) {
    if (done_) return false;

    line_.clear();
    if (!producer_(line_)) {
        done_ = true;
        return false;
    }
    out_line = without_cr(line_);
    out_line_no = ++line_no_;
    return true;
}

std::unique_ptr<FileLineSource> open_file_source(const std::string& filepath) {
    return std::make_unique<FileLineSource>(filepath);
}

void WriteBuffer::append_escaped_string(std::string_view s) {
    data_.push_back('"');
    append_escaped(data_, s);
    data_.push_back('"');
}

std::string WriteBuffer::take() {
    std::string out;
    out.swap(data_);
    return out;
}

bool WriteBuffer::write_to_file(const std::string& filepath) const {
    std::ofstream out(filepath, std::ios::binary);
    if (!out.is_open()) {
        return false;
    }
    out.write(data_.data(), static_cast<std::streamsize>(data_.size()));
    return out.good();
}

} // namespace toonpack
