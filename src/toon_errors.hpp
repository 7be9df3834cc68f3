#ifndef TOON_ERRORS_HPP
#define TOON_ERRORS_HPP

#include <string>
#include <stdexcept>
#include <cstddef>
#include <utility>

namespace toonpack {

enum class ErrorType {
    PARSE_ERROR,
    VALIDATION_ERROR,
    IO_ERROR,
    ENCODING_ERROR,
    INTERNAL_ERROR
};

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::PARSE_ERROR: return "parse_error";
        case ErrorType::VALIDATION_ERROR: return "validation_error";
        case ErrorType::IO_ERROR: return "io_error";
        case ErrorType::ENCODING_ERROR: return "encoding_error";
        case ErrorType::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown_error";
}

// Where in the input a problem was found.  Zero line/column means unknown.
struct SourceLocation {
    size_t line = 0;
    size_t column = 0;
    std::string snippet;
    std::string file;

    // "file:line:column", skipping the parts that are unknown
    std::string describe() const {
        std::string out = file;
        if (line > 0) {
            if (!out.empty()) out += ':';
            out += std::to_string(line);
            if (column > 0) out += ':' + std::to_string(column);
        }
        return out;
    }
};

// Root of every error raised by the codec
class ToonError : public std::runtime_error {
public:
    ToonError(ErrorType type, const std::string& message)
        : std::runtime_error(message), type_(type) {}

    ErrorType type() const { return type_; }

private:
    ErrorType type_;
};

// Malformed input
class ParseError : public ToonError {
public:
    ParseError(const std::string& message, size_t line = 0, size_t column = 0,
               const std::string& snippet = "", const std::string& file = "")
        : ParseError(ErrorType::PARSE_ERROR, message,
                     SourceLocation{line, column, snippet, file}) {}

    const SourceLocation& location() const { return loc_; }
    size_t line() const { return loc_.line; }
    size_t column() const { return loc_.column; }
    const std::string& snippet() const { return loc_.snippet; }
    const std::string& file() const { return loc_.file; }

    // Message prefixed with the location, followed by the offending line
    std::string formatted_message() const {
        std::string where = loc_.describe();
        std::string msg = where.empty() ? std::string(what()) : where + ": " + what();
        if (!loc_.snippet.empty()) {
            msg += "\n    " + loc_.snippet;
        }
        return msg;
    }

protected:
    ParseError(ErrorType type, const std::string& message, SourceLocation loc)
        : ToonError(type, message), loc_(std::move(loc)) {}

private:
    SourceLocation loc_;
};

// Well-formed input that breaks a declared cardinality (strict mode only)
class ValidationError : public ParseError {
public:
    ValidationError(const std::string& message, size_t line = 0, size_t column = 0,
                    const std::string& snippet = "", const std::string& file = "")
        : ParseError(ErrorType::VALIDATION_ERROR, message,
                     SourceLocation{line, column, snippet, file}) {}
};

// Value that cannot be represented; path is "$" based, e.g. $.items[2].name
class EncodeError : public ToonError {
public:
    EncodeError(const std::string& message, const std::string& path = "")
        : ToonError(ErrorType::ENCODING_ERROR,
                    path.empty() ? message : message + " at " + path),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class IoError : public ToonError {
public:
    IoError(const std::string& message, const std::string& file = "")
        : ToonError(ErrorType::IO_ERROR, message), file_(file) {}

    const std::string& file() const { return file_; }

private:
    std::string file_;
};

// Unexpected failure inside a backend, normalized at the codec boundary
class InternalError : public ToonError {
public:
    explicit InternalError(const std::string& message)
        : ToonError(ErrorType::INTERNAL_ERROR, message) {}
};

// Outcome of a validate_* call; failures are reported, not thrown
struct ValidationResult {
    bool valid = true;
    ErrorType error_type = ErrorType::PARSE_ERROR;
    std::string message;
    size_t line = 0;
    size_t column = 0;
    std::string snippet;
    std::string file;

    static ValidationResult ok() { return ValidationResult(); }

    static ValidationResult failed(const ParseError& e) {
        return failed(e.type(), e.what(), e.location());
    }

    static ValidationResult failed(const IoError& e) {
        SourceLocation loc;
        loc.file = e.file();
        return failed(e.type(), e.what(), loc);
    }

private:
    static ValidationResult failed(ErrorType type, const std::string& message,
                                   const SourceLocation& loc) {
        ValidationResult r;
        r.valid = false;
        r.error_type = type;
        r.message = message;
        r.line = loc.line;
        r.column = loc.column;
        r.snippet = loc.snippet;
        r.file = loc.file;
        return r;
    }
};

// Non-fatal repair made in lenient mode, or a backend fallback
struct Warning {
    std::string type;
    std::string message;

    Warning(const std::string& t, const std::string& m) : type(t), message(m) {}
};

} // namespace toonpack

#endif // TOON_ERRORS_HPP
