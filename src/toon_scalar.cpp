#include "toon_scalar.hpp"
#include "toon_charconv.hpp"
#include <cctype>

namespace toonpack {

NumberClass classify_number(std::string_view text) {
    size_t i = 0;
    size_t n = text.size();

    if (i < n && text[i] == '-') i++;

    size_t digits_start = i;
    while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) i++;
    if (i == digits_start) return NumberClass::NOT_A_NUMBER;

    bool is_float = false;

    if (i < n && text[i] == '.') {
        i++;
        size_t frac_start = i;
        while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) i++;
        if (i == frac_start) return NumberClass::NOT_A_NUMBER;
        is_float = true;
    }

    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        i++;
        if (i < n && (text[i] == '+' || text[i] == '-')) i++;
        size_t exp_start = i;
        while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) i++;
        if (i == exp_start) return NumberClass::NOT_A_NUMBER;
        is_float = true;
    }

    if (i != n) return NumberClass::NOT_A_NUMBER;
    return is_float ? NumberClass::FLOAT : NumberClass::INTEGER;
}

bool needs_quoting(std::string_view s, char delimiter) {
    if (s.empty()) return true;

    unsigned char first = static_cast<unsigned char>(s.front());
    unsigned char last = static_cast<unsigned char>(s.back());
    if (std::isspace(first) || std::isspace(last)) return true;

    if (is_reserved_literal(s)) return true;
    if (is_numeric_literal(s)) return true;

    // Would lex as a list marker, a quoted string or a comment
    if (s.front() == '-' || s.front() == '"' || s.front() == '#') return true;

    bool prev_space = false;
    for (char c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        switch (c) {
            case ':':
            case ',':
            case '[':
            case ']':
            case '{':
            case '}':
            case '"':
            case '\\':
                return true;
            default:
                break;
        }
        if (c == delimiter) return true;
        if (u < 0x20 || u == 0x7f) return true;
        if (c == '#' && prev_space) return true;
        prev_space = std::isspace(u) != 0;
    }
    return false;
}

void append_escaped(std::string& out, std::string_view s) {
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
}

std::string quote_string(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    append_escaped(out, s);
    out += '"';
    return out;
}

std::string format_string(std::string_view s, char delimiter) {
    if (needs_quoting(s, delimiter)) {
        return quote_string(s);
    }
    return std::string(s);
}

std::string format_integer(int64_t v) {
    char buf[24];
    auto result = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, result.ptr);
}

std::string format_double(double v) {
    std::string s = double_to_string(v);
    // Keep floats distinguishable from integers
    if (s.find_first_of(".eE") == std::string::npos) {
        s += ".0";
    }
    return s;
}

NodePtr parse_number_token(std::string_view text, bool is_float) {
    if (!is_float) {
        int64_t value = 0;
        auto result = std::from_chars(text.data(), text.data() + text.size(), value);
        if (result.ec == std::errc{} && result.ptr == text.data() + text.size()) {
            return Node::make_int(value);
        }
    }

    double value = 0.0;
    if (parse_double(text, value)) {
        return Node::make_double(value);
    }
    return nullptr;
}

std::string delimiter_name(char delimiter) {
    switch (delimiter) {
        case ',': return "comma";
        case '\t': return "tab";
        case '|': return "pipe";
        default: return std::string("'") + delimiter + "'";
    }
}

} // namespace toonpack
