#ifndef TOON_SCALAR_HPP
#define TOON_SCALAR_HPP

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>
#include "toon_value.hpp"

namespace toonpack {

// Numeric literal classification for bare text
enum class NumberClass {
    NOT_A_NUMBER,
    INTEGER,
    FLOAT
};

// Matches -?[0-9]+(\.[0-9]+)?([eE][+-]?[0-9]+)?
NumberClass classify_number(std::string_view text);

inline bool is_numeric_literal(std::string_view text) {
    return classify_number(text) != NumberClass::NOT_A_NUMBER;
}

inline bool is_reserved_literal(std::string_view text) {
    return text == "true" || text == "false" || text == "null";
}

// Quoting rule shared by the encoder and the decoder's bare-token reading.
// A string may be written bare only if reading that bare token back yields
// the same string.
bool needs_quoting(std::string_view s, char delimiter);

// Escape \\ \" \n \t \r; everything else is copied verbatim
void append_escaped(std::string& out, std::string_view s);

// Quoted form including the surrounding double quotes
std::string quote_string(std::string_view s);

// Bare or quoted depending on needs_quoting
std::string format_string(std::string_view s, char delimiter);

// Decimal integer text
std::string format_integer(int64_t v);

// Shortest round-trip form; ".0" appended when the text reads as an integer.
// Caller handles NaN and Infinity.
std::string format_double(double v);

// Parse a token already classified as a number.  Integers that overflow
// int64 come back as doubles.
NodePtr parse_number_token(std::string_view text, bool is_float);

// Human readable form of a delimiter for messages
std::string delimiter_name(char delimiter);

} // namespace toonpack

#endif // TOON_SCALAR_HPP
