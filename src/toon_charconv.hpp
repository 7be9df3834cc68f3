#ifndef TOON_CHARCONV_HPP
#define TOON_CHARCONV_HPP

#include <charconv>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>

#ifdef _LIBCPP_VERSION
#include <xlocale.h>
#endif

namespace toonpack {

// libc++ ships no floating-point std::from_chars / std::to_chars; there the
// C library is used under a fixed "C" locale so LC_NUMERIC never leaks in.

#ifdef _LIBCPP_VERSION
inline locale_t c_numeric_locale() {
    static locale_t loc = newlocale(LC_ALL_MASK, "C", nullptr);
    return loc;
}
#endif

// `text` must already match the numeric literal grammar.  False when it
// does not fit a double.
inline bool parse_double(std::string_view text, double& out) {
#ifdef _LIBCPP_VERSION
    std::string buf(text);
    char* end = nullptr;
    errno = 0;
    double value = strtod_l(buf.c_str(), &end, c_numeric_locale());
    if (end != buf.c_str() + buf.size() || errno == ERANGE) {
        return false;
    }
    out = value;
    return true;
#else
    auto result = std::from_chars(text.data(), text.data() + text.size(), out);
    return result.ec == std::errc{} && result.ptr == text.data() + text.size();
#endif
}

// Shortest text that reads back as the same double
inline std::string double_to_string(double value) {
    char buf[32];
#ifdef _LIBCPP_VERSION
    for (int precision = 1; precision <= 17; precision++) {
        locale_t old = uselocale(c_numeric_locale());
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        uselocale(old);
        if (strtod_l(buf, nullptr, c_numeric_locale()) == value) break;
    }
    return std::string(buf);
#else
    auto result = std::to_chars(buf, buf + sizeof(buf), value);
    return std::string(buf, result.ptr);
#endif
}

} // namespace toonpack

#endif // TOON_CHARCONV_HPP
