#ifndef TOON_CONFIG_HPP
#define TOON_CONFIG_HPP

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <cstddef>
#include "toon_errors.hpp"
#include "toon_encoder.hpp"
#include "toon_grammar.hpp"

namespace toonpack {

enum class BackendKind {
    AUTO,
    REFERENCE,
    ACCELERATED
};

const char* backend_kind_name(BackendKind kind);

// Process-level codec settings.  Built once and passed by reference.
struct Config {
    int indent = 2;
    char delimiter = ',';
    bool strict = true;
    bool type_inference = true;
    bool sort_keys = false;
    bool compact = false;
    bool length_marker = false;
    bool key_folding = false;
    bool expand_paths = false;
    bool allow_comments = true;
    bool allow_duplicate_keys = true;
    size_t parallelism_threshold = 1000;
    size_t max_workers = 0;  // 0 = hardware concurrency
    BackendKind backend = BackendKind::AUTO;
    bool fallback_to_reference = true;

    // Environment lookup; std::nullopt when the variable is unset
    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    // Read TOONPACK_* variables.  Invalid values keep the default and add a
    // "config" warning to `warnings` when given.
    static Config from_env(std::vector<Warning>* warnings = nullptr);
    static Config from_env(const Lookup& lookup, std::vector<Warning>* warnings = nullptr);

    EncodeOptions encode_options() const;
    ParseOptions parse_options() const;

    // Worker threads for batch and tabular work
    size_t effective_workers() const;
};

// Parse helpers shared with the R bridge
std::optional<bool> parse_bool_setting(const std::string& text);
std::optional<char> parse_delimiter_setting(const std::string& text);
std::optional<BackendKind> parse_backend_setting(const std::string& text);

} // namespace toonpack

#endif // TOON_CONFIG_HPP
