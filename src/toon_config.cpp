#include "toon_config.hpp"
#include "toon_parallel.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace toonpack {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<long long> parse_integer(const std::string& text) {
    long long value = 0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Applies one variable: unset keeps the default silently, invalid keeps it
// with a warning.
class EnvReader {
public:
    EnvReader(const Config::Lookup& lookup, std::vector<Warning>* warnings)
        : lookup_(lookup), warnings_(warnings) {}

    void read_bool(const char* name, bool& target) {
        auto raw = lookup_(name);
        if (!raw) return;
        if (auto value = parse_bool_setting(*raw)) {
            target = *value;
        } else {
            invalid(name, *raw);
        }
    }

    void read_count(const char* name, size_t& target, long long min) {
        auto raw = lookup_(name);
        if (!raw) return;
        auto value = parse_integer(*raw);
        if (value && *value >= min) {
            target = static_cast<size_t>(*value);
        } else {
            invalid(name, *raw);
        }
    }

    void read_indent(const char* name, int& target) {
        auto raw = lookup_(name);
        if (!raw) return;
        auto value = parse_integer(*raw);
        if (value && *value >= 1 && *value <= 16) {
            target = static_cast<int>(*value);
        } else {
            invalid(name, *raw);
        }
    }

    void read_delimiter(const char* name, char& target) {
        auto raw = lookup_(name);
        if (!raw) return;
        if (auto value = parse_delimiter_setting(*raw)) {
            target = *value;
        } else {
            invalid(name, *raw);
        }
    }

    void read_backend(const char* name, BackendKind& target) {
        auto raw = lookup_(name);
        if (!raw) return;
        if (auto value = parse_backend_setting(*raw)) {
            target = *value;
        } else {
            invalid(name, *raw);
        }
    }

private:
    void invalid(const char* name, const std::string& raw) {
        if (warnings_) {
            warnings_->emplace_back("config", std::string("Invalid value '") + raw +
                                    "' for " + name + "; using default");
        }
    }

    const Config::Lookup& lookup_;
    std::vector<Warning>* warnings_;
};

} // namespace

const char* backend_kind_name(BackendKind kind) {
    switch (kind) {
        case BackendKind::AUTO: return "auto";
        case BackendKind::REFERENCE: return "reference";
        case BackendKind::ACCELERATED: return "accelerated";
    }
    return "unknown";
}

std::optional<bool> parse_bool_setting(const std::string& text) {
    std::string v = lowercase(text);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

std::optional<char> parse_delimiter_setting(const std::string& text) {
    std::string v = lowercase(text);
    if (v == "comma" || v == ",") return ',';
    if (v == "tab" || v == "\t") return '\t';
    if (v == "pipe" || v == "|") return '|';
    return std::nullopt;
}

std::optional<BackendKind> parse_backend_setting(const std::string& text) {
    std::string v = lowercase(text);
    if (v == "auto") return BackendKind::AUTO;
    if (v == "reference") return BackendKind::REFERENCE;
    if (v == "accelerated") return BackendKind::ACCELERATED;
    return std::nullopt;
}

Config Config::from_env(std::vector<Warning>* warnings) {
    Lookup lookup = [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    };
    return from_env(lookup, warnings);
}

Config Config::from_env(const Lookup& lookup, std::vector<Warning>* warnings) {
    Config config;
    EnvReader env(lookup, warnings);

    env.read_indent("TOONPACK_INDENT", config.indent);
    env.read_delimiter("TOONPACK_DELIMITER", config.delimiter);
    env.read_bool("TOONPACK_STRICT", config.strict);
    env.read_bool("TOONPACK_TYPE_INFERENCE", config.type_inference);
    env.read_bool("TOONPACK_SORT_KEYS", config.sort_keys);
    env.read_count("TOONPACK_PARALLELISM_THRESHOLD", config.parallelism_threshold, 1);
    env.read_count("TOONPACK_WORKERS", config.max_workers, 0);
    env.read_backend("TOONPACK_BACKEND", config.backend);
    env.read_bool("TOONPACK_FALLBACK", config.fallback_to_reference);

    return config;
}

EncodeOptions Config::encode_options() const {
    EncodeOptions opts;
    opts.indent = indent;
    opts.delimiter = delimiter;
    opts.compact = compact;
    opts.sort_keys = sort_keys;
    opts.length_marker = length_marker;
    opts.key_folding = key_folding;
    opts.strict = strict;
    opts.parallelism_threshold = parallelism_threshold;
    opts.workers = 1;
    return opts;
}

ParseOptions Config::parse_options() const {
    ParseOptions opts;
    opts.indent = indent;
    opts.delimiter = delimiter;
    opts.strict = strict;
    opts.type_inference = type_inference;
    opts.allow_comments = allow_comments;
    opts.allow_duplicate_keys = allow_duplicate_keys;
    opts.expand_paths = expand_paths;
    return opts;
}

size_t Config::effective_workers() const {
    return resolve_workers(max_workers);
}

} // namespace toonpack
