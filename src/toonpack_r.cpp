#include <R.h>
#include <Rinternals.h>
#include <R_ext/Rdynload.h>

#include <climits>
#include <cstring>
#include <stdexcept>
#include <string>

#include "toon_codec.hpp"
#include "toon_config.hpp"
#include "toon_errors.hpp"
#include "toon_events.hpp"
#include "toon_io.hpp"
#include "toon_parser.hpp"
#include "toon_scalar.hpp"

using namespace toonpack;

namespace {

// Rf_error longjmps, so the message is parked here and raised only after
// every C++ object on the failing path has been destroyed.
char r_error_buf[8192];

void park_error(const std::string& message) {
    std::strncpy(r_error_buf, message.c_str(), sizeof(r_error_buf) - 1);
    r_error_buf[sizeof(r_error_buf) - 1] = '\0';
}

template <typename Body>
SEXP r_guarded(const char* context, Body body) {
    try {
        return body();
    } catch (const ParseError& e) {
        park_error(e.formatted_message());
    } catch (const ToonError& e) {
        park_error(e.what());
    } catch (const std::exception& e) {
        park_error(std::string(context) + ": " + e.what());
    }
    Rf_error("%s", r_error_buf);
    return R_NilValue;
}

bool r_flag(SEXP x) {
    return Rf_asLogical(x) == TRUE;
}

std::string r_string(SEXP x) {
    return std::string(CHAR(STRING_ELT(x, 0)));
}

SEXP r_utf8(const std::string& s) {
    return Rf_mkCharCE(s.c_str(), CE_UTF8);
}

SEXP r_scalar_string(const std::string& s) {
    SEXP out = PROTECT(Rf_allocVector(STRSXP, 1));
    SET_STRING_ELT(out, 0, r_utf8(s));
    UNPROTECT(1);
    return out;
}

SEXP r_optional_string(const std::string& s) {
    return s.empty() ? Rf_ScalarString(NA_STRING) : r_scalar_string(s);
}

SEXP r_named_list(const char* const* names, int n) {
    SEXP list = PROTECT(Rf_allocVector(VECSXP, n));
    SEXP r_names = PROTECT(Rf_allocVector(STRSXP, n));
    for (int i = 0; i < n; i++) {
        SET_STRING_ELT(r_names, i, Rf_mkChar(names[i]));
    }
    Rf_setAttrib(list, R_NamesSymbol, r_names);
    UNPROTECT(2);
    return list;
}

// Runs an R call without letting an R error longjmp over C++ frames.
// False, with R's message in `failure`, when the call raised an error.
bool eval_callback(SEXP call, std::string& failure) {
    int error_occurred = 0;
    R_tryEvalSilent(call, R_GlobalEnv, &error_occurred);
    if (error_occurred) {
        failure = R_curErrorBuf();
        while (!failure.empty() && failure.back() == '\n') {
            failure.pop_back();
        }
        return false;
    }
    return true;
}

void report_warnings(const std::vector<Warning>& warnings) {
    for (const auto& w : warnings) {
        Rf_warning("%s", w.message.c_str());
    }
}

// INT_MIN is NA_integer_ in R
bool fits_r_int(int64_t v) {
    return v > INT_MIN && v <= INT_MAX;
}

// Kind shared by every non-null primitive item, N_NULL when the items mix
// kinds, hold containers, or are all null
NodeKind atomic_kind(const std::vector<NodePtr>& items, bool& ints_fit) {
    NodeKind kind = NodeKind::N_NULL;
    ints_fit = true;
    for (const auto& item : items) {
        if (!item->is_primitive()) return NodeKind::N_NULL;
        if (item->kind == NodeKind::N_NULL) continue;
        if (kind != NodeKind::N_NULL && item->kind != kind) return NodeKind::N_NULL;
        kind = item->kind;
        if (kind == NodeKind::N_INT && !fits_r_int(item->int_val)) ints_fit = false;
    }
    return kind;
}

template <typename Fill>
SEXP r_vector(SEXPTYPE type, R_xlen_t n, Fill fill) {
    SEXP out = PROTECT(Rf_allocVector(type, n));
    for (R_xlen_t i = 0; i < n; i++) {
        fill(out, i);
    }
    UNPROTECT(1);
    return out;
}

SEXP to_r(const NodePtr& node, bool simplify);

SEXP atomic_array_to_r(const std::vector<NodePtr>& items, NodeKind kind, bool ints_fit) {
    R_xlen_t n = static_cast<R_xlen_t>(items.size());
    auto is_na = [&](R_xlen_t i) { return items[i]->kind == NodeKind::N_NULL; };

    switch (kind) {
        case NodeKind::N_BOOL:
            return r_vector(LGLSXP, n, [&](SEXP v, R_xlen_t i) {
                LOGICAL(v)[i] = is_na(i) ? NA_LOGICAL : (items[i]->bool_val ? TRUE : FALSE);
            });
        case NodeKind::N_INT:
            if (ints_fit) {
                return r_vector(INTSXP, n, [&](SEXP v, R_xlen_t i) {
                    INTEGER(v)[i] = is_na(i) ? NA_INTEGER : static_cast<int>(items[i]->int_val);
                });
            }
            return r_vector(REALSXP, n, [&](SEXP v, R_xlen_t i) {
                REAL(v)[i] = is_na(i) ? NA_REAL : static_cast<double>(items[i]->int_val);
            });
        case NodeKind::N_DOUBLE:
            return r_vector(REALSXP, n, [&](SEXP v, R_xlen_t i) {
                REAL(v)[i] = is_na(i) ? NA_REAL : items[i]->double_val;
            });
        case NodeKind::N_STRING:
            return r_vector(STRSXP, n, [&](SEXP v, R_xlen_t i) {
                SET_STRING_ELT(v, i, is_na(i) ? NA_STRING : r_utf8(items[i]->string_val));
            });
        default:
            return R_NilValue;
    }
}

SEXP array_to_r(const std::vector<NodePtr>& items, bool simplify) {
    if (simplify && !items.empty()) {
        bool ints_fit = true;
        NodeKind kind = atomic_kind(items, ints_fit);
        if (kind != NodeKind::N_NULL) {
            return atomic_array_to_r(items, kind, ints_fit);
        }
    }
    return r_vector(VECSXP, static_cast<R_xlen_t>(items.size()), [&](SEXP v, R_xlen_t i) {
        SET_VECTOR_ELT(v, i, to_r(items[i], simplify));
    });
}

SEXP object_to_r(const Node& node, bool simplify) {
    R_xlen_t n = static_cast<R_xlen_t>(node.object_items.size());
    SEXP out = PROTECT(Rf_allocVector(VECSXP, n));
    SEXP names = PROTECT(Rf_allocVector(STRSXP, n));
    for (R_xlen_t i = 0; i < n; i++) {
        const auto& field = node.object_items[i];
        SET_STRING_ELT(names, i, r_utf8(field.first));
        SET_VECTOR_ELT(out, i, to_r(field.second, simplify));
    }
    Rf_setAttrib(out, R_NamesSymbol, names);
    UNPROTECT(2);
    return out;
}

// Arrays of one primitive kind become atomic vectors when `simplify` is set
SEXP to_r(const NodePtr& node, bool simplify) {
    if (!node) return R_NilValue;

    switch (node->kind) {
        case NodeKind::N_NULL:
        case NodeKind::N_STREAM:
            return R_NilValue;
        case NodeKind::N_BOOL:
            return Rf_ScalarLogical(node->bool_val ? TRUE : FALSE);
        case NodeKind::N_INT:
            if (fits_r_int(node->int_val)) {
                return Rf_ScalarInteger(static_cast<int>(node->int_val));
            }
            return Rf_ScalarReal(static_cast<double>(node->int_val));
        case NodeKind::N_DOUBLE:
            return Rf_ScalarReal(node->double_val);
        case NodeKind::N_STRING:
            return r_scalar_string(node->string_val);
        case NodeKind::N_ARRAY:
            return array_to_r(node->array_items, simplify);
        case NodeKind::N_OBJECT:
            return object_to_r(*node, simplify);
    }
    return R_NilValue;
}

// Length-one atomic vectors are scalars; longer ones arrays
template <typename Elem>
NodePtr atomic_from_r(R_xlen_t n, Elem elem) {
    if (n == 1) return elem(0);
    NodePtr arr = Node::make_array();
    arr->array_items.reserve(static_cast<size_t>(n));
    for (R_xlen_t i = 0; i < n; i++) {
        arr->array_items.push_back(elem(i));
    }
    return arr;
}

NodePtr from_r(SEXP x, const std::string& path) {
    R_xlen_t n = Rf_xlength(x);

    switch (TYPEOF(x)) {
        case NILSXP:
            return Node::make_null();
        case LGLSXP: {
            const int* data = LOGICAL(x);
            return atomic_from_r(n, [data](R_xlen_t i) {
                return data[i] == NA_LOGICAL ? Node::make_null() : Node::make_bool(data[i] != 0);
            });
        }
        case INTSXP: {
            const int* data = INTEGER(x);
            return atomic_from_r(n, [data](R_xlen_t i) {
                return data[i] == NA_INTEGER ? Node::make_null() : Node::make_int(data[i]);
            });
        }
        case REALSXP: {
            const double* data = REAL(x);
            return atomic_from_r(n, [data](R_xlen_t i) {
                return ISNA(data[i]) ? Node::make_null() : Node::make_double(data[i]);
            });
        }
        case STRSXP:
            return atomic_from_r(n, [x](R_xlen_t i) {
                SEXP s = STRING_ELT(x, i);
                return s == NA_STRING ? Node::make_null()
                                      : Node::make_string(Rf_translateCharUTF8(s));
            });
        case VECSXP: {
            SEXP names = Rf_getAttrib(x, R_NamesSymbol);
            if (names == R_NilValue) {
                NodePtr arr = Node::make_array();
                for (R_xlen_t i = 0; i < n; i++) {
                    arr->array_items.push_back(
                        from_r(VECTOR_ELT(x, i), path + "[" + std::to_string(i) + "]"));
                }
                return arr;
            }
            NodePtr obj = Node::make_object();
            for (R_xlen_t i = 0; i < n; i++) {
                std::string key = Rf_translateCharUTF8(STRING_ELT(names, i));
                obj->set(key, from_r(VECTOR_ELT(x, i), path + "." + key));
            }
            return obj;
        }
        default:
            throw EncodeError(std::string("Unsupported R type '") + Rf_type2char(TYPEOF(x)) + "'",
                              path);
    }
}

// Session defaults come from TOONPACK_*; call arguments override them
Config r_decode_config(SEXP strict, SEXP allow_comments, SEXP allow_duplicate_keys) {
    std::vector<Warning> env_warnings;
    Config config = Config::from_env(&env_warnings);
    report_warnings(env_warnings);
    config.strict = r_flag(strict);
    config.allow_comments = r_flag(allow_comments);
    config.allow_duplicate_keys = r_flag(allow_duplicate_keys);
    return config;
}

char r_delimiter(SEXP delimiter) {
    std::string name = r_string(delimiter);
    auto value = parse_delimiter_setting(name);
    if (!value) {
        throw std::invalid_argument("Unknown delimiter '" + name + "'");
    }
    return *value;
}

SEXP validation_to_r(const ValidationResult& vr) {
    // Fresh vector: Rf_ScalarLogical may hand back the shared TRUE/FALSE
    SEXP result = PROTECT(Rf_allocVector(LGLSXP, 1));
    LOGICAL(result)[0] = vr.valid ? TRUE : FALSE;
    if (!vr.valid) {
        static const char* const fields[] = {"type", "message", "line", "column", "snippet", "file"};
        SEXP info = PROTECT(r_named_list(fields, 6));
        SET_VECTOR_ELT(info, 0, Rf_mkString(error_type_name(vr.error_type)));
        SET_VECTOR_ELT(info, 1, r_scalar_string(vr.message));
        SET_VECTOR_ELT(info, 2, Rf_ScalarInteger(vr.line > 0 ? static_cast<int>(vr.line) : NA_INTEGER));
        SET_VECTOR_ELT(info, 3, Rf_ScalarInteger(vr.column > 0 ? static_cast<int>(vr.column) : NA_INTEGER));
        SET_VECTOR_ELT(info, 4, r_optional_string(vr.snippet));
        SET_VECTOR_ELT(info, 5, r_optional_string(vr.file));
        Rf_setAttrib(result, Rf_install("error"), info);
        UNPROTECT(1);
    }
    UNPROTECT(1);
    return result;
}

} // namespace

extern "C" {

// Text (character or raw) to an R value
SEXP C_from_toon(SEXP text, SEXP strict, SEXP simplify, SEXP allow_comments,
                 SEXP allow_duplicate_keys, SEXP type_inference, SEXP expand_paths) {
    return r_guarded("Error parsing TOON", [&]() {
        Config config = r_decode_config(strict, allow_comments, allow_duplicate_keys);
        config.type_inference = r_flag(type_inference);
        config.expand_paths = r_flag(expand_paths);

        std::string input;
        if (TYPEOF(text) == RAWSXP) {
            input.assign(reinterpret_cast<const char*>(RAW(text)),
                         static_cast<size_t>(Rf_xlength(text)));
        } else {
            input = r_string(text);
        }

        Codec codec(config);
        NodePtr value = codec.decode(input);
        report_warnings(codec.warnings());
        return to_r(value, r_flag(simplify));
    });
}

SEXP C_read_toon(SEXP file, SEXP strict, SEXP simplify, SEXP allow_comments,
                 SEXP allow_duplicate_keys, SEXP type_inference, SEXP expand_paths) {
    return r_guarded("Error reading TOON file", [&]() {
        Config config = r_decode_config(strict, allow_comments, allow_duplicate_keys);
        config.type_inference = r_flag(type_inference);
        config.expand_paths = r_flag(expand_paths);

        Codec codec(config);
        NodePtr value = codec.decode_file(r_string(file));
        report_warnings(codec.warnings());
        return to_r(value, r_flag(simplify));
    });
}

// R value to a character scalar of class "toon"
SEXP C_to_toon(SEXP x, SEXP indent, SEXP delimiter, SEXP strict, SEXP compact,
               SEXP sort_keys, SEXP length_marker, SEXP key_folding) {
    return r_guarded("Error encoding to TOON", [&]() {
        Config config = Config::from_env();
        config.indent = Rf_asInteger(indent);
        config.delimiter = r_delimiter(delimiter);
        config.strict = r_flag(strict);
        config.compact = r_flag(compact);
        config.sort_keys = r_flag(sort_keys);
        config.length_marker = r_flag(length_marker);
        config.key_folding = r_flag(key_folding);

        Codec codec(config);
        std::string text = codec.encode(from_r(x, "$"));
        report_warnings(codec.warnings());

        SEXP out = PROTECT(r_scalar_string(text));
        SEXP cls = PROTECT(Rf_mkString("toon"));
        Rf_setAttrib(out, R_ClassSymbol, cls);
        UNPROTECT(2);
        return out;
    });
}

// TRUE, or FALSE with an "error" attribute describing the first failure
SEXP C_validate_toon(SEXP x, SEXP is_file, SEXP strict, SEXP allow_comments,
                     SEXP allow_duplicate_keys) {
    return r_guarded("Error validating TOON", [&]() {
        Config config = r_decode_config(strict, allow_comments, allow_duplicate_keys);
        Parser parser(config.parse_options());
        ValidationResult vr = r_flag(is_file) ? parser.validate_file(r_string(x))
                                              : parser.validate_string(r_string(x));
        return validation_to_r(vr);
    });
}

// Re-encode with the given indent and key order
SEXP C_format_toon(SEXP x, SEXP is_file, SEXP indent, SEXP sort_keys, SEXP allow_comments) {
    return r_guarded("Error formatting TOON", [&]() {
        Config read_config = Config::from_env();
        read_config.allow_comments = r_flag(allow_comments);
        Codec reader(read_config);
        NodePtr value = r_flag(is_file) ? reader.decode_file(r_string(x))
                                        : reader.decode(r_string(x));

        Config write_config = read_config;
        write_config.indent = Rf_asInteger(indent);
        write_config.sort_keys = r_flag(sort_keys);
        Codec writer(write_config);
        return r_scalar_string(writer.encode(value));
    });
}

// Call `callback(item)` for every item of a TOON file without loading it whole
SEXP C_toon_items(SEXP file, SEXP callback, SEXP strict, SEXP simplify, SEXP allow_comments) {
    return r_guarded("Error streaming TOON", [&]() {
        Config config = Config::from_env();
        config.strict = r_flag(strict);
        config.allow_comments = r_flag(allow_comments);
        ParseOptions opts = config.parse_options();
        bool simplify_items = r_flag(simplify);

        auto source = open_file_source(r_string(file));
        ItemReader reader(make_event_parser(*source, opts), opts.expand_paths);

        int count = 0;
        while (NodePtr item = reader.next()) {
            SEXP r_item = PROTECT(to_r(item, simplify_items));
            SEXP call = PROTECT(Rf_lang2(callback, r_item));
            std::string failure;
            bool ok = eval_callback(call, failure);
            UNPROTECT(2);
            if (!ok) {
                throw std::runtime_error("callback failed on item " + std::to_string(count + 1) +
                                         ": " + failure);
            }
            count++;
        }
        report_warnings(reader.warnings());
        return Rf_ScalarInteger(count);
    });
}

// Effective TOONPACK_* configuration as a named list
SEXP C_toon_config() {
    return r_guarded("Error reading configuration", []() {
        std::vector<Warning> warnings;
        Config config = Config::from_env(&warnings);
        report_warnings(warnings);

        static const char* const fields[] = {"indent", "delimiter", "strict", "type_inference",
                                             "sort_keys", "parallelism_threshold", "workers",
                                             "backend", "fallback"};
        SEXP out = PROTECT(r_named_list(fields, 9));
        SET_VECTOR_ELT(out, 0, Rf_ScalarInteger(config.indent));
        SET_VECTOR_ELT(out, 1, r_scalar_string(delimiter_name(config.delimiter)));
        SET_VECTOR_ELT(out, 2, Rf_ScalarLogical(config.strict ? TRUE : FALSE));
        SET_VECTOR_ELT(out, 3, Rf_ScalarLogical(config.type_inference ? TRUE : FALSE));
        SET_VECTOR_ELT(out, 4, Rf_ScalarLogical(config.sort_keys ? TRUE : FALSE));
        SET_VECTOR_ELT(out, 5, Rf_ScalarReal(static_cast<double>(config.parallelism_threshold)));
        SET_VECTOR_ELT(out, 6, Rf_ScalarInteger(static_cast<int>(config.effective_workers())));
        SET_VECTOR_ELT(out, 7, Rf_mkString(backend_kind_name(config.backend)));
        SET_VECTOR_ELT(out, 8, Rf_ScalarLogical(config.fallback_to_reference ? TRUE : FALSE));
        UNPROTECT(1);
        return out;
    });
}

} // extern "C"
