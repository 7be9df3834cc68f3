#ifndef TOONPACK_HPP
#define TOONPACK_HPP

#include <memory>
#include <string>
#include "toon_codec.hpp"
#include "toon_config.hpp"
#include "toon_encoder.hpp"
#include "toon_errors.hpp"
#include "toon_events.hpp"
#include "toon_io.hpp"
#include "toon_parser.hpp"
#include "toon_stream.hpp"
#include "toon_value.hpp"

namespace toonpack {

inline std::string encode(const NodePtr& value, const EncodeOptions& opts = EncodeOptions()) {
    Encoder encoder(opts);
    return encoder.encode(value);
}

inline NodePtr decode(const std::string& text, const ParseOptions& opts = ParseOptions()) {
    Parser parser(opts);
    return parser.parse_string(text);
}

inline NodePtr decode_file(const std::string& filepath, const ParseOptions& opts = ParseOptions()) {
    Parser parser(opts);
    return parser.parse_file(filepath);
}

inline StreamEncoder encode_stream(NodePtr value, const EncodeOptions& opts = EncodeOptions()) {
    return StreamEncoder(std::move(value), opts);
}

// `source` must outlive the returned decoder
inline std::unique_ptr<EventParser> decode_events(LineSource& source,
                                                  const ParseOptions& opts = ParseOptions()) {
    return make_event_parser(source, opts);
}

inline ItemReader decode_items(LineSource& source, const ParseOptions& opts = ParseOptions()) {
    return ItemReader(make_event_parser(source, opts), opts.expand_paths);
}

} // namespace toonpack

#endif // TOONPACK_HPP
