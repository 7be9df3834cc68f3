#ifndef TOON_CODEC_HPP
#define TOON_CODEC_HPP

#include <string>
#include <vector>
#include <memory>
#include <utility>
#include "toon_config.hpp"
#include "toon_encoder.hpp"
#include "toon_errors.hpp"
#include "toon_grammar.hpp"
#include "toon_io.hpp"
#include "toon_value.hpp"

namespace toonpack {

// One encode/decode implementation.  Parser warnings go to `warnings`.
class CodecBackend {
public:
    virtual ~CodecBackend() = default;

    virtual const char* name() const = 0;

    virtual std::string encode(const NodePtr& value, const EncodeOptions& opts) = 0;

    virtual NodePtr decode(const std::string& text, const ParseOptions& opts,
                           std::vector<Warning>& warnings) = 0;

    virtual NodePtr decode_source(LineSource& source, const ParseOptions& opts,
                                  std::vector<Warning>& warnings) = 0;
};

// Sequential encoder and parser
class ReferenceBackend : public CodecBackend {
public:
    const char* name() const override { return "reference"; }

    std::string encode(const NodePtr& value, const EncodeOptions& opts) override;
    NodePtr decode(const std::string& text, const ParseOptions& opts,
                   std::vector<Warning>& warnings) override;
    NodePtr decode_source(LineSource& source, const ParseOptions& opts,
                          std::vector<Warning>& warnings) override;
};

// Large tabular arrays are encoded in row batches on worker threads
class AcceleratedBackend : public ReferenceBackend {
public:
    explicit AcceleratedBackend(size_t workers) : workers_(workers) {}

    const char* name() const override { return "accelerated"; }

    std::string encode(const NodePtr& value, const EncodeOptions& opts) override;

private:
    size_t workers_;
};

std::unique_ptr<CodecBackend> make_backend(const Config& config);

// Outcome of one document in a batch call
struct BatchResult {
    bool ok = false;
    std::string source;                 // file path for decode_files
    std::string text;                   // encode output
    NodePtr value;                      // decode output
    ErrorType error_type = ErrorType::INTERNAL_ERROR;
    std::string error;
    std::vector<Warning> warnings;
};

// Codec front end: picks a backend from the configuration and normalizes
// failures at the boundary.  ToonErrors pass through unchanged; anything
// else becomes InternalError, after one retry on the reference backend when
// fallback is enabled.
class Codec {
public:
    explicit Codec(const Config& config = Config());
    Codec(const Config& config, std::unique_ptr<CodecBackend> backend);

    std::string encode(const NodePtr& value);
    NodePtr decode(const std::string& text);
    NodePtr decode_file(const std::string& filepath);

    // Independent documents; parallel from parallelism_threshold items on.
    // Failures are reported per item, never thrown.
    std::vector<BatchResult> encode_batch(const std::vector<NodePtr>& values);
    std::vector<BatchResult> decode_batch(const std::vector<std::string>& texts);
    std::vector<BatchResult> decode_files(const std::vector<std::string>& filepaths);

    const std::vector<Warning>& warnings() const { return warnings_; }
    void clear_warnings() { warnings_.clear(); }

    const CodecBackend& backend() const { return *backend_; }
    const Config& config() const { return config_; }

private:
    template <typename Op>
    auto guarded(Op op, std::vector<Warning>& warnings) -> decltype(op(std::declval<CodecBackend&>()));

    template <typename Fn>
    std::vector<BatchResult> run_batch(size_t n, Fn fn);

    Config config_;
    EncodeOptions encode_opts_;
    ParseOptions parse_opts_;
    std::unique_ptr<CodecBackend> backend_;
    ReferenceBackend reference_;
    std::vector<Warning> warnings_;
};

} // namespace toonpack

#endif // TOON_CODEC_HPP
