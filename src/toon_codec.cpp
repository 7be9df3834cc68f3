#include "toon_codec.hpp"
#include "toon_parallel.hpp"
#include "toon_parser.hpp"
#include <exception>
#include <stdexcept>
#include <utility>

namespace toonpack {

std::string ReferenceBackend::encode(const NodePtr& value, const EncodeOptions& opts) {
    EncodeOptions sequential = opts;
    sequential.workers = 1;
    Encoder encoder(sequential);
    return encoder.encode(value);
}

NodePtr ReferenceBackend::decode(const std::string& text, const ParseOptions& opts,
                                 std::vector<Warning>& warnings) {
    Parser parser(opts);
    NodePtr value = parser.parse_string(text);
    warnings.insert(warnings.end(), parser.warnings().begin(), parser.warnings().end());
    return value;
}

NodePtr ReferenceBackend::decode_source(LineSource& source, const ParseOptions& opts,
                                        std::vector<Warning>& warnings) {
    Parser parser(opts);
    NodePtr value = parser.parse_source(source);
    warnings.insert(warnings.end(), parser.warnings().begin(), parser.warnings().end());
    return value;
}

std::string AcceleratedBackend::encode(const NodePtr& value, const EncodeOptions& opts) {
    EncodeOptions parallel = opts;
    parallel.workers = workers_;
    Encoder encoder(parallel);
    return encoder.encode(value);
}

std::unique_ptr<CodecBackend> make_backend(const Config& config) {
    size_t workers = config.effective_workers();
    switch (config.backend) {
        case BackendKind::REFERENCE:
            return std::make_unique<ReferenceBackend>();
        case BackendKind::ACCELERATED:
            return std::make_unique<AcceleratedBackend>(workers);
        case BackendKind::AUTO:
            break;
    }
    if (workers > 1) {
        return std::make_unique<AcceleratedBackend>(workers);
    }
    return std::make_unique<ReferenceBackend>();
}

Codec::Codec(const Config& config) : Codec(config, make_backend(config)) {}

Codec::Codec(const Config& config, std::unique_ptr<CodecBackend> backend)
    : config_(config),
      encode_opts_(config.encode_options()),
      parse_opts_(config.parse_options()),
      backend_(std::move(backend)) {
    if (config_.indent < 1) {
        throw std::invalid_argument("indent must be at least 1, got " +
                                    std::to_string(config_.indent));
    }
}

template <typename Op>
auto Codec::guarded(Op op, std::vector<Warning>& warnings)
    -> decltype(op(std::declval<CodecBackend&>())) {
    std::string cause;
    try {
        return op(*backend_);
    } catch (const ToonError&) {
        throw;
    } catch (const std::exception& e) {
        cause = e.what();
    } catch (...) {
        cause = "non-standard exception";
    }

    std::string msg = std::string(backend_->name()) + " backend failed: " + cause;
    if (!config_.fallback_to_reference ||
        std::string(backend_->name()) == reference_.name()) {
        throw InternalError(msg);
    }
    warnings.emplace_back("backend_fallback", msg + "; retrying with the reference backend");

    // The retry answers to the same error contract
    try {
        return op(reference_);
    } catch (const ToonError&) {
        throw;
    } catch (const std::exception& e) {
        throw InternalError(std::string("reference backend failed: ") + e.what());
    } catch (...) {
        throw InternalError("reference backend failed: non-standard exception");
    }
}

std::string Codec::encode(const NodePtr& value) {
    return guarded([&](CodecBackend& b) { return b.encode(value, encode_opts_); }, warnings_);
}

NodePtr Codec::decode(const std::string& text) {
    return guarded([&](CodecBackend& b) {
        std::vector<Warning> found;
        NodePtr value = b.decode(text, parse_opts_, found);
        warnings_.insert(warnings_.end(), found.begin(), found.end());
        return value;
    }, warnings_);
}

NodePtr Codec::decode_file(const std::string& filepath) {
    return guarded([&](CodecBackend& b) {
        auto source = open_file_source(filepath);
        std::vector<Warning> found;
        NodePtr value = b.decode_source(*source, parse_opts_, found);
        warnings_.insert(warnings_.end(), found.begin(), found.end());
        return value;
    }, warnings_);
}

template <typename Fn>
std::vector<BatchResult> Codec::run_batch(size_t n, Fn fn) {
    std::vector<BatchResult> results(n);

    auto run_range = [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; i++) {
            BatchResult& r = results[i];
            try {
                fn(i, r);
                r.ok = true;
            } catch (const ToonError& e) {
                r.ok = false;
                r.error_type = e.type();
                r.error = e.what();
            }
        }
    };

    size_t workers = config_.effective_workers();
    if (n >= config_.parallelism_threshold && workers > 1) {
        parallel_for_ranges(n, workers, run_range);
    } else {
        run_range(0, n);
    }
    return results;
}

std::vector<BatchResult> Codec::encode_batch(const std::vector<NodePtr>& values) {
    return run_batch(values.size(), [&](size_t i, BatchResult& r) {
        r.text = guarded([&](CodecBackend& b) { return b.encode(values[i], encode_opts_); },
                         r.warnings);
    });
}

std::vector<BatchResult> Codec::decode_batch(const std::vector<std::string>& texts) {
    return run_batch(texts.size(), [&](size_t i, BatchResult& r) {
        r.value = guarded([&](CodecBackend& b) {
            std::vector<Warning> found;
            NodePtr value = b.decode(texts[i], parse_opts_, found);
            r.warnings.insert(r.warnings.end(), found.begin(), found.end());
            return value;
        }, r.warnings);
    });
}

std::vector<BatchResult> Codec::decode_files(const std::vector<std::string>& filepaths) {
    return run_batch(filepaths.size(), [&](size_t i, BatchResult& r) {
        r.source = filepaths[i];
        r.value = guarded([&](CodecBackend& b) {
            auto source = open_file_source(filepaths[i]);
            std::vector<Warning> found;
            NodePtr value = b.decode_source(*source, parse_opts_, found);
            r.warnings.insert(r.warnings.end(), found.begin(), found.end());
            return value;
        }, r.warnings);
    });
}

} // namespace toonpack
