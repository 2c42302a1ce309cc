#pragma once
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>

namespace semsearch {

using Embedding = std::vector<float>;

// Text-to-vector provider shared by the ingestion and query pipelines.
//
// Implementations must be length- and order-preserving: embed() returns one
// vector per input text, in input order, each exactly dimensions() long.
// After init() returns, embed() must be safe to call from several threads.
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual std::string name() const = 0;
    virtual size_t dimensions() const = 0;

    // One-time setup (connect, warm up, validate dimensions).
    // Throws EmbeddingFailure or DimensionMismatch on failure.
    virtual void init() {}

    // Throws EmbeddingFailure on provider errors.
    virtual std::vector<Embedding> embed(const std::vector<std::string>& texts) = 0;
};

// Builds the provider named by cfg.provider. Throws std::invalid_argument
// for an unknown provider name.
std::unique_ptr<Embedder> create_embedder(const EmbeddingConfig& cfg);

} // namespace semsearch
