#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "embedders/hashing_embedder.hpp"
#include <stdexcept>

namespace semsearch {

std::unique_ptr<Embedder> create_embedder(const EmbeddingConfig& cfg) {
    if (cfg.provider == "http") {
        return std::make_unique<HttpEmbedder>(cfg);
    }
    if (cfg.provider == "hashing") {
        return std::make_unique<HashingEmbedder>(static_cast<size_t>(cfg.dimensions));
    }
    throw std::invalid_argument("unknown embedding provider: " + cfg.provider);
}

} // namespace semsearch
