#pragma once
#include "../embedder.hpp"
#include <string>
#include <vector>

namespace semsearch {

// OpenAI-compatible embeddings client: POST {api_base}/embeddings.
class HttpEmbedder : public Embedder {
public:
    explicit HttpEmbedder(const EmbeddingConfig& cfg);

    std::string name() const override { return "http:" + config_.model; }
    size_t dimensions() const override { return static_cast<size_t>(config_.dimensions); }

    // Sends a single probe request and checks the returned dimension.
    void init() override;

    std::vector<Embedding> embed(const std::vector<std::string>& texts) override;

    // Extracts data[].embedding, ordered by data[].index when present.
    // Throws EmbeddingFailure on malformed payloads.
    static std::vector<Embedding> parse_response(const std::string& body);

private:
    EmbeddingConfig config_;
    // Cached URL components (parsed once in constructor)
    std::string scheme_;
    std::string host_;
    int port_;
    std::string path_prefix_;
    std::string base_url_;  // scheme://host:port
};

} // namespace semsearch
