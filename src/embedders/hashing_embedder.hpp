#pragma once
#include "../embedder.hpp"
#include <string>
#include <vector>

namespace semsearch {

// Offline embedder: signed feature hashing of word tokens and character
// trigrams into `dim` buckets, L2-normalized. Deterministic across runs
// and platforms; captures lexical overlap only.
class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(size_t dim);

    std::string name() const override { return "hashing"; }
    size_t dimensions() const override { return dim_; }

    std::vector<Embedding> embed(const std::vector<std::string>& texts) override;

    Embedding embed_one(const std::string& text) const;

private:
    size_t dim_;

    void add_feature(Embedding& v, const std::string& feature, float weight) const;
};

} // namespace semsearch
