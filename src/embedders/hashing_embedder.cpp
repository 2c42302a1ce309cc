#include "hashing_embedder.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace semsearch {

static uint64_t fnv1a(const std::string& s) {
    uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

static std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string cur;
    for (unsigned char c : text) {
        // Bytes >= 0x80 are kept so UTF-8 words stay intact.
        if (std::isalnum(c) || c >= 0x80 || c == '#' || c == '+') {
            cur += static_cast<char>(std::tolower(c));
        } else if (!cur.empty()) {
            tokens.push_back(std::move(cur));
            cur.clear();
        }
    }
    if (!cur.empty()) tokens.push_back(std::move(cur));
    return tokens;
}

static void l2_normalize(Embedding& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

HashingEmbedder::HashingEmbedder(size_t dim) : dim_(dim) {
    if (dim_ == 0) {
        throw std::invalid_argument("HashingEmbedder dim must be > 0");
    }
}

void HashingEmbedder::add_feature(Embedding& v, const std::string& feature, float weight) const {
    uint64_t h = fnv1a(feature);
    size_t bucket = static_cast<size_t>(h % dim_);
    float sign = ((h >> 63) & 1ULL) ? -1.0f : 1.0f;
    v[bucket] += sign * weight;
}

Embedding HashingEmbedder::embed_one(const std::string& text) const {
    Embedding v(dim_, 0.0f);
    for (const auto& tok : tokenize(text)) {
        add_feature(v, "w:" + tok, 1.0f);
        std::string padded = "<" + tok + ">";
        for (size_t i = 0; i + 3 <= padded.size(); i++) {
            add_feature(v, "c:" + padded.substr(i, 3), 0.5f);
        }
    }
    l2_normalize(v);
    return v;
}

std::vector<Embedding> HashingEmbedder::embed(const std::vector<std::string>& texts) {
    std::vector<Embedding> out;
    out.reserve(texts.size());
    for (const auto& t : texts) out.push_back(embed_one(t));
    return out;
}

} // namespace semsearch
