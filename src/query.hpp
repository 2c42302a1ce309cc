#pragma once
#include "embedder.hpp"
#include "record_store.hpp"
#include <atomic>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace semsearch {

struct QueryResponse {
    std::vector<QueryResult> results;   // descending score, at most k
    double embed_ms = 0.0;
    double search_ms = 0.0;

    nlohmann::json to_json() const;
};

// Stateless embed -> score -> rank. Safe to call concurrently; holds no
// per-query state.
class QueryPipeline {
public:
    QueryPipeline(Embedder& embedder, RecordStore& store, std::string index_name);

    // Throws std::invalid_argument for empty text, EmbeddingFailure,
    // StoreQueryFailure, DimensionMismatch, or QueryCancelled when `cancel`
    // is set before scoring begins.
    QueryResponse query(const std::string& text, int k,
                        const std::atomic<bool>* cancel = nullptr) const;

    const std::string& index_name() const { return index_name_; }

private:
    Embedder& embedder_;
    RecordStore& store_;
    std::string index_name_;
};

} // namespace semsearch
