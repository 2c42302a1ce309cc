#include "query.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>
#include <stdexcept>

namespace semsearch {

nlohmann::json QueryResponse::to_json() const {
    nlohmann::json j;
    j["results"] = nlohmann::json::array();
    for (auto& r : results) j["results"].push_back(r.to_json());
    j["embed_ms"] = embed_ms;
    j["search_ms"] = search_ms;
    return j;
}

QueryPipeline::QueryPipeline(Embedder& embedder, RecordStore& store, std::string index_name)
    : embedder_(embedder), store_(store), index_name_(std::move(index_name)) {}

QueryResponse QueryPipeline::query(const std::string& text, int k,
                                   const std::atomic<bool>* cancel) const {
    if (trim(text).empty()) {
        throw std::invalid_argument("query text is empty");
    }

    QueryResponse resp;
    if (k <= 0) return resp;

    if (cancel && cancel->load()) throw QueryCancelled();

    auto start = Clock::now();
    std::vector<Embedding> vectors;
    try {
        vectors = embedder_.embed({text});
    } catch (const EmbeddingFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw EmbeddingFailure(std::string("provider error: ") + e.what());
    }
    resp.embed_ms = elapsed_ms(start);

    if (vectors.size() != 1) {
        throw EmbeddingFailure("provider returned " + std::to_string(vectors.size()) +
                               " vectors for one query");
    }

    if (cancel && cancel->load()) throw QueryCancelled();

    start = Clock::now();
    resp.results = store_.score_query(index_name_, vectors[0], k);
    resp.search_ms = elapsed_ms(start);
    return resp;
}

} // namespace semsearch
