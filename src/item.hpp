#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace semsearch {

enum class ItemKind { Question, Answer };

struct Item {
    int64_t id = 0;               // 0 until the store assigns one
    ItemKind kind = ItemKind::Question;
    std::string title;
    std::string body;
    std::vector<float> vector;    // empty until ingestion attaches it
    nlohmann::json metadata = nlohmann::json::object();  // passthrough fields

    bool has_vector() const { return !vector.empty(); }
};

// One ranked hit. `score` is the shifted cosine similarity.
struct QueryResult {
    int64_t id = 0;
    double score = 0.0;
    std::string title;
    std::string body;

    nlohmann::json to_json() const {
        return {{"id", id}, {"score", score}, {"title", title}, {"body", body}};
    }
};

} // namespace semsearch
