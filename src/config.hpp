#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace semsearch {

struct EmbeddingConfig {
    std::string provider = "http";   // "http" or "hashing"
    std::string api_base = "http://127.0.0.1:8000/v1";
    std::string api_key;             // Optional Bearer token
    std::string model = "text-embedding-3-small";
    int dimensions = 1536;
    int timeout = 60;                // read timeout, seconds
};

struct StoreConfig {
    std::string path = "~/.semsearch/index.db";
    std::string index = "questions";
};

struct IngestConfig {
    int batch_size = 100;
    bool strict = false;             // abort the run on the first failed batch
    bool pipeline_writes = true;     // overlap bulk write N with embedding N+1
};

struct QueryConfig {
    int top_k = 10;
};

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 18800;
};

struct Config {
    EmbeddingConfig embedding;
    StoreConfig store;
    IngestConfig ingest;
    QueryConfig query;
    ServerConfig server;

    std::string store_path() const {
        return expand_path(store.path);
    }

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace semsearch
