#include "config.hpp"
#include <fstream>
#include <iostream>

namespace semsearch {

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    auto& e = j["embedding"];
    e["provider"] = embedding.provider;
    e["api_base"] = embedding.api_base;
    if (!embedding.api_key.empty()) e["api_key"] = embedding.api_key;
    e["model"] = embedding.model;
    e["dimensions"] = embedding.dimensions;
    e["timeout"] = embedding.timeout;

    j["store"] = {{"path", store.path}, {"index", store.index}};

    j["ingest"] = {
        {"batch_size", ingest.batch_size},
        {"strict", ingest.strict},
        {"pipeline_writes", ingest.pipeline_writes}
    };

    j["query"] = {{"top_k", query.top_k}};
    j["server"] = {{"host", server.host}, {"port", server.port}};
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;

    if (j.contains("embedding")) {
        auto& e = j["embedding"];
        c.embedding.provider = e.value("provider", c.embedding.provider);
        c.embedding.api_base = e.value("api_base", c.embedding.api_base);
        c.embedding.api_key = e.value("api_key", c.embedding.api_key);
        c.embedding.model = e.value("model", c.embedding.model);
        c.embedding.dimensions = e.value("dimensions", c.embedding.dimensions);
        c.embedding.timeout = e.value("timeout", c.embedding.timeout);
    }

    if (j.contains("store")) {
        auto& s = j["store"];
        c.store.path = s.value("path", c.store.path);
        c.store.index = s.value("index", c.store.index);
    }

    if (j.contains("ingest")) {
        auto& in = j["ingest"];
        c.ingest.batch_size = in.value("batch_size", c.ingest.batch_size);
        c.ingest.strict = in.value("strict", c.ingest.strict);
        c.ingest.pipeline_writes = in.value("pipeline_writes", c.ingest.pipeline_writes);
    }

    if (j.contains("query")) {
        c.query.top_k = j["query"].value("top_k", c.query.top_k);
    }

    if (j.contains("server")) {
        auto& sv = j["server"];
        c.server.host = sv.value("host", c.server.host);
        c.server.port = sv.value("port", c.server.port);
    }

    // Out-of-range values fall back to defaults rather than failing later.
    if (c.ingest.batch_size <= 0) {
        std::cerr << "[config] Warning: ingest.batch_size must be > 0, using 100\n";
        c.ingest.batch_size = 100;
    }
    if (c.embedding.dimensions <= 0) {
        std::cerr << "[config] Warning: embedding.dimensions must be > 0, using 1536\n";
        c.embedding.dimensions = 1536;
    }

    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
}

} // namespace semsearch
