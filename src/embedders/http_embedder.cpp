#include "http_embedder.hpp"
#include "../errors.hpp"
#include "../utils.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <iostream>

namespace semsearch {

static void parse_url(const std::string& url, std::string& scheme, std::string& host, int& port, std::string& path_prefix) {
    scheme = "http";
    host = "127.0.0.1";
    port = 80;
    path_prefix = "";

    size_t pos = 0;
    if (url.substr(0, 8) == "https://") {
        scheme = "https"; pos = 8; port = 443;
    } else if (url.substr(0, 7) == "http://") {
        scheme = "http"; pos = 7; port = 80;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        path_prefix = url.substr(slash);
        while (!path_prefix.empty() && path_prefix.back() == '/') path_prefix.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        host = host_port.substr(0, colon);
        port = std::stoi(host_port.substr(colon + 1));
    } else {
        host = host_port;
    }
}

HttpEmbedder::HttpEmbedder(const EmbeddingConfig& cfg) : config_(cfg) {
    parse_url(config_.api_base, scheme_, host_, port_, path_prefix_);
    base_url_ = scheme_ + "://" + host_ + ":" + std::to_string(port_);
}

void HttpEmbedder::init() {
    auto start = Clock::now();
    auto probe = embed({"warmup"});
    if (probe.size() != 1) {
        throw EmbeddingFailure("probe returned " + std::to_string(probe.size()) + " vectors");
    }
    if (probe[0].size() != dimensions()) {
        throw DimensionMismatch(dimensions(), probe[0].size());
    }
    std::cerr << "[embed] Provider ready: " << base_url_ << path_prefix_
              << " model=" << config_.model << " dim=" << dimensions()
              << " (" << static_cast<int>(elapsed_ms(start)) << " ms)\n";
}

std::vector<Embedding> HttpEmbedder::parse_response(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const std::exception& e) {
        throw EmbeddingFailure(std::string("Failed to parse embedding response: ") + e.what());
    }

    if (!j.contains("data") || !j["data"].is_array()) {
        throw EmbeddingFailure("Embedding response has no data array");
    }

    std::vector<std::pair<int64_t, Embedding>> indexed;
    int64_t pos = 0;
    for (auto& item : j["data"]) {
        if (!item.is_object() || !item.contains("embedding") || !item["embedding"].is_array()) {
            throw EmbeddingFailure("Embedding response item " + std::to_string(pos) + " has no embedding");
        }
        Embedding vec;
        vec.reserve(item["embedding"].size());
        for (auto& v : item["embedding"]) {
            if (!v.is_number()) {
                throw EmbeddingFailure("Embedding response item " + std::to_string(pos) + " has a non-numeric value");
            }
            double d = v.get<double>();
            if (!std::isfinite(d) || std::fabs(d) > std::numeric_limits<float>::max()) {
                throw EmbeddingFailure("Embedding response item " + std::to_string(pos) + " has an out-of-range value");
            }
            vec.push_back(static_cast<float>(d));
        }
        int64_t idx = pos;
        if (item.contains("index")) {
            if (!item["index"].is_number_integer()) {
                throw EmbeddingFailure("Embedding response item " + std::to_string(pos) + " has a non-integer index");
            }
            idx = item["index"].get<int64_t>();
        }
        indexed.emplace_back(idx, std::move(vec));
        pos++;
    }

    std::stable_sort(indexed.begin(), indexed.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    // Indices must be exactly 0..n-1, otherwise vectors cannot be matched to inputs.
    for (size_t i = 0; i < indexed.size(); i++) {
        if (indexed[i].first != static_cast<int64_t>(i)) {
            throw EmbeddingFailure("Embedding response indices are not 0.." +
                                   std::to_string(indexed.size() - 1) + " (duplicate, missing or out of range)");
        }
    }

    std::vector<Embedding> out;
    out.reserve(indexed.size());
    for (auto& [idx, vec] : indexed) out.push_back(std::move(vec));
    return out;
}

std::vector<Embedding> HttpEmbedder::embed(const std::vector<std::string>& texts) {
    if (texts.empty()) return {};

    httplib::Client cli(base_url_);
    cli.set_connection_timeout(30);
    cli.set_read_timeout(config_.timeout);

    nlohmann::json body;
    body["model"] = config_.model;
    body["input"] = texts;

    std::string path = path_prefix_ + "/embeddings";
    std::string payload = body.dump();

    httplib::Headers headers = {
        {"Content-Type", "application/json"}
    };
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    auto res = cli.Post(path, headers, payload, "application/json");
    if (!res) {
        throw EmbeddingFailure("Embedding request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw EmbeddingFailure("Embedding returned status " + std::to_string(res->status) + ": " + res->body);
    }

    auto vectors = parse_response(res->body);
    if (vectors.size() != texts.size()) {
        throw EmbeddingFailure("Embedding returned " + std::to_string(vectors.size()) +
                               " vectors for " + std::to_string(texts.size()) + " inputs");
    }
    return vectors;
}

} // namespace semsearch
