#pragma once
#include "query.hpp"
#include "config.hpp"
#include <httplib.h>
#include <string>
#include <thread>

namespace semsearch {

struct HttpReply {
    int status = 200;
    std::string body;   // JSON
};

// POST /search body -> reply. Kept free of httplib so it can be driven
// directly.
HttpReply handle_search_request(const QueryPipeline& pipeline, const std::string& body, int default_k);

// GET /health and POST /search {"query": str, "k": int}.
class SearchServer {
public:
    SearchServer(const ServerConfig& cfg, const QueryPipeline& pipeline, int default_k);
    ~SearchServer();

    SearchServer(const SearchServer&) = delete;
    SearchServer& operator=(const SearchServer&) = delete;

    // Binds host:port, then serves on a background thread. Returns false
    // if the address cannot be bound.
    bool start();
    void stop();

private:
    ServerConfig config_;
    const QueryPipeline& pipeline_;
    int default_k_;
    httplib::Server server_;
    std::thread thread_;
};

} // namespace semsearch
