#include "search_server.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <iostream>
#include <limits>

namespace semsearch {

static HttpReply error_reply(int status, const std::string& msg) {
    nlohmann::json err;
    err["error"] = msg;
    return {status, err.dump()};
}

HttpReply handle_search_request(const QueryPipeline& pipeline, const std::string& body, int default_k) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error&) {
        return error_reply(400, "invalid JSON in request body");
    }
    if (!j.is_object()) {
        return error_reply(400, "request body must be a JSON object");
    }

    std::string text;
    try {
        text = j.value("query", "");
    } catch (const nlohmann::json::type_error&) {
        return error_reply(400, "'query' must be a string");
    }

    int k = default_k;
    if (j.contains("k")) {
        const auto& kj = j["k"];
        if (!kj.is_number_integer()) {
            return error_reply(400, "'k' must be an integer");
        }
        if (kj.is_number_unsigned()) {
            if (kj.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
                return error_reply(400, "'k' is out of range");
            }
        } else {
            int64_t v = kj.get<int64_t>();
            if (v < 0 || v > std::numeric_limits<int>::max()) {
                return error_reply(400, "'k' is out of range");
            }
        }
        k = static_cast<int>(kj.get<int64_t>());
    }
    if (text.empty()) {
        return error_reply(400, "'query' is required");
    }

    try {
        QueryResponse resp = pipeline.query(text, k);
        return {200, resp.to_json().dump()};
    } catch (const std::invalid_argument& e) {
        return error_reply(400, e.what());
    } catch (const EmbeddingFailure& e) {
        std::cerr << "[server] Embedding failed: " << e.what() << "\n";
        return error_reply(502, e.what());
    } catch (const StoreQueryFailure& e) {
        std::cerr << "[server] Search failed: " << e.what() << "\n";
        return error_reply(503, e.what());
    } catch (const DimensionMismatch& e) {
        // Index was built with a different embedding model.
        std::cerr << "[server] Search failed: " << e.what() << "\n";
        return error_reply(409, std::string(e.what()) + ", re-run ingest");
    }
}

SearchServer::SearchServer(const ServerConfig& cfg, const QueryPipeline& pipeline, int default_k)
    : config_(cfg), pipeline_(pipeline), default_k_(default_k) {}

SearchServer::~SearchServer() {
    stop();
}

bool SearchServer::start() {
    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", "application/json");
    });

    // Global exception handler for httplib
    server_.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        std::string msg = "unknown error";
        try { if (ep) std::rethrow_exception(ep); }
        catch (const std::exception& e) { msg = e.what(); }
        catch (...) { msg = "non-std exception"; }
        std::cerr << "[server] Unhandled exception: " << msg << "\n";
        res.status = 500;
        nlohmann::json err;
        err["error"] = msg;
        res.set_content(err.dump(), "application/json");
    });

    server_.Post("/search", [this](const httplib::Request& req, httplib::Response& res) {
        HttpReply reply = handle_search_request(pipeline_, req.body, default_k_);
        res.status = reply.status;
        res.set_content(reply.body, "application/json");
    });

    if (!server_.bind_to_port(config_.host, config_.port)) {
        std::cerr << "[server] Failed to bind " << config_.host << ":" << config_.port << "\n";
        return false;
    }

    thread_ = std::thread([this]() {
        std::cerr << "[server] Listening on " << config_.host << ":" << config_.port << "\n";
        if (!server_.listen_after_bind()) {
            std::cerr << "[server] Listener on " << config_.host << ":" << config_.port << " stopped with an error\n";
        }
    });
    return true;
}

void SearchServer::stop() {
    server_.stop();
    if (thread_.joinable()) thread_.join();
}

} // namespace semsearch
