#include "commands.hpp"
#include "app_context.hpp"
#include "query.hpp"
#include "search_server.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace semsearch {

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

int cmd_serve(const std::string& config_path, const std::vector<std::string>& args) {
    Config cfg = Config::load(config_path);

    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--host" && i + 1 < args.size()) {
            cfg.server.host = args[++i];
        } else if (args[i] == "--port" && i + 1 < args.size()) {
            cfg.server.port = std::stoi(args[++i]);
        } else if (args[i] == "--index" && i + 1 < args.size()) {
            cfg.store.index = args[++i];
        } else {
            std::cerr << "Unknown serve option: " << args[i] << "\n";
            return 1;
        }
    }

    // The provider is fully initialized before the listener accepts anything.
    AppContext ctx;
    try {
        ctx = AppContext::open(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[server] Startup failed: " << e.what() << "\n";
        return 1;
    }
    if (!ctx.store->has_index(cfg.store.index)) {
        std::cerr << "[warn] Index '" << cfg.store.index << "' does not exist yet; searches will fail until ingest runs\n";
    }

    QueryPipeline pipeline(*ctx.embedder, *ctx.store, cfg.store.index);
    SearchServer server(cfg.server, pipeline, cfg.query.top_k);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!server.start()) {
        return 1;
    }
    std::cerr << "[server] Ready. Ctrl+C to quit.\n";

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down...\n";
    server.stop();
    std::cerr << "[server] Done.\n";
    return 0;
}

} // namespace semsearch
