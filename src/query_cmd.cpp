#include "commands.hpp"
#include "app_context.hpp"
#include "query.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>

namespace semsearch {

static std::atomic<bool> g_interrupted{false};

static void signal_handler(int) {
    g_interrupted = true;
}

static std::string snippet(const std::string& s, size_t max_len) {
    std::string one_line;
    one_line.reserve(std::min(s.size(), max_len));
    for (char c : s) {
        if (one_line.size() >= max_len) break;
        one_line += (c == '\n' || c == '\r' || c == '\t') ? ' ' : c;
    }
    if (s.size() > max_len) one_line += "...";
    return one_line;
}

static void print_response(const QueryResponse& resp) {
    std::cout << std::fixed << std::setprecision(1)
              << "[embed " << resp.embed_ms << " ms, search " << resp.search_ms << " ms]\n";
    if (resp.results.empty()) {
        std::cout << "No results.\n";
        return;
    }
    std::cout << std::setprecision(4);
    for (size_t i = 0; i < resp.results.size(); i++) {
        auto& r = resp.results[i];
        std::cout << std::setw(3) << (i + 1) << ". " << r.score << "  #" << r.id << "  " << r.title << "\n";
        if (!r.body.empty()) std::cout << "       " << snippet(r.body, 160) << "\n";
    }
    std::cout.unsetf(std::ios::floatfield);
}

// One query, errors reported to the user. Returns false on failure.
static bool run_one(const QueryPipeline& pipeline, const std::string& text, int k, bool json) {
    try {
        QueryResponse resp = pipeline.query(text, k, &g_interrupted);
        if (json) std::cout << resp.to_json().dump(2) << "\n";
        else print_response(resp);
        return true;
    } catch (const QueryCancelled&) {
        std::cerr << "[query] Cancelled\n";
    } catch (const EmbeddingFailure& e) {
        std::cerr << "[query] Embedding failed: " << e.what() << "\n";
    } catch (const StoreQueryFailure& e) {
        std::cerr << "[query] Search failed: " << e.what() << "\n";
    } catch (const DimensionMismatch& e) {
        std::cerr << "[query] " << e.what() << " (index built with a different model? re-run ingest)\n";
    } catch (const std::invalid_argument& e) {
        std::cerr << "[query] " << e.what() << "\n";
    }
    return false;
}

int cmd_query(const std::string& config_path, const std::vector<std::string>& args) {
    Config cfg = Config::load(config_path);

    std::string text;
    bool json = false;
    int k = cfg.query.top_k;
    for (size_t i = 0; i < args.size(); i++) {
        if ((args[i] == "-q" || args[i] == "--query") && i + 1 < args.size()) {
            text = args[++i];
        } else if (args[i] == "-k" && i + 1 < args.size()) {
            k = std::stoi(args[++i]);
        } else if (args[i] == "--index" && i + 1 < args.size()) {
            cfg.store.index = args[++i];
        } else if (args[i] == "--json") {
            json = true;
        } else {
            std::cerr << "Unknown query option: " << args[i] << "\n";
            return 1;
        }
    }

    AppContext ctx;
    try {
        ctx = AppContext::open(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[query] Startup failed: " << e.what() << "\n";
        return 1;
    }

    QueryPipeline pipeline(*ctx.embedder, *ctx.store, cfg.store.index);

    if (!text.empty()) {
        return run_one(pipeline, text, k, json) ? 0 : 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::cerr << "[query] Index '" << cfg.store.index << "', top " << k
              << ". Type a query, or exit / Ctrl+D to quit.\n";

    std::string line;
    while (!g_interrupted) {
        std::cout << "query> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        line = trim(line);
        if (line.empty()) continue;
        if (line == "exit" || line == "quit" || line == ":q") break;
        run_one(pipeline, line, k, json);
    }
    std::cout << "\n";
    return 0;
}

} // namespace semsearch
