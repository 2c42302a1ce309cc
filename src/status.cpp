#include "commands.hpp"
#include "config.hpp"
#include "sqlite_store.hpp"
#include "errors.hpp"
#include <iostream>

namespace semsearch {

int cmd_status(const std::string& config_path) {
    Config cfg = Config::load(config_path);

    std::cout << "=== semsearch status ===\n";
    std::cout << "Config path  : " << config_path << "\n";
    std::cout << "Embedding    : " << cfg.embedding.provider;
    if (cfg.embedding.provider == "http") {
        std::cout << " (" << cfg.embedding.api_base << ", model " << cfg.embedding.model << ")";
    }
    std::cout << "\n";
    std::cout << "Dimensions   : " << cfg.embedding.dimensions << "\n";
    std::cout << "Store        : " << cfg.store_path() << "\n";
    std::cout << "Index        : " << cfg.store.index << "\n";
    std::cout << "Batch size   : " << cfg.ingest.batch_size
              << (cfg.ingest.strict ? " (strict)" : "") << "\n";
    std::cout << "Top k        : " << cfg.query.top_k << "\n";
    std::cout << "Server       : " << cfg.server.host << ":" << cfg.server.port << "\n";

    if (!fs::exists(cfg.store_path())) {
        std::cout << "Documents    : (store not created yet)\n";
        return 0;
    }

    try {
        SqliteRecordStore store(cfg.store_path());
        if (!store.has_index(cfg.store.index)) {
            std::cout << "Documents    : (index not created yet)\n";
            return 0;
        }
        IndexSchema schema = store.schema(cfg.store.index);
        std::cout << "Documents    : " << store.count(cfg.store.index) << "\n";
        std::cout << "Index dims   : " << schema.dims << "\n";
        if (schema.dims != static_cast<size_t>(cfg.embedding.dimensions)) {
            std::cout << "[warn] Index dimension differs from configured embedding dimension, re-run ingest\n";
        }
    } catch (const Error& e) {
        std::cerr << "[status] " << e.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace semsearch
