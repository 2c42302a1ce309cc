#include "app_context.hpp"
#include <iostream>

namespace semsearch {

AppContext AppContext::open(const Config& cfg) {
    AppContext ctx;
    ctx.config = cfg;

    ctx.store = std::make_unique<SqliteRecordStore>(cfg.store_path());
    std::cerr << "[store] Opened " << ctx.store->path() << "\n";

    ctx.embedder = create_embedder(cfg.embedding);
    ctx.embedder->init();
    std::cerr << "[embed] Using " << ctx.embedder->name()
              << " (dim=" << ctx.embedder->dimensions() << ")\n";
    return ctx;
}

} // namespace semsearch
