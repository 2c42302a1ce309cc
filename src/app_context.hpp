#pragma once
#include "config.hpp"
#include "embedder.hpp"
#include "sqlite_store.hpp"
#include <memory>

namespace semsearch {

// Process-wide resources with an explicit lifecycle: opened once at
// startup, released when the context goes out of scope. Commands hand
// references to these into the pipelines.
struct AppContext {
    Config config;
    std::unique_ptr<Embedder> embedder;
    std::unique_ptr<SqliteRecordStore> store;

    // Creates and initializes the embedder and opens the store. Throws on
    // any failure; callers treat that as fatal.
    static AppContext open(const Config& cfg);
};

} // namespace semsearch
