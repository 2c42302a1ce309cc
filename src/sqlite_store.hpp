#pragma once
#include "record_store.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <cstdint>

struct sqlite3;

namespace semsearch {

// RecordStore backed by a single SQLite database.
//
// Each index is a table "idx_<name>"; its declared schema lives in the
// semsearch_indices table. Vectors are stored as raw float32 BLOBs and
// scored inside SQLite through the registered cosine_similarity() SQL
// function, so ranking never leaves the database.
//
// bulk_upsert() writes into an open transaction; refresh() commits it.
// Writes that were never refreshed are rolled back when the store closes.
class SqliteRecordStore : public RecordStore {
public:
    // ":memory:" opens a private in-memory database.
    // Throws StoreWriteFailure if the database cannot be opened.
    explicit SqliteRecordStore(const std::string& db_path);
    ~SqliteRecordStore() override;

    // Non-copyable
    SqliteRecordStore(const SqliteRecordStore&) = delete;
    SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;

    void drop_index(const std::string& name) override;
    void create_index(const std::string& name, const IndexSchema& schema) override;
    bool has_index(const std::string& name) override;
    BulkResult bulk_upsert(const std::string& name, const std::vector<Item>& items) override;
    void refresh(const std::string& name) override;
    std::vector<QueryResult> score_query(const std::string& name,
                                         const Embedding& query, int k) override;
    int64_t count(const std::string& name) override;
    std::vector<Item> scan(const std::string& name) override;

    // Schema of an existing index. Throws StoreQueryFailure if absent.
    IndexSchema schema(const std::string& name);

    const std::string& path() const { return db_path_; }

private:
    sqlite3* db_ = nullptr;
    std::string db_path_;
    std::mutex mutex_;
    std::map<std::string, IndexSchema> schemas_;

    void init_tables();
    void register_functions();
    void exec(const std::string& sql);
    void begin_if_needed();
    bool load_schema(const std::string& name, IndexSchema& out);

    static std::string table_name(const std::string& index);
    static std::vector<uint8_t> vector_to_blob(const std::vector<float>& v);
    static std::vector<float> blob_to_vector(const void* data, int bytes);
};

} // namespace semsearch
