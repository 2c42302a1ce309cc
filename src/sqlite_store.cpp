#include "sqlite_store.hpp"
#include "similarity.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <sqlite3.h>
#include <cstring>
#include <iostream>
#include <set>

namespace semsearch {

// cosine_similarity(a BLOB, b BLOB) -> REAL
// NULL if either argument is NULL; an error if the lengths differ.
static void sql_cosine_similarity(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    if (argc != 2 ||
        sqlite3_value_type(argv[0]) == SQLITE_NULL ||
        sqlite3_value_type(argv[1]) == SQLITE_NULL) {
        sqlite3_result_null(ctx);
        return;
    }

    int a_bytes = sqlite3_value_bytes(argv[0]);
    int b_bytes = sqlite3_value_bytes(argv[1]);
    if (a_bytes != b_bytes || a_bytes % static_cast<int>(sizeof(float)) != 0) {
        sqlite3_result_error(ctx, "cosine_similarity: dimension mismatch", -1);
        return;
    }

    // Blob storage carries no alignment guarantee, copy before reading floats.
    size_t dim = static_cast<size_t>(a_bytes) / sizeof(float);
    std::vector<float> a(dim), b(dim);
    if (dim > 0) {
        std::memcpy(a.data(), sqlite3_value_blob(argv[0]), a_bytes);
        std::memcpy(b.data(), sqlite3_value_blob(argv[1]), b_bytes);
    }
    sqlite3_result_double(ctx, cosine_similarity(a.data(), b.data(), dim));
}

static bool valid_identifier(const std::string& s) {
    if (s.empty() || s.size() > 64) return false;
    for (unsigned char c : s) {
        if (!std::isalnum(c) && c != '_') return false;
    }
    return true;
}

static const char* column_type(FieldType t) {
    switch (t) {
        case FieldType::Integer: return "INTEGER";
        case FieldType::DenseVector: return "BLOB NOT NULL";
        default: return "TEXT";
    }
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* t = sqlite3_column_text(stmt, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

SqliteRecordStore::SqliteRecordStore(const std::string& db_path) : db_path_(db_path) {
    if (db_path_ != ":memory:") {
        auto parent = fs::path(db_path_).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(db_path_.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StoreWriteFailure("Failed to open store " + db_path_ + ": " + msg);
    }

    sqlite3_busy_timeout(db_, 5000);

    try {
        register_functions();
        init_tables();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteRecordStore::~SqliteRecordStore() {
    if (!db_) return;
    if (!sqlite3_get_autocommit(db_)) {
        std::cerr << "[store] Warning: discarding writes that were never refreshed\n";
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
    sqlite3_close(db_);
}

void SqliteRecordStore::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreWriteFailure(msg);
    }
}

void SqliteRecordStore::register_functions() {
    int rc = sqlite3_create_function(db_, "cosine_similarity", 2,
                                     SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr,
                                     sql_cosine_similarity, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        throw StoreWriteFailure("Failed to register cosine_similarity: " + std::string(sqlite3_errmsg(db_)));
    }
}

void SqliteRecordStore::init_tables() {
    exec(R"SQL(
        CREATE TABLE IF NOT EXISTS semsearch_indices (
            name TEXT PRIMARY KEY,
            dims INTEGER NOT NULL,
            schema TEXT NOT NULL
        );
    )SQL");
}

void SqliteRecordStore::begin_if_needed() {
    if (!sqlite3_get_autocommit(db_)) return;
    exec("BEGIN");
}

std::string SqliteRecordStore::table_name(const std::string& index) {
    return "idx_" + index;
}

std::vector<uint8_t> SqliteRecordStore::vector_to_blob(const std::vector<float>& v) {
    std::vector<uint8_t> blob(v.size() * sizeof(float));
    if (!v.empty()) std::memcpy(blob.data(), v.data(), blob.size());
    return blob;
}

std::vector<float> SqliteRecordStore::blob_to_vector(const void* data, int bytes) {
    int count = bytes / static_cast<int>(sizeof(float));
    std::vector<float> v(count);
    if (count > 0) std::memcpy(v.data(), data, count * sizeof(float));
    return v;
}

bool SqliteRecordStore::load_schema(const std::string& name, IndexSchema& out) {
    auto it = schemas_.find(name);
    if (it != schemas_.end()) {
        out = it->second;
        return true;
    }

    const char* sql = "SELECT schema FROM semsearch_indices WHERE name = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreQueryFailure("schema lookup prepare error: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    bool found = false;
    std::string schema_json;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        schema_json = column_text(stmt, 0);
        found = true;
    }
    sqlite3_finalize(stmt);
    if (!found) return false;

    try {
        out = IndexSchema::from_json(nlohmann::json::parse(schema_json));
    } catch (const std::exception& e) {
        throw StoreQueryFailure("corrupt schema for index " + name + ": " + e.what());
    }
    schemas_[name] = out;
    return true;
}

IndexSchema SqliteRecordStore::schema(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    IndexSchema s;
    if (!load_schema(name, s)) {
        throw StoreQueryFailure("index not found: " + name);
    }
    return s;
}

bool SqliteRecordStore::has_index(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    IndexSchema s;
    return load_schema(name, s);
}

void SqliteRecordStore::drop_index(const std::string& name) {
    if (!valid_identifier(name)) {
        throw StoreWriteFailure("invalid index name: " + name);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    begin_if_needed();
    exec("DROP TABLE IF EXISTS " + table_name(name));

    const char* sql = "DELETE FROM semsearch_indices WHERE name = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreWriteFailure("drop prepare error: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw StoreWriteFailure("drop error: " + std::string(sqlite3_errmsg(db_)));
    }
    schemas_.erase(name);
}

void SqliteRecordStore::create_index(const std::string& name, const IndexSchema& schema) {
    if (!valid_identifier(name)) {
        throw StoreWriteFailure("invalid index name: " + name);
    }
    if (schema.dims == 0) {
        throw StoreWriteFailure("index " + name + ": vector dimension must be > 0");
    }

    int vector_fields = 0;
    bool has_title = false, has_body = false;
    std::set<std::string> seen;
    for (auto& f : schema.fields) {
        if (!valid_identifier(f.name) || f.name == "id" || f.name == "metadata") {
            throw StoreWriteFailure("index " + name + ": invalid field name '" + f.name + "'");
        }
        if (!seen.insert(f.name).second) {
            throw StoreWriteFailure("index " + name + ": duplicate field '" + f.name + "'");
        }
        if (f.type == FieldType::DenseVector) vector_fields++;
        if (f.name == "title") has_title = true;
        if (f.name == "body") has_body = true;
    }
    if (vector_fields != 1 || !has_title || !has_body) {
        throw StoreWriteFailure("index " + name + ": schema needs title, body and exactly one dense_vector field");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    IndexSchema existing;
    if (load_schema(name, existing)) {
        throw StoreWriteFailure("index already exists: " + name);
    }

    std::string ddl = "CREATE TABLE " + table_name(name) + " (id INTEGER PRIMARY KEY AUTOINCREMENT";
    for (auto& f : schema.fields) {
        ddl += ", " + f.name + " " + column_type(f.type);
        if (f.name == "title") ddl += " NOT NULL";
    }
    ddl += ", metadata TEXT)";

    begin_if_needed();
    exec(ddl);

    const char* sql = "INSERT INTO semsearch_indices (name, dims, schema) VALUES (?, ?, ?)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreWriteFailure("create prepare error: " + std::string(sqlite3_errmsg(db_)));
    }
    std::string schema_json = schema.to_json().dump();
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(schema.dims));
    sqlite3_bind_text(stmt, 3, schema_json.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw StoreWriteFailure("create error: " + std::string(sqlite3_errmsg(db_)));
    }

    schemas_[name] = schema;
    std::cerr << "[store] Created index " << name << " (dims=" << schema.dims << ")\n";
}

BulkResult SqliteRecordStore::bulk_upsert(const std::string& name, const std::vector<Item>& items) {
    std::lock_guard<std::mutex> lock(mutex_);
    IndexSchema schema;
    if (!load_schema(name, schema)) {
        throw StoreWriteFailure("index not found: " + name);
    }

    BulkResult result;
    if (items.empty()) return result;

    std::string cols = "id";
    std::string params = "?";
    for (auto& f : schema.fields) {
        cols += ", " + f.name;
        params += ", ?";
    }
    cols += ", metadata";
    params += ", ?";
    std::string sql = "INSERT OR REPLACE INTO " + table_name(name) + " (" + cols + ") VALUES (" + params + ")";

    begin_if_needed();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreWriteFailure("bulk prepare error: " + std::string(sqlite3_errmsg(db_)));
    }

    result.items.reserve(items.size());
    for (size_t i = 0; i < items.size(); i++) {
        const Item& item = items[i];
        BulkItemResult r;
        r.position = i;

        if (item.kind != ItemKind::Question) {
            r.error = "only question items can be indexed";
            result.items.push_back(std::move(r));
            continue;
        }
        if (item.vector.size() != schema.dims) {
            r.error = DimensionMismatch(schema.dims, item.vector.size()).what();
            result.items.push_back(std::move(r));
            continue;
        }

        int col = 1;
        if (item.id > 0) sqlite3_bind_int64(stmt, col++, item.id);
        else sqlite3_bind_null(stmt, col++);

        std::vector<uint8_t> blob;
        for (auto& f : schema.fields) {
            if (f.type == FieldType::DenseVector) {
                blob = vector_to_blob(item.vector);
                sqlite3_bind_blob(stmt, col++, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
            } else if (f.name == "title") {
                sqlite3_bind_text(stmt, col++, item.title.c_str(), static_cast<int>(item.title.size()), SQLITE_TRANSIENT);
            } else if (f.name == "body") {
                sqlite3_bind_text(stmt, col++, item.body.c_str(), static_cast<int>(item.body.size()), SQLITE_TRANSIENT);
            } else if (!f.source.empty() && item.metadata.is_object() && item.metadata.contains(f.source)) {
                const auto& v = item.metadata[f.source];
                if (v.is_string()) {
                    const auto& s = v.get_ref<const std::string&>();
                    sqlite3_bind_text(stmt, col++, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
                } else if (f.type == FieldType::Integer && v.is_number_integer()) {
                    sqlite3_bind_int64(stmt, col++, v.get<int64_t>());
                } else if (v.is_null()) {
                    sqlite3_bind_null(stmt, col++);
                } else {
                    std::string s = v.dump();
                    sqlite3_bind_text(stmt, col++, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
                }
            } else {
                sqlite3_bind_null(stmt, col++);
            }
        }
        std::string meta = item.metadata.is_null() ? "{}" : item.metadata.dump();
        sqlite3_bind_text(stmt, col++, meta.c_str(), static_cast<int>(meta.size()), SQLITE_TRANSIENT);

        if (sqlite3_step(stmt) == SQLITE_DONE) {
            r.ok = true;
            r.id = sqlite3_last_insert_rowid(db_);
        } else {
            r.error = sqlite3_errmsg(db_);
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        result.items.push_back(std::move(r));
    }
    sqlite3_finalize(stmt);
    return result;
}

void SqliteRecordStore::refresh(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sqlite3_get_autocommit(db_)) return;
    exec("COMMIT");
    std::cerr << "[store] Refreshed " << name << "\n";
}

std::vector<QueryResult> SqliteRecordStore::score_query(const std::string& name,
                                                        const Embedding& query, int k) {
    std::lock_guard<std::mutex> lock(mutex_);
    IndexSchema schema;
    if (!load_schema(name, schema)) {
        throw StoreQueryFailure("index not found: " + name);
    }
    if (query.size() != schema.dims) {
        throw DimensionMismatch(schema.dims, query.size());
    }
    if (k <= 0) return {};

    const FieldSpec* vf = schema.vector_field();
    if (!vf) {
        throw StoreQueryFailure("index " + name + " has no vector field");
    }

    // Equal scores fall back to ascending id, the table's iteration order.
    std::string sql = "SELECT id, title, body, cosine_similarity(?1, " + vf->name + ") + " +
                      std::to_string(kScoreShift) + " AS score FROM " + table_name(name) +
                      " ORDER BY score DESC, id ASC LIMIT ?2";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreQueryFailure("score prepare error: " + std::string(sqlite3_errmsg(db_)));
    }

    auto blob = vector_to_blob(query);
    sqlite3_bind_blob(stmt, 1, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, k);

    std::vector<QueryResult> results;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        QueryResult r;
        r.id = sqlite3_column_int64(stmt, 0);
        r.title = column_text(stmt, 1);
        r.body = column_text(stmt, 2);
        r.score = sqlite3_column_double(stmt, 3);
        results.push_back(std::move(r));
    }
    std::string err = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw StoreQueryFailure("score query error: " + err);
    }
    return results;
}

int64_t SqliteRecordStore::count(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    IndexSchema schema;
    if (!load_schema(name, schema)) {
        throw StoreQueryFailure("index not found: " + name);
    }

    std::string sql = "SELECT COUNT(*) FROM " + table_name(name);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreQueryFailure("count prepare error: " + std::string(sqlite3_errmsg(db_)));
    }
    int64_t n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        n = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return n;
}

std::vector<Item> SqliteRecordStore::scan(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    IndexSchema schema;
    if (!load_schema(name, schema)) {
        throw StoreQueryFailure("index not found: " + name);
    }
    const FieldSpec* vf = schema.vector_field();

    std::string sql = "SELECT id, title, body, " + vf->name + ", metadata FROM " +
                      table_name(name) + " ORDER BY id";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreQueryFailure("scan prepare error: " + std::string(sqlite3_errmsg(db_)));
    }

    std::vector<Item> items;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Item it;
        it.id = sqlite3_column_int64(stmt, 0);
        it.kind = ItemKind::Question;
        it.title = column_text(stmt, 1);
        it.body = column_text(stmt, 2);
        const void* data = sqlite3_column_blob(stmt, 3);
        int bytes = sqlite3_column_bytes(stmt, 3);
        if (data && bytes > 0) it.vector = blob_to_vector(data, bytes);
        std::string meta = column_text(stmt, 4);
        it.metadata = nlohmann::json::parse(meta.empty() ? "{}" : meta, nullptr, false);
        if (it.metadata.is_discarded()) it.metadata = nlohmann::json::object();
        items.push_back(std::move(it));
    }
    std::string err = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw StoreQueryFailure("scan error: " + err);
    }
    return items;
}

} // namespace semsearch
