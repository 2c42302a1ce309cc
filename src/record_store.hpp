#pragma once
#include "item.hpp"
#include "embedder.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace semsearch {

enum class FieldType { Keyword, Text, Date, Integer, DenseVector };

const char* field_type_name(FieldType t);
FieldType parse_field_type(const std::string& s);

struct FieldSpec {
    std::string name;
    FieldType type = FieldType::Text;
    std::string source;   // metadata key the value is read from (passthrough fields)
};

// Declared layout of an index. "title" and "body" are always present;
// exactly one DenseVector field holds the item vector.
struct IndexSchema {
    size_t dims = 0;
    std::vector<FieldSpec> fields;

    const FieldSpec* vector_field() const;

    nlohmann::json to_json() const;
    static IndexSchema from_json(const nlohmann::json& j);
};

// source_id, title, body, tags, creation_date, title_vector[dims]
IndexSchema question_schema(size_t dims);

struct BulkItemResult {
    size_t position = 0;   // index into the submitted batch
    int64_t id = 0;        // assigned id on success
    bool ok = false;
    std::string error;
};

struct BulkResult {
    std::vector<BulkItemResult> items;

    size_t succeeded() const;
    size_t failed() const;
};

// Document store holding items with a dense vector field.
//
// Writes may be buffered: bulk_upsert() results are only guaranteed to be
// visible to other readers after refresh(). Implementations must tolerate
// concurrent score_query() calls.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // No error if the index does not exist.
    virtual void drop_index(const std::string& name) = 0;

    // Throws StoreWriteFailure if the index exists or cannot be created.
    virtual void create_index(const std::string& name, const IndexSchema& schema) = 0;

    virtual bool has_index(const std::string& name) = 0;

    // Create-or-replace per item (id 0 lets the store assign one). Per-item
    // failures are reported in the result; a failure of the whole call
    // throws StoreWriteFailure.
    virtual BulkResult bulk_upsert(const std::string& name, const std::vector<Item>& items) = 0;

    virtual void refresh(const std::string& name) = 0;

    // Scores every record as cosine_similarity(query, vector) + 1.0 and
    // returns the top k by descending score. Throws StoreQueryFailure
    // (e.g. index absent) or DimensionMismatch.
    virtual std::vector<QueryResult> score_query(const std::string& name,
                                                 const Embedding& query, int k) = 0;

    virtual int64_t count(const std::string& name) = 0;

    // Every record with its vector, ascending id.
    virtual std::vector<Item> scan(const std::string& name) = 0;
};

} // namespace semsearch
