#include "record_store.hpp"
#include <stdexcept>

namespace semsearch {

const char* field_type_name(FieldType t) {
    switch (t) {
        case FieldType::Keyword: return "keyword";
        case FieldType::Text: return "text";
        case FieldType::Date: return "date";
        case FieldType::Integer: return "integer";
        case FieldType::DenseVector: return "dense_vector";
    }
    return "text";
}

FieldType parse_field_type(const std::string& s) {
    if (s == "keyword") return FieldType::Keyword;
    if (s == "text") return FieldType::Text;
    if (s == "date") return FieldType::Date;
    if (s == "integer") return FieldType::Integer;
    if (s == "dense_vector") return FieldType::DenseVector;
    throw std::invalid_argument("unknown field type: " + s);
}

const FieldSpec* IndexSchema::vector_field() const {
    for (auto& f : fields) {
        if (f.type == FieldType::DenseVector) return &f;
    }
    return nullptr;
}

nlohmann::json IndexSchema::to_json() const {
    nlohmann::json j;
    j["dims"] = dims;
    j["fields"] = nlohmann::json::array();
    for (auto& f : fields) {
        nlohmann::json fj = {{"name", f.name}, {"type", field_type_name(f.type)}};
        if (!f.source.empty()) fj["source"] = f.source;
        j["fields"].push_back(fj);
    }
    return j;
}

IndexSchema IndexSchema::from_json(const nlohmann::json& j) {
    IndexSchema s;
    s.dims = j.value("dims", static_cast<size_t>(0));
    if (j.contains("fields") && j["fields"].is_array()) {
        for (auto& fj : j["fields"]) {
            FieldSpec f;
            f.name = fj.value("name", "");
            f.type = parse_field_type(fj.value("type", "text"));
            f.source = fj.value("source", "");
            s.fields.push_back(std::move(f));
        }
    }
    return s;
}

IndexSchema question_schema(size_t dims) {
    IndexSchema s;
    s.dims = dims;
    s.fields = {
        {"source_id", FieldType::Keyword, "id"},
        {"title", FieldType::Text, ""},
        {"body", FieldType::Text, ""},
        {"tags", FieldType::Keyword, "tags"},
        {"creation_date", FieldType::Date, "creationDate"},
        {"title_vector", FieldType::DenseVector, ""},
    };
    return s;
}

size_t BulkResult::succeeded() const {
    size_t n = 0;
    for (auto& r : items) if (r.ok) n++;
    return n;
}

size_t BulkResult::failed() const {
    return items.size() - succeeded();
}

} // namespace semsearch
