#include "source_reader.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

namespace semsearch {

SourceReader::SourceReader(const std::string& path)
    : owned_(std::make_unique<std::ifstream>(path)), in_(owned_.get()) {
    if (!*owned_) {
        throw std::runtime_error("Cannot open source file: " + path);
    }
}

SourceReader::SourceReader(std::istream& in) : in_(&in) {}

Item SourceReader::parse_line(const std::string& line, size_t line_no) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw InputFormatError(line_no, std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw InputFormatError(line_no, "record is not a JSON object");
    }

    if (!j.contains("type") || !j["type"].is_string()) {
        throw InputFormatError(line_no, "missing string field 'type'");
    }

    Item item;
    std::string type = to_lower(j["type"].get<std::string>());
    if (type == "question") {
        item.kind = ItemKind::Question;
    } else if (type == "answer") {
        item.kind = ItemKind::Answer;
    } else {
        throw InputFormatError(line_no, "unknown type '" + type + "'");
    }

    if (j.contains("title") && !j["title"].is_null()) {
        if (!j["title"].is_string()) throw InputFormatError(line_no, "'title' is not a string");
        item.title = j["title"].get<std::string>();
    }
    if (j.contains("body") && !j["body"].is_null()) {
        if (!j["body"].is_string()) throw InputFormatError(line_no, "'body' is not a string");
        item.body = j["body"].get<std::string>();
    }
    if (item.kind == ItemKind::Question && trim(item.title).empty()) {
        throw InputFormatError(line_no, "question without a title");
    }

    for (auto& [key, value] : j.items()) {
        if (key == "type" || key == "title" || key == "body") continue;
        item.metadata[key] = value;
    }
    return item;
}

bool SourceReader::next(Item& out) {
    std::string line;
    while (std::getline(*in_, line)) {
        line_no_++;
        if (trim(line).empty()) continue;
        try {
            out = parse_line(line, line_no_);
            records_++;
            return true;
        } catch (const InputFormatError& e) {
            skipped_++;
            std::cerr << "[warn] Skipping malformed record, " << e.what() << "\n";
        }
    }
    return false;
}

} // namespace semsearch
