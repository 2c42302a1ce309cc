#pragma once
#include "item.hpp"
#include <istream>
#include <fstream>
#include <memory>
#include <string>

namespace semsearch {

// Streams Items out of JSON Lines input. Each line is an object with at
// least "type" ("question" | "answer"), "title" and "body"; every other
// field is kept as passthrough metadata. Malformed lines are logged and
// skipped.
class SourceReader {
public:
    // Throws std::runtime_error if the file cannot be opened.
    explicit SourceReader(const std::string& path);
    explicit SourceReader(std::istream& in);

    // Next well-formed record, false at end of input.
    bool next(Item& out);

    size_t lines_read() const { return line_no_; }
    size_t records_read() const { return records_; }
    size_t skipped() const { return skipped_; }

    // Throws InputFormatError.
    static Item parse_line(const std::string& line, size_t line_no);

private:
    std::unique_ptr<std::ifstream> owned_;
    std::istream* in_;
    size_t line_no_ = 0;
    size_t records_ = 0;
    size_t skipped_ = 0;
};

} // namespace semsearch
