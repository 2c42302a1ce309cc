#pragma once
#include "embedder.hpp"
#include "record_store.hpp"
#include "source_reader.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace semsearch {

struct IngestOptions {
    size_t batch_size = 100;
    std::string index_name = "questions";
    bool strict = false;           // rethrow the first batch failure
    bool pipeline_writes = true;   // write batch N while embedding batch N+1
};

struct IngestReport {
    size_t lines_read = 0;         // input lines, blank and malformed included
    size_t records_read = 0;       // well-formed records, questions and answers
    size_t malformed_skipped = 0;
    size_t answers_filtered = 0;
    size_t batches = 0;
    size_t batches_failed = 0;
    size_t items_indexed = 0;
    size_t items_failed = 0;
    double elapsed_ms = 0.0;
    std::vector<std::string> errors;

    nlohmann::json to_json() const;
};

// Recreates the target index, then embeds and bulk-writes every question
// from the source in batches, and refreshes the index at the end.
//
// A batch whose embedding fails (provider error, wrong vector count, wrong
// vector length) is dropped as a whole: none of its records are written.
// Unless strict, the run continues with the next batch.
class IngestPipeline {
public:
    IngestPipeline(Embedder& embedder, RecordStore& store);

    IngestReport run(SourceReader& source, const IngestOptions& opts);

private:
    struct WriteOutcome {
        size_t batch_no = 0;
        size_t size = 0;
        size_t indexed = 0;
        size_t failed = 0;
        bool batch_failed = false;
        std::string error;
    };

    Embedder& embedder_;
    RecordStore& store_;

    // Throws EmbeddingFailure or DimensionMismatch; leaves the batch
    // untouched on failure.
    void attach_vectors(std::vector<Item>& batch);

    WriteOutcome write_batch(const std::string& index, const std::vector<Item>& batch, size_t batch_no);

    static void merge(IngestReport& report, const WriteOutcome& w, bool strict);
};

} // namespace semsearch
