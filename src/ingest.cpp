#include "ingest.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <future>
#include <iostream>
#include <stdexcept>

namespace semsearch {

nlohmann::json IngestReport::to_json() const {
    return {
        {"lines_read", lines_read},
        {"records_read", records_read},
        {"malformed_skipped", malformed_skipped},
        {"answers_filtered", answers_filtered},
        {"batches", batches},
        {"batches_failed", batches_failed},
        {"items_indexed", items_indexed},
        {"items_failed", items_failed},
        {"elapsed_ms", elapsed_ms},
        {"errors", errors}
    };
}

IngestPipeline::IngestPipeline(Embedder& embedder, RecordStore& store)
    : embedder_(embedder), store_(store) {}

void IngestPipeline::attach_vectors(std::vector<Item>& batch) {
    std::vector<std::string> titles;
    titles.reserve(batch.size());
    for (auto& item : batch) titles.push_back(item.title);

    std::vector<Embedding> vectors;
    try {
        vectors = embedder_.embed(titles);
    } catch (const EmbeddingFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw EmbeddingFailure(std::string("provider error: ") + e.what());
    }

    if (vectors.size() != batch.size()) {
        throw EmbeddingFailure("provider returned " + std::to_string(vectors.size()) +
                               " vectors for " + std::to_string(batch.size()) + " titles");
    }

    // Validate everything before attaching anything.
    const size_t dim = embedder_.dimensions();
    for (auto& v : vectors) {
        if (v.size() != dim) throw DimensionMismatch(dim, v.size());
    }
    for (size_t i = 0; i < batch.size(); i++) {
        batch[i].vector = std::move(vectors[i]);
    }
}

IngestPipeline::WriteOutcome IngestPipeline::write_batch(const std::string& index,
                                                         const std::vector<Item>& batch,
                                                         size_t batch_no) {
    WriteOutcome w;
    w.batch_no = batch_no;
    w.size = batch.size();

    auto start = Clock::now();
    try {
        BulkResult res = store_.bulk_upsert(index, batch);
        for (auto& r : res.items) {
            if (r.ok) {
                w.indexed++;
            } else {
                w.failed++;
                std::cerr << "[ingest] batch " << batch_no << " item " << r.position
                          << " (\"" << batch[r.position].title << "\") not written: " << r.error << "\n";
            }
        }
    } catch (const StoreWriteFailure& e) {
        w.batch_failed = true;
        w.failed = batch.size();
        w.indexed = 0;
        w.error = "batch " + std::to_string(batch_no) + ": store write failed: " + e.what();
        std::cerr << "[ingest] " << w.error << "\n";
        return w;
    }

    std::cerr << "[ingest] batch " << batch_no << ": wrote " << w.indexed << "/" << w.size
              << " in " << static_cast<int>(elapsed_ms(start)) << " ms\n";
    return w;
}

void IngestPipeline::merge(IngestReport& report, const WriteOutcome& w, bool strict) {
    report.items_indexed += w.indexed;
    report.items_failed += w.failed;
    if (w.batch_failed) {
        report.batches_failed++;
        report.errors.push_back(w.error);
        if (strict) throw StoreWriteFailure(w.error);
    }
}

IngestReport IngestPipeline::run(SourceReader& source, const IngestOptions& opts) {
    if (opts.batch_size == 0) {
        throw std::invalid_argument("batch_size must be > 0");
    }

    IngestReport report;
    auto start = Clock::now();
    const std::string& index = opts.index_name;

    store_.drop_index(index);
    store_.create_index(index, question_schema(embedder_.dimensions()));
    std::cerr << "[ingest] Recreated index " << index << " (dim=" << embedder_.dimensions()
              << ", batch_size=" << opts.batch_size << ")\n";

    std::vector<Item> batch;
    batch.reserve(opts.batch_size);
    std::future<WriteOutcome> pending;

    auto collect_pending = [&]() {
        if (pending.valid()) merge(report, pending.get(), opts.strict);
    };

    auto flush = [&]() {
        if (batch.empty()) return;
        size_t batch_no = ++report.batches;

        auto embed_start = Clock::now();
        try {
            attach_vectors(batch);
        } catch (const Error& e) {
            // EmbeddingFailure or DimensionMismatch: nothing from this batch is written.
            std::string msg = "batch " + std::to_string(batch_no) + ": " + e.what();
            std::cerr << "[ingest] " << msg << ", dropping " << batch.size() << " records\n";
            report.batches_failed++;
            report.items_failed += batch.size();
            report.errors.push_back(msg);
            batch.clear();
            if (opts.strict) throw;
            return;
        }
        std::cerr << "[ingest] batch " << batch_no << ": embedded " << batch.size() << " titles in "
                  << static_cast<int>(elapsed_ms(embed_start)) << " ms\n";

        collect_pending();

        if (opts.pipeline_writes) {
            pending = std::async(std::launch::async,
                                 [this, index, batch_no, items = std::move(batch)]() {
                                     return write_batch(index, items, batch_no);
                                 });
        } else {
            merge(report, write_batch(index, batch, batch_no), opts.strict);
        }
        batch.clear();
        batch.reserve(opts.batch_size);
    };

    try {
        Item item;
        while (source.next(item)) {
            if (item.kind != ItemKind::Question) {
                report.answers_filtered++;
                continue;
            }
            batch.push_back(std::move(item));
            item = Item{};
            if (batch.size() >= opts.batch_size) flush();
        }
        flush();
        collect_pending();
    } catch (const std::exception& e) {
        // Strict abort: finish the write in flight and make it visible so
        // the partially populated index is consistent.
        if (pending.valid()) merge(report, pending.get(), false);
        std::cerr << "[ingest] Aborted: " << e.what() << "\n";
        store_.refresh(index);
        throw;
    }

    store_.refresh(index);

    report.lines_read = source.lines_read();
    report.records_read = source.records_read();
    report.malformed_skipped = source.skipped();
    report.elapsed_ms = elapsed_ms(start);
    std::cerr << "[ingest] Done: " << report.items_indexed << " indexed, "
              << report.items_failed << " failed, " << report.answers_filtered << " answers filtered, "
              << report.malformed_skipped << " malformed skipped ("
              << static_cast<int>(report.elapsed_ms) << " ms)\n";
    return report;
}

} // namespace semsearch
