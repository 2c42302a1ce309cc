#include <gtest/gtest.h>
#include "fakes.hpp"
#include "ingest.hpp"
#include <sstream>

using namespace semsearch;
using namespace semsearch::fakes;

namespace {

constexpr size_t kDim = 8;

IngestOptions options(size_t batch_size, bool pipeline = true, bool strict = false) {
    IngestOptions o;
    o.batch_size = batch_size;
    o.index_name = "questions";
    o.pipeline_writes = pipeline;
    o.strict = strict;
    return o;
}

IngestReport ingest_text(Embedder& emb, RecordStore& store, const std::string& text,
                         const IngestOptions& opts) {
    std::istringstream in(text);
    SourceReader reader(in);
    IngestPipeline pipeline(emb, store);
    return pipeline.run(reader, opts);
}

} // namespace

TEST(IngestTest, IndexesEveryQuestion) {
    FakeEmbedder emb(kDim);
    RecordingStore store;

    auto report = ingest_text(emb, store, corpus(7, 0), options(3));

    EXPECT_EQ(report.items_indexed, 7u);
    EXPECT_EQ(report.items_failed, 0u);
    EXPECT_EQ(report.batches, 3u);
    EXPECT_EQ(report.batches_failed, 0u);
    EXPECT_EQ(store.count("questions"), 7);
    for (auto& item : store.scan("questions")) {
        EXPECT_EQ(item.vector.size(), kDim);
        EXPECT_EQ(item.kind, ItemKind::Question);
    }
}

TEST(IngestTest, AnswersAreFilteredOut) {
    FakeEmbedder emb(kDim);
    RecordingStore store;

    auto report = ingest_text(emb, store, corpus(5, 4), options(2));

    EXPECT_EQ(report.records_read, 9u);
    EXPECT_EQ(report.answers_filtered, 4u);
    EXPECT_EQ(report.items_indexed, 5u);
    EXPECT_EQ(store.count("questions"), 5);
    for (auto& item : store.scan("questions")) {
        EXPECT_EQ(item.title.rfind("Q", 0), 0u) << item.title;
    }
    // Only titles reach the provider.
    for (auto& req : emb.requests()) {
        for (auto& t : req) EXPECT_EQ(t.rfind("Q", 0), 0u) << t;
    }
}

TEST(IngestTest, TitlesAreEmbeddedInSourceOrder) {
    FakeEmbedder emb(kDim);
    RecordingStore store;

    ingest_text(emb, store, corpus(5, 0), options(5, false));

    auto reqs = emb.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0], (std::vector<std::string>{"Q1", "Q2", "Q3", "Q4", "Q5"}));

    auto items = store.scan("questions");
    ASSERT_EQ(items.size(), 5u);
    for (auto& item : items) {
        EXPECT_EQ(item.vector, HashingEmbedder(kDim).embed_one(item.title));
    }
}

TEST(IngestTest, ReingestRecreatesTheIndex) {
    FakeEmbedder emb(kDim);
    RecordingStore store;
    std::string text = corpus(6, 2);

    ingest_text(emb, store, text, options(4));
    auto first = store.scan("questions");
    ingest_text(emb, store, text, options(4));
    auto second = store.scan("questions");

    ASSERT_EQ(first.size(), 6u);
    ASSERT_EQ(second.size(), first.size());
    for (size_t i = 0; i < first.size(); i++) {
        EXPECT_EQ(second[i].title, first[i].title);
        EXPECT_EQ(second[i].body, first[i].body);
        EXPECT_EQ(second[i].vector, first[i].vector);
        EXPECT_EQ(second[i].metadata, first[i].metadata);
    }
}

TEST(IngestTest, BatchBoundaryProducesTrailingBatch) {
    for (bool pipeline : {true, false}) {
        FakeEmbedder emb(kDim);
        RecordingStore store;

        auto report = ingest_text(emb, store, corpus(5, 0), options(4, pipeline));

        EXPECT_EQ(store.bulk_sizes(), (std::vector<size_t>{4, 1})) << "pipeline=" << pipeline;
        EXPECT_EQ(report.batches, 2u);
        EXPECT_EQ(store.count("questions"), 5);
    }
}

TEST(IngestTest, RefreshesOnceAtTheEnd) {
    FakeEmbedder emb(kDim);
    RecordingStore store;

    ingest_text(emb, store, corpus(10, 0), options(3));
    EXPECT_EQ(store.refreshes(), 1);
}

TEST(IngestTest, EmptySourceLeavesEmptyIndex) {
    FakeEmbedder emb(kDim);
    RecordingStore store;

    auto report = ingest_text(emb, store, corpus(0, 3), options(3));
    EXPECT_EQ(report.batches, 0u);
    EXPECT_TRUE(store.has_index("questions"));
    EXPECT_EQ(store.count("questions"), 0);
    EXPECT_EQ(emb.calls(), 0);
}

TEST(IngestTest, DimensionMismatchDropsWholeBatch) {
    FakeEmbedder emb(kDim);
    emb.shorten("Q2");
    RecordingStore store;

    auto report = ingest_text(emb, store, corpus(4, 0), options(2));

    EXPECT_EQ(report.batches, 2u);
    EXPECT_EQ(report.batches_failed, 1u);
    EXPECT_EQ(report.items_failed, 2u);
    EXPECT_EQ(report.items_indexed, 2u);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_NE(report.errors[0].find("dimension mismatch"), std::string::npos);

    // Q1 shares the batch with Q2, so neither is written.
    EXPECT_EQ(store.bulk_sizes(), (std::vector<size_t>{2}));
    auto items = store.scan("questions");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].title, "Q3");
    EXPECT_EQ(items[1].title, "Q4");
}

TEST(IngestTest, StrictDimensionMismatchAbortsAndRefreshes) {
    FakeEmbedder emb(kDim);
    emb.shorten("Q3");
    RecordingStore store;

    EXPECT_THROW(ingest_text(emb, store, corpus(6, 0), options(2, true, true)), DimensionMismatch);

    // The first batch was written before the abort and stays visible.
    EXPECT_EQ(store.refreshes(), 1);
    EXPECT_EQ(store.count("questions"), 2);
}

TEST(IngestTest, EmbeddingFailureSkipsOnlyThatBatch) {
    FakeEmbedder emb(kDim);
    emb.fail_on_call(2);
    RecordingStore store;

    auto report = ingest_text(emb, store, corpus(6, 0), options(2));

    EXPECT_EQ(report.batches, 3u);
    EXPECT_EQ(report.batches_failed, 1u);
    EXPECT_EQ(report.items_indexed, 4u);
    EXPECT_EQ(store.count("questions"), 4);
    EXPECT_EQ(store.bulk_sizes(), (std::vector<size_t>{2, 2}));
}

TEST(IngestTest, StrictEmbeddingFailurePropagates) {
    FakeEmbedder emb(kDim);
    emb.fail_on_call(1);
    RecordingStore store;

    EXPECT_THROW(ingest_text(emb, store, corpus(3, 0), options(2, true, true)), EmbeddingFailure);
    EXPECT_EQ(store.count("questions"), 0);
}

TEST(IngestTest, VectorCountMismatchIsEmbeddingFailure) {
    FakeEmbedder emb(kDim);
    emb.drop_last(true);
    RecordingStore store;

    auto report = ingest_text(emb, store, corpus(3, 0), options(3));

    EXPECT_EQ(report.batches_failed, 1u);
    EXPECT_EQ(report.items_indexed, 0u);
    EXPECT_TRUE(store.bulk_sizes().empty());
}

TEST(IngestTest, StoreWriteFailureFailsTheBatch) {
    FakeEmbedder emb(kDim);
    RecordingStore store;
    store.fail_bulk_call(1);

    auto report = ingest_text(emb, store, corpus(4, 0), options(2));

    EXPECT_EQ(report.batches_failed, 1u);
    EXPECT_EQ(report.items_failed, 2u);
    EXPECT_EQ(report.items_indexed, 2u);
    EXPECT_EQ(store.count("questions"), 2);
}

TEST(IngestTest, StrictStoreWriteFailurePropagates) {
    for (bool pipeline : {true, false}) {
        FakeEmbedder emb(kDim);
        RecordingStore store;
        store.fail_bulk_call(1);

        EXPECT_THROW(ingest_text(emb, store, corpus(4, 0), options(2, pipeline, true)), StoreWriteFailure)
            << "pipeline=" << pipeline;
        EXPECT_EQ(store.refreshes(), 1);
    }
}

TEST(IngestTest, MalformedLinesAreSkipped) {
    FakeEmbedder emb(kDim);
    RecordingStore store;

    std::string text = question_line("good one") +
                       "this is not json\n" +
                       "{\"type\": \"question\", \"body\": \"no title\"}\n" +
                       "\n" +
                       "{\"type\": \"comment\", \"title\": \"x\"}\n" +
                       question_line("good two");

    auto report = ingest_text(emb, store, text, options(10));

    EXPECT_EQ(report.lines_read, 6u);
    EXPECT_EQ(report.malformed_skipped, 3u);
    EXPECT_EQ(report.records_read, 2u);
    EXPECT_EQ(report.items_indexed, 2u);
    EXPECT_EQ(store.count("questions"), 2);
}

TEST(IngestTest, ZeroBatchSizeIsRejected) {
    FakeEmbedder emb(kDim);
    RecordingStore store;
    EXPECT_THROW(ingest_text(emb, store, corpus(1, 0), options(0)), std::invalid_argument);
}

TEST(IngestTest, ReportSerializes) {
    FakeEmbedder emb(kDim);
    RecordingStore store;

    auto j = ingest_text(emb, store, corpus(3, 1), options(2)).to_json();
    EXPECT_EQ(j["items_indexed"], 3);
    EXPECT_EQ(j["answers_filtered"], 1);
    EXPECT_EQ(j["lines_read"], 4);
    EXPECT_TRUE(j["errors"].is_array());
}
