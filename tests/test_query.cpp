#include <gtest/gtest.h>
#include "fakes.hpp"
#include "ingest.hpp"
#include "query.hpp"
#include "similarity.hpp"
#include <algorithm>
#include <sstream>
#include <thread>

using namespace semsearch;
using namespace semsearch::fakes;

namespace {

// Three questions on unrelated topics with hand-picked 4-d vectors.
class QueryTest : public ::testing::Test {
protected:
    FakeEmbedder emb{4};
    RecordingStore store;

    void SetUp() override {
        emb.set("CUDA performance", {1.0f, 0.1f, 0.0f, 0.0f});
        emb.set("C# closures", {0.0f, 1.0f, 0.1f, 0.0f});
        emb.set("HTML layout", {0.0f, 0.0f, 1.0f, 0.1f});
        emb.set("cuda programming", {0.9f, 0.2f, 0.1f, 0.0f});

        std::istringstream in(question_line("CUDA performance", "kernels", "10") +
                              answer_line("use shared memory") +
                              question_line("C# closures", "lambdas", "11") +
                              question_line("HTML layout", "flexbox", "12"));
        SourceReader reader(in);
        IngestOptions opts;
        opts.batch_size = 2;
        IngestPipeline(emb, store).run(reader, opts);
    }

    QueryPipeline pipeline() { return QueryPipeline(emb, store, "questions"); }
};

} // namespace

TEST_F(QueryTest, RanksClosestTitleFirst) {
    auto resp = pipeline().query("cuda programming", 2);

    ASSERT_EQ(resp.results.size(), 2u);
    EXPECT_EQ(resp.results[0].title, "CUDA performance");
    EXPECT_EQ(resp.results[0].body, "kernels");
    EXPECT_GT(resp.results[0].score, resp.results[1].score);
    for (auto& r : resp.results) {
        EXPECT_GE(r.score, 0.0);
        EXPECT_LE(r.score, 2.0);
    }
    EXPECT_GE(resp.embed_ms, 0.0);
    EXPECT_GE(resp.search_ms, 0.0);
}

TEST_F(QueryTest, ScoresAreShiftedCosine) {
    auto resp = pipeline().query("cuda programming", 3);
    auto items = store.scan("questions");
    ASSERT_EQ(resp.results.size(), items.size());

    Embedding q = {0.9f, 0.2f, 0.1f, 0.0f};
    for (auto& r : resp.results) {
        auto it = std::find_if(items.begin(), items.end(),
                               [&](const Item& item) { return item.id == r.id; });
        ASSERT_NE(it, items.end());
        EXPECT_NEAR(r.score, shifted_score(q, it->vector), 1e-9);
    }
}

TEST_F(QueryTest, RepeatedQueriesAreIdentical) {
    auto p = pipeline();
    auto a = p.query("cuda programming", 3);
    auto b = p.query("cuda programming", 3);

    ASSERT_EQ(a.results.size(), b.results.size());
    for (size_t i = 0; i < a.results.size(); i++) {
        EXPECT_EQ(a.results[i].id, b.results[i].id);
        EXPECT_EQ(a.results[i].score, b.results[i].score);
    }
}

TEST_F(QueryTest, KLargerThanCorpusReturnsEverything) {
    auto resp = pipeline().query("cuda programming", 50);
    EXPECT_EQ(resp.results.size(), 3u);
}

TEST_F(QueryTest, NonPositiveKSkipsEmbedding) {
    int before = emb.calls();
    EXPECT_TRUE(pipeline().query("cuda programming", 0).results.empty());
    EXPECT_TRUE(pipeline().query("cuda programming", -3).results.empty());
    EXPECT_EQ(emb.calls(), before);
}

TEST_F(QueryTest, EmptyTextIsRejected) {
    EXPECT_THROW(pipeline().query("", 3), std::invalid_argument);
    EXPECT_THROW(pipeline().query("   ", 3), std::invalid_argument);
}

TEST_F(QueryTest, MissingIndexIsQueryFailure) {
    QueryPipeline p(emb, store, "nope");
    EXPECT_THROW(p.query("cuda programming", 3), StoreQueryFailure);
}

TEST_F(QueryTest, EmbeddingFailurePropagates) {
    emb.fail_on_call(emb.calls() + 1);
    EXPECT_THROW(pipeline().query("cuda programming", 3), EmbeddingFailure);
}

TEST_F(QueryTest, WrongQueryDimensionIsRejected) {
    emb.shorten("short query");
    EXPECT_THROW(pipeline().query("short query", 3), DimensionMismatch);
}

TEST_F(QueryTest, CancelledBeforeEmbedding) {
    std::atomic<bool> cancel{true};
    int before = emb.calls();
    EXPECT_THROW(pipeline().query("cuda programming", 3, &cancel), QueryCancelled);
    EXPECT_EQ(emb.calls(), before);
}

TEST_F(QueryTest, UnsetCancelFlagRunsNormally) {
    std::atomic<bool> cancel{false};
    auto resp = pipeline().query("cuda programming", 1, &cancel);
    ASSERT_EQ(resp.results.size(), 1u);
    EXPECT_EQ(resp.results[0].title, "CUDA performance");
}

TEST_F(QueryTest, ConcurrentQueries) {
    auto p = pipeline();
    std::vector<std::thread> threads;
    std::atomic<int> top_hits{0};
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&]() {
            for (int n = 0; n < 10; n++) {
                auto resp = p.query("cuda programming", 2);
                if (!resp.results.empty() && resp.results[0].title == "CUDA performance") top_hits++;
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(top_hits.load(), 80);
}

TEST_F(QueryTest, ResponseSerializes) {
    auto j = pipeline().query("cuda programming", 1).to_json();
    ASSERT_TRUE(j["results"].is_array());
    ASSERT_EQ(j["results"].size(), 1u);
    EXPECT_EQ(j["results"][0]["title"], "CUDA performance");
    EXPECT_TRUE(j["results"][0].contains("score"));
    EXPECT_TRUE(j.contains("embed_ms"));
    EXPECT_TRUE(j.contains("search_ms"));
}
