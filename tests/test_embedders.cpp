#include <gtest/gtest.h>
#include "embedder.hpp"
#include "embedders/hashing_embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "errors.hpp"
#include "similarity.hpp"
#include <cmath>

using namespace semsearch;

TEST(HashingEmbedderTest, DeterministicAndUnitLength) {
    HashingEmbedder a(64), b(64);
    auto va = a.embed_one("How do I reverse a linked list?");
    auto vb = b.embed_one("How do I reverse a linked list?");

    ASSERT_EQ(va.size(), 64u);
    EXPECT_EQ(va, vb);

    double ss = 0.0;
    for (float x : va) ss += (double)x * x;
    EXPECT_NEAR(std::sqrt(ss), 1.0, 1e-5);
}

TEST(HashingEmbedderTest, CaseAndPunctuationInsensitive) {
    HashingEmbedder e(128);
    EXPECT_EQ(e.embed_one("CUDA kernels!"), e.embed_one("cuda, kernels"));
}

TEST(HashingEmbedderTest, SharedWordsScoreHigher) {
    HashingEmbedder e(256);
    auto q = e.embed_one("cuda kernel performance");
    auto close = e.embed_one("improving cuda kernel performance");
    auto distant = e.embed_one("html table layout");
    EXPECT_GT(cosine_similarity(q, close), cosine_similarity(q, distant));
}

TEST(HashingEmbedderTest, EmptyTextIsZeroVector) {
    HashingEmbedder e(32);
    auto v = e.embed_one("  ...  ");
    ASSERT_EQ(v.size(), 32u);
    for (float x : v) EXPECT_EQ(x, 0.0f);
}

TEST(HashingEmbedderTest, BatchPreservesOrderAndLength) {
    HashingEmbedder e(32);
    auto out = e.embed({"alpha", "beta", "gamma"});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0], e.embed_one("alpha"));
    EXPECT_EQ(out[2], e.embed_one("gamma"));
    EXPECT_TRUE(e.embed({}).empty());
}

TEST(HashingEmbedderTest, ZeroDimensionRejected) {
    EXPECT_THROW(HashingEmbedder(0), std::invalid_argument);
}

TEST(EmbedderFactoryTest, BuildsNamedProvider) {
    EmbeddingConfig cfg;
    cfg.provider = "hashing";
    cfg.dimensions = 48;
    auto e = create_embedder(cfg);
    EXPECT_EQ(e->name(), "hashing");
    EXPECT_EQ(e->dimensions(), 48u);

    cfg.provider = "http";
    EXPECT_EQ(create_embedder(cfg)->name(), "http:" + cfg.model);

    cfg.provider = "word2vec";
    EXPECT_THROW(create_embedder(cfg), std::invalid_argument);
}

TEST(HttpEmbedderTest, ParsesResponseInIndexOrder) {
    auto out = HttpEmbedder::parse_response(R"({
        "data": [
            {"index": 1, "embedding": [0.5, 0.25]},
            {"index": 0, "embedding": [1, 2]}
        ],
        "model": "m"
    })");
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], (Embedding{1.0f, 2.0f}));
    EXPECT_EQ(out[1], (Embedding{0.5f, 0.25f}));
}

TEST(HttpEmbedderTest, ParsesResponseWithoutIndex) {
    auto out = HttpEmbedder::parse_response(R"({"data": [{"embedding": [3]}, {"embedding": [4]}]})");
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0][0], 3.0f);
    EXPECT_EQ(out[1][0], 4.0f);
}

TEST(HttpEmbedderTest, MalformedResponsesFail) {
    EXPECT_THROW(HttpEmbedder::parse_response("not json"), EmbeddingFailure);
    EXPECT_THROW(HttpEmbedder::parse_response(R"({"error": "quota"})"), EmbeddingFailure);
    EXPECT_THROW(HttpEmbedder::parse_response(R"({"data": [{"index": 0}]})"), EmbeddingFailure);
    EXPECT_THROW(HttpEmbedder::parse_response(R"({"data": [{"embedding": [1, "x"]}]})"), EmbeddingFailure);
    EXPECT_THROW(HttpEmbedder::parse_response(R"({"data": [
        {"index": 1, "embedding": [1]}, {"index": 0, "embedding": [2]}, {"index": 0, "embedding": [3]}
    ]})"), EmbeddingFailure);
    EXPECT_THROW(HttpEmbedder::parse_response(R"({"data": [
        {"index": 0, "embedding": [1]}, {"index": 2, "embedding": [2]}
    ]})"), EmbeddingFailure);
    EXPECT_THROW(HttpEmbedder::parse_response(R"({"data": [{"index": -1, "embedding": [1]}]})"), EmbeddingFailure);
    EXPECT_THROW(HttpEmbedder::parse_response(R"({"data": [{"index": 0, "embedding": [1e300]}]})"), EmbeddingFailure);
}

TEST(HttpEmbedderTest, UnreachableProviderIsEmbeddingFailure) {
    EmbeddingConfig cfg;
    cfg.api_base = "http://127.0.0.1:1/v1";
    cfg.timeout = 2;
    HttpEmbedder e(cfg);

    EXPECT_THROW(e.embed({"hello"}), EmbeddingFailure);
    EXPECT_THROW(e.init(), EmbeddingFailure);
    EXPECT_TRUE(e.embed({}).empty());
}
