#pragma once
#include <vector>
#include <cstddef>

namespace semsearch {

// Added to every cosine similarity so relevance scores land in [0, 2].
constexpr double kScoreShift = 1.0;

// Cosine similarity of two equal-length vectors, accumulated in double.
// Returns 0.0 when either magnitude is exactly zero.
// Throws DimensionMismatch when the lengths differ.
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// Raw-pointer form used by the store's SQL scoring function.
double cosine_similarity(const float* a, const float* b, size_t dim);

// cosine_similarity(a, b) + kScoreShift
double shifted_score(const std::vector<float>& a, const std::vector<float>& b);

} // namespace semsearch
