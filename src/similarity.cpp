#include "similarity.hpp"
#include "errors.hpp"
#include <cmath>

namespace semsearch {

double cosine_similarity(const float* a, const float* b, size_t dim) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < dim; i++) {
        double x = a[i], y = b[i];
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatch(a.size(), b.size());
    }
    return cosine_similarity(a.data(), b.data(), a.size());
}

double shifted_score(const std::vector<float>& a, const std::vector<float>& b) {
    return cosine_similarity(a, b) + kScoreShift;
}

} // namespace semsearch
