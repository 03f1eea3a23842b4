#include "recognition/embedding_comparator.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace autoface {

namespace {

// Máximo score para vectores distintos
const float MAX_NON_IDENTICAL = std::nextafter(1.0f, 0.0f);

} // namespace

SimilarityMetric parse_metric(const std::string& name) {
    if (name == "cosine") return SimilarityMetric::COSINE;
    if (name == "euclidean") return SimilarityMetric::EUCLIDEAN;
    throw std::invalid_argument("Unknown similarity metric: " + name);
}

const char* to_string(SimilarityMetric metric) {
    switch (metric) {
        case SimilarityMetric::COSINE: return "cosine";
        case SimilarityMetric::EUCLIDEAN: return "euclidean";
    }
    return "unknown";
}

// ==================== COMPARISON ====================

float EmbeddingComparator::compare(const Embedding& a, const Embedding& b) const {
    if (a.size() != b.size()) {
        throw DimensionMismatch(a.size(), b.size());
    }

    if (a == b) {
        return 1.0f;
    }

    float score = (metric_type == SimilarityMetric::COSINE)
        ? cosine_score(a, b)
        : euclidean_score(a, b);

    if (std::isnan(score)) {
        return 0.0f;
    }
    return std::clamp(score, 0.0f, MAX_NON_IDENTICAL);
}

float EmbeddingComparator::cosine_score(const Embedding& a, const Embedding& b) {
    // Acumular en double: los embeddings de 512D pierden precisión en float
    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a <= 0.0 || norm_b <= 0.0) {
        return 0.0f;
    }

    double cosine = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    double cosine_distance = 1.0 - std::max(-1.0, std::min(1.0, cosine));
    return static_cast<float>(1.0 - cosine_distance);
}

float EmbeddingComparator::euclidean_score(const Embedding& a, const Embedding& b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = static_cast<double>(a[i]) - b[i];
        sum += d * d;
    }
    return static_cast<float>(1.0 / (1.0 + std::sqrt(sum)));
}

void EmbeddingComparator::l2_normalize(Embedding& embedding) {
    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    }
}

} // namespace autoface
