// ============= include/recognition/embedding_comparator.hpp =============
/*
 * Embedding Comparator
 *
 * CARACTERÍSTICAS:
 * - Score de similitud en [0, 1] (mayor = más parecido)
 * - Simétrico: compare(a, b) == compare(b, a)
 * - 1.0 solo para vectores idénticos (los no idénticos quedan < 1.0)
 * - Sin estado: seguro para llamar desde cualquier thread
 *
 * MÉTRICAS:
 * - cosine:    max(0, 1 - cosine_distance)
 * - euclidean: 1 / (1 + ||a - b||)
 *
 * Lanza DimensionMismatch si los tamaños difieren.
 */

#pragma once
#include "core/types.hpp"
#include <string>

namespace autoface {

enum class SimilarityMetric {
    COSINE = 0,
    EUCLIDEAN = 1
};

// "cosine" | "euclidean"; lanza std::invalid_argument si no se reconoce
SimilarityMetric parse_metric(const std::string& name);
const char* to_string(SimilarityMetric metric);

constexpr float DEFAULT_MATCH_THRESHOLD = 0.65f;

class EmbeddingComparator {
public:
    explicit EmbeddingComparator(SimilarityMetric metric = SimilarityMetric::COSINE)
        : metric_type(metric) {}

    float compare(const Embedding& a, const Embedding& b) const;

    // Regla de decisión: candidato si score >= threshold
    static bool is_match(float score, float threshold) { return score >= threshold; }

    // threshold válido: (0, 1]
    static bool valid_threshold(float threshold) {
        return threshold > 0.0f && threshold <= 1.0f;
    }

    static void l2_normalize(Embedding& embedding);

    SimilarityMetric metric() const { return metric_type; }

private:
    SimilarityMetric metric_type;

    static float cosine_score(const Embedding& a, const Embedding& b);
    static float euclidean_score(const Embedding& a, const Embedding& b);
};

} // namespace autoface
