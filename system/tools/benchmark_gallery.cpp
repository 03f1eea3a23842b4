// ============= tools/benchmark_gallery.cpp =============
#include "database/match_index.hpp"
#include "recognition/embedding_comparator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <vector>

using namespace autoface;

// -----------------------------------------------------
// Helpers
// -----------------------------------------------------
template<typename T>
double mean(const std::vector<T>& v)
{
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / v.size();
}

Embedding random_embedding(std::mt19937& gen, size_t dim)
{
    std::normal_distribution<float> dis(0.0f, 1.0f);
    Embedding emb(dim);
    for (auto& v : emb) v = dis(gen);
    EmbeddingComparator::l2_normalize(emb);
    return emb;
}

// -----------------------------------------------------
// Benchmark
// -----------------------------------------------------
void benchmark(SimilarityMetric metric,
               size_t identities,
               size_t dim,
               int warmup = 10,
               int iterations = 1000)
{
    spdlog::info("Benchmark best_match ({})", to_string(metric));
    spdlog::info("   Identities : {}", identities);
    spdlog::info("   Dim        : {}", dim);

    std::mt19937 gen(42);
    EmbeddingComparator comparator(metric);
    LinearScanIndex index(comparator);

    for (size_t i = 0; i < identities; ++i)
        index.add({static_cast<int64_t>(i + 1), static_cast<Timestamp>(i), random_embedding(gen, dim)});

    std::vector<Embedding> queries;
    for (int i = 0; i < 64; ++i)
        queries.push_back(random_embedding(gen, dim));

    // warmup
    for (int i = 0; i < warmup; ++i)
        index.best(queries[i % queries.size()]);

    std::vector<double> times;
    times.reserve(iterations);
    float best_score = 0.0f;

    for (int i = 0; i < iterations; ++i)
    {
        const auto& query = queries[i % queries.size()];
        auto t0 = std::chrono::high_resolution_clock::now();
        auto match = index.best(query);
        auto t1 = std::chrono::high_resolution_clock::now();
        times.push_back(std::chrono::duration<double, std::milli>(t1 - t0).count());
        if (match) best_score = std::max(best_score, match->score);
    }

    double avg = mean(times);
    double min = *std::min_element(times.begin(), times.end());
    double max = *std::max_element(times.begin(), times.end());

    spdlog::info("------------------------------------------------");
    spdlog::info("Average : {:.4f} ms", avg);
    spdlog::info("Min     : {:.4f} ms", min);
    spdlog::info("Max     : {:.4f} ms", max);
    spdlog::info("Throughput: {:.0f} lookups/s", avg > 0.0 ? 1000.0 / avg : 0.0);
    spdlog::info("Best random score: {:.4f} (threshold {:.2f})", best_score, DEFAULT_MATCH_THRESHOLD);
}

// -----------------------------------------------------
// Sanity check (misma entrada → score 1.0)
// -----------------------------------------------------
void sanity_check(size_t dim)
{
    std::mt19937 gen(7);
    EmbeddingComparator comparator;
    auto e = random_embedding(gen, dim);
    spdlog::info("Self-similarity: {:.4f} (should be 1.0)", comparator.compare(e, e));
}

// -----------------------------------------------------
// main
// -----------------------------------------------------
int main(int argc, char* argv[])
{
    spdlog::set_pattern("[%H:%M:%S] %v");

    size_t identities = 1000;
    size_t dim = 128;
    int iterations = 1000;

    try
    {
        if (argc >= 2) identities = std::stoul(argv[1]);
        if (argc >= 3) dim = std::stoul(argv[2]);
        if (argc >= 4) iterations = std::stoi(argv[3]);
    }
    catch (const std::logic_error&)
    {
        std::cerr << "Usage: " << argv[0] << " [identities] [dim] [iterations]\n";
        return 1;
    }

    if (dim == 0 || iterations <= 0)
    {
        std::cerr << "dim e iterations deben ser > 0\n";
        return 1;
    }

    sanity_check(dim);
    benchmark(SimilarityMetric::COSINE, identities, dim, 10, iterations);
    benchmark(SimilarityMetric::EUCLIDEAN, identities, dim, 10, iterations);
    return 0;
}
