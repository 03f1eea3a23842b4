#include "engine/face_registry.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace autoface {

namespace {

Clock or_system_clock(Clock clock) {
    if (clock) return clock;
    return []() { return system_clock_ms(); };
}

std::unique_ptr<CodeGenerator> or_configured(std::unique_ptr<CodeGenerator> codes,
                                             const AppConfig& config) {
    if (codes) return codes;
    return make_code_generator(config.matching.code_generator);
}

} // namespace

FaceRegistry::FaceRegistry(const AppConfig& config,
                           Clock clock,
                           std::unique_ptr<CodeGenerator> codes)
    : threshold(config.matching.threshold),
      clock(or_system_clock(std::move(clock))),
      store(config.database.path),
      comparator(config.matching.metric),
      fingerprints(),
      gallery(store, comparator, or_configured(std::move(codes), config), config.gallery_config()),
      activity(store, this->clock),
      engine(store, gallery, fingerprints, activity, this->clock)
{
    if (!EmbeddingComparator::valid_threshold(threshold)) {
        throw std::invalid_argument("Threshold fuera de rango (0, 1]: " + std::to_string(threshold));
    }

    spdlog::info("Cargando registry desde {}", store.path());

    size_t loaded = gallery.load();
    fingerprints.load(store.load_fingerprints());

    spdlog::info("✓ Registry listo: {} identidades, {} fingerprints, metric={}, threshold={:.2f}",
                 loaded, fingerprints.size(), to_string(comparator.metric()), threshold);
}

RegistrationOutcome FaceRegistry::process(const std::vector<unsigned char>& image,
                                          FaceAnalyzer& analyzer) {
    return engine.process(image, analyzer, threshold);
}

RegistrationOutcome FaceRegistry::process(const std::vector<unsigned char>& image,
                                          FaceAnalyzer& analyzer,
                                          float request_threshold) {
    return engine.process(image, analyzer, request_threshold);
}

RegistrationOutcome FaceRegistry::resolve(const AnalysisResult& analysis,
                                          const std::string& fingerprint) {
    return engine.resolve(analysis, fingerprint, threshold);
}

RegistrationOutcome FaceRegistry::resolve(const AnalysisResult& analysis,
                                          const std::string& fingerprint,
                                          float request_threshold) {
    return engine.resolve(analysis, fingerprint, request_threshold);
}

} // namespace autoface
