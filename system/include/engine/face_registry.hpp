// ============= include/engine/face_registry.hpp =============
/*
 * Face Registry - ensamblado del engine
 *
 * Dueño de: FaceStore → Gallery + FingerprintIndex + ActivityLog → Engine.
 * El constructor abre la DB y reconstruye el estado en memoria
 * (identidades + fingerprints) antes de aceptar requests.
 */

#pragma once
#include "config.hpp"
#include "core/types.hpp"
#include "database/activity_log.hpp"
#include "database/display_code.hpp"
#include "database/face_store.hpp"
#include "database/fingerprint_index.hpp"
#include "database/identity_gallery.hpp"
#include "engine/registration_engine.hpp"
#include "recognition/embedding_comparator.hpp"
#include <memory>
#include <string>
#include <vector>

namespace autoface {

class FaceRegistry {
public:
    // clock == nullptr → system_clock_ms
    // codes == nullptr → make_code_generator(config.matching.code_generator)
    explicit FaceRegistry(const AppConfig& config,
                          Clock clock = nullptr,
                          std::unique_ptr<CodeGenerator> codes = nullptr);

    FaceRegistry(const FaceRegistry&) = delete;
    FaceRegistry& operator=(const FaceRegistry&) = delete;

    RegistrationOutcome process(const std::vector<unsigned char>& image, FaceAnalyzer& analyzer);
    RegistrationOutcome process(const std::vector<unsigned char>& image, FaceAnalyzer& analyzer,
                                float threshold);

    RegistrationOutcome resolve(const AnalysisResult& analysis, const std::string& fingerprint);
    RegistrationOutcome resolve(const AnalysisResult& analysis, const std::string& fingerprint,
                                float threshold);

    std::vector<DetectionEvent> recent(int limit) const { return activity.recent(limit); }
    ActivityStats stats() const { return activity.stats(); }

    IdentityGallery& identities() { return gallery; }
    const IdentityGallery& identities() const { return gallery; }
    const FingerprintIndex& fingerprint_index() const { return fingerprints; }
    ActivityLog& activity_log() { return activity; }
    RegistrationEngine& registration_engine() { return engine; }
    FaceStore& face_store() { return store; }

    float default_threshold() const { return threshold; }

private:
    float threshold;
    Clock clock;

    FaceStore store;
    EmbeddingComparator comparator;
    FingerprintIndex fingerprints;
    IdentityGallery gallery;
    ActivityLog activity;
    RegistrationEngine engine;
};

} // namespace autoface
