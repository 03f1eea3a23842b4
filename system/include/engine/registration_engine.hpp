// ============= include/engine/registration_engine.hpp =============
/*
 * Registration Engine - un request, una decisión
 *
 * FLUJO:
 *   analyzer (SIN locks)
 *        │
 *        ├─ 0 caras ──────────────► no_face
 *        ├─ >1 caras ─────────────► multiple_faces
 *        ▼
 *   ┌─────────── registry_mutex + Transaction ───────────┐
 *   │ fingerprint conocido? ──────► exact_duplicate      │
 *   │ best_match >= threshold? ───► person_recognized    │
 *   │ si no ──────────────────────► new_person_registered│
 *   └────────────────────────────────────────────────────┘
 *
 * GARANTÍAS:
 * - Máximo un "first sight" por fingerprint y un registro ganador por
 *   persona aunque dos requests iguales compitan
 * - Cada outcome aplica sus mutaciones completas o ninguna
 * - Sin reintentos internos: los errores retryable se propagan
 */

#pragma once
#include "core/types.hpp"
#include "database/activity_log.hpp"
#include "database/face_store.hpp"
#include "database/fingerprint_index.hpp"
#include "database/identity_gallery.hpp"
#include "recognition/embedding_comparator.hpp"
#include "recognition/face_analyzer.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace autoface {

enum class OutcomeStatus {
    NO_FACE,
    MULTIPLE_FACES,
    EXACT_DUPLICATE,
    PERSON_RECOGNIZED,
    NEW_PERSON_REGISTERED,
    ANALYSIS_FAILED
};

// "no_face", "multiple_faces", "exact_duplicate", ...
const char* to_string(OutcomeStatus status);

struct RegistrationOutcome {
    OutcomeStatus status = OutcomeStatus::NO_FACE;
    int faces_found = 0;

    // person_recognized / new_person_registered
    int64_t identity_id = -1;
    std::string display_code;
    int64_t event_id = -1;

    // person_recognized
    float confidence = 0.0f;
    int total_detections = 0;
    Timestamp first_seen = 0;
    std::optional<double> average_confidence;

    // exact_duplicate (identity_id también se completa)
    int64_t original_event_id = -1;

    // analysis_failed
    std::string error;

    bool seen_before() const {
        return status == OutcomeStatus::EXACT_DUPLICATE ||
               status == OutcomeStatus::PERSON_RECOGNIZED;
    }

    std::string to_string() const;
};

class RegistrationEngine {
public:
    RegistrationEngine(FaceStore& store,
                       IdentityGallery& gallery,
                       FingerprintIndex& fingerprints,
                       ActivityLog& activity,
                       Clock clock);

    // Decide sobre un análisis ya hecho. Lanza std::invalid_argument si el
    // threshold no está en (0, 1]; DimensionMismatch, IdentityCodeCollision
    // o StorageError si el request no se pudo aplicar (sin cambios).
    RegistrationOutcome resolve(const AnalysisResult& analysis,
                                const std::string& fingerprint,
                                float threshold = DEFAULT_MATCH_THRESHOLD);

    // Fingerprint + analyzer (fuera de locks) + resolve()
    RegistrationOutcome process(const std::vector<unsigned char>& image,
                                FaceAnalyzer& analyzer,
                                float threshold = DEFAULT_MATCH_THRESHOLD);

    struct Stats {
        size_t no_face;
        size_t multiple_faces;
        size_t exact_duplicates;
        size_t recognized;
        size_t registered;
        size_t analysis_failed;
        size_t errors;
        double avg_resolve_time_ms;
    };
    Stats get_stats() const;
    void print_stats() const;

private:
    FaceStore& store;
    IdentityGallery& gallery;
    FingerprintIndex& fingerprints;
    ActivityLog& activity;
    Clock clock;

    // Serializa fingerprint check → gallery lookup → mutación
    std::mutex registry_mutex;

    // ===== STATS =====
    std::atomic<size_t> stat_no_face{0};
    std::atomic<size_t> stat_multiple_faces{0};
    std::atomic<size_t> stat_duplicates{0};
    std::atomic<size_t> stat_recognized{0};
    std::atomic<size_t> stat_registered{0};
    std::atomic<size_t> stat_analysis_failed{0};
    std::atomic<size_t> stat_errors{0};
    std::atomic<size_t> stat_resolved{0};
    std::atomic<int64_t> stat_total_resolve_time_us{0};

    RegistrationOutcome resolve_locked(const AnalysisResult& analysis,
                                       const std::string& fingerprint,
                                       float threshold);
};

} // namespace autoface
