#include "engine/registration_engine.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace autoface {

const char* to_string(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::NO_FACE:               return "no_face";
        case OutcomeStatus::MULTIPLE_FACES:        return "multiple_faces";
        case OutcomeStatus::EXACT_DUPLICATE:       return "exact_duplicate";
        case OutcomeStatus::PERSON_RECOGNIZED:     return "person_recognized";
        case OutcomeStatus::NEW_PERSON_REGISTERED: return "new_person_registered";
        case OutcomeStatus::ANALYSIS_FAILED:       return "analysis_failed";
    }
    return "unknown";
}

std::string RegistrationOutcome::to_string() const {
    std::ostringstream ss;
    ss << autoface::to_string(status);

    switch (status) {
        case OutcomeStatus::NO_FACE:
            break;
        case OutcomeStatus::MULTIPLE_FACES:
            ss << " (" << faces_found << " faces)";
            break;
        case OutcomeStatus::EXACT_DUPLICATE:
            ss << " " << display_code << " (original event " << original_event_id << ")";
            break;
        case OutcomeStatus::PERSON_RECOGNIZED:
            ss << " " << display_code << " conf=" << confidence
               << " detections=" << total_detections;
            if (average_confidence) {
                ss << " avg=" << *average_confidence;
            }
            break;
        case OutcomeStatus::NEW_PERSON_REGISTERED:
            ss << " " << display_code << " (id " << identity_id << ")";
            break;
        case OutcomeStatus::ANALYSIS_FAILED:
            ss << ": " << error;
            break;
    }
    return ss.str();
}

RegistrationEngine::RegistrationEngine(FaceStore& store,
                                       IdentityGallery& gallery,
                                       FingerprintIndex& fingerprints,
                                       ActivityLog& activity,
                                       Clock clock)
    : store(store), gallery(gallery), fingerprints(fingerprints),
      activity(activity), clock(std::move(clock))
{
    if (!this->clock) {
        throw std::invalid_argument("RegistrationEngine requiere un Clock");
    }
}

RegistrationOutcome RegistrationEngine::process(const std::vector<unsigned char>& image,
                                                FaceAnalyzer& analyzer,
                                                float threshold) {
    if (!EmbeddingComparator::valid_threshold(threshold)) {
        throw std::invalid_argument("Threshold fuera de rango (0, 1]: " + std::to_string(threshold));
    }

    std::string fingerprint = content_fingerprint(image);

    AnalysisResult analysis;
    try {
        analysis = analyzer.analyze(image);
    } catch (const AnalysisError& e) {
        spdlog::warn("Analysis failed for {}...: {}", fingerprint.substr(0, 12), e.what());
        stat_analysis_failed++;

        RegistrationOutcome outcome;
        outcome.status = OutcomeStatus::ANALYSIS_FAILED;
        outcome.error = e.what();
        return outcome;
    }

    return resolve(analysis, fingerprint, threshold);
}

RegistrationOutcome RegistrationEngine::resolve(const AnalysisResult& analysis,
                                                const std::string& fingerprint,
                                                float threshold) {
    if (!EmbeddingComparator::valid_threshold(threshold)) {
        throw std::invalid_argument("Threshold fuera de rango (0, 1]: " + std::to_string(threshold));
    }

    RegistrationOutcome outcome;
    outcome.faces_found = analysis.faces_found;

    // ==================== INPUT OUTCOMES (sin mutaciones) ====================
    if (analysis.faces_found <= 0) {
        outcome.status = OutcomeStatus::NO_FACE;
        stat_no_face++;
        return outcome;
    }
    if (analysis.faces_found > 1) {
        outcome.status = OutcomeStatus::MULTIPLE_FACES;
        stat_multiple_faces++;
        return outcome;
    }
    if (analysis.embedding.empty()) {
        outcome.status = OutcomeStatus::ANALYSIS_FAILED;
        outcome.error = "Analyzer reported one face without an embedding";
        stat_analysis_failed++;
        return outcome;
    }

    auto t_start = std::chrono::steady_clock::now();

    try {
        std::lock_guard<std::mutex> lock(registry_mutex);
        outcome = resolve_locked(analysis, fingerprint, threshold);
    } catch (...) {
        stat_errors++;
        throw;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - t_start).count();
    stat_total_resolve_time_us += elapsed;
    stat_resolved++;

    return outcome;
}

RegistrationOutcome RegistrationEngine::resolve_locked(const AnalysisResult& analysis,
                                                       const std::string& fingerprint,
                                                       float threshold) {
    RegistrationOutcome outcome;
    outcome.faces_found = analysis.faces_found;
    Timestamp now = clock();

    // ==================== EXACT DUPLICATE ====================
    if (auto hit = fingerprints.lookup(fingerprint)) {
        FaceStore::Transaction tx(store);
        activity.record_duplicate(tx, fingerprint, *hit, now);
        tx.commit();

        outcome.status = OutcomeStatus::EXACT_DUPLICATE;
        outcome.identity_id = hit->identity_id;
        outcome.original_event_id = hit->event_id;
        if (auto identity = gallery.get(hit->identity_id)) {
            outcome.display_code = identity->display_code;
            outcome.total_detections = identity->total_detections;
            outcome.first_seen = identity->first_seen;
            outcome.average_confidence = identity->confidence_running_average;
        }

        stat_duplicates++;
        spdlog::debug("Duplicate content {}... → {} (event {})",
                      fingerprint.substr(0, 12), outcome.display_code, hit->event_id);
        return outcome;
    }

    // ==================== MATCH O REGISTRO ====================
    auto match = gallery.best_match(analysis.embedding, threshold);

    FaceStore::Transaction tx(store);
    Identity identity;
    DetectionEvent event;
    event.timestamp = now;
    event.content_fingerprint = fingerprint;
    event.attributes = analysis.attributes;

    if (match) {
        identity = gallery.record_match(tx, match->identity_id, match->score, now);
        event.confidence = match->score;
    } else {
        identity = gallery.insert(tx, analysis.embedding, analysis.attributes, now);
    }

    event.identity_id = identity.identity_id;
    activity.append(tx, event);

    FingerprintHit hit{event.event_id, identity.identity_id};
    tx.on_commit([this, fingerprint, hit]() {
        fingerprints.record(fingerprint, hit);
    });
    tx.commit();

    outcome.identity_id = identity.identity_id;
    outcome.display_code = identity.display_code;
    outcome.event_id = event.event_id;
    outcome.total_detections = identity.total_detections;
    outcome.first_seen = identity.first_seen;
    outcome.average_confidence = identity.confidence_running_average;

    if (match) {
        outcome.status = OutcomeStatus::PERSON_RECOGNIZED;
        outcome.confidence = match->score;
        stat_recognized++;
        spdlog::info("Recognized {} (conf {:.3f}, {} detections)",
                     identity.display_code, match->score, identity.total_detections);
    } else {
        outcome.status = OutcomeStatus::NEW_PERSON_REGISTERED;
        stat_registered++;
        spdlog::info("✓ Registered {} (id {})", identity.display_code, identity.identity_id);
    }

    return outcome;
}

RegistrationEngine::Stats RegistrationEngine::get_stats() const {
    Stats s;
    s.no_face = stat_no_face.load();
    s.multiple_faces = stat_multiple_faces.load();
    s.exact_duplicates = stat_duplicates.load();
    s.recognized = stat_recognized.load();
    s.registered = stat_registered.load();
    s.analysis_failed = stat_analysis_failed.load();
    s.errors = stat_errors.load();

    size_t resolved = stat_resolved.load();
    s.avg_resolve_time_ms = resolved > 0
        ? stat_total_resolve_time_us.load() / 1000.0 / resolved
        : 0.0;
    return s;
}

void RegistrationEngine::print_stats() const {
    auto stats = get_stats();
    spdlog::info("=== Registration Engine Stats ===");
    spdlog::info("  Registered: {} | Recognized: {} | Duplicates: {}",
                 stats.registered, stats.recognized, stats.exact_duplicates);
    spdlog::info("  No face: {} | Multiple faces: {} | Analysis failed: {}",
                 stats.no_face, stats.multiple_faces, stats.analysis_failed);
    spdlog::info("  Errors: {} | Avg resolve: {:.2f} ms", stats.errors, stats.avg_resolve_time_ms);
}

} // namespace autoface
