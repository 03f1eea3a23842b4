// ============= include/core/types.hpp =============
/*
 * Tipos compartidos del engine de auto-registro
 *
 * Identity        → una persona registrada (embedding representativo fijo)
 * DetectionEvent  → un request no duplicado atribuido a una Identity
 * AnalysisResult  → lo que devuelve el analyzer externo
 *
 * Timestamps: milisegundos desde epoch (int64).
 */

#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace autoface {

using Embedding = std::vector<float>;
using Timestamp = int64_t;
using Clock = std::function<Timestamp()>;

// Distribución de scores de un atributo (gender, emotion, ethnicity).
// El core no la interpreta, solo la persiste.
struct ScoreDistribution {
    std::string dominant;
    std::map<std::string, float> scores;

    bool empty() const { return dominant.empty() && scores.empty(); }
};

struct FaceAttributes {
    std::optional<int> age;
    ScoreDistribution gender;
    ScoreDistribution emotion;
    ScoreDistribution ethnicity;
};

struct AnalysisResult {
    int faces_found = 0;
    Embedding embedding;               // Solo si faces_found == 1
    FaceAttributes attributes;
};

struct Identity {
    int64_t identity_id = -1;
    std::string display_code;
    Embedding representative_embedding;
    Timestamp first_seen = 0;
    Timestamp last_seen = 0;
    int total_detections = 0;

    // Promedio de los scores de match. Vacío hasta el primer match:
    // el evento de registro aporta el sentinel, no un score.
    std::optional<double> confidence_running_average;

    std::optional<int> age_estimate;
    std::string gender_estimate;
};

struct DetectionEvent {
    int64_t event_id = -1;
    int64_t identity_id = -1;
    Timestamp timestamp = 0;
    std::optional<float> confidence;   // nullopt = sentinel de registro
    std::string content_fingerprint;
    FaceAttributes attributes;
};

struct MatchCandidate {
    int64_t identity_id;
    float score;
};

struct FingerprintHit {
    int64_t event_id;
    int64_t identity_id;
};

struct ActivityStats {
    int64_t total_identities = 0;
    int64_t total_detections = 0;
    int64_t total_exact_duplicates = 0;
    int64_t detections_last_24h = 0;
    std::string most_seen_code;
    int most_seen_count = 0;
};

} // namespace autoface
