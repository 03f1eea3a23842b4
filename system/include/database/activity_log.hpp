// ============= include/database/activity_log.hpp =============
/*
 * Activity Log - registro append-only de detecciones
 *
 * - append() escribe dentro de la Transaction del request
 * - recent() / stats() leen por la conexión read-only del FaceStore:
 *   no esperan al writer, pueden no ver un request en vuelo
 */

#pragma once
#include "core/types.hpp"
#include "database/face_store.hpp"
#include <atomic>
#include <string>
#include <vector>

namespace autoface {

class ActivityLog {
public:
    ActivityLog(FaceStore& store, Clock clock);

    // Asigna event.event_id y lo retorna
    int64_t append(FaceStore::Transaction& tx, DetectionEvent& event);

    void record_duplicate(FaceStore::Transaction& tx,
                          const std::string& fingerprint,
                          const FingerprintHit& original,
                          Timestamp observed_at);

    // Más recientes primero
    std::vector<DetectionEvent> recent(int limit) const;

    ActivityStats stats() const;

    // Contadores de esta sesión (solo commits)
    size_t session_events() const { return events_committed.load(); }
    size_t session_duplicates() const { return duplicates_committed.load(); }

private:
    FaceStore& store;
    Clock clock;

    std::atomic<size_t> events_committed{0};
    std::atomic<size_t> duplicates_committed{0};
};

} // namespace autoface
