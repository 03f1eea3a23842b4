#include "database/activity_log.hpp"
#include <stdexcept>
#include <utility>

namespace autoface {

ActivityLog::ActivityLog(FaceStore& store, Clock clock)
    : store(store), clock(std::move(clock))
{
    if (!this->clock) {
        throw std::invalid_argument("ActivityLog requiere un Clock");
    }
}

int64_t ActivityLog::append(FaceStore::Transaction& tx, DetectionEvent& event) {
    event.event_id = store.insert_detection(tx, event);
    tx.on_commit([this]() { events_committed++; });
    return event.event_id;
}

void ActivityLog::record_duplicate(FaceStore::Transaction& tx,
                                   const std::string& fingerprint,
                                   const FingerprintHit& original,
                                   Timestamp observed_at) {
    store.insert_duplicate_hit(tx, fingerprint, original.event_id, observed_at);
    tx.on_commit([this]() { duplicates_committed++; });
}

std::vector<DetectionEvent> ActivityLog::recent(int limit) const {
    return store.recent_detections(limit);
}

ActivityStats ActivityLog::stats() const {
    return store.stats(clock());
}

} // namespace autoface
