#include "database/match_index.hpp"

namespace autoface {

LinearScanIndex::LinearScanIndex(const EmbeddingComparator& comparator)
    : comparator(comparator) {}

void LinearScanIndex::add(const IndexEntry& entry) {
    entries.push_back(entry);
}

std::optional<MatchCandidate> LinearScanIndex::best(const Embedding& query) const {
    const IndexEntry* best_entry = nullptr;
    float best_score = 0.0f;

    for (const auto& entry : entries) {
        float score = comparator.compare(query, entry.embedding);

        bool better = best_entry == nullptr || score > best_score;
        if (!better && score == best_score) {
            better = entry.first_seen < best_entry->first_seen ||
                     (entry.first_seen == best_entry->first_seen &&
                      entry.identity_id < best_entry->identity_id);
        }

        if (better) {
            best_entry = &entry;
            best_score = score;
        }
    }

    if (!best_entry) {
        return std::nullopt;
    }
    return MatchCandidate{best_entry->identity_id, best_score};
}

} // namespace autoface
