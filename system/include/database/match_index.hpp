// ============= include/database/match_index.hpp =============
/*
 * Match Index - búsqueda del mejor candidato
 *
 * ALGORITMO: linear scan exhaustivo
 * - Complexity: O(n * d)
 * - Suficiente para galerías de hasta unos miles de identidades
 *   (~0.5ms para 5k x 512D)
 *
 * DESEMPATE: con score máximo igual gana el first_seen más antiguo;
 * con first_seen igual, el identity_id menor.
 *
 * MatchIndex es la interfaz: un índice ANN puede reemplazar al
 * LinearScanIndex sin tocar el RegistrationEngine.
 */

#pragma once
#include "core/types.hpp"
#include "recognition/embedding_comparator.hpp"
#include <optional>
#include <vector>

namespace autoface {

struct IndexEntry {
    int64_t identity_id;
    Timestamp first_seen;
    Embedding embedding;
};

class MatchIndex {
public:
    virtual ~MatchIndex() = default;

    virtual void add(const IndexEntry& entry) = 0;

    // Mejor candidato sin aplicar threshold; nullopt si está vacío
    virtual std::optional<MatchCandidate> best(const Embedding& query) const = 0;

    virtual size_t size() const = 0;
    virtual void clear() = 0;
};

class LinearScanIndex : public MatchIndex {
public:
    explicit LinearScanIndex(const EmbeddingComparator& comparator);

    void add(const IndexEntry& entry) override;
    std::optional<MatchCandidate> best(const Embedding& query) const override;
    size_t size() const override { return entries.size(); }
    void clear() override { entries.clear(); }

private:
    const EmbeddingComparator& comparator;
    std::vector<IndexEntry> entries;
};

} // namespace autoface
