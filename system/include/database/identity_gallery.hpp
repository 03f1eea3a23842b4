// ============= include/database/identity_gallery.hpp =============
/*
 * Identity Gallery
 *
 * CARACTERÍSTICAS:
 * - Dueña de todo el estado de identidades (memoria + SQLite)
 * - insert() y record_match() son los únicos puntos de mutación
 * - Las mutaciones se escriben dentro de la Transaction del request y se
 *   aplican en memoria solo después del COMMIT
 * - representative_embedding nunca se actualiza (sin drift de centroide)
 *
 * OPERACIONES:
 * - best_match(): mejor identidad con score >= threshold
 * - insert(): nueva identidad (total=1, promedio = sentinel)
 * - record_match(): last_seen, total_detections++, promedio incremental
 * - get() / list() / size()
 */

#pragma once
#include "core/types.hpp"
#include "database/display_code.hpp"
#include "database/face_store.hpp"
#include "database/match_index.hpp"
#include "recognition/embedding_comparator.hpp"
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace autoface {

class IdentityGallery {
public:
    struct Config {
        size_t embedding_dim;      // 0 = inferir del primer registro
        int max_code_attempts;     // propuestas del generador antes de recorrer el bucket

        Config()
            : embedding_dim(0),
              max_code_attempts(16) {}
    };

    // index == nullptr → LinearScanIndex
    IdentityGallery(FaceStore& store,
                    const EmbeddingComparator& comparator,
                    std::unique_ptr<CodeGenerator> code_generator,
                    const Config& config = Config(),
                    std::unique_ptr<MatchIndex> index = nullptr);

    // Carga identidades persistidas. Retorna cuántas.
    size_t load();

    std::optional<MatchCandidate> best_match(const Embedding& query, float threshold) const;

    Identity insert(FaceStore::Transaction& tx,
                    const Embedding& embedding,
                    const FaceAttributes& attributes,
                    Timestamp now);

    Identity record_match(FaceStore::Transaction& tx,
                          int64_t identity_id,
                          float score,
                          Timestamp now);

    std::optional<Identity> get(int64_t identity_id) const;
    std::vector<Identity> list() const;   // last_seen DESC
    size_t size() const;
    size_t embedding_dim() const;

private:
    FaceStore& store;
    const EmbeddingComparator& comparator;
    std::unique_ptr<CodeGenerator> codes;
    Config config;
    std::unique_ptr<MatchIndex> index;

    std::unordered_map<int64_t, Identity> identities;
    std::unordered_set<std::string> codes_in_use;
    size_t dim;

    mutable std::shared_mutex mutex;

    void check_dimension(const Embedding& embedding) const;   // requiere lock
    std::string next_display_code(Timestamp now) const;
    void add_locked(const Identity& identity);
};

} // namespace autoface
