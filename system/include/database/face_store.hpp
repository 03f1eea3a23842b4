// ============= include/database/face_store.hpp =============
/*
 * Face Store - SQLite Backend
 *
 * CARACTERÍSTICAS:
 * - Persistencia de identidades + eventos de detección
 * - WAL mode: los lectores (stats, recent) usan una conexión read-only
 *   propia y no esperan al writer
 * - Transaction RAII: BEGIN IMMEDIATE / COMMIT / ROLLBACK automático
 * - Hooks on_commit: el estado en memoria se actualiza SOLO si el
 *   COMMIT fue exitoso (all-or-nothing por request)
 *
 * TABLAS:
 * identities
 * ├── identity_id (INTEGER PRIMARY KEY)
 * ├── display_code (TEXT UNIQUE)         - PERSON_20251124_1430_0042
 * ├── embedding (BLOB)                   - N floats, fijo desde el registro
 * ├── first_seen / last_seen (INTEGER)   - ms desde epoch
 * ├── total_detections (INTEGER)
 * ├── confidence_avg (REAL, NULL = sin matches todavía)
 * └── age_estimate / gender_estimate
 *
 * detections
 * ├── event_id (INTEGER PRIMARY KEY)
 * ├── identity_id (FK → identities)
 * ├── detected_at, confidence (NULL = registro), content_fingerprint
 * └── age / gender / emotion / ethnicity (dominantes)
 *
 * detection_scores  (event_id, category, label, score)
 * duplicate_hits    (content_fingerprint, original_event_id, observed_at)
 */

#pragma once
#include "core/types.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <sqlite3.h>

namespace autoface {

class FaceStore {
public:
    // db_path debe ser un archivo (no ":memory:"): el lector abre su propia conexión
    explicit FaceStore(const std::string& db_path);
    ~FaceStore();

    FaceStore(const FaceStore&) = delete;
    FaceStore& operator=(const FaceStore&) = delete;

    class Transaction {
    public:
        explicit Transaction(FaceStore& store);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        // COMMIT, ejecuta los hooks en orden y libera la conexión writer.
        // Lanza StorageError si falla.
        void commit();
        void on_commit(std::function<void()> hook);

        bool committed() const { return done; }

    private:
        FaceStore& store;
        std::unique_lock<std::mutex> lock;
        std::vector<std::function<void()>> hooks;
        bool done;
    };

    // ===== WRITES (requieren Transaction abierta) =====

    int64_t insert_identity(Transaction& tx, const Identity& identity);
    void update_identity_match(Transaction& tx, int64_t identity_id,
                               Timestamp last_seen, int total_detections,
                               double confidence_avg);
    int64_t insert_detection(Transaction& tx, const DetectionEvent& event);
    void insert_duplicate_hit(Transaction& tx, const std::string& fingerprint,
                              int64_t original_event_id, Timestamp observed_at);

    // ===== STARTUP =====

    std::vector<Identity> load_identities();
    std::vector<std::pair<std::string, FingerprintHit>> load_fingerprints();

    // ===== READS (conexión read-only) =====

    std::vector<DetectionEvent> recent_detections(int limit) const;
    std::vector<Identity> list_identities() const;   // last_seen DESC, sin embeddings
    ActivityStats stats(Timestamp now) const;

    const std::string& path() const { return db_path; }

private:
    sqlite3* db;
    sqlite3* reader;
    std::string db_path;

    mutable std::mutex db_mutex;       // Conexión writer
    mutable std::mutex reader_mutex;   // Conexión read-only

    void open_connections();
    void create_tables();
    void close();

    static std::vector<unsigned char> serialize_embedding(const Embedding& emb);
    static Embedding deserialize_embedding(const void* data, int size);
};

} // namespace autoface
