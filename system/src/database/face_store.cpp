#include "database/face_store.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <filesystem>
#include <stdexcept>

namespace autoface {

namespace {

// ==================== SQLITE HELPERS ====================

void exec(sqlite3* conn, const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(conn, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg ? err_msg : sqlite3_errmsg(conn);
        sqlite3_free(err_msg);
        throw StorageError(message, rc);
    }
}

// sqlite3_stmt con finalize automático (los writes pueden lanzar a mitad)
class Statement {
public:
    Statement(sqlite3* conn, const char* sql) : conn(conn), stmt(nullptr) {
        int rc = sqlite3_prepare_v2(conn, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw StorageError(std::string("prepare failed: ") + sqlite3_errmsg(conn), rc);
        }
    }

    ~Statement() { sqlite3_finalize(stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_int64(int idx, int64_t value) { check(sqlite3_bind_int64(stmt, idx, value)); }
    void bind_int(int idx, int value) { check(sqlite3_bind_int(stmt, idx, value)); }
    void bind_double(int idx, double value) { check(sqlite3_bind_double(stmt, idx, value)); }
    void bind_null(int idx) { check(sqlite3_bind_null(stmt, idx)); }

    void bind_text(int idx, const std::string& value) {
        check(sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT));
    }

    void bind_blob(int idx, const std::vector<unsigned char>& blob) {
        check(sqlite3_bind_blob(stmt, idx, blob.data(), static_cast<int>(blob.size()),
                                SQLITE_TRANSIENT));
    }

    // true = hay fila, false = terminado
    bool step() {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError(sqlite3_errmsg(conn), rc);
    }

    void reset() {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }

    bool is_null(int col) const { return sqlite3_column_type(stmt, col) == SQLITE_NULL; }
    int64_t column_int64(int col) const { return sqlite3_column_int64(stmt, col); }
    int column_int(int col) const { return sqlite3_column_int(stmt, col); }
    double column_double(int col) const { return sqlite3_column_double(stmt, col); }

    std::string column_text(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    const void* column_blob(int col) const { return sqlite3_column_blob(stmt, col); }
    int column_bytes(int col) const { return sqlite3_column_bytes(stmt, col); }

private:
    sqlite3* conn;
    sqlite3_stmt* stmt;

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StorageError(std::string("bind failed: ") + sqlite3_errmsg(conn), rc);
        }
    }
};

void bind_optional_text(Statement& stmt, int idx, const std::string& value) {
    if (value.empty()) {
        stmt.bind_null(idx);
    } else {
        stmt.bind_text(idx, value);
    }
}

void insert_scores(sqlite3* conn, int64_t event_id, const char* category,
                   const ScoreDistribution& dist) {
    if (dist.scores.empty()) return;

    Statement stmt(conn,
        "INSERT INTO detection_scores (event_id, category, label, score) VALUES (?, ?, ?, ?)");

    for (const auto& [label, score] : dist.scores) {
        stmt.reset();
        stmt.bind_int64(1, event_id);
        stmt.bind_text(2, category);
        stmt.bind_text(3, label);
        stmt.bind_double(4, score);
        stmt.step();
    }
}

} // namespace

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

FaceStore::FaceStore(const std::string& db_path)
    : db(nullptr), reader(nullptr), db_path(db_path)
{
    if (db_path.empty() || db_path == ":memory:") {
        throw std::invalid_argument("FaceStore requiere un archivo, no: '" + db_path + "'");
    }

    spdlog::info("Inicializando Face Store");
    spdlog::info("   Path: {}", db_path);

    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    try {
        open_connections();
    } catch (const std::exception& e) {
        spdlog::error("Cannot open face store {}: {}", db_path, e.what());
        close();
        throw;
    }
}

FaceStore::~FaceStore() {
    close();
}

void FaceStore::close() {
    if (reader) {
        sqlite3_close(reader);
        reader = nullptr;
    }
    if (db) {
        sqlite3_close(db);
        db = nullptr;
    }
}

// ==================== INITIALIZATION ====================

void FaceStore::open_connections() {
    int rc = sqlite3_open_v2(db_path.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        throw StorageError(db ? sqlite3_errmsg(db) : "sqlite3_open_v2 failed", rc);
    }

    sqlite3_busy_timeout(db, 5000);
    exec(db, "PRAGMA journal_mode=WAL;");
    exec(db, "PRAGMA synchronous=NORMAL;");
    exec(db, "PRAGMA foreign_keys=ON;");

    create_tables();

    rc = sqlite3_open_v2(db_path.c_str(), &reader,
                         SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        throw StorageError(reader ? sqlite3_errmsg(reader) : "reader open failed", rc);
    }
    sqlite3_busy_timeout(reader, 5000);
}

void FaceStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS identities (
            identity_id INTEGER PRIMARY KEY AUTOINCREMENT,
            display_code TEXT NOT NULL UNIQUE,
            embedding BLOB NOT NULL,
            first_seen INTEGER NOT NULL,
            last_seen INTEGER NOT NULL,
            total_detections INTEGER NOT NULL DEFAULT 1 CHECK (total_detections >= 1),
            confidence_avg REAL,
            age_estimate INTEGER,
            gender_estimate TEXT
        );

        CREATE TABLE IF NOT EXISTS detections (
            event_id INTEGER PRIMARY KEY AUTOINCREMENT,
            identity_id INTEGER NOT NULL REFERENCES identities(identity_id),
            detected_at INTEGER NOT NULL,
            confidence REAL,
            content_fingerprint TEXT NOT NULL,
            age INTEGER,
            gender TEXT,
            emotion TEXT,
            ethnicity TEXT
        );

        CREATE TABLE IF NOT EXISTS detection_scores (
            event_id INTEGER NOT NULL REFERENCES detections(event_id),
            category TEXT NOT NULL,
            label TEXT NOT NULL,
            score REAL NOT NULL,
            PRIMARY KEY (event_id, category, label)
        );

        CREATE TABLE IF NOT EXISTS duplicate_hits (
            hit_id INTEGER PRIMARY KEY AUTOINCREMENT,
            content_fingerprint TEXT NOT NULL,
            original_event_id INTEGER NOT NULL REFERENCES detections(event_id),
            observed_at INTEGER NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_detections_fingerprint ON detections(content_fingerprint);
        CREATE INDEX IF NOT EXISTS idx_detections_identity ON detections(identity_id);
        CREATE INDEX IF NOT EXISTS idx_detections_time ON detections(detected_at);
        CREATE INDEX IF NOT EXISTS idx_identities_last_seen ON identities(last_seen DESC);
    )";

    exec(db, sql);
}

// ==================== SERIALIZATION ====================

std::vector<unsigned char> FaceStore::serialize_embedding(const Embedding& emb) {
    std::vector<unsigned char> blob(emb.size() * sizeof(float));
    if (!blob.empty()) {
        std::memcpy(blob.data(), emb.data(), blob.size());
    }
    return blob;
}

Embedding FaceStore::deserialize_embedding(const void* data, int size) {
    Embedding emb(static_cast<size_t>(size) / sizeof(float));
    if (!emb.empty()) {
        std::memcpy(emb.data(), data, emb.size() * sizeof(float));
    }
    return emb;
}

// ==================== TRANSACTION ====================

FaceStore::Transaction::Transaction(FaceStore& store)
    : store(store), lock(store.db_mutex), done(false)
{
    exec(store.db, "BEGIN IMMEDIATE;");
}

FaceStore::Transaction::~Transaction() {
    if (done) return;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(store.db, "ROLLBACK;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        spdlog::error("ROLLBACK failed: {}", err_msg ? err_msg : sqlite3_errmsg(store.db));
    } else {
        spdlog::debug("Transaction rolled back");
    }
    sqlite3_free(err_msg);
}

void FaceStore::Transaction::commit() {
    if (done) {
        throw std::logic_error("Transaction already committed");
    }

    exec(store.db, "COMMIT;");
    done = true;

    for (auto& hook : hooks) {
        hook();
    }
    hooks.clear();
    lock.unlock();
}

void FaceStore::Transaction::on_commit(std::function<void()> hook) {
    hooks.push_back(std::move(hook));
}

// ==================== WRITES ====================

int64_t FaceStore::insert_identity(Transaction&, const Identity& identity) {
    auto blob = serialize_embedding(identity.representative_embedding);

    Statement stmt(db, R"(
        INSERT INTO identities (display_code, embedding, first_seen, last_seen,
                                total_detections, confidence_avg, age_estimate, gender_estimate)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )");

    stmt.bind_text(1, identity.display_code);
    stmt.bind_blob(2, blob);
    stmt.bind_int64(3, identity.first_seen);
    stmt.bind_int64(4, identity.last_seen);
    stmt.bind_int(5, identity.total_detections);
    if (identity.confidence_running_average) {
        stmt.bind_double(6, *identity.confidence_running_average);
    } else {
        stmt.bind_null(6);
    }
    if (identity.age_estimate) {
        stmt.bind_int(7, *identity.age_estimate);
    } else {
        stmt.bind_null(7);
    }
    bind_optional_text(stmt, 8, identity.gender_estimate);

    stmt.step();
    return sqlite3_last_insert_rowid(db);
}

void FaceStore::update_identity_match(Transaction&, int64_t identity_id,
                                      Timestamp last_seen, int total_detections,
                                      double confidence_avg) {
    Statement stmt(db, R"(
        UPDATE identities
        SET last_seen = ?, total_detections = ?, confidence_avg = ?
        WHERE identity_id = ?
    )");

    stmt.bind_int64(1, last_seen);
    stmt.bind_int(2, total_detections);
    stmt.bind_double(3, confidence_avg);
    stmt.bind_int64(4, identity_id);
    stmt.step();

    if (sqlite3_changes(db) != 1) {
        throw StorageError("identity " + std::to_string(identity_id) + " not found", SQLITE_NOTFOUND);
    }
}

int64_t FaceStore::insert_detection(Transaction&, const DetectionEvent& event) {
    Statement stmt(db, R"(
        INSERT INTO detections (identity_id, detected_at, confidence, content_fingerprint,
                                age, gender, emotion, ethnicity)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )");

    stmt.bind_int64(1, event.identity_id);
    stmt.bind_int64(2, event.timestamp);
    if (event.confidence) {
        stmt.bind_double(3, *event.confidence);
    } else {
        stmt.bind_null(3);
    }
    stmt.bind_text(4, event.content_fingerprint);
    if (event.attributes.age) {
        stmt.bind_int(5, *event.attributes.age);
    } else {
        stmt.bind_null(5);
    }
    bind_optional_text(stmt, 6, event.attributes.gender.dominant);
    bind_optional_text(stmt, 7, event.attributes.emotion.dominant);
    bind_optional_text(stmt, 8, event.attributes.ethnicity.dominant);
    stmt.step();

    int64_t event_id = sqlite3_last_insert_rowid(db);

    insert_scores(db, event_id, "gender", event.attributes.gender);
    insert_scores(db, event_id, "emotion", event.attributes.emotion);
    insert_scores(db, event_id, "ethnicity", event.attributes.ethnicity);

    return event_id;
}

void FaceStore::insert_duplicate_hit(Transaction&, const std::string& fingerprint,
                                     int64_t original_event_id, Timestamp observed_at) {
    Statement stmt(db,
        "INSERT INTO duplicate_hits (content_fingerprint, original_event_id, observed_at) "
        "VALUES (?, ?, ?)");

    stmt.bind_text(1, fingerprint);
    stmt.bind_int64(2, original_event_id);
    stmt.bind_int64(3, observed_at);
    stmt.step();
}

// ==================== STARTUP ====================

std::vector<Identity> FaceStore::load_identities() {
    std::lock_guard<std::mutex> lock(db_mutex);
    std::vector<Identity> identities;

    Statement stmt(db, R"(
        SELECT identity_id, display_code, embedding, first_seen, last_seen,
               total_detections, confidence_avg, age_estimate, gender_estimate
        FROM identities
        ORDER BY identity_id
    )");

    while (stmt.step()) {
        Identity identity;
        identity.identity_id = stmt.column_int64(0);
        identity.display_code = stmt.column_text(1);
        identity.representative_embedding =
            deserialize_embedding(stmt.column_blob(2), stmt.column_bytes(2));
        identity.first_seen = stmt.column_int64(3);
        identity.last_seen = stmt.column_int64(4);
        identity.total_detections = stmt.column_int(5);
        if (!stmt.is_null(6)) identity.confidence_running_average = stmt.column_double(6);
        if (!stmt.is_null(7)) identity.age_estimate = stmt.column_int(7);
        identity.gender_estimate = stmt.column_text(8);
        identities.push_back(std::move(identity));
    }

    return identities;
}

std::vector<std::pair<std::string, FingerprintHit>> FaceStore::load_fingerprints() {
    std::lock_guard<std::mutex> lock(db_mutex);
    std::vector<std::pair<std::string, FingerprintHit>> records;

    // MIN() con columnas "bare": SQLite devuelve identity_id de la fila mínima
    Statement stmt(db, R"(
        SELECT content_fingerprint, MIN(event_id), identity_id
        FROM detections
        GROUP BY content_fingerprint
    )");

    while (stmt.step()) {
        records.emplace_back(stmt.column_text(0),
                             FingerprintHit{stmt.column_int64(1), stmt.column_int64(2)});
    }

    return records;
}

// ==================== READS ====================

std::vector<DetectionEvent> FaceStore::recent_detections(int limit) const {
    std::vector<DetectionEvent> events;
    if (limit <= 0) return events;

    std::lock_guard<std::mutex> lock(reader_mutex);

    Statement stmt(reader, R"(
        SELECT event_id, identity_id, detected_at, confidence, content_fingerprint,
               age, gender, emotion, ethnicity
        FROM detections
        ORDER BY event_id DESC
        LIMIT ?
    )");
    stmt.bind_int(1, limit);

    while (stmt.step()) {
        DetectionEvent event;
        event.event_id = stmt.column_int64(0);
        event.identity_id = stmt.column_int64(1);
        event.timestamp = stmt.column_int64(2);
        if (!stmt.is_null(3)) event.confidence = static_cast<float>(stmt.column_double(3));
        event.content_fingerprint = stmt.column_text(4);
        if (!stmt.is_null(5)) event.attributes.age = stmt.column_int(5);
        event.attributes.gender.dominant = stmt.column_text(6);
        event.attributes.emotion.dominant = stmt.column_text(7);
        event.attributes.ethnicity.dominant = stmt.column_text(8);
        events.push_back(std::move(event));
    }

    Statement scores(reader,
        "SELECT category, label, score FROM detection_scores WHERE event_id = ?");

    for (auto& event : events) {
        scores.reset();
        scores.bind_int64(1, event.event_id);
        while (scores.step()) {
            std::string category = scores.column_text(0);
            float score = static_cast<float>(scores.column_double(2));
            if (category == "gender") {
                event.attributes.gender.scores[scores.column_text(1)] = score;
            } else if (category == "emotion") {
                event.attributes.emotion.scores[scores.column_text(1)] = score;
            } else if (category == "ethnicity") {
                event.attributes.ethnicity.scores[scores.column_text(1)] = score;
            }
        }
    }

    return events;
}

std::vector<Identity> FaceStore::list_identities() const {
    std::lock_guard<std::mutex> lock(reader_mutex);
    std::vector<Identity> identities;

    Statement stmt(reader, R"(
        SELECT identity_id, display_code, first_seen, last_seen,
               total_detections, confidence_avg, age_estimate, gender_estimate
        FROM identities
        ORDER BY last_seen DESC, identity_id DESC
    )");

    while (stmt.step()) {
        Identity identity;
        identity.identity_id = stmt.column_int64(0);
        identity.display_code = stmt.column_text(1);
        identity.first_seen = stmt.column_int64(2);
        identity.last_seen = stmt.column_int64(3);
        identity.total_detections = stmt.column_int(4);
        if (!stmt.is_null(5)) identity.confidence_running_average = stmt.column_double(5);
        if (!stmt.is_null(6)) identity.age_estimate = stmt.column_int(6);
        identity.gender_estimate = stmt.column_text(7);
        identities.push_back(std::move(identity));
    }

    return identities;
}

ActivityStats FaceStore::stats(Timestamp now) const {
    std::lock_guard<std::mutex> lock(reader_mutex);
    ActivityStats stats;

    Statement counts(reader, R"(
        SELECT
            (SELECT COUNT(*) FROM identities),
            (SELECT COUNT(*) FROM detections),
            (SELECT COUNT(*) FROM duplicate_hits),
            (SELECT COUNT(*) FROM detections WHERE detected_at > ?)
    )");
    counts.bind_int64(1, now - 24LL * 3600 * 1000);

    if (counts.step()) {
        stats.total_identities = counts.column_int64(0);
        stats.total_detections = counts.column_int64(1);
        stats.total_exact_duplicates = counts.column_int64(2);
        stats.detections_last_24h = counts.column_int64(3);
    }

    Statement most_seen(reader, R"(
        SELECT display_code, total_detections
        FROM identities
        ORDER BY total_detections DESC, first_seen ASC, identity_id ASC
        LIMIT 1
    )");

    if (most_seen.step()) {
        stats.most_seen_code = most_seen.column_text(0);
        stats.most_seen_count = most_seen.column_int(1);
    }

    return stats;
}

} // namespace autoface
