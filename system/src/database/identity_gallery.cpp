#include "database/identity_gallery.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace autoface {

IdentityGallery::IdentityGallery(FaceStore& store,
                                 const EmbeddingComparator& comparator,
                                 std::unique_ptr<CodeGenerator> code_generator,
                                 const Config& config,
                                 std::unique_ptr<MatchIndex> index)
    : store(store),
      comparator(comparator),
      codes(std::move(code_generator)),
      config(config),
      index(std::move(index)),
      dim(config.embedding_dim)
{
    if (!codes) {
        throw std::invalid_argument("IdentityGallery requiere un CodeGenerator");
    }
    if (config.max_code_attempts < 1) {
        throw std::invalid_argument("max_code_attempts debe ser >= 1");
    }
    if (!this->index) {
        this->index = std::make_unique<LinearScanIndex>(comparator);
    }
}

// ==================== LOAD ====================

size_t IdentityGallery::load() {
    auto stored = store.load_identities();

    std::unique_lock<std::shared_mutex> lock(mutex);
    identities.clear();
    codes_in_use.clear();
    index->clear();
    dim = config.embedding_dim;

    for (const auto& identity : stored) {
        check_dimension(identity.representative_embedding);
        add_locked(identity);
    }

    spdlog::info("Gallery ready ({} identities, dim={}, metric={})",
                 identities.size(), dim, to_string(comparator.metric()));
    return identities.size();
}

void IdentityGallery::check_dimension(const Embedding& embedding) const {
    if (embedding.empty()) {
        throw DimensionMismatch(dim, 0);
    }
    if (dim != 0 && embedding.size() != dim) {
        throw DimensionMismatch(dim, embedding.size());
    }
}

void IdentityGallery::add_locked(const Identity& identity) {
    if (dim == 0) {
        dim = identity.representative_embedding.size();
    }
    codes_in_use.insert(identity.display_code);
    index->add({identity.identity_id, identity.first_seen, identity.representative_embedding});
    identities[identity.identity_id] = identity;
}

// ==================== BEST MATCH ====================

std::optional<MatchCandidate> IdentityGallery::best_match(const Embedding& query,
                                                          float threshold) const {
    if (!EmbeddingComparator::valid_threshold(threshold)) {
        throw std::invalid_argument("threshold fuera de (0, 1]: " + std::to_string(threshold));
    }

    std::shared_lock<std::shared_mutex> lock(mutex);
    check_dimension(query);

    auto candidate = index->best(query);
    if (!candidate) {
        return std::nullopt;
    }

    spdlog::debug("Best candidate: identity {} score={:.4f} (threshold {:.2f})",
                  candidate->identity_id, candidate->score, threshold);

    if (!EmbeddingComparator::is_match(candidate->score, threshold)) {
        return std::nullopt;
    }
    return candidate;
}

// ==================== INSERT ====================

std::string IdentityGallery::next_display_code(Timestamp now) const {
    try {
        for (int attempt = 0; attempt < config.max_code_attempts; ++attempt) {
            std::string code = codes->generate(now);
            if (codes_in_use.count(code) == 0) {
                return code;
            }
            spdlog::debug("Display code {} en uso, regenerando", code);
        }
    } catch (const IdentityCodeCollision& e) {
        spdlog::debug("{}", e.what());
    }

    // Intentos agotados: primer sufijo libre del bucket
    std::string bucket = minute_bucket(now);
    int space = codes->suffix_space();
    for (int suffix = 0; suffix < space; ++suffix) {
        std::string code = format_display_code(bucket, suffix);
        if (codes_in_use.count(code) == 0) {
            spdlog::debug("Display code {} tras {} intentos", code, config.max_code_attempts);
            return code;
        }
    }
    throw IdentityCodeCollision(bucket, space);
}

Identity IdentityGallery::insert(FaceStore::Transaction& tx,
                                 const Embedding& embedding,
                                 const FaceAttributes& attributes,
                                 Timestamp now) {
    Identity identity;
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        check_dimension(embedding);
        identity.display_code = next_display_code(now);
    }

    identity.representative_embedding = embedding;
    identity.first_seen = now;
    identity.last_seen = now;
    identity.total_detections = 1;
    identity.age_estimate = attributes.age;
    identity.gender_estimate = attributes.gender.dominant;

    identity.identity_id = store.insert_identity(tx, identity);

    tx.on_commit([this, identity]() {
        std::unique_lock<std::shared_mutex> lock(mutex);
        add_locked(identity);
    });

    return identity;
}

// ==================== RECORD MATCH ====================

Identity IdentityGallery::record_match(FaceStore::Transaction& tx,
                                       int64_t identity_id,
                                       float score,
                                       Timestamp now) {
    Identity updated;
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        auto it = identities.find(identity_id);
        if (it == identities.end()) {
            throw std::out_of_range("Unknown identity " + std::to_string(identity_id));
        }
        updated = it->second;
    }

    updated.last_seen = now;
    updated.total_detections += 1;

    // El evento de registro no aporta score: el promedio es sobre los matches
    int match_count = updated.total_detections - 1;
    double avg = updated.confidence_running_average.value_or(0.0);
    avg += (static_cast<double>(score) - avg) / match_count;
    updated.confidence_running_average = avg;

    store.update_identity_match(tx, identity_id, updated.last_seen,
                                updated.total_detections, avg);

    Timestamp last_seen = updated.last_seen;
    int total = updated.total_detections;
    tx.on_commit([this, identity_id, last_seen, total, avg]() {
        std::unique_lock<std::shared_mutex> lock(mutex);
        auto& identity = identities.at(identity_id);
        identity.last_seen = last_seen;
        identity.total_detections = total;
        identity.confidence_running_average = avg;
    });

    return updated;
}

// ==================== QUERY ====================

std::optional<Identity> IdentityGallery::get(int64_t identity_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = identities.find(identity_id);
    if (it == identities.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Identity> IdentityGallery::list() const {
    std::vector<Identity> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        result.reserve(identities.size());
        for (const auto& [id, identity] : identities) {
            result.push_back(identity);
        }
    }

    std::sort(result.begin(), result.end(), [](const Identity& a, const Identity& b) {
        if (a.last_seen != b.last_seen) return a.last_seen > b.last_seen;
        return a.identity_id > b.identity_id;
    });
    return result;
}

size_t IdentityGallery::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return identities.size();
}

size_t IdentityGallery::embedding_dim() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return dim;
}

} // namespace autoface
