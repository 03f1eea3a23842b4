// ============= test/test_identity_gallery.cpp =============
#include "database/identity_gallery.hpp"
#include "database/match_index.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <deque>
#include <memory>

using namespace autoface;
using namespace autoface::testing_support;

namespace {

// Devuelve los codes en orden; repite el último cuando se acaban
class ScriptedCodeGenerator : public CodeGenerator {
public:
    explicit ScriptedCodeGenerator(std::deque<std::string> codes,
                                   int space = DISPLAY_CODE_SUFFIX_SPACE)
        : codes(std::move(codes)), space(space) {}

    std::string generate(Timestamp) override {
        std::string code = codes.front();
        if (codes.size() > 1) codes.pop_front();
        generated++;
        return code;
    }

    int suffix_space() const override { return space; }

    int generated = 0;

private:
    std::deque<std::string> codes;
    int space;
};

} // namespace

class IdentityGalleryTest : public ::testing::Test {
protected:
    TempDatabase db;
    std::unique_ptr<FaceStore> store;
    EmbeddingComparator comparator;
    std::unique_ptr<IdentityGallery> gallery;

    void SetUp() override {
        store = std::make_unique<FaceStore>(db.path());
        gallery = std::make_unique<IdentityGallery>(
            *store, comparator, std::make_unique<SequentialCodeGenerator>());
    }

    Identity insert(const Embedding& embedding, Timestamp now, FaceAttributes attrs = FaceAttributes()) {
        FaceStore::Transaction tx(*store);
        Identity identity = gallery->insert(tx, embedding, attrs, now);
        tx.commit();
        return identity;
    }

    Identity match(int64_t identity_id, float score, Timestamp now) {
        FaceStore::Transaction tx(*store);
        Identity identity = gallery->record_match(tx, identity_id, score, now);
        tx.commit();
        return identity;
    }
};

TEST_F(IdentityGalleryTest, InsertInitializesIdentity) {
    FaceAttributes attrs;
    attrs.age = 31;
    attrs.gender.dominant = "Woman";

    Identity identity = insert({1.0f, 0.0f, 0.0f}, BASE_TIME, attrs);

    EXPECT_GT(identity.identity_id, 0);
    EXPECT_EQ(identity.display_code, format_display_code(minute_bucket(BASE_TIME), 0));
    EXPECT_EQ(identity.first_seen, BASE_TIME);
    EXPECT_EQ(identity.last_seen, BASE_TIME);
    EXPECT_EQ(identity.total_detections, 1);
    EXPECT_FALSE(identity.confidence_running_average.has_value());
    ASSERT_TRUE(identity.age_estimate.has_value());
    EXPECT_EQ(*identity.age_estimate, 31);
    EXPECT_EQ(identity.gender_estimate, "Woman");

    auto stored = gallery->get(identity.identity_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->display_code, identity.display_code);
    EXPECT_EQ(gallery->size(), 1u);
    EXPECT_EQ(gallery->embedding_dim(), 3u);
}

TEST_F(IdentityGalleryTest, UncommittedInsertLeavesNoTrace) {
    {
        FaceStore::Transaction tx(*store);
        gallery->insert(tx, {1.0f, 0.0f}, FaceAttributes(), BASE_TIME);
        // sin commit
    }

    EXPECT_EQ(gallery->size(), 0u);
    EXPECT_FALSE(gallery->best_match({1.0f, 0.0f}, 0.5f).has_value());
    EXPECT_TRUE(store->list_identities().empty());
}

TEST_F(IdentityGalleryTest, BestMatchAppliesThreshold) {
    Identity a = insert({1.0f, 0.0f}, BASE_TIME);
    insert({0.0f, 1.0f}, BASE_TIME + 1);

    auto m = gallery->best_match({1.0f, 0.2f}, 0.65f);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->identity_id, a.identity_id);
    EXPECT_NEAR(m->score, 1.0f / std::sqrt(1.04f), 1e-6f);

    // Ninguno llega a 0.99
    EXPECT_FALSE(gallery->best_match({1.0f, 0.2f}, 0.99f).has_value());
}

TEST_F(IdentityGalleryTest, BestMatchOnEmptyGallery) {
    EXPECT_FALSE(gallery->best_match({1.0f, 0.0f}, 0.65f).has_value());
}

TEST_F(IdentityGalleryTest, BestMatchRejectsInvalidThreshold) {
    insert({1.0f, 0.0f}, BASE_TIME);
    EXPECT_THROW(gallery->best_match({1.0f, 0.0f}, 0.0f), std::invalid_argument);
    EXPECT_THROW(gallery->best_match({1.0f, 0.0f}, 1.5f), std::invalid_argument);
}

TEST_F(IdentityGalleryTest, DimensionIsEnforced) {
    insert({1.0f, 0.0f, 0.0f}, BASE_TIME);

    EXPECT_THROW(gallery->best_match({1.0f, 0.0f}, 0.65f), DimensionMismatch);
    {
        FaceStore::Transaction tx(*store);
        EXPECT_THROW(gallery->insert(tx, {1.0f, 0.0f}, FaceAttributes(), BASE_TIME), DimensionMismatch);
        EXPECT_THROW(gallery->insert(tx, {}, FaceAttributes(), BASE_TIME), DimensionMismatch);
    }
    EXPECT_EQ(gallery->size(), 1u);
}

TEST_F(IdentityGalleryTest, ConfiguredDimensionAppliesBeforeFirstInsert) {
    IdentityGallery::Config config;
    config.embedding_dim = 4;
    IdentityGallery fixed(*store, comparator, std::make_unique<SequentialCodeGenerator>(), config);

    FaceStore::Transaction tx(*store);
    EXPECT_THROW(fixed.insert(tx, {1.0f, 0.0f}, FaceAttributes(), BASE_TIME), DimensionMismatch);
    EXPECT_NO_THROW(fixed.insert(tx, {1.0f, 0.0f, 0.0f, 0.0f}, FaceAttributes(), BASE_TIME));
}

TEST_F(IdentityGalleryTest, RecordMatchAveragesOnlyMatchScores) {
    Identity identity = insert({1.0f, 0.0f}, BASE_TIME);

    Identity after_first = match(identity.identity_id, 0.8f, BASE_TIME + 1000);
    EXPECT_EQ(after_first.total_detections, 2);
    EXPECT_EQ(after_first.last_seen, BASE_TIME + 1000);
    ASSERT_TRUE(after_first.confidence_running_average.has_value());
    EXPECT_DOUBLE_EQ(*after_first.confidence_running_average, static_cast<double>(0.8f));

    match(identity.identity_id, 0.9f, BASE_TIME + 2000);
    Identity after_third = match(identity.identity_id, 0.7f, BASE_TIME + 3000);

    double expected = (static_cast<double>(0.8f) + 0.9f + 0.7f) / 3.0;
    EXPECT_EQ(after_third.total_detections, 4);
    EXPECT_NEAR(*after_third.confidence_running_average, expected, 1e-9);

    // Memoria y DB coinciden
    auto stored = gallery->get(identity.identity_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->total_detections, 4);
    EXPECT_EQ(stored->first_seen, BASE_TIME);
    EXPECT_EQ(stored->last_seen, BASE_TIME + 3000);
    EXPECT_EQ(stored->representative_embedding, (Embedding{1.0f, 0.0f}));

    auto listed = store->list_identities();
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].total_detections, 4);
    EXPECT_NEAR(*listed[0].confidence_running_average, expected, 1e-9);
}

TEST_F(IdentityGalleryTest, RecordMatchUnknownIdentityThrows) {
    FaceStore::Transaction tx(*store);
    EXPECT_THROW(gallery->record_match(tx, 999, 0.9f, BASE_TIME), std::out_of_range);
}

TEST_F(IdentityGalleryTest, ListOrdersByLastSeenDescending) {
    Identity a = insert({1.0f, 0.0f}, BASE_TIME);
    Identity b = insert({0.0f, 1.0f}, BASE_TIME + 10);
    match(a.identity_id, 0.9f, BASE_TIME + 20);

    auto listed = gallery->list();
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].identity_id, a.identity_id);
    EXPECT_EQ(listed[1].identity_id, b.identity_id);
}

TEST_F(IdentityGalleryTest, LoadRestoresPersistedIdentities) {
    Identity a = insert({1.0f, 0.0f}, BASE_TIME);
    match(a.identity_id, 0.75f, BASE_TIME + 5);

    IdentityGallery reloaded(*store, comparator, std::make_unique<SequentialCodeGenerator>());
    EXPECT_EQ(reloaded.load(), 1u);

    auto restored = reloaded.get(a.identity_id);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->display_code, a.display_code);
    EXPECT_EQ(restored->total_detections, 2);
    EXPECT_DOUBLE_EQ(*restored->confidence_running_average, static_cast<double>(0.75f));
    EXPECT_EQ(restored->representative_embedding, a.representative_embedding);
    EXPECT_EQ(reloaded.embedding_dim(), 2u);
}

TEST_F(IdentityGalleryTest, CodeInUseIsRegenerated) {
    std::string bucket = minute_bucket(BASE_TIME);
    auto scripted = std::make_unique<ScriptedCodeGenerator>(std::deque<std::string>{
        format_display_code(bucket, 7), format_display_code(bucket, 7), format_display_code(bucket, 8)});
    auto* script = scripted.get();

    IdentityGallery custom(*store, comparator, std::move(scripted));

    FaceStore::Transaction tx(*store);
    Identity first = custom.insert(tx, {1.0f, 0.0f}, FaceAttributes(), BASE_TIME);
    tx.commit();

    FaceStore::Transaction tx2(*store);
    Identity second = custom.insert(tx2, {0.0f, 1.0f}, FaceAttributes(), BASE_TIME);
    tx2.commit();

    EXPECT_EQ(first.display_code, format_display_code(bucket, 7));
    EXPECT_EQ(second.display_code, format_display_code(bucket, 8));
    EXPECT_EQ(script->generated, 3);
}

TEST_F(IdentityGalleryTest, FreeSuffixTakenAfterMaxAttempts) {
    std::string bucket = minute_bucket(BASE_TIME);
    IdentityGallery::Config config;
    config.max_code_attempts = 4;

    auto scripted = std::make_unique<ScriptedCodeGenerator>(
        std::deque<std::string>{format_display_code(bucket, 1)});
    auto* script = scripted.get();
    IdentityGallery custom(*store, comparator, std::move(scripted), config);

    FaceStore::Transaction tx(*store);
    Identity first = custom.insert(tx, {1.0f, 0.0f}, FaceAttributes(), BASE_TIME);
    tx.commit();

    FaceStore::Transaction tx2(*store);
    Identity second = custom.insert(tx2, {0.0f, 1.0f}, FaceAttributes(), BASE_TIME);
    tx2.commit();

    EXPECT_EQ(first.display_code, format_display_code(bucket, 1));
    EXPECT_EQ(second.display_code, format_display_code(bucket, 0));
    EXPECT_EQ(script->generated, 1 + 4);
    EXPECT_EQ(custom.size(), 2u);
}

TEST_F(IdentityGalleryTest, CodeCollisionOnlyWhenBucketFull) {
    std::string bucket = minute_bucket(BASE_TIME);
    auto scripted = std::make_unique<ScriptedCodeGenerator>(
        std::deque<std::string>{format_display_code(bucket, 0)}, 2);
    IdentityGallery custom(*store, comparator, std::move(scripted));

    {
        FaceStore::Transaction tx(*store);
        custom.insert(tx, {1.0f, 0.0f}, FaceAttributes(), BASE_TIME);
        tx.commit();
    }
    {
        FaceStore::Transaction tx(*store);
        Identity second = custom.insert(tx, {0.0f, 1.0f}, FaceAttributes(), BASE_TIME);
        EXPECT_EQ(second.display_code, format_display_code(bucket, 1));
        tx.commit();
    }

    {
        FaceStore::Transaction tx(*store);
        try {
            custom.insert(tx, {1.0f, 1.0f}, FaceAttributes(), BASE_TIME);
            FAIL() << "expected IdentityCodeCollision";
        } catch (const IdentityCodeCollision& e) {
            EXPECT_TRUE(e.retryable());
            EXPECT_EQ(e.bucket(), bucket);
        }
    }
    EXPECT_EQ(custom.size(), 2u);

    // Otro minuto, otro bucket
    FaceStore::Transaction tx(*store);
    Identity later = custom.insert(tx, {1.0f, 1.0f}, FaceAttributes(), BASE_TIME + ONE_MINUTE);
    tx.commit();
    EXPECT_EQ(later.display_code, format_display_code(minute_bucket(BASE_TIME + ONE_MINUTE), 0));
}

// ==================== TIE-BREAK ====================

TEST(LinearScanIndexTest, TieGoesToEarliestFirstSeen) {
    EmbeddingComparator comparator;
    LinearScanIndex index(comparator);

    // Mismo score exacto para ambos: componentes simétricas
    Embedding u{1.0f, 0.0f};
    Embedding v{0.0f, 1.0f};
    Embedding q{0.70710677f, 0.70710677f};
    ASSERT_EQ(comparator.compare(q, u), comparator.compare(q, v));

    index.add({3, 200, v});
    index.add({5, 100, u});

    auto best = index.best(q);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->identity_id, 5);
}

TEST(LinearScanIndexTest, TieWithEqualFirstSeenGoesToLowerId) {
    EmbeddingComparator comparator;
    LinearScanIndex index(comparator);

    Embedding u{1.0f, 0.0f};
    Embedding v{0.0f, 1.0f};
    Embedding q{0.70710677f, 0.70710677f};

    index.add({9, 100, u});
    index.add({4, 100, v});

    auto best = index.best(q);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->identity_id, 4);
}

TEST(LinearScanIndexTest, EmptyIndexHasNoCandidate) {
    EmbeddingComparator comparator;
    LinearScanIndex index(comparator);
    EXPECT_FALSE(index.best({1.0f}).has_value());

    index.add({1, 0, {1.0f}});
    EXPECT_EQ(index.size(), 1u);
    index.clear();
    EXPECT_EQ(index.size(), 0u);
}
