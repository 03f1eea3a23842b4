// ============= test/test_config.cpp =============
#include "config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace autoface;

namespace {

AppConfig parse(const std::string& content) {
    SimpleToml toml;
    toml.parse(content);
    return parse_app_config(toml);
}

} // namespace

TEST(SimpleTomlTest, SectionsQuotesAndComments) {
    SimpleToml toml;
    toml.parse(R"(
# comentario
top = 1

[database]
path = "data/faces.db"   # archivo

[matching]
threshold = 0.7  # inline
metric=euclidean
)");

    EXPECT_EQ(toml.get_int("top"), 1);
    EXPECT_EQ(toml.get("database.path"), "data/faces.db");
    EXPECT_FLOAT_EQ(toml.get_float("matching.threshold"), 0.7f);
    EXPECT_EQ(toml.get("matching.metric"), "euclidean");
    EXPECT_FALSE(toml.has("matching.missing"));
}

TEST(SimpleTomlTest, MissingKeysReturnDefaults) {
    SimpleToml toml;
    toml.parse("[a]\nflag = false\n");

    EXPECT_EQ(toml.get("a.none", "x"), "x");
    EXPECT_EQ(toml.get_int("a.none", 7), 7);
    EXPECT_FLOAT_EQ(toml.get_float("a.none", 0.5f), 0.5f);
    EXPECT_TRUE(toml.get_bool("a.none", true));
    EXPECT_FALSE(toml.get_bool("a.flag", true));
}

TEST(SimpleTomlTest, MalformedValuesThrow) {
    SimpleToml toml;
    toml.parse("[a]\nn = abc\nb = maybe\n");

    EXPECT_THROW(toml.get_int("a.n"), std::invalid_argument);
    EXPECT_THROW(toml.get_float("a.n"), std::invalid_argument);
    EXPECT_THROW(toml.get_bool("a.b"), std::invalid_argument);
}

TEST(AppConfigTest, Defaults) {
    AppConfig config = parse("");

    EXPECT_EQ(config.database.path, "database/autoface.db");
    EXPECT_FLOAT_EQ(config.matching.threshold, 0.65f);
    EXPECT_EQ(config.matching.metric, SimilarityMetric::COSINE);
    EXPECT_EQ(config.matching.embedding_dim, 0u);
    EXPECT_EQ(config.matching.code_generator, "random");
    EXPECT_EQ(config.matching.max_code_attempts, 16);
    EXPECT_FLOAT_EQ(config.analyzer.score_threshold, 0.9f);
    EXPECT_FLOAT_EQ(config.analyzer.nms_threshold, 0.3f);
    EXPECT_EQ(config.ingest.threads, 4);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_TRUE(config.logging.file.empty());
}

TEST(AppConfigTest, FullFile) {
    AppConfig config = parse(R"(
[database]
path = "/var/lib/autoface/registry.db"

[matching]
threshold = 0.5
metric = "euclidean"
embedding_dim = 128
code_generator = "sequential"
max_code_attempts = 4

[analyzer]
detector_model = "m/yunet.onnx"
recognizer_model = "m/sface.onnx"
score_threshold = 0.8

[ingest]
threads = 2

[logging]
level = "debug"
file = "logs/autoface.log"
)");

    EXPECT_EQ(config.database.path, "/var/lib/autoface/registry.db");
    EXPECT_FLOAT_EQ(config.matching.threshold, 0.5f);
    EXPECT_EQ(config.matching.metric, SimilarityMetric::EUCLIDEAN);
    EXPECT_EQ(config.matching.embedding_dim, 128u);
    EXPECT_EQ(config.matching.code_generator, "sequential");
    EXPECT_EQ(config.analyzer.detector_model, "m/yunet.onnx");
    EXPECT_EQ(config.analyzer.recognizer_model, "m/sface.onnx");
    EXPECT_FLOAT_EQ(config.analyzer.score_threshold, 0.8f);
    EXPECT_EQ(config.ingest.threads, 2);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.file, "logs/autoface.log");

    auto gallery = config.gallery_config();
    EXPECT_EQ(gallery.embedding_dim, 128u);
    EXPECT_EQ(gallery.max_code_attempts, 4);
}

TEST(AppConfigTest, InvalidValuesRejected) {
    EXPECT_THROW(parse("[matching]\nthreshold = 0\n"), std::invalid_argument);
    EXPECT_THROW(parse("[matching]\nthreshold = 1.5\n"), std::invalid_argument);
    EXPECT_THROW(parse("[matching]\nmetric = \"dot\"\n"), std::invalid_argument);
    EXPECT_THROW(parse("[matching]\ncode_generator = \"uuid\"\n"), std::invalid_argument);
    EXPECT_THROW(parse("[matching]\nembedding_dim = -1\n"), std::invalid_argument);
    EXPECT_THROW(parse("[matching]\nmax_code_attempts = 0\n"), std::invalid_argument);
    EXPECT_THROW(parse("[ingest]\nthreads = 0\n"), std::invalid_argument);
    EXPECT_THROW(parse("[logging]\nlevel = \"verbose\"\n"), std::invalid_argument);
    EXPECT_THROW(parse("[database]\npath = \"\"\n"), std::invalid_argument);
}

TEST(AppConfigTest, ThresholdOverrideIsValidated) {
    AppConfig config;
    apply_threshold_override(config, 0.8f);
    EXPECT_FLOAT_EQ(config.matching.threshold, 0.8f);

    // Negativos y cero se rechazan, no se ignoran
    EXPECT_THROW(apply_threshold_override(config, -0.5f), std::invalid_argument);
    EXPECT_THROW(apply_threshold_override(config, 0.0f), std::invalid_argument);
    EXPECT_THROW(apply_threshold_override(config, 1.01f), std::invalid_argument);
    EXPECT_FLOAT_EQ(config.matching.threshold, 0.8f);
}

TEST(AppConfigTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "autoface_config_test.toml";
    {
        std::ofstream out(path);
        out << "[matching]\nthreshold = 0.72\n";
    }

    AppConfig config = load_app_config(path.string());
    EXPECT_FLOAT_EQ(config.matching.threshold, 0.72f);
    std::filesystem::remove(path);

    EXPECT_THROW(load_app_config("/nonexistent/autoface.toml"), std::runtime_error);
}
