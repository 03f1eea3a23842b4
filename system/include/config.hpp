// ============= include/config.hpp =============
/*
 * Configuración de autoface (subset de TOML)
 *
 * FORMATO:
 *   # comentario
 *   [seccion]
 *   clave = valor
 *   clave = "string"
 *
 * Las claves quedan como "seccion.clave". Sin arrays ni tablas anidadas.
 */

#pragma once
#include "database/identity_gallery.hpp"
#include "recognition/embedding_comparator.hpp"
#include "recognition/analyzer_config.hpp"
#include <map>
#include <string>

namespace autoface {

class SimpleToml {
public:
    bool load(const std::string& filename);
    void parse(const std::string& content);

    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;
    bool get_bool(const std::string& key, bool def = false) const;

private:
    std::map<std::string, std::string> values;
};

struct AppConfig {
    struct Database {
        std::string path;

        Database() : path("database/autoface.db") {}
    };

    struct Matching {
        float threshold;
        SimilarityMetric metric;
        size_t embedding_dim;          // 0 = inferir
        std::string code_generator;    // "random" | "sequential"
        int max_code_attempts;

        Matching()
            : threshold(DEFAULT_MATCH_THRESHOLD),
              metric(SimilarityMetric::COSINE),
              embedding_dim(0),
              code_generator("random"),
              max_code_attempts(16) {}
    };

    struct Ingest {
        int threads;

        Ingest() : threads(4) {}
    };

    struct Logging {
        std::string level;
        std::string file;              // vacío = solo consola

        Logging() : level("info"), file("") {}
    };

    Database database;
    Matching matching;
    AnalyzerConfig analyzer;
    Ingest ingest;
    Logging logging;

    IdentityGallery::Config gallery_config() const;
};

// Lanza std::runtime_error si el archivo no existe y std::invalid_argument
// si algún valor es inválido.
AppConfig load_app_config(const std::string& path);
AppConfig parse_app_config(const SimpleToml& toml);

// --threshold de línea de comandos; std::invalid_argument fuera de (0, 1]
void apply_threshold_override(AppConfig& config, float threshold);

} // namespace autoface
