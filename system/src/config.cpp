#include "config.hpp"
#include "database/display_code.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace autoface {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool valid_log_level(const std::string& level) {
    static const char* levels[] = {
        "trace", "debug", "info", "warn", "warning", "error", "critical", "off"
    };
    for (const char* l : levels) {
        if (level == l) return true;
    }
    return false;
}

} // namespace

// ==================== SIMPLE TOML ====================

bool SimpleToml::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::stringstream buffer;
    buffer << file.rdbuf();
    parse(buffer.str());
    return true;
}

void SimpleToml::parse(const std::string& content) {
    std::istringstream input(content);
    std::string line, section;

    while (std::getline(input, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (val.size() >= 2 && val.front() == '"') {
            auto close = val.find('"', 1);
            if (close != std::string::npos) {
                val = val.substr(1, close - 1);
            }
        } else {
            // Comentario al final de la línea
            auto hash = val.find('#');
            if (hash != std::string::npos) {
                val = trim(val.substr(0, hash));
            }
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        values[full_key] = val;
    }
}

bool SimpleToml::has(const std::string& key) const {
    return values.find(key) != values.end();
}

std::string SimpleToml::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int SimpleToml::get_int(const std::string& key, int def) const {
    if (!has(key)) return def;
    try {
        return std::stoi(get(key));
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Valor entero inválido para " + key + ": " + get(key));
    }
}

float SimpleToml::get_float(const std::string& key, float def) const {
    if (!has(key)) return def;
    try {
        return std::stof(get(key));
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Valor numérico inválido para " + key + ": " + get(key));
    }
}

bool SimpleToml::get_bool(const std::string& key, bool def) const {
    if (!has(key)) return def;
    std::string v = get(key);
    if (v == "true" || v == "1") return true;
    if (v == "false" || v == "0") return false;
    throw std::invalid_argument("Valor booleano inválido para " + key + ": " + v);
}

// ==================== APP CONFIG ====================

IdentityGallery::Config AppConfig::gallery_config() const {
    IdentityGallery::Config config;
    config.embedding_dim = matching.embedding_dim;
    config.max_code_attempts = matching.max_code_attempts;
    return config;
}

AppConfig parse_app_config(const SimpleToml& toml) {
    AppConfig config;

    config.database.path = toml.get("database.path", config.database.path);
    if (config.database.path.empty()) {
        throw std::invalid_argument("database.path no puede estar vacío");
    }

    config.matching.threshold = toml.get_float("matching.threshold", config.matching.threshold);
    if (!EmbeddingComparator::valid_threshold(config.matching.threshold)) {
        throw std::invalid_argument("matching.threshold fuera de rango (0, 1]: " +
                                    toml.get("matching.threshold"));
    }

    config.matching.metric = parse_metric(toml.get("matching.metric", to_string(config.matching.metric)));

    int dim = toml.get_int("matching.embedding_dim", 0);
    if (dim < 0) {
        throw std::invalid_argument("matching.embedding_dim no puede ser negativo");
    }
    config.matching.embedding_dim = static_cast<size_t>(dim);

    config.matching.code_generator = toml.get("matching.code_generator", config.matching.code_generator);
    // Valida el nombre
    make_code_generator(config.matching.code_generator);

    config.matching.max_code_attempts = toml.get_int("matching.max_code_attempts",
                                                     config.matching.max_code_attempts);
    if (config.matching.max_code_attempts < 1) {
        throw std::invalid_argument("matching.max_code_attempts debe ser >= 1");
    }

    config.analyzer.detector_model = toml.get("analyzer.detector_model", config.analyzer.detector_model);
    config.analyzer.recognizer_model = toml.get("analyzer.recognizer_model", config.analyzer.recognizer_model);
    config.analyzer.score_threshold = toml.get_float("analyzer.score_threshold", config.analyzer.score_threshold);
    config.analyzer.nms_threshold = toml.get_float("analyzer.nms_threshold", config.analyzer.nms_threshold);
    config.analyzer.top_k = toml.get_int("analyzer.top_k", config.analyzer.top_k);

    config.ingest.threads = toml.get_int("ingest.threads", config.ingest.threads);
    if (config.ingest.threads < 1) {
        throw std::invalid_argument("ingest.threads debe ser >= 1");
    }

    config.logging.level = toml.get("logging.level", config.logging.level);
    if (!valid_log_level(config.logging.level)) {
        throw std::invalid_argument("logging.level desconocido: " + config.logging.level);
    }
    config.logging.file = toml.get("logging.file", config.logging.file);

    return config;
}

void apply_threshold_override(AppConfig& config, float threshold) {
    if (!EmbeddingComparator::valid_threshold(threshold)) {
        throw std::invalid_argument("threshold fuera de (0, 1]: " + std::to_string(threshold));
    }
    config.matching.threshold = threshold;
}

AppConfig load_app_config(const std::string& path) {
    SimpleToml toml;
    if (!toml.load(path)) {
        throw std::runtime_error("No se pudo cargar " + path);
    }
    return parse_app_config(toml);
}

} // namespace autoface
