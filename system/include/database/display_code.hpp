// ============= include/database/display_code.hpp =============
/*
 * Display codes: PERSON_<YYYYMMDD_HHMM>_<NNNN>
 *
 * - Bucket = minuto de creación (hora local)
 * - Sufijo de 4 dígitos para desambiguar registros del mismo minuto
 * - RandomCodeGenerator en producción, SequentialCodeGenerator en tests
 *
 * La unicidad global la verifica IdentityGallery (regenera si el código
 * ya existe y, agotados los intentos, recorre los sufijos libres del
 * bucket); el generador solo propone.
 */

#pragma once
#include "core/types.hpp"
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace autoface {

constexpr int DISPLAY_CODE_SUFFIX_SPACE = 10000;   // 0000-9999

// "20251124_1430"
std::string minute_bucket(Timestamp ts);

// "PERSON_20251124_1430_0042"
std::string format_display_code(const std::string& bucket, int suffix);

class CodeGenerator {
public:
    virtual ~CodeGenerator() = default;
    virtual std::string generate(Timestamp ts) = 0;

    // Sufijos válidos por bucket: [0, suffix_space())
    virtual int suffix_space() const { return DISPLAY_CODE_SUFFIX_SPACE; }
};

class RandomCodeGenerator : public CodeGenerator {
public:
    RandomCodeGenerator();
    explicit RandomCodeGenerator(uint32_t seed);

    std::string generate(Timestamp ts) override;

private:
    std::mutex mutex;
    std::mt19937 gen;
    std::uniform_int_distribution<int> dis;
};

// Contador del bucket actual; se reinicia al cambiar de minuto.
// Lanza IdentityCodeCollision al agotar el bucket.
class SequentialCodeGenerator : public CodeGenerator {
public:
    explicit SequentialCodeGenerator(int capacity_per_bucket = DISPLAY_CODE_SUFFIX_SPACE);

    std::string generate(Timestamp ts) override;
    int suffix_space() const override { return capacity; }

private:
    std::mutex mutex;
    int capacity;
    std::string current_bucket;
    int next_suffix = 0;
};

// "random" | "sequential"; lanza std::invalid_argument si no se reconoce
std::unique_ptr<CodeGenerator> make_code_generator(const std::string& name);

} // namespace autoface
