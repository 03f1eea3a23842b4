#include "database/display_code.hpp"
#include "core/errors.hpp"
#include "utils.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace autoface {

std::string minute_bucket(Timestamp ts) {
    return format_timestamp(ts, "%Y%m%d_%H%M");
}

std::string format_display_code(const std::string& bucket, int suffix) {
    std::ostringstream oss;
    oss << "PERSON_" << bucket << '_' << std::setfill('0') << std::setw(4) << suffix;
    return oss.str();
}

// ==================== RANDOM ====================

RandomCodeGenerator::RandomCodeGenerator()
    : gen(std::random_device{}()), dis(0, DISPLAY_CODE_SUFFIX_SPACE - 1) {}

RandomCodeGenerator::RandomCodeGenerator(uint32_t seed)
    : gen(seed), dis(0, DISPLAY_CODE_SUFFIX_SPACE - 1) {}

std::string RandomCodeGenerator::generate(Timestamp ts) {
    int suffix;
    {
        std::lock_guard<std::mutex> lock(mutex);
        suffix = dis(gen);
    }
    return format_display_code(minute_bucket(ts), suffix);
}

// ==================== SEQUENTIAL ====================

SequentialCodeGenerator::SequentialCodeGenerator(int capacity_per_bucket)
    : capacity(capacity_per_bucket)
{
    if (capacity <= 0 || capacity > DISPLAY_CODE_SUFFIX_SPACE) {
        throw std::invalid_argument("capacity_per_bucket fuera de rango: " +
                                    std::to_string(capacity_per_bucket));
    }
}

std::string SequentialCodeGenerator::generate(Timestamp ts) {
    std::string bucket = minute_bucket(ts);

    std::lock_guard<std::mutex> lock(mutex);
    if (bucket != current_bucket) {
        current_bucket = bucket;
        next_suffix = 0;
    }
    if (next_suffix >= capacity) {
        throw IdentityCodeCollision(bucket, capacity);
    }
    return format_display_code(bucket, next_suffix++);
}

std::unique_ptr<CodeGenerator> make_code_generator(const std::string& name) {
    if (name == "random") return std::make_unique<RandomCodeGenerator>();
    if (name == "sequential") return std::make_unique<SequentialCodeGenerator>();
    throw std::invalid_argument("Unknown code generator: " + name);
}

} // namespace autoface
