#include "utils.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace autoface {

Timestamp system_clock_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string format_timestamp(Timestamp ts, const char* fmt) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    std::tm tm_local{};
    localtime_r(&secs, &tm_local);

    char buffer[64];
    size_t n = std::strftime(buffer, sizeof(buffer), fmt, &tm_local);
    return std::string(buffer, n);
}

std::vector<unsigned char> read_file_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("No se pudo abrir " + path);
    }

    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(file)),
                                     std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("Error leyendo " + path);
    }
    return bytes;
}

bool is_image_file(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png" ||
           ext == ".bmp" || ext == ".webp";
}

// ==================== LOGGING ====================

void configure_logging(const std::string& level, const std::string& file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!file.empty()) {
        std::filesystem::path p(file);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
        // 5 MB x 3 archivos
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file, 5 * 1024 * 1024, 3));
    }

    auto logger = std::make_shared<spdlog::logger>("autoface", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(level));
}

} // namespace autoface
