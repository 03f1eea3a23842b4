// ============= main.cpp - INGEST DE IMÁGENES CON AUTO-REGISTRO =============
#include "config.hpp"
#include "core/errors.hpp"
#include "database/thread_pool.hpp"
#include "engine/face_registry.hpp"
#include "recognition/opencv_face_analyzer.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace autoface;
namespace fs = std::filesystem;

std::atomic<bool> stop_signal(false);

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        spdlog::info("Deteniendo");
        stop_signal = true;
    }
}

void print_usage(const char* prog) {
    spdlog::info("Uso: {} <config.toml> <imagen|directorio>... [--threshold T]", prog);
}

// Archivos a procesar: imágenes sueltas + contenido (no recursivo) de directorios
std::vector<std::string> collect_inputs(const std::vector<std::string>& args) {
    std::vector<std::string> files;

    for (const auto& arg : args) {
        std::error_code ec;
        if (fs::is_directory(arg, ec)) {
            std::vector<std::string> dir_files;
            for (const auto& entry : fs::directory_iterator(arg, ec)) {
                if (entry.is_regular_file() && is_image_file(entry.path().string())) {
                    dir_files.push_back(entry.path().string());
                }
            }
            if (ec) {
                spdlog::warn("No se pudo leer {}: {}", arg, ec.message());
            }
            std::sort(dir_files.begin(), dir_files.end());
            files.insert(files.end(), dir_files.begin(), dir_files.end());
        } else if (fs::is_regular_file(arg, ec)) {
            files.push_back(arg);
        } else {
            spdlog::warn("Ignorando {} (no existe)", arg);
        }
    }
    return files;
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string config_file = argv[1];
    std::vector<std::string> input_args;
    std::optional<float> threshold_override;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--threshold" && i + 1 < argc) {
            try {
                threshold_override = std::stof(argv[++i]);
            } catch (const std::logic_error&) {
                spdlog::error("Threshold inválido: {}", argv[i]);
                return 1;
            }
        } else {
            input_args.push_back(arg);
        }
    }

    AppConfig config;
    try {
        config = load_app_config(config_file);
    } catch (const std::exception& e) {
        spdlog::error("Config: {}", e.what());
        return 1;
    }

    if (threshold_override) {
        try {
            apply_threshold_override(config, *threshold_override);
        } catch (const std::invalid_argument& e) {
            spdlog::error("Config: {}", e.what());
            return 1;
        }
    }

    try {
        configure_logging(config.logging.level, config.logging.file);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Logging: {}", e.what());
        return 1;
    }

    std::vector<std::string> files = collect_inputs(input_args);
    if (files.empty()) {
        spdlog::error("Sin imágenes para procesar");
        return 1;
    }

    std::unique_ptr<FaceRegistry> registry;
    std::unique_ptr<OpenCvFaceAnalyzer> analyzer;

    try {
        analyzer = std::make_unique<OpenCvFaceAnalyzer>(config.analyzer);
        registry = std::make_unique<FaceRegistry>(config);
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }

    spdlog::info("Procesando {} imágenes con {} threads (threshold {:.2f})",
                 files.size(), config.ingest.threads, config.matching.threshold);

    std::atomic<size_t> failed(0);

    {
        ThreadPool pool(static_cast<size_t>(config.ingest.threads));
        std::vector<std::future<void>> pending;
        pending.reserve(files.size());

        for (const auto& path : files) {
            pending.push_back(pool.submit([&, path]() {
                if (stop_signal) return;

                try {
                    auto bytes = read_file_bytes(path);
                    auto outcome = registry->process(bytes, *analyzer);
                    spdlog::info("{} → {}", fs::path(path).filename().string(), outcome.to_string());
                } catch (const Error& e) {
                    failed++;
                    spdlog::error("{}: {}{}", path, e.what(), e.retryable() ? " (retryable)" : "");
                } catch (const std::exception& e) {
                    failed++;
                    spdlog::error("{}: {}", path, e.what());
                }
            }));
        }

        pool.wait_all();
        for (auto& f : pending) {
            f.get();
        }
    }

    if (stop_signal) {
        spdlog::warn("Interrumpido por señal");
    }

    // ==================== RESUMEN ====================
    registry->registration_engine().print_stats();

    try {
        auto stats = registry->stats();
        spdlog::info("=== Registry ===");
        spdlog::info("  Identidades: {} | Detecciones: {} | Duplicados exactos: {}",
                     stats.total_identities, stats.total_detections, stats.total_exact_duplicates);
        spdlog::info("  Últimas 24h: {}", stats.detections_last_24h);
        if (!stats.most_seen_code.empty()) {
            spdlog::info("  Más visto: {} ({} detecciones)", stats.most_seen_code, stats.most_seen_count);
        }
    } catch (const StorageError& e) {
        spdlog::error("No se pudieron leer stats: {}", e.what());
        return 1;
    }

    return failed > 0 ? 2 : 0;
}
