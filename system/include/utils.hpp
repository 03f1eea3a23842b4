// ============= include/utils.hpp =============
#pragma once
#include "core/types.hpp"
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace autoface {

// Reloj de sistema en ms desde epoch
Timestamp system_clock_ms();

// "2025-11-24 14:30:52" (hora local)
std::string format_timestamp(Timestamp ts, const char* fmt = "%Y-%m-%d %H:%M:%S");

// Leer archivo completo (imagen) a memoria. Lanza std::runtime_error si falla.
std::vector<unsigned char> read_file_bytes(const std::string& path);

// Extensiones aceptadas por el ingest (jpg, jpeg, png, bmp, webp)
bool is_image_file(const std::string& path);

// Pattern + nivel globales de spdlog, con sink rotativo opcional
void configure_logging(const std::string& level, const std::string& file = "");

} // namespace autoface
