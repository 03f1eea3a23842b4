// ============= include/database/fingerprint_index.hpp =============
/*
 * Fingerprint Index - detector de re-envíos exactos
 *
 * - Fingerprint = SHA-256 (hex) de los bytes crudos de la imagen,
 *   NO del embedding
 * - fingerprint → primer evento que lo produjo (gana el primero)
 * - En memoria; se reconstruye desde la tabla detections al arrancar
 *
 * El read-decide-write lo serializa el RegistrationEngine; el
 * shared_mutex interno solo protege lecturas externas (tools, tests).
 */

#pragma once
#include "core/types.hpp"
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace autoface {

// SHA-256 hex lowercase (64 chars). Lanza std::runtime_error si OpenSSL falla.
std::string content_fingerprint(const unsigned char* data, size_t size);
std::string content_fingerprint(const std::vector<unsigned char>& bytes);

class FingerprintIndex {
public:
    FingerprintIndex() = default;

    // Reemplaza el contenido (startup)
    void load(const std::vector<std::pair<std::string, FingerprintHit>>& records);

    std::optional<FingerprintHit> lookup(const std::string& fingerprint) const;

    // No sobreescribe: el primer evento queda como referencia.
    // Retorna false si el fingerprint ya existía.
    bool record(const std::string& fingerprint, const FingerprintHit& hit);

    size_t size() const;

private:
    std::unordered_map<std::string, FingerprintHit> entries;
    mutable std::shared_mutex mutex;
};

} // namespace autoface
