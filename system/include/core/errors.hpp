// ============= include/core/errors.hpp =============
/*
 * Error taxonomy del engine
 *
 * - Input errors (no face / multiple faces / analysis failure) NO son
 *   excepciones: se devuelven como RegistrationOutcome.
 * - Contract violations y storage errors se lanzan como subclases de
 *   autoface::Error. retryable() indica si el caller puede reintentar.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace autoface {

class Error : public std::runtime_error {
public:
    Error(const std::string& message, bool retryable)
        : std::runtime_error(message), retryable_flag(retryable) {}

    bool retryable() const noexcept { return retryable_flag; }

private:
    bool retryable_flag;
};

// Embeddings de distinta dimensión. Nunca debería pasar con un solo analyzer;
// violación de contrato, reintentable como IdentityCodeCollision.
class DimensionMismatch : public Error {
public:
    DimensionMismatch(size_t expected, size_t actual)
        : Error("Embedding dimension mismatch: expected " + std::to_string(expected) +
                ", got " + std::to_string(actual), true),
          expected_dim(expected), actual_dim(actual) {}

    size_t expected() const noexcept { return expected_dim; }
    size_t actual() const noexcept { return actual_dim; }

private:
    size_t expected_dim;
    size_t actual_dim;
};

class IdentityCodeCollision : public Error {
public:
    // Todos los sufijos [0, suffix_space) del bucket están en uso
    IdentityCodeCollision(const std::string& bucket, int suffix_space)
        : Error("Display code space exhausted for bucket " + bucket +
                " (" + std::to_string(suffix_space) + " codes in use)", true),
          bucket_name(bucket) {}

    const std::string& bucket() const noexcept { return bucket_name; }

private:
    std::string bucket_name;
};

class StorageError : public Error {
public:
    StorageError(const std::string& message, int sqlite_code)
        : Error("Storage error: " + message + " (sqlite code " +
                std::to_string(sqlite_code) + ")", true),
          rc(sqlite_code) {}

    int code() const noexcept { return rc; }

private:
    int rc;
};

// Lanzada por los FaceAnalyzer (imagen corrupta, decode fallido, modelo roto).
class AnalysisError : public Error {
public:
    explicit AnalysisError(const std::string& message)
        : Error(message, false) {}
};

} // namespace autoface
