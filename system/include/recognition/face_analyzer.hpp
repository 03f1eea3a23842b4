// ============= include/recognition/face_analyzer.hpp =============
#pragma once
#include "core/types.hpp"
#include <vector>

namespace autoface {

// Colaborador externo: bytes de imagen → caras + embedding + atributos.
// Lanza AnalysisError si la imagen no se puede analizar.
class FaceAnalyzer {
public:
    virtual ~FaceAnalyzer() = default;
    virtual AnalysisResult analyze(const std::vector<unsigned char>& image) = 0;
};

} // namespace autoface
