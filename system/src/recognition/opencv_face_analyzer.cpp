#include "recognition/opencv_face_analyzer.hpp"
#include "recognition/embedding_comparator.hpp"
#include "core/errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>

namespace autoface {

OpenCvFaceAnalyzer::OpenCvFaceAnalyzer(const Config& config)
    : config(config)
{
    spdlog::info("Inicializando OpenCV Face Analyzer");
    spdlog::info("   Detector: {}", config.detector_model);
    spdlog::info("   Recognizer: {}", config.recognizer_model);
    spdlog::info("   Score threshold: {:.2f}", config.score_threshold);

    for (const auto& model : {config.detector_model, config.recognizer_model}) {
        if (!std::filesystem::exists(model)) {
            throw std::runtime_error("Modelo no encontrado: " + model);
        }
    }

    try {
        // El input size real se ajusta por imagen en analyze()
        detector = cv::FaceDetectorYN::create(config.detector_model, "", cv::Size(320, 320),
                                              config.score_threshold, config.nms_threshold,
                                              config.top_k);
        recognizer = cv::FaceRecognizerSF::create(config.recognizer_model, "");
    } catch (const cv::Exception& e) {
        throw std::runtime_error(std::string("No se pudieron cargar los modelos: ") + e.what());
    }

    spdlog::info("✓ Face analyzer ready");
}

AnalysisResult OpenCvFaceAnalyzer::analyze(const std::vector<unsigned char>& image) {
    if (image.empty()) {
        throw AnalysisError("Empty image");
    }

    cv::Mat decoded;
    try {
        decoded = cv::imdecode(image, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw AnalysisError(std::string("Decode failed: ") + e.what());
    }
    if (decoded.empty()) {
        throw AnalysisError("Could not decode image (" + std::to_string(image.size()) + " bytes)");
    }

    AnalysisResult result;

    try {
        std::lock_guard<std::mutex> lock(mutex);

        cv::Mat faces;
        detector->setInputSize(decoded.size());
        detector->detect(decoded, faces);

        result.faces_found = faces.empty() ? 0 : faces.rows;
        spdlog::debug("Detected {} face(s) in {}x{} image",
                      result.faces_found, decoded.cols, decoded.rows);

        if (result.faces_found != 1) {
            return result;
        }

        cv::Mat aligned;
        cv::Mat feature;
        recognizer->alignCrop(decoded, faces.row(0), aligned);
        recognizer->feature(aligned, feature);

        cv::Mat flat = feature.reshape(1, 1);
        flat.convertTo(flat, CV_32F);
        result.embedding.assign(flat.ptr<float>(0), flat.ptr<float>(0) + flat.cols);
    } catch (const cv::Exception& e) {
        throw AnalysisError(std::string("Face analysis failed: ") + e.what());
    }

    EmbeddingComparator::l2_normalize(result.embedding);
    return result;
}

} // namespace autoface
