// ============= include/recognition/opencv_face_analyzer.hpp =============
/*
 * OpenCV Face Analyzer (YuNet + SFace)
 *
 * CARACTERÍSTICAS:
 * - Decodifica la imagen en memoria (cv::imdecode)
 * - Detección con cv::FaceDetectorYN (face_detection_yunet_*.onnx)
 * - Alineado + embedding 128D con cv::FaceRecognizerSF
 *   (face_recognition_sface_*.onnx), L2-normalizado
 * - Sin atributos demográficos: age/gender/emotion quedan vacíos
 *
 * Las redes DNN de OpenCV no son thread-safe: analyze() serializa con
 * un mutex propio (nunca con el lock de la galería).
 */

#pragma once
#include "recognition/analyzer_config.hpp"
#include "recognition/face_analyzer.hpp"
#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>
#include <mutex>
#include <string>

namespace autoface {

class OpenCvFaceAnalyzer : public FaceAnalyzer {
public:
    using Config = AnalyzerConfig;

    explicit OpenCvFaceAnalyzer(const Config& config = Config());

    AnalysisResult analyze(const std::vector<unsigned char>& image) override;

private:
    Config config;
    cv::Ptr<cv::FaceDetectorYN> detector;
    cv::Ptr<cv::FaceRecognizerSF> recognizer;
    std::mutex mutex;
};

} // namespace autoface
