// ============= include/recognition/analyzer_config.hpp =============
#pragma once
#include <string>

namespace autoface {

// Modelos YuNet (detector) + SFace (recognizer) de OpenCV Zoo
struct AnalyzerConfig {
    std::string detector_model;
    std::string recognizer_model;
    float score_threshold;
    float nms_threshold;
    int top_k;

    AnalyzerConfig()
        : detector_model("models/face_detection_yunet_2023mar.onnx"),
          recognizer_model("models/face_recognition_sface_2021dec.onnx"),
          score_threshold(0.9f),
          nms_threshold(0.3f),
          top_k(5000) {}
};

} // namespace autoface
