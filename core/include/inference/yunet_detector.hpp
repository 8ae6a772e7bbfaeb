#pragma once

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <inference/face_detector.hpp>
#include <pipeline/types.hpp>

namespace fr {
    enum class DetectorBackend {
        Auto,
        Gpu,
        Cpu
    };

    DetectorBackend detector_backend_from_str(const std::string& s);

    struct YuNetDetectorConfig {
        std::string param_path = "models/detector/face_detection_yunet_2023mar.ncnn.param";
        std::string bin_path = "models/detector/face_detection_yunet_2023mar.ncnn.bin";
        // 0x0: follow the frame size, rounded up to a multiple of 32.
        int input_w = 0;
        int input_h = 0;
        float nms_threshold = 0.3f;
        int top_k = 750;
        int ncnn_threads = 1;
        DetectorBackend backend = DetectorBackend::Auto;
    };

    class YuNetDetector : public IFaceDetector {
    public:
        explicit YuNetDetector(YuNetDetectorConfig cfg);
        ~YuNetDetector() override;

        YuNetDetector(YuNetDetector&&) noexcept;
        YuNetDetector& operator=(YuNetDetector&&) noexcept;

        YuNetDetector(const YuNetDetector&) = delete;
        YuNetDetector& operator=(const YuNetDetector&) = delete;

        std::vector<Detection> detect(const cv::Mat& bgr, float threshold) override;

    private:
        YuNetDetectorConfig cfg_;
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
