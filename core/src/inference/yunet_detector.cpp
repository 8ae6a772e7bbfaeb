#include <inference/yunet_detector.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <ncnn/allocator.h>
#include <ncnn/net.h>
#include <ncnn/platform.h>
#if NCNN_VULKAN
#include <ncnn/gpu.h>
#endif

#include <common/errors.hpp>

namespace fr {
    namespace {
        constexpr int kStrideAlign = 32;

        float area_of(const Detection& d) {
            return std::max(0.0f, d.x2 - d.x1) * std::max(0.0f, d.y2 - d.y1);
        }

        float iou_of(const Detection& a, const Detection& b) {
            const float xx1 = std::max(a.x1, b.x1);
            const float yy1 = std::max(a.y1, b.y1);
            const float xx2 = std::min(a.x2, b.x2);
            const float yy2 = std::min(a.y2, b.y2);

            const float iw = std::max(0.0f, xx2 - xx1);
            const float ih = std::max(0.0f, yy2 - yy1);
            const float inter = iw * ih;
            if (inter <= 0.0f) return 0.0f;

            const float uni = area_of(a) + area_of(b) - inter;
            if (uni <= 0.0f) return 0.0f;
            return inter / uni;
        }

        int align_up(int v) {
            return std::max(kStrideAlign, ((v + kStrideAlign - 1) / kStrideAlign) * kStrideAlign);
        }

        std::string resolve_path_or_throw(const std::string& p) {
            namespace fs = std::filesystem;
            if (fs::exists(fs::path(p))) return p;
            const fs::path alt = fs::path("../../../") / p;
            if (fs::exists(alt)) return alt.string();
            throw std::runtime_error("Model path not found: " + p);
        }

        bool gpu_available() {
#if NCNN_VULKAN
            return ncnn::get_gpu_count() > 0;
#else
            return false;
#endif
        }
    } // namespace

    DetectorBackend detector_backend_from_str(const std::string& s) {
        std::string b = s;
        std::transform(b.begin(), b.end(), b.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (b == "auto") return DetectorBackend::Auto;
        if (b == "gpu" || b == "vulkan") return DetectorBackend::Gpu;
        if (b == "cpu") return DetectorBackend::Cpu;
        throw ConfigError("unknown detector backend: " + s);
    }

    class YuNetDetector::Impl {
    public:
        explicit Impl(const YuNetDetectorConfig& cfg) {
            switch (cfg.backend) {
                case DetectorBackend::Cpu:
                    use_gpu_ = false;
                    break;
                case DetectorBackend::Gpu:
                    if (!gpu_available()) {
                        throw std::runtime_error("GPU backend requested, but ncnn has no Vulkan device");
                    }
                    use_gpu_ = true;
                    break;
                case DetectorBackend::Auto:
                    use_gpu_ = gpu_available();
                    break;
            }

            net_.opt.use_vulkan_compute = use_gpu_;
            net_.opt.num_threads = std::max(1, cfg.ncnn_threads);
            workspace_pool_allocator_.set_size_compare_ratio(0.0f);
            blob_pool_allocator_.set_size_compare_ratio(0.0f);

            const std::string param = resolve_path_or_throw(cfg.param_path);
            const std::string bin = resolve_path_or_throw(cfg.bin_path);

            if (net_.load_param(param.c_str()) != 0) {
                throw std::runtime_error("Failed to load YuNet param: " + param);
            }
            if (net_.load_model(bin.c_str()) != 0) {
                throw std::runtime_error("Failed to load YuNet weights: " + bin);
            }

            std::cerr << "[YuNet] loaded " << param << " (backend: " << (use_gpu_ ? "vulkan" : "cpu") << ")\n";
        }

        std::vector<Detection> detect(const cv::Mat& bgr, float threshold, const YuNetDetectorConfig& cfg) {
            if (bgr.empty()) return {};

            const int in_w = cfg.input_w > 0 ? align_up(cfg.input_w) : align_up(bgr.cols);
            const int in_h = cfg.input_h > 0 ? align_up(cfg.input_h) : align_up(bgr.rows);

            ncnn::Mat in = ncnn::Mat::from_pixels_resize(
                bgr.data,
                ncnn::Mat::PIXEL_BGR,
                bgr.cols,
                bgr.rows,
                static_cast<int>(bgr.step[0]),
                in_w,
                in_h);

            ncnn::Extractor ex = net_.create_extractor();
            ex.set_light_mode(true);
            ex.set_blob_allocator(&blob_pool_allocator_);
            ex.set_workspace_allocator(&workspace_pool_allocator_);
            if (ex.input("in0", in) != 0) {
                throw DetectionError("YuNet: failed to bind input blob in0");
            }

            std::array<ncnn::Mat, 12> out{};
            static constexpr const char* kOutNames[12] = {
                "out0", "out1", "out2",
                "out3", "out4", "out5",
                "out6", "out7", "out8",
                "out9", "out10", "out11"
            };

            for (size_t i = 0; i < out.size(); ++i) {
                if (ex.extract(kOutNames[i], out[i]) != 0) {
                    throw DetectionError(std::string("YuNet: failed to extract ") + kOutNames[i]);
                }
            }

            const float sx = static_cast<float>(bgr.cols) / static_cast<float>(in_w);
            const float sy = static_cast<float>(bgr.rows) / static_cast<float>(in_h);

            std::vector<Detection> candidates;
            candidates.reserve(512);

            static constexpr int kStrides[3] = {8, 16, 32};
            for (int level = 0; level < 3; ++level) {
                const int stride = kStrides[level];
                const int cols = in_w / stride;
                const int rows = in_h / stride;
                const int num = cols * rows;

                const float* cls = static_cast<const float*>(out[static_cast<size_t>(level)].data);
                const float* obj = static_cast<const float*>(out[static_cast<size_t>(3 + level)].data);
                const float* bbox = static_cast<const float*>(out[static_cast<size_t>(6 + level)].data);

                if (!cls || !obj || !bbox) continue;

                for (int idx = 0; idx < num; ++idx) {
                    const float score = std::sqrt(std::clamp(cls[idx], 0.0f, 1.0f) *
                                                  std::clamp(obj[idx], 0.0f, 1.0f));
                    if (score < threshold) continue;

                    const int y = idx / cols;
                    const int x = idx - y * cols;

                    const float dx = bbox[idx * 4 + 0];
                    const float dy = bbox[idx * 4 + 1];
                    const float dw = bbox[idx * 4 + 2];
                    const float dh = bbox[idx * 4 + 3];

                    const float cx = (static_cast<float>(x) + dx) * static_cast<float>(stride);
                    const float cy = (static_cast<float>(y) + dy) * static_cast<float>(stride);
                    const float w = std::exp(dw) * static_cast<float>(stride);
                    const float h = std::exp(dh) * static_cast<float>(stride);

                    Detection d;
                    d.x1 = std::max(0.0f, (cx - w * 0.5f) * sx);
                    d.y1 = std::max(0.0f, (cy - h * 0.5f) * sy);
                    d.x2 = std::min(static_cast<float>(bgr.cols), (cx + w * 0.5f) * sx);
                    d.y2 = std::min(static_cast<float>(bgr.rows), (cy + h * 0.5f) * sy);
                    if (d.x2 <= d.x1 || d.y2 <= d.y1) continue;

                    d.score = score;
                    candidates.push_back(d);
                }
            }

            std::vector<int> order(candidates.size());
            for (size_t i = 0; i < candidates.size(); ++i) order[i] = static_cast<int>(i);

            std::sort(order.begin(),
                      order.end(),
                      [&candidates](int a, int b) {
                          return candidates[static_cast<size_t>(a)].score >
                                 candidates[static_cast<size_t>(b)].score;
                      });

            if (cfg.top_k > 0 && static_cast<int>(order.size()) > cfg.top_k) {
                order.resize(static_cast<size_t>(cfg.top_k));
            }

            std::vector<int> keep_indices;
            keep_indices.reserve(order.size());

            for (int idx : order) {
                const Detection& cand = candidates[static_cast<size_t>(idx)];
                bool keep = true;
                for (int kept : keep_indices) {
                    if (iou_of(cand, candidates[static_cast<size_t>(kept)]) > cfg.nms_threshold) {
                        keep = false;
                        break;
                    }
                }
                if (keep) keep_indices.push_back(idx);
            }

            std::vector<Detection> out_dets;
            out_dets.reserve(keep_indices.size());
            for (int idx : keep_indices) {
                out_dets.push_back(candidates[static_cast<size_t>(idx)]);
            }
            return out_dets;
        }

    private:
        ncnn::Net net_;
        ncnn::UnlockedPoolAllocator blob_pool_allocator_;
        ncnn::PoolAllocator workspace_pool_allocator_;
        bool use_gpu_ = false;
    };

    YuNetDetector::YuNetDetector(YuNetDetectorConfig cfg)
        : cfg_(std::move(cfg)),
          impl_(std::make_unique<Impl>(cfg_)) {}

    YuNetDetector::~YuNetDetector() = default;
    YuNetDetector::YuNetDetector(YuNetDetector&&) noexcept = default;
    YuNetDetector& YuNetDetector::operator=(YuNetDetector&&) noexcept = default;

    std::vector<Detection> YuNetDetector::detect(const cv::Mat& bgr, float threshold) {
        return impl_->detect(bgr, threshold, cfg_);
    }
}
