#include <encode/image_sink.hpp>

#include <opencv2/imgcodecs.hpp>

#include <common/errors.hpp>

namespace fr {
    ImageSink::ImageSink(std::string path) : path_(std::move(path)) {}

    void ImageSink::open(const SourceInfo&) {
        if (!cv::haveImageWriter(path_)) {
            throw WriteError("[ImageSink] no image encoder for " + path_);
        }
    }

    void ImageSink::write(const cv::Mat& bgr) {
        bool ok = false;
        try {
            ok = cv::imwrite(path_, bgr);
        } catch (const cv::Exception& e) {
            throw WriteError("[ImageSink] imwrite failed for " + path_ + ": " + e.what());
        }
        if (!ok) {
            throw WriteError("[ImageSink] imwrite failed for " + path_);
        }
    }
}
