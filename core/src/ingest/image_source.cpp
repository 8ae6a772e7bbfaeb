#include <ingest/image_source.hpp>

#include <filesystem>

#include <opencv2/imgcodecs.hpp>

#include <common/errors.hpp>

namespace fr {
    ImageSource::ImageSource(std::string path) : path_(std::move(path)) {}

    void ImageSource::open() {
        if (!std::filesystem::is_regular_file(path_)) {
            throw SourceOpenError(SourceOpenError::Reason::NotFound, path_, "");
        }

        try {
            image_ = cv::imread(path_, cv::IMREAD_COLOR);
        } catch (const cv::Exception& e) {
            throw SourceOpenError(SourceOpenError::Reason::Unreadable, path_, e.what());
        }
        if (image_.empty()) {
            throw SourceOpenError(SourceOpenError::Reason::Unreadable, path_, "not a decodable image");
        }

        info_.width = image_.cols;
        info_.height = image_.rows;
        info_.fps = 0.0;
        info_.frame_count = 1;
        consumed_ = false;
    }

    ReadStatus ImageSource::read(FramePacket& out, int) {
        if (consumed_ || image_.empty()) return ReadStatus::End;
        out.bgr = image_;
        consumed_ = true;
        return ReadStatus::Frame;
    }

    void ImageSource::close() {
        image_.release();
        consumed_ = true;
    }
}
