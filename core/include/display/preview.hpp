#pragma once

#include <string>

#include <opencv2/core.hpp>

namespace fr {
    struct IPreview {
        virtual ~IPreview() = default;
        // Returns false once the user asked to quit.
        virtual bool show(const cv::Mat& bgr) = 0;
    };

    // highgui window; 'q' or Esc quits.
    class PreviewWindow : public IPreview {
    public:
        explicit PreviewWindow(std::string title);
        ~PreviewWindow() override;

        PreviewWindow(const PreviewWindow&) = delete;
        PreviewWindow& operator=(const PreviewWindow&) = delete;

        bool show(const cv::Mat& bgr) override;

    private:
        std::string title_;
        bool opened_ = false;
    };
}
