#include <display/preview.hpp>

#include <iostream>

#include <opencv2/highgui.hpp>

namespace fr {
    PreviewWindow::PreviewWindow(std::string title) : title_(std::move(title)) {}

    PreviewWindow::~PreviewWindow() {
        if (!opened_) return;
        try {
            cv::destroyWindow(title_);
            cv::waitKey(1);
        } catch (const cv::Exception& e) {
            std::cerr << "[Preview](~) " << e.what() << "\n";
        }
    }

    bool PreviewWindow::show(const cv::Mat& bgr) {
        if (bgr.empty()) return true;
        cv::imshow(title_, bgr);
        opened_ = true;

        const int key = cv::waitKey(1) & 0xFF;
        return !(key == 'q' || key == 'Q' || key == 27);
    }
}
