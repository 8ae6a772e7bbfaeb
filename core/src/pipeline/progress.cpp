#include <pipeline/progress.hpp>

#include <algorithm>
#include <cstdio>

namespace fr {
    namespace {
        constexpr int kBarWidth = 24;
        constexpr auto kMinRenderInterval = std::chrono::milliseconds(100);

        // ANSI: erase line, cursor up.
        constexpr const char* kEraseLine = "\x1b[2K";
        constexpr const char* kCursorUp = "\x1b[A";
    } // namespace

    ProgressBar::ProgressBar(std::ostream& out,
                             std::optional<int64_t> total,
                             Placement placement,
                             std::string desc)
        : out_(out),
          total_(total),
          placement_(placement),
          desc_(std::move(desc)),
          start_(std::chrono::steady_clock::now()),
          last_render_(start_) {
        if (total_ && *total_ < 0) total_.reset();
        render_(true);
    }

    ProgressBar::~ProgressBar() {
        close();
    }

    void ProgressBar::update(int64_t n) {
        if (closed_) return;
        count_ += n;
        render_(false);
    }

    void ProgressBar::set_description(std::string desc) {
        desc_ = std::move(desc);
        render_(true);
    }

    void ProgressBar::close() {
        if (closed_) return;
        render_(true);
        closed_ = true;

        if (placement_ == Placement::TopLevel) {
            out_ << "\n";
        } else {
            out_ << "\n" << kEraseLine << kCursorUp << "\r";
        }
        out_.flush();
    }

    double ProgressBar::rate_() const {
        const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
        if (secs <= 0.0) return 0.0;
        return static_cast<double>(count_) / secs;
    }

    std::string ProgressBar::format_line() const {
        std::string line;
        if (!desc_.empty()) line = desc_ + ": ";

        char rate[32];
        std::snprintf(rate, sizeof(rate), "%.2f", rate_());

        if (!total_ || *total_ == 0) {
            line += std::to_string(count_) + "it [" + rate + "it/s]";
            return line;
        }

        const int64_t total = *total_;
        const double frac = std::clamp(static_cast<double>(count_) / static_cast<double>(total), 0.0, 1.0);
        const int filled = static_cast<int>(frac * kBarWidth);

        char pct[8];
        std::snprintf(pct, sizeof(pct), "%3d%%", static_cast<int>(frac * 100.0));

        line += pct;
        line += "|";
        line += std::string(static_cast<size_t>(filled), '#');
        line += std::string(static_cast<size_t>(kBarWidth - filled), ' ');
        line += "| " + std::to_string(count_) + "/" + std::to_string(total);
        line += " [" + std::string(rate) + "it/s]";
        return line;
    }

    void ProgressBar::render_(bool force) {
        if (closed_) return;

        const auto now = std::chrono::steady_clock::now();
        if (!force && rendered_ && now - last_render_ < kMinRenderInterval) return;
        last_render_ = now;
        rendered_ = true;

        if (placement_ == Placement::TopLevel) {
            out_ << "\r" << kEraseLine << format_line();
        } else {
            out_ << "\n" << kEraseLine << format_line() << kCursorUp << "\r";
        }
        out_.flush();
    }
}
