#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace fr {
    // Single-line text progress indicator.
    //
    // TopLevel bars own the current terminal line and stay visible after
    // close(). Nested bars draw one line below (under an enclosing TopLevel
    // bar) and erase themselves on close(). Without a total the bar degrades
    // to a plain counter.
    class ProgressBar {
    public:
        enum class Placement {
            TopLevel,
            Nested
        };

        ProgressBar(std::ostream& out,
                    std::optional<int64_t> total,
                    Placement placement,
                    std::string desc = {});
        ~ProgressBar();

        ProgressBar(const ProgressBar&) = delete;
        ProgressBar& operator=(const ProgressBar&) = delete;

        void update(int64_t n = 1);
        void set_description(std::string desc);
        void close();

        int64_t count() const { return count_; }
        const std::optional<int64_t>& total() const { return total_; }
        bool closed() const { return closed_; }

        std::string format_line() const;

    private:
        void render_(bool force);
        double rate_() const;

        std::ostream& out_;
        std::optional<int64_t> total_;
        Placement placement_;
        std::string desc_;

        int64_t count_ = 0;
        bool closed_ = false;
        bool rendered_ = false;
        std::chrono::steady_clock::time_point start_;
        std::chrono::steady_clock::time_point last_render_;
    };
}
