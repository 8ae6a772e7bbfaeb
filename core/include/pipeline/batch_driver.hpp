#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <common/config.hpp>
#include <pipeline/stream_processor.hpp>
#include <pipeline/types.hpp>

namespace fr {
    struct BatchItemResult {
        enum class Status {
            Done,
            Skipped, // not an image or video
            Failed   // open/decode/write/detection error
        };

        std::filesystem::path input;
        std::optional<std::filesystem::path> output;
        Status status = Status::Done;
        std::string message;
        int64_t frames = 0;
    };

    // "*" takes every file with an extension; otherwise the extension must
    // match exactly (with or without the leading dot). Recursive, hidden
    // entries skipped, sorted.
    std::vector<std::filesystem::path> discover_files(const std::filesystem::path& dir,
                                                      const std::string& ext_filter);

    class BatchDriver {
    public:
        BatchDriver(StreamProcessor& processor, std::ostream& report_out);

        // Every discovered item is attempted; no per-item error escapes.
        std::vector<BatchItemResult> run(const std::filesystem::path& dir,
                                         const StreamJob& job_template,
                                         const BatchConfig& batch);

    private:
        BatchItemResult run_item_(const std::filesystem::path& path,
                                  const StreamJob& job_template,
                                  const BatchConfig& batch);

        StreamProcessor& processor_;
        std::ostream& report_out_;
    };
}
