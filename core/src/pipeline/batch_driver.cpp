#include <pipeline/batch_driver.hpp>

#include <algorithm>
#include <exception>
#include <system_error>

#include <common/errors.hpp>
#include <common/media_type.hpp>
#include <pipeline/progress.hpp>

namespace fr {
    namespace {
        bool is_hidden(const std::filesystem::path& p) {
            const std::string name = p.filename().string();
            return !name.empty() && name[0] == '.';
        }

        bool matches_filter(const std::filesystem::path& p, const std::string& ext_filter) {
            const std::string ext = p.extension().string();
            if (ext_filter == "*") return !ext.empty();
            const std::string want = ext_filter[0] == '.' ? ext_filter : "." + ext_filter;
            return ext == want;
        }
    } // namespace

    std::vector<std::filesystem::path> discover_files(const std::filesystem::path& dir,
                                                      const std::string& ext_filter) {
        namespace fs = std::filesystem;
        std::vector<fs::path> out;
        if (ext_filter.empty()) return out;

        std::error_code ec;
        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            throw SourceOpenError(SourceOpenError::Reason::NotFound, dir.string(), ec.message());
        }

        fs::recursive_directory_iterator end;
        for (; it != end; it.increment(ec)) {
            if (ec) break;
            const fs::path& p = it->path();
            if (is_hidden(p)) {
                if (it->is_directory(ec)) it.disable_recursion_pending();
                continue;
            }
            if (!it->is_regular_file(ec)) continue;
            if (matches_filter(p, ext_filter)) out.push_back(p);
        }

        std::sort(out.begin(), out.end());
        return out;
    }

    BatchDriver::BatchDriver(StreamProcessor& processor, std::ostream& report_out)
        : processor_(processor),
          report_out_(report_out) {}

    std::vector<BatchItemResult> BatchDriver::run(const std::filesystem::path& dir,
                                                  const StreamJob& job_template,
                                                  const BatchConfig& batch) {
        // Collected up front, so outputs written below are never picked up.
        const std::vector<std::filesystem::path> paths = discover_files(dir, batch.ext);

        std::vector<BatchItemResult> results;
        results.reserve(paths.size());

        ProgressBar bar(processor_.progress_out(),
                        static_cast<int64_t>(paths.size()),
                        ProgressBar::Placement::TopLevel);

        for (const auto& p : paths) {
            if (!processor_.running()) {
                report_out_ << "\n[Batch] interrupted, " << (paths.size() - results.size()) << " files not attempted\n";
                break;
            }
            bar.set_description("Current file: " + p.filename().string());
            results.push_back(run_item_(p, job_template, batch));
            bar.update();
        }
        bar.close();

        size_t done = 0;
        for (const auto& r : results) {
            if (r.status == BatchItemResult::Status::Done) ++done;
        }
        report_out_ << "[Batch] " << done << "/" << results.size() << " files anonymized in " << dir.string() << "\n";
        return results;
    }

    BatchItemResult BatchDriver::run_item_(const std::filesystem::path& path,
                                           const StreamJob& job_template,
                                           const BatchConfig& batch) {
        BatchItemResult res;
        res.input = path;

        const MediaKind kind = classify_media(path);
        if (kind == MediaKind::Unknown) {
            res.status = BatchItemResult::Status::Skipped;
            res.message = UnknownContentTypeError(path.string()).what();
            report_out_ << "\n[Batch] File " << path.string() << " has an unknown content type. Skipping...\n";
            return res;
        }

        StreamJob job = job_template;
        job.kind = kind == MediaKind::Video ? SourceKind::VideoFile : SourceKind::Image;
        job.input = path.string();
        job.output = derive_output_path(path, batch.suffix).string();
        job.preview = false;
        job.nested = true;
        res.output = std::filesystem::path(*job.output);

        try {
            const StreamResult sr = processor_.run(job);
            res.frames = sr.frames;
            res.status = BatchItemResult::Status::Done;
        } catch (const std::exception& e) {
            res.status = BatchItemResult::Status::Failed;
            res.message = e.what();
            report_out_ << "\n[Batch] " << to_string(kind) << " " << path.string()
                        << " failed: " << e.what() << ". Skipping...\n";
        }
        return res;
    }
}
