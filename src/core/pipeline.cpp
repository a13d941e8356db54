#include "pipeline.h"

#include "file_utils.h"
#include "path_resolver.h"
#include "staleness.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace imgopt::core {

namespace {

OptimizerConfig resolve_roots(OptimizerConfig config) {
    std::error_code ec;
    if (!config.input.empty() && config.input.is_relative()) {
        fs::path absolute = fs::absolute(config.input, ec);
        if (!ec) {
            config.input = absolute.lexically_normal();
        }
    }
    if (!config.output.empty() && config.output.is_relative()) {
        fs::path absolute = fs::absolute(config.output, ec);
        if (!ec) {
            config.output = absolute.lexically_normal();
        }
    }
    return config;
}

// Clears the flag on every exit path.
class ProcessingGuard {
public:
    explicit ProcessingGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~ProcessingGuard() { flag_.store(false); }
    ProcessingGuard(const ProcessingGuard&) = delete;
    ProcessingGuard& operator=(const ProcessingGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

std::string format_seconds(std::chrono::milliseconds elapsed) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << static_cast<double>(elapsed.count()) / 1000.0 << "s";
    return out.str();
}

} // namespace

Pipeline::Pipeline(OptimizerConfig config, ImageCodec& codec, Logger& log)
    : config_(resolve_roots(std::move(config))),
      codec_(codec),
      log_(log),
      generator_(config_, codec_, manifest_, locks_, log_) {}

fs::path Pipeline::manifest_path() const {
    return config_.output / k_manifest_filename;
}

bool Pipeline::load_manifest() {
    std::string error;
    ErrorKind kind = ErrorKind::None;
    if (!manifest_.load(manifest_path(), error, &kind)) {
        if (kind == ErrorKind::ManifestCorrupt) {
            log_.error(error + ", starting from scratch");
        } else {
            log_.detail("No existing manifest, all images will be processed");
        }
        return false;
    }
    log_.detail("Loaded existing manifest with " + std::to_string(manifest_.size()) + " images");
    return true;
}

GenerationReport Pipeline::process_image(const std::string& relative_path) {
    return generator_.generate(relative_path);
}

std::vector<std::string> Pipeline::decodable_only(const std::vector<std::string>& relative_paths,
                                                 BatchSummary& summary) {
    std::vector<std::string> kept;
    kept.reserve(relative_paths.size());
    for (const auto& path : relative_paths) {
        const std::string extension = extension_of(path);
        if (!codec_.can_decode(extension)) {
            log_.detail("Skipping " + path + " (no decoder for ." + extension + ")");
            ++summary.unsupported;
            continue;
        }
        kept.push_back(path);
    }
    return kept;
}

void Pipeline::run_reports(const std::vector<std::string>& relative_paths, BatchSummary& summary) {
    std::vector<GenerationReport> reports(relative_paths.size());

    unsigned int worker_count = config_.threads > 0 ? config_.threads : std::thread::hardware_concurrency();
    if (worker_count == 0) {
        worker_count = 1;
    }
    worker_count = std::min<unsigned int>(worker_count,
                                          static_cast<unsigned int>(std::max<size_t>(1, relative_paths.size())));

    if (worker_count <= 1) {
        for (size_t i = 0; i < relative_paths.size(); ++i) {
            reports[i] = generator_.generate(relative_paths[i]);
        }
    } else {
        std::atomic<size_t> next_index{0};
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (unsigned int i = 0; i < worker_count; ++i) {
            workers.emplace_back([&]() {
                while (true) {
                    size_t idx = next_index.fetch_add(1, std::memory_order_relaxed);
                    if (idx >= relative_paths.size()) {
                        break;
                    }
                    reports[idx] = generator_.generate(relative_paths[idx]);
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    for (auto& report : reports) {
        ++summary.processed;
        summary.encoded += report.encoded;
        summary.failed_variants += report.failed;
        if (!report.ok) {
            ++summary.failed_originals;
        }
        summary.reports.push_back(std::move(report));
    }
}

bool Pipeline::process_all(bool force, BatchSummary& summary, std::string& error) {
    summary = BatchSummary{};
    bool expected = false;
    if (!processing_.compare_exchange_strong(expected, true)) {
        log_.info("Already processing, skipping...");
        summary.already_running = true;
        return true;
    }
    ProcessingGuard guard(processing_);
    const auto start = std::chrono::steady_clock::now();

    std::error_code ec;
    if (!fs::is_directory(config_.input, ec)) {
        error = "input directory does not exist: " + config_.input.string();
        summary.error_kind = ErrorKind::InputDirectoryMissing;
        log_.error(error);
        return false;
    }

    std::vector<std::string> images;
    std::vector<std::string> rejected;
    if (!discover_images(config_.input, images, error, &rejected)) {
        log_.error(error);
        return false;
    }
    summary.discovered = images.size() + rejected.size();
    for (const auto& name : rejected) {
        GenerationReport report;
        report.original = name;
        report.error_kind = ErrorKind::SourceUnreadable;
        report.error = "file name is not valid UTF-8: " + name;
        log_.error(report.error);
        ++summary.failed_originals;
        summary.reports.push_back(std::move(report));
    }
    images = decodable_only(images, summary);
    if (images.empty()) {
        log_.info("No images found in " + config_.input.string());
        return true;
    }

    if (!ensure_directory(config_.output, error)) {
        log_.error(error);
        return false;
    }

    std::vector<std::string> to_process;
    if (force) {
        to_process = images;
        log_.info("Force processing " + std::to_string(images.size()) + " images...");
    } else {
        for (const auto& image : images) {
            const StalenessResult staleness = check_staleness(manifest_, config_.input, config_.output, image);
            if (staleness.stale) {
                std::string reason = stale_reason_name(staleness.reason);
                if (!staleness.detail.empty()) {
                    reason += ": " + staleness.detail;
                }
                log_.detail("Needs processing: " + image + " (" + reason + ")");
                to_process.push_back(image);
            }
        }
        summary.up_to_date = images.size() - to_process.size();
        if (to_process.empty()) {
            log_.info("All " + std::to_string(images.size()) + " images are up to date");
            return true;
        }
        log_.info("Processing " + std::to_string(to_process.size()) + "/" + std::to_string(images.size()) +
                  " images (" + std::to_string(summary.up_to_date) + " cached)...");
    }

    run_reports(to_process, summary);

    if (!persist(error)) {
        log_.error(error);
        return false;
    }
    summary.manifest_written = config_.generate_manifest;

    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    log_.info("Completed in " + format_seconds(summary.elapsed));
    return true;
}

bool Pipeline::process_paths(const std::vector<std::string>& relative_paths,
                             BatchSummary& summary,
                             std::string& error) {
    summary = BatchSummary{};
    if (relative_paths.empty()) {
        return true;
    }
    const auto start = std::chrono::steady_clock::now();
    summary.discovered = relative_paths.size();
    const std::vector<std::string> paths = decodable_only(relative_paths, summary);
    if (paths.empty()) {
        return true;
    }
    if (!ensure_directory(config_.output, error)) {
        log_.error(error);
        return false;
    }
    run_reports(paths, summary);
    if (!persist(error)) {
        log_.error(error);
        return false;
    }
    summary.manifest_written = config_.generate_manifest;
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    return true;
}

bool Pipeline::persist(std::string& error) {
    if (!config_.generate_manifest) {
        return true;
    }
    if (!ensure_directory(config_.output, error)) {
        return false;
    }
    manifest_.set_generated_at(current_timestamp());
    if (!manifest_.save(manifest_path(), error)) {
        return false;
    }
    log_.info("Manifest written to " + manifest_path().string());
    return true;
}

bool Pipeline::clean(std::string& error) {
    log_.info("Cleaning " + config_.output.string() + "...");
    std::error_code ec;
    fs::remove_all(config_.output, ec);
    if (ec) {
        error = "failed to clean '" + config_.output.string() + "': " + ec.message();
        return false;
    }
    manifest_.clear();
    log_.info("Output directory cleaned");
    return true;
}

} // namespace imgopt::core
