#pragma once

#include "config.h"
#include "image_codec.h"
#include "log.h"
#include "manifest.h"
#include "path_locks.h"
#include "variant_generator.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace imgopt::core {

struct BatchSummary {
    bool already_running = false;
    size_t discovered = 0;
    size_t up_to_date = 0;
    size_t unsupported = 0;
    size_t processed = 0;
    size_t encoded = 0;
    size_t failed_originals = 0;
    size_t failed_variants = 0;
    bool manifest_written = false;
    ErrorKind error_kind = ErrorKind::None;
    std::chrono::milliseconds elapsed{0};
    std::vector<GenerationReport> reports;
};

// Owns all pipeline state for the lifetime of the service: configuration,
// manifest, the single-flight flag of batch runs and the per-original locks.
class Pipeline {
public:
    // Relative input/output directories are resolved against the working directory.
    Pipeline(OptimizerConfig config, ImageCodec& codec, Logger& log);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    const OptimizerConfig& config() const { return config_; }
    ImageCodec& codec() { return codec_; }
    Logger& log() { return log_; }
    ManifestStore& manifest() { return manifest_; }
    const ManifestStore& manifest() const { return manifest_; }
    PathLocks& path_locks() { return locks_; }

    const std::filesystem::path& input_root() const { return config_.input; }
    const std::filesystem::path& output_root() const { return config_.output; }
    std::filesystem::path manifest_path() const;

    // False when there is no usable manifest; the store is then empty.
    bool load_manifest();

    // Full pass over the input tree. A call made while another pass is running
    // returns true at once with summary.already_running set.
    bool process_all(bool force, BatchSummary& summary, std::string& error);

    // Regenerates the given originals unconditionally and persists once.
    bool process_paths(const std::vector<std::string>& relative_paths, BatchSummary& summary, std::string& error);

    GenerationReport process_image(const std::string& relative_path);

    // Stamps generatedAt and writes the manifest; a no-op when manifest
    // generation is disabled.
    bool persist(std::string& error);

    // Deletes the output tree and forgets every manifest entry.
    bool clean(std::string& error);

    bool is_processing() const { return processing_.load(); }

private:
    void run_reports(const std::vector<std::string>& relative_paths, BatchSummary& summary);
    std::vector<std::string> decodable_only(const std::vector<std::string>& relative_paths, BatchSummary& summary);

    OptimizerConfig config_;
    ImageCodec& codec_;
    Logger& log_;
    ManifestStore manifest_;
    PathLocks locks_;
    VariantGenerator generator_;
    std::atomic<bool> processing_{false};
};

} // namespace imgopt::core
