#pragma once

#include "config.h"
#include "errors.h"
#include "image_codec.h"
#include "log.h"
#include "manifest.h"
#include "path_locks.h"

#include <cstdint>
#include <string>
#include <vector>

namespace imgopt::core {

enum class VariantStatus { Generated, SkippedExisting, SkippedUpscale, Failed };

struct VariantOutcome {
    int width = 0;
    ImageFormat format = ImageFormat::WebP;
    std::string path;
    VariantStatus status = VariantStatus::Failed;
    std::uintmax_t bytes = 0;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
};

struct GenerationReport {
    std::string original;
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    int width = 0;
    int height = 0;
    std::vector<VariantOutcome> outcomes;
    size_t encoded = 0;
    size_t reused = 0;
    size_t failed = 0;
};

// Produces every configured width x format variant of one original and
// replaces its manifest entry. The config's input and output paths are used
// as given.
class VariantGenerator {
public:
    VariantGenerator(const OptimizerConfig& config,
                     ImageCodec& codec,
                     ManifestStore& manifest,
                     PathLocks& locks,
                     Logger& log);

    GenerationReport generate(const std::string& relative_path);

private:
    void produce_variant(const std::string& relative_path,
                         const ImageInfo& source,
                         int target_width,
                         ImageFormat format,
                         GenerationReport& report,
                         std::vector<VariantRecord>& records);

    const OptimizerConfig& config_;
    ImageCodec& codec_;
    ManifestStore& manifest_;
    PathLocks& locks_;
    Logger& log_;
};

const char* variant_status_name(VariantStatus status);

} // namespace imgopt::core
