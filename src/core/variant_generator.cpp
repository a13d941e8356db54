#include "variant_generator.h"

#include "file_utils.h"
#include "path_resolver.h"

#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace imgopt::core {

namespace {

std::string format_kilobytes(std::uintmax_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / 1024.0 << "KB";
    return out.str();
}

} // namespace

VariantGenerator::VariantGenerator(const OptimizerConfig& config,
                                   ImageCodec& codec,
                                   ManifestStore& manifest,
                                   PathLocks& locks,
                                   Logger& log)
    : config_(config), codec_(codec), manifest_(manifest), locks_(locks), log_(log) {}

GenerationReport VariantGenerator::generate(const std::string& relative_path) {
    GenerationReport report;
    report.original = relative_path;

    if (!is_valid_utf8(relative_path)) {
        report.error_kind = ErrorKind::SourceUnreadable;
        report.error = "file name is not valid UTF-8: " + relative_path;
        log_.error(report.error);
        return report;
    }
    const std::string extension = extension_of(relative_path);
    if (!codec_.can_decode(extension)) {
        report.error_kind = ErrorKind::UnsupportedSource;
        report.error = "no decoder for ." + extension + " originals: " + relative_path;
        log_.detail(report.error);
        return report;
    }

    auto lock = locks_.lock(relative_path);

    const fs::path input_path = config_.input / relative_path;
    ImageInfo source;
    std::string error;
    if (!codec_.probe(input_path, source, error) || source.width <= 0 || source.height <= 0) {
        report.error_kind = ErrorKind::SourceUnreadable;
        report.error = "could not read metadata for " + relative_path + (error.empty() ? "" : ": " + error);
        log_.error(report.error);
        return report;
    }
    report.width = source.width;
    report.height = source.height;

    std::vector<VariantRecord> records;
    for (int target_width : config_.sizes) {
        if (target_width > source.width) {
            log_.detail("Skipping " + std::to_string(target_width) + "w for " + relative_path +
                        " (original is " + std::to_string(source.width) + "w)");
            for (ImageFormat format : config_.formats) {
                VariantOutcome skipped;
                skipped.width = target_width;
                skipped.format = format;
                skipped.path = output_filename(relative_path, target_width, format);
                skipped.status = VariantStatus::SkippedUpscale;
                report.outcomes.push_back(std::move(skipped));
            }
            continue;
        }
        for (ImageFormat format : config_.formats) {
            produce_variant(relative_path, source, target_width, format, report, records);
        }
    }

    if (config_.keep_original) {
        if (!copy_file_atomic(input_path, config_.output / relative_path, error)) {
            log_.error("failed to copy original " + relative_path + ": " + error);
        }
    }

    manifest_.upsert_entry(relative_path, ManifestEntry{relative_path, source.width, source.height, std::move(records)});
    report.ok = true;

    std::string summary = "Processed: " + relative_path + " -> " +
                          std::to_string(report.encoded + report.reused) + " variants";
    if (report.failed > 0) {
        summary += " (" + std::to_string(report.failed) + " failed)";
    }
    log_.info(summary);
    return report;
}

void VariantGenerator::produce_variant(const std::string& relative_path,
                                       const ImageInfo& source,
                                       int target_width,
                                       ImageFormat format,
                                       GenerationReport& report,
                                       std::vector<VariantRecord>& records) {
    const ImageInfo target = cover_dimensions(source, target_width);
    VariantOutcome outcome;
    outcome.width = target_width;
    outcome.format = format;
    outcome.path = output_filename(relative_path, target_width, format);
    const fs::path output_path = config_.output / outcome.path;

    if (config_.skip_existing && file_exists(output_path)) {
        log_.detail("Skipping existing: " + outcome.path);
        outcome.status = VariantStatus::SkippedExisting;
        outcome.bytes = file_size_or_zero(output_path);
        records.push_back(VariantRecord{format, target_width, outcome.path, target.width, target.height, outcome.bytes});
        ++report.reused;
        report.outcomes.push_back(std::move(outcome));
        return;
    }

    TransformRequest request;
    request.width = target.width;
    request.height = target.height;
    request.params = make_encode_params(format, config_.quality);

    EncodedImage encoded;
    std::string error;
    if (!codec_.transform(config_.input / relative_path, request, encoded, error)) {
        outcome.status = VariantStatus::Failed;
        outcome.error_kind = ErrorKind::EncodeFailed;
        outcome.error = error;
        log_.error("failed to encode " + outcome.path + ": " + error);
        ++report.failed;
        report.outcomes.push_back(std::move(outcome));
        return;
    }
    if (!write_file_atomic(output_path, encoded.bytes, error)) {
        outcome.status = VariantStatus::Failed;
        outcome.error_kind = ErrorKind::EncodeFailed;
        outcome.error = error;
        log_.error("failed to write " + outcome.path + ": " + error);
        ++report.failed;
        report.outcomes.push_back(std::move(outcome));
        return;
    }

    outcome.status = VariantStatus::Generated;
    outcome.bytes = encoded.bytes.size();
    log_.detail("Generated: " + outcome.path + " (" + format_kilobytes(outcome.bytes) + ")");
    records.push_back(VariantRecord{format, target_width, outcome.path,
                                    encoded.width > 0 ? encoded.width : target.width,
                                    encoded.height > 0 ? encoded.height : target.height,
                                    outcome.bytes});
    ++report.encoded;
    report.outcomes.push_back(std::move(outcome));
}

const char* variant_status_name(VariantStatus status) {
    switch (status) {
        case VariantStatus::Generated:
            return "generated";
        case VariantStatus::SkippedExisting:
            return "skipped (exists)";
        case VariantStatus::SkippedUpscale:
            return "skipped (wider than source)";
        case VariantStatus::Failed:
            return "failed";
    }
    return "unknown";
}

} // namespace imgopt::core
