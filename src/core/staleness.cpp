#include "staleness.h"

#include "file_utils.h"

namespace imgopt::core {

namespace {

StalenessResult stale(StaleReason reason, std::string detail = {}) {
    return StalenessResult{true, reason, std::move(detail)};
}

} // namespace

StalenessResult check_staleness(const ManifestStore& manifest,
                                const std::filesystem::path& input_root,
                                const std::filesystem::path& output_root,
                                const std::string& relative_path) {
    const std::optional<ManifestEntry> entry = manifest.find(relative_path);
    if (!entry) {
        return stale(StaleReason::MissingEntry);
    }
    if (entry->variants.empty()) {
        return stale(StaleReason::NoVariants);
    }

    for (const auto& variant : entry->variants) {
        if (!file_exists(output_root / variant.path)) {
            return stale(StaleReason::MissingOutput, variant.path);
        }
    }

    long long source_ticks = 0;
    long long output_ticks = 0;
    const VariantRecord& first = entry->variants.front();
    if (!last_write_ticks(input_root / relative_path, source_ticks) ||
        !last_write_ticks(output_root / first.path, output_ticks)) {
        return stale(StaleReason::StatFailed, first.path);
    }
    if (source_ticks > output_ticks) {
        return stale(StaleReason::SourceNewer, first.path);
    }
    return StalenessResult{false, StaleReason::Fresh, {}};
}

const char* stale_reason_name(StaleReason reason) {
    switch (reason) {
        case StaleReason::Fresh:
            return "up to date";
        case StaleReason::MissingEntry:
            return "not in manifest";
        case StaleReason::NoVariants:
            return "no variants recorded";
        case StaleReason::MissingOutput:
            return "missing variant";
        case StaleReason::SourceNewer:
            return "source modified";
        case StaleReason::StatFailed:
            return "cannot stat files";
    }
    return "unknown";
}

} // namespace imgopt::core
