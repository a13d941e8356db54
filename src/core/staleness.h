#pragma once

#include "manifest.h"

#include <filesystem>
#include <string>

namespace imgopt::core {

enum class StaleReason { Fresh, MissingEntry, NoVariants, MissingOutput, SourceNewer, StatFailed };

struct StalenessResult {
    bool stale = true;
    StaleReason reason = StaleReason::MissingEntry;
    std::string detail; // offending variant path, when there is one
};

// Only the first variant's timestamp is compared against the source; a forced
// run is the way to recover from damage to later variants.
StalenessResult check_staleness(const ManifestStore& manifest,
                                const std::filesystem::path& input_root,
                                const std::filesystem::path& output_root,
                                const std::string& relative_path);

const char* stale_reason_name(StaleReason reason);

} // namespace imgopt::core
