// common_options.cpp
// MIT License (c) 2026 Pedro

#include "commands.h"

#include "core/cli_parse.h"
#include "core/path_resolver.h"

#include <filesystem>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

namespace imgopt::commands {

using core::OptimizerConfig;
using core::ProfileDefinition;

namespace {

bool load_profiles(const CommonOptions& options, std::vector<ProfileDefinition>& profiles, std::string& error) {
    if (!options.config_path.empty()) {
        std::error_code ec;
        if (!fs::exists(options.config_path, ec)) {
            error = "config file not found: " + options.config_path;
            return false;
        }
        if (!core::load_profiles_config_from_file(options.config_path, profiles, error)) {
            error = "failed to load config (" + options.config_path + "): " + error;
            return false;
        }
        return true;
    }

    std::vector<std::string> tried;
    for (const fs::path& candidate : core::default_config_candidates()) {
        std::error_code ec;
        if (!fs::exists(candidate, ec) || ec) {
            tried.push_back(candidate.string());
            continue;
        }
        if (!core::load_profiles_config_from_file(candidate, profiles, error)) {
            error = "failed to load config (" + candidate.string() + "): " + error;
            return false;
        }
        return true;
    }

    if (!options.profile_name.empty()) {
        error = "profile '" + options.profile_name + "' requested but no config file was found. Tried:";
        for (const auto& path : tried) {
            error += " " + path;
        }
        return false;
    }
    return true;
}

} // namespace

OptionMatch parse_common_option(int argc, char** argv, int& i, CommonOptions& options) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    ProfileDefinition& o = options.overrides;

    if (arg == "--verbose" || arg == "-v") {
        o.verbose = true;
        return OptionMatch::Consumed;
    }
    if (arg == "--keep-original") {
        o.keep_original = true;
        return OptionMatch::Consumed;
    }
    if (arg == "--no-skip-existing") {
        o.skip_existing = false;
        return OptionMatch::Consumed;
    }
    if (arg == "--no-manifest") {
        o.generate_manifest = false;
        return OptionMatch::Consumed;
    }
    if (!has_value) {
        return OptionMatch::NotMatched;
    }

    if (arg == "--config") {
        options.config_path = argv[++i];
    } else if (arg == "--profile") {
        options.profile_name = argv[++i];
    } else if (arg == "--input") {
        o.input = argv[++i];
    } else if (arg == "--output") {
        o.output = argv[++i];
    } else if (arg == "--public-path") {
        o.public_path = argv[++i];
    } else if (arg == "--formats") {
        std::vector<core::ImageFormat> formats;
        std::string error;
        if (!core::parse_format_list(argv[++i], formats, error)) {
            std::cerr << "Error: Invalid formats value: " << argv[i] << " (" << error << ")\n";
            return OptionMatch::Invalid;
        }
        o.formats = std::move(formats);
    } else if (arg == "--sizes") {
        std::vector<int> sizes;
        if (!core::parse_width_list(argv[++i], sizes)) {
            std::cerr << "Error: Invalid sizes value: " << argv[i] << '\n';
            return OptionMatch::Invalid;
        }
        o.sizes = std::move(sizes);
    } else if (arg == "--quality") {
        int quality = 0;
        if (!core::parse_positive_int(argv[++i], quality) || quality > core::k_max_quality) {
            std::cerr << "Error: Invalid quality value: " << argv[i] << '\n';
            return OptionMatch::Invalid;
        }
        o.quality = quality;
    } else if (arg == "--threads") {
        unsigned int threads = 0;
        if (!core::parse_non_negative_uint(argv[++i], threads)) {
            std::cerr << "Error: Invalid threads value: " << argv[i] << '\n';
            return OptionMatch::Invalid;
        }
        o.threads = threads;
    } else {
        return OptionMatch::NotMatched;
    }
    return OptionMatch::Consumed;
}

bool resolve_config(const CommonOptions& options, OptimizerConfig& config, std::string& error) {
    std::vector<ProfileDefinition> profiles;
    if (!load_profiles(options, profiles, error)) {
        return false;
    }

    if (!profiles.empty()) {
        const ProfileDefinition* profile = core::select_profile(profiles, options.profile_name);
        if (profile == nullptr) {
            std::string available;
            for (size_t idx = 0; idx < profiles.size(); ++idx) {
                if (idx > 0) {
                    available += ", ";
                }
                available += profiles[idx].name;
            }
            error = "invalid profile '" + options.profile_name + "'. Available profiles: " + available;
            return false;
        }
        core::apply_profile(*profile, config);
    }
    core::apply_profile(options.overrides, config);
    return core::validate_config(config, error);
}

void print_common_options() {
    std::cout << "Common options:\n"
              << "  --config PATH          Profiles config file (default: ./" << core::k_config_filename
              << ", ~/" << core::k_user_config_relpath << ", " << core::k_global_config_path << ")\n"
              << "  --profile NAME         Profile to use (default: " << core::k_default_profile_name << ")\n"
              << "  --input DIR            Directory with the original images\n"
              << "  --output DIR           Directory for generated variants (default: " << core::k_default_output_dir
              << ")\n"
              << "  --public-path P        URL prefix of the output tree (default: " << core::k_default_public_path
              << ")\n"
              << "  --formats LIST         Output formats, e.g. webp,avif,jpeg,png (default: webp)\n"
              << "  --sizes LIST           Target widths, e.g. 320,640,1280\n"
              << "  --quality N            Encoder quality 1-100 (default: " << core::k_default_quality << ")\n"
              << "  --threads N            Worker threads (default: 0 = auto)\n"
              << "  --keep-original        Copy the untouched original into the output tree\n"
              << "  --no-skip-existing     Re-encode variants that already exist\n"
              << "  --no-manifest          Do not write manifest.json\n"
              << "  --verbose, -v          Log every variant\n";
}

} // namespace imgopt::commands
