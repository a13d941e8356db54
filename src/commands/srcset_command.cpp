// srcset_command.cpp
// MIT License (c) 2026 Pedro

#include "commands.h"

#include "core/cli_parse.h"
#include "core/log.h"
#include "core/manifest.h"
#include "core/path_resolver.h"
#include "core/pipeline.h"
#include "core/stb_image_codec.h"

#include <iostream>

namespace imgopt::commands {

namespace {

void print_usage() {
    std::cout << "Usage: imgopt srcset [OPTIONS] <image>\n\n"
              << "Print the srcset of an original recorded in the manifest.\n\n"
              << "Options:\n"
              << "  --format F             Variant format (default: first configured format)\n"
              << "  --width N              Also print the best variant URL for a display width\n"
              << "  --picture              Print one <source> line per format instead\n"
              << "  --help, -h             Show this help message\n\n";
    print_common_options();
}

} // namespace

int run_srcset(int argc, char** argv) {
    CommonOptions options;
    std::string image;
    std::string format_arg;
    int width = 0;
    bool picture = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--picture") {
            picture = true;
            continue;
        }
        if (arg == "--format" && i + 1 < argc) {
            format_arg = argv[++i];
            continue;
        }
        if (arg == "--width" && i + 1 < argc) {
            if (!core::parse_positive_int(argv[++i], width)) {
                std::cerr << "Error: Invalid width value: " << argv[i] << '\n';
                return 1;
            }
            continue;
        }
        const OptionMatch match = parse_common_option(argc, argv, i, options);
        if (match == OptionMatch::Invalid) {
            return 1;
        }
        if (match == OptionMatch::Consumed) {
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << '\n';
            print_usage();
            return 1;
        }
        if (!image.empty()) {
            std::cerr << "Error: Too many arguments\n";
            print_usage();
            return 1;
        }
        image = arg;
    }
    if (image.empty()) {
        std::cerr << "Error: Image path is required\n";
        print_usage();
        return 1;
    }

    core::OptimizerConfig config;
    std::string error;
    if (!resolve_config(options, config, error)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }
    core::ImageFormat format = config.formats.front();
    if (!format_arg.empty() && !core::parse_image_format(format_arg, format, error)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }

    core::Logger log;
    log.set_verbose(config.verbose);
    core::StbImageCodec codec;
    core::Pipeline pipeline(config, codec, log);
    if (!pipeline.load_manifest()) {
        std::cerr << "Error: no manifest at " << pipeline.manifest_path().string() << '\n';
        return 1;
    }

    const std::optional<core::ManifestEntry> entry = pipeline.manifest().find(image);
    if (!entry) {
        std::cerr << "Error: " << image << " is not in the manifest\n";
        return 1;
    }

    const std::string prefix = core::collapse_slashes(config.public_path + "/");
    if (picture) {
        for (const auto& source : core::picture_sources(*entry, prefix)) {
            std::cout << "<source type=\"" << source.type << "\" srcset=\"" << source.srcset << "\">\n";
        }
        return 0;
    }

    const std::string srcset = core::build_srcset(*entry, format, prefix);
    if (srcset.empty()) {
        std::cerr << "Error: " << image << " has no " << core::format_name(format) << " variants\n";
        return 1;
    }
    std::cout << srcset << '\n';
    if (width > 0) {
        if (const auto best = core::optimal_variant(*entry, width, format)) {
            std::cout << prefix << best->path << '\n';
        }
    }
    return 0;
}

} // namespace imgopt::commands
