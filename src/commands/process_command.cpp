// process_command.cpp
// MIT License (c) 2026 Pedro

#include "commands.h"

#include "core/log.h"
#include "core/pipeline.h"
#include "core/stb_image_codec.h"

#include <iostream>

namespace imgopt::commands {

namespace {

void print_usage() {
    std::cout << "Usage: imgopt process [OPTIONS]\n\n"
              << "Generate every missing or outdated variant of the images under the input directory.\n\n"
              << "Options:\n"
              << "  --force                Regenerate every image, ignoring the manifest\n"
              << "  --help, -h             Show this help message\n\n";
    print_common_options();
}

} // namespace

int run_process(int argc, char** argv) {
    CommonOptions options;
    bool force = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--force") {
            force = true;
            continue;
        }
        const OptionMatch match = parse_common_option(argc, argv, i, options);
        if (match == OptionMatch::Invalid) {
            return 1;
        }
        if (match == OptionMatch::NotMatched) {
            std::cerr << "Error: Unknown option: " << arg << '\n';
            print_usage();
            return 1;
        }
    }

    core::OptimizerConfig config;
    std::string error;
    if (!resolve_config(options, config, error)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }

    core::Logger log;
    log.set_verbose(config.verbose);
    core::StbImageCodec codec;
    core::Pipeline pipeline(config, codec, log);
    pipeline.load_manifest();

    core::BatchSummary summary;
    if (!pipeline.process_all(force, summary, error)) {
        return 1;
    }
    if (summary.failed_originals > 0 || summary.failed_variants > 0) {
        log.error(std::to_string(summary.failed_originals) + " images and " +
                  std::to_string(summary.failed_variants) + " variants failed");
        return 1;
    }
    return 0;
}

} // namespace imgopt::commands
