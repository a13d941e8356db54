// manifest_command.cpp
// MIT License (c) 2026 Pedro

#include "commands.h"

#include "core/log.h"
#include "core/pipeline.h"
#include "core/stb_image_codec.h"

#include <iostream>

namespace imgopt::commands {

namespace {

void print_usage() {
    std::cout << "Usage: imgopt manifest [OPTIONS]\n\n"
              << "Rewrite manifest.json from the entries already recorded, without encoding.\n\n";
    print_common_options();
}

} // namespace

int run_manifest(int argc, char** argv) {
    CommonOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
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
    if (!config.generate_manifest) {
        std::cerr << "Error: manifest generation is disabled\n";
        return 1;
    }

    core::Logger log;
    log.set_verbose(config.verbose);
    core::StbImageCodec codec;
    core::Pipeline pipeline(config, codec, log);
    pipeline.load_manifest();
    if (!pipeline.persist(error)) {
        log.error(error);
        return 1;
    }
    return 0;
}

} // namespace imgopt::commands
