// fetch_command.cpp
// MIT License (c) 2026 Pedro

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#include <stdio.h>
#endif

#include "commands.h"

#include "core/file_utils.h"
#include "core/log.h"
#include "core/on_the_fly.h"
#include "core/pipeline.h"
#include "core/stb_image_codec.h"

#include <iostream>

namespace imgopt::commands {

namespace {

void print_usage() {
    std::cout << "Usage: imgopt fetch [OPTIONS] <request-target>\n\n"
              << "Resolve one image request the way the server would and print the response.\n"
              << "Status and headers go to stderr, the body to stdout or --out.\n\n"
              << "Options:\n"
              << "  --out FILE             Write the body to FILE\n"
              << "  --head                 Print status and headers only\n"
              << "  --help, -h             Show this help message\n\n";
    print_common_options();
    std::cout << "\nExamples:\n"
              << "  imgopt fetch /optimized/hero-640w.webp --out hero.webp\n"
              << "  imgopt fetch \"/optimized/hero.jpg?w=800&format=webp\" --head\n";
}

} // namespace

int run_fetch(int argc, char** argv) {
    CommonOptions options;
    std::string target;
    std::string out_path;
    bool head_only = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--head") {
            head_only = true;
            continue;
        }
        if (arg == "--out" && i + 1 < argc) {
            out_path = argv[++i];
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
        if (!target.empty()) {
            std::cerr << "Error: Too many arguments\n";
            print_usage();
            return 1;
        }
        target = arg;
    }
    if (target.empty()) {
        std::cerr << "Error: Request target is required\n";
        print_usage();
        return 1;
    }

    core::OptimizerConfig config;
    std::string error;
    if (!resolve_config(options, config, error)) {
        std::cerr << "Error: " << error << '\n';
        return 1;
    }

    core::Logger log;
    log.set_verbose(config.verbose);
    log.set_quiet(out_path.empty() && !head_only);
    core::StbImageCodec codec;
    core::Pipeline pipeline(config, codec, log);
    core::OnTheFlyResolver resolver(pipeline);

    const core::Response response = resolver.handle(target);
    std::cerr << "HTTP " << response.status << ' ' << core::status_text(response.status) << '\n'
              << "Content-Type: " << response.content_type << '\n'
              << "Content-Length: " << response.body.size() << '\n';
    for (const auto& [name, value] : response.headers) {
        std::cerr << name << ": " << value << '\n';
    }

    const bool ok = response.status >= 200 && response.status < 300;
    if (head_only) {
        return ok ? 0 : 1;
    }
    if (!out_path.empty()) {
        if (!core::write_file_atomic(out_path, response.body, error)) {
            std::cerr << "Error: " << error << '\n';
            return 1;
        }
    } else {
#ifdef _WIN32
        if (_setmode(_fileno(stdout), _O_BINARY) == -1) {
            std::cerr << "Failed to set stdout to binary mode\n";
            return 1;
        }
#endif
        std::cout.write(reinterpret_cast<const char*>(response.body.data()),
                        static_cast<std::streamsize>(response.body.size()));
        std::cout.flush();
        if (!std::cout) {
            std::cerr << "Error: failed to write response body\n";
            return 1;
        }
    }
    return ok ? 0 : 1;
}

} // namespace imgopt::commands
