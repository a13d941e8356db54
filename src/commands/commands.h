#pragma once

#include "core/config.h"

#include <string>

namespace imgopt::commands {

// Options shared by every command; unset values keep the profile's.
struct CommonOptions {
    std::string config_path;
    std::string profile_name;
    core::ProfileDefinition overrides;
};

enum class OptionMatch { Consumed, NotMatched, Invalid };

// Consumes argv[i] (and its value, advancing i) when it is a common option.
OptionMatch parse_common_option(int argc, char** argv, int& i, CommonOptions& options);

// Profile file, then command-line overrides, then validation.
bool resolve_config(const CommonOptions& options, core::OptimizerConfig& config, std::string& error);

void print_common_options();

// argv[0] is the command name.
int run_process(int argc, char** argv);
int run_clean(int argc, char** argv);
int run_manifest(int argc, char** argv);
int run_fetch(int argc, char** argv);
int run_srcset(int argc, char** argv);

} // namespace imgopt::commands
