#pragma once

#include "image_format.h"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#ifndef IMGOPT_GLOBAL_CONFIG
#define IMGOPT_GLOBAL_CONFIG "/usr/local/share/imgopt/imgopt.cfg"
#endif

namespace imgopt::core {

constexpr const char* k_config_filename = "imgopt.cfg";
constexpr const char* k_user_config_relpath = ".config/imgopt/imgopt.cfg";
constexpr const char* k_global_config_path = IMGOPT_GLOBAL_CONFIG;
constexpr const char* k_default_profile_name = "default";
constexpr const char* k_default_output_dir = "static/optimized";
constexpr int k_default_quality = 80;

struct OptimizerConfig {
    std::filesystem::path input;
    std::filesystem::path output = k_default_output_dir;
    std::string public_path = "/optimized";
    std::vector<ImageFormat> formats = {ImageFormat::WebP};
    std::vector<int> sizes = {320, 640, 1280};
    int quality = k_default_quality;
    bool generate_manifest = true;
    bool keep_original = false;
    bool skip_existing = true;
    bool verbose = false;
    unsigned int threads = 0;
};

// One [profile NAME] section; unset keys fall back to OptimizerConfig defaults.
struct ProfileDefinition {
    std::string name;
    std::optional<std::string> input;
    std::optional<std::string> output;
    std::optional<std::string> public_path;
    std::optional<std::vector<ImageFormat>> formats;
    std::optional<std::vector<int>> sizes;
    std::optional<int> quality;
    std::optional<bool> generate_manifest;
    std::optional<bool> keep_original;
    std::optional<bool> skip_existing;
    std::optional<bool> verbose;
    std::optional<unsigned int> threads;
};

bool parse_format_list(const std::string& value, std::vector<ImageFormat>& out, std::string& error);

bool parse_profiles_config(std::istream& input, std::vector<ProfileDefinition>& out, std::string& error);
bool load_profiles_config_from_file(const std::filesystem::path& path,
                                    std::vector<ProfileDefinition>& out,
                                    std::string& error);

// ./imgopt.cfg, then the user config, then the global one.
std::vector<std::filesystem::path> default_config_candidates();

// Named profile, else "default", else the first one.
const ProfileDefinition* select_profile(const std::vector<ProfileDefinition>& profiles, const std::string& name);

void apply_profile(const ProfileDefinition& profile, OptimizerConfig& config);

// Rejects configurations the pipeline cannot run with.
bool validate_config(const OptimizerConfig& config, std::string& error);

} // namespace imgopt::core
