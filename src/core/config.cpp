#include "config.h"

#include "cli_parse.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace imgopt::core {

bool parse_format_list(const std::string& value, std::vector<ImageFormat>& out, std::string& error) {
    std::vector<std::string> items;
    if (!split_list(value, items)) {
        error = "invalid format list '" + value + "'";
        return false;
    }
    std::vector<ImageFormat> formats;
    for (const auto& item : items) {
        ImageFormat format = ImageFormat::WebP;
        if (!parse_image_format(item, format, error)) {
            return false;
        }
        if (std::ranges::find(formats, format) == formats.end()) {
            formats.push_back(format);
        }
    }
    out = std::move(formats);
    return true;
}

bool parse_profiles_config(std::istream& input, std::vector<ProfileDefinition>& out, std::string& error) {
    out.clear();
    std::unordered_set<std::string> seen_names;
    std::optional<ProfileDefinition> current;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            if (current) {
                out.push_back(*current);
                current.reset();
            }
            std::string header = trimmed.substr(1, trimmed.size() - 2);
            std::istringstream iss(header);
            std::string section_type;
            if (!(iss >> section_type)) {
                error = "empty section header at line " + std::to_string(line_number);
                return false;
            }
            section_type = to_lower_copy(section_type);
            if (section_type != "profile") {
                error = "unsupported section '" + section_type + "' at line " + std::to_string(line_number);
                return false;
            }
            std::string name;
            if (!(iss >> name)) {
                error = "missing profile name at line " + std::to_string(line_number);
                return false;
            }
            std::string extra;
            if (iss >> extra) {
                error = "unexpected token '" + extra + "' in profile header at line " +
                        std::to_string(line_number);
                return false;
            }
            if (seen_names.find(name) != seen_names.end()) {
                error = "duplicate profile '" + name + "' at line " + std::to_string(line_number);
                return false;
            }
            seen_names.insert(name);
            ProfileDefinition def;
            def.name = name;
            current = def;
            continue;
        }

        if (!current) {
            error = "entry outside of profile section at line " + std::to_string(line_number);
            return false;
        }

        size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            error = "invalid line '" + trimmed + "' at line " + std::to_string(line_number);
            return false;
        }
        std::string key = trim_copy(trimmed.substr(0, equals));
        std::string value = trim_copy(trimmed.substr(equals + 1));
        if (key.empty()) {
            error = "empty key at line " + std::to_string(line_number);
            return false;
        }
        if (value.empty()) {
            error = "empty value for key '" + key + "' at line " + std::to_string(line_number);
            return false;
        }

        auto parse_flag = [&](std::optional<bool>& target) {
            bool parsed = false;
            if (!parse_bool_value(value, parsed)) {
                error = "invalid " + key + " '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            target = parsed;
            return true;
        };

        std::string lower_key = to_lower_copy(key);
        if (lower_key == "input") {
            current->input = value;
        } else if (lower_key == "output") {
            current->output = value;
        } else if (lower_key == "public_path") {
            current->public_path = value;
        } else if (lower_key == "formats") {
            std::vector<ImageFormat> formats;
            if (!parse_format_list(value, formats, error)) {
                error += " at line " + std::to_string(line_number);
                return false;
            }
            current->formats = formats;
        } else if (lower_key == "sizes") {
            std::vector<int> sizes;
            if (!parse_width_list(value, sizes)) {
                error = "invalid sizes '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            current->sizes = sizes;
        } else if (lower_key == "quality") {
            int parsed_quality = 0;
            if (!parse_positive_int(value, parsed_quality) || parsed_quality > k_max_quality) {
                error = "invalid quality '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            current->quality = parsed_quality;
        } else if (lower_key == "generate_manifest") {
            if (!parse_flag(current->generate_manifest)) {
                return false;
            }
        } else if (lower_key == "keep_original") {
            if (!parse_flag(current->keep_original)) {
                return false;
            }
        } else if (lower_key == "skip_existing") {
            if (!parse_flag(current->skip_existing)) {
                return false;
            }
        } else if (lower_key == "verbose") {
            if (!parse_flag(current->verbose)) {
                return false;
            }
        } else if (lower_key == "threads") {
            unsigned int parsed_threads = 0;
            if (!parse_non_negative_uint(value, parsed_threads)) {
                error = "invalid threads '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            current->threads = parsed_threads;
        } else {
            error = "unknown key '" + key + "' at line " + std::to_string(line_number);
            return false;
        }
    }

    if (current) {
        out.push_back(*current);
    }

    if (out.empty()) {
        error = "no profiles defined";
        return false;
    }
    return true;
}

bool load_profiles_config_from_file(const fs::path& path,
                                    std::vector<ProfileDefinition>& out,
                                    std::string& error) {
    std::ifstream input(path);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    return parse_profiles_config(input, out, error);
}

std::vector<fs::path> default_config_candidates() {
    std::vector<fs::path> candidates;
    candidates.emplace_back(k_config_filename);
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        candidates.push_back(fs::path(home) / k_user_config_relpath);
    }
    candidates.emplace_back(k_global_config_path);
    return candidates;
}

const ProfileDefinition* select_profile(const std::vector<ProfileDefinition>& profiles, const std::string& name) {
    if (profiles.empty()) {
        return nullptr;
    }
    const std::string wanted = name.empty() ? std::string(k_default_profile_name) : name;
    for (const auto& profile : profiles) {
        if (profile.name == wanted) {
            return &profile;
        }
    }
    if (!name.empty()) {
        return nullptr;
    }
    return &profiles.front();
}

void apply_profile(const ProfileDefinition& profile, OptimizerConfig& config) {
    if (profile.input) {
        config.input = *profile.input;
    }
    if (profile.output) {
        config.output = *profile.output;
    }
    if (profile.public_path) {
        config.public_path = *profile.public_path;
    }
    if (profile.formats) {
        config.formats = *profile.formats;
    }
    if (profile.sizes) {
        config.sizes = *profile.sizes;
    }
    if (profile.quality) {
        config.quality = *profile.quality;
    }
    if (profile.generate_manifest) {
        config.generate_manifest = *profile.generate_manifest;
    }
    if (profile.keep_original) {
        config.keep_original = *profile.keep_original;
    }
    if (profile.skip_existing) {
        config.skip_existing = *profile.skip_existing;
    }
    if (profile.verbose) {
        config.verbose = *profile.verbose;
    }
    if (profile.threads) {
        config.threads = *profile.threads;
    }
}

bool validate_config(const OptimizerConfig& config, std::string& error) {
    if (config.input.empty()) {
        error = "no input directory configured";
        return false;
    }
    if (config.output.empty()) {
        error = "no output directory configured";
        return false;
    }
    if (config.formats.empty()) {
        error = "no output formats configured";
        return false;
    }
    if (config.sizes.empty()) {
        error = "no output sizes configured";
        return false;
    }
    for (int size : config.sizes) {
        if (size <= 0) {
            error = "invalid size " + std::to_string(size);
            return false;
        }
    }
    if (config.quality < k_min_quality || config.quality > k_max_quality) {
        error = "quality must be between 1 and 100";
        return false;
    }
    if (config.public_path.empty() || config.public_path.front() != '/') {
        error = "public path must start with '/'";
        return false;
    }
    return true;
}

} // namespace imgopt::core
