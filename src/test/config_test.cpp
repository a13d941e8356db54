#include <cassert>
#include <iostream>
#include <sstream>

#include "core/cli_parse.h"
#include "core/config.h"
#include "test_support.h"

using namespace imgopt::core;
using imgopt::test::pass;
using imgopt::test::section;

namespace {

bool parse(const std::string& text, std::vector<ProfileDefinition>& out, std::string& error) {
    std::istringstream input(text);
    return parse_profiles_config(input, out, error);
}

} // namespace

int main() {
    section("Value parsers");
    {
        std::vector<int> widths;
        assert(parse_width_list(" 320, 640,1280 ,640", widths));
        assert((widths == std::vector<int>{320, 640, 1280}));
        assert(!parse_width_list("320,,640", widths));
        assert(!parse_width_list("320,-1", widths));
        assert(!parse_width_list("", widths));

        std::vector<ImageFormat> formats;
        std::string error;
        assert(parse_format_list("avif, WEBP,jpg,webp", formats, error));
        assert((formats == std::vector<ImageFormat>{ImageFormat::Avif, ImageFormat::WebP, ImageFormat::Jpeg}));
        assert(!parse_format_list("webp,heic", formats, error));

        bool flag = false;
        assert(parse_bool_value("Yes", flag) && flag);
        assert(parse_bool_value("off", flag) && !flag);
        assert(!parse_bool_value("maybe", flag));

        int value = 0;
        assert(parse_int("-12", value) && value == -12);
        assert(!parse_int("12px", value));
        assert(!parse_positive_int("0", value));
        unsigned int threads = 7;
        assert(parse_non_negative_uint("0", threads) && threads == 0);
    }
    pass("cli_parse helpers");

    section("Profiles file");
    {
        std::vector<ProfileDefinition> profiles;
        std::string error;
        const bool ok = parse(R"(# imgopt settings
[profile default]
input = static/images
output = static/optimized
formats = avif, webp
sizes = 320, 640, 1280
quality = 75
keep_original = true

; smaller set for previews
[profile preview]
input = static/images
sizes = 160
generate_manifest = no
threads = 2
)", profiles, error);
        assert(ok);
        assert(profiles.size() == 2);
        assert(profiles[0].name == "default");
        assert(*profiles[0].input == "static/images");
        assert(profiles[0].formats->size() == 2);
        assert(*profiles[0].quality == 75);
        assert(*profiles[0].keep_original);
        assert(!profiles[0].threads.has_value());
        assert(profiles[1].name == "preview");
        assert(!*profiles[1].generate_manifest);
        assert(*profiles[1].threads == 2);

        assert(select_profile(profiles, "")->name == "default");
        assert(select_profile(profiles, "preview")->name == "preview");
        assert(select_profile(profiles, "missing") == nullptr);

        OptimizerConfig config;
        apply_profile(*select_profile(profiles, "preview"), config);
        assert(config.input == "static/images");
        assert((config.sizes == std::vector<int>{160}));
        assert(config.quality == k_default_quality);
        assert(!config.generate_manifest);
        assert(validate_config(config, error));
    }
    pass("parse_profiles_config / select_profile / apply_profile");

    section("Profiles file errors");
    {
        std::vector<ProfileDefinition> profiles;
        std::string error;
        assert(!parse("input = x\n", profiles, error));
        assert(error.find("line 1") != std::string::npos);
        assert(!parse("[profile a]\ncolour = red\n", profiles, error));
        assert(error.find("unknown key 'colour' at line 2") != std::string::npos);
        assert(!parse("[profile a]\nquality = 101\n", profiles, error));
        assert(error.find("invalid quality") != std::string::npos);
        assert(!parse("[profile a]\n[profile a]\n", profiles, error));
        assert(error.find("duplicate profile") != std::string::npos);
        assert(!parse("[section a]\n", profiles, error));
        assert(!parse("[profile a]\nformats = gif\n", profiles, error));
        assert(error.find("line 2") != std::string::npos);
        assert(!parse("# empty\n", profiles, error));
        assert(error == "no profiles defined");
    }
    pass("line-numbered errors");

    section("Validation");
    {
        OptimizerConfig config;
        std::string error;
        assert(!validate_config(config, error));
        assert(error.find("input") != std::string::npos);
        config.input = "images";
        assert(validate_config(config, error));
        config.formats.clear();
        assert(!validate_config(config, error));
        config.formats = {ImageFormat::WebP};
        config.quality = 0;
        assert(!validate_config(config, error));
        config.quality = 80;
        config.public_path = "optimized";
        assert(!validate_config(config, error));
        config.public_path = "/optimized";
        config.sizes.clear();
        assert(!validate_config(config, error));
    }
    pass("validate_config");

    section("Config lookup order");
    {
        const auto candidates = default_config_candidates();
        assert(candidates.size() >= 2);
        assert(candidates.front() == std::filesystem::path(k_config_filename));
        assert(candidates.back() == std::filesystem::path(k_global_config_path));
    }
    pass("default_config_candidates");

    std::cout << "[Test] config_test completed." << std::endl;
    return 0;
}
