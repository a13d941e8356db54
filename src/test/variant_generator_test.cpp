#include <cassert>
#include <iostream>
#include <sstream>

#include "core/file_utils.h"
#include "core/variant_generator.h"
#include "fake_codec.h"
#include "test_support.h"

using namespace imgopt::core;
using imgopt::test::FakeCodec;
using imgopt::test::pass;
using imgopt::test::read_text;
using imgopt::test::ScratchDir;
using imgopt::test::section;
using imgopt::test::write_source;

namespace {

size_t count_status(const GenerationReport& report, VariantStatus status) {
    size_t n = 0;
    for (const auto& outcome : report.outcomes) {
        if (outcome.status == status) {
            ++n;
        }
    }
    return n;
}

} // namespace

int main() {
    ScratchDir scratch("generator");
    OptimizerConfig config;
    config.input = scratch / "in";
    config.output = scratch / "out";
    config.formats = {ImageFormat::WebP, ImageFormat::Avif};
    config.sizes = {320, 640, 1280};
    config.quality = 80;

    FakeCodec codec;
    ManifestStore manifest;
    PathLocks locks;
    std::ostringstream out;
    std::ostringstream err;
    Logger log(out, err);
    log.set_verbose(true);
    VariantGenerator generator(config, codec, manifest, locks, log);

    write_source(config.input, "photos/hero.jpg", 1000, 667);

    section("Generate every width x format");
    {
        const GenerationReport report = generator.generate("photos/hero.jpg");
        assert(report.ok);
        assert(report.width == 1000 && report.height == 667);
        assert(report.encoded == 4);
        assert(count_status(report, VariantStatus::SkippedUpscale) == 2);
        assert(codec.transform_calls() == 4);

        const auto entry = manifest.find("photos/hero.jpg");
        assert(entry.has_value());
        assert(entry->variants.size() == 4);
        assert(entry->variants[0].path == "photos/hero-320w.webp");
        assert(entry->variants[1].path == "photos/hero-320w.avif");
        assert(entry->variants[2].path == "photos/hero-640w.webp");
        assert(entry->variants[3].path == "photos/hero-640w.avif");
        assert(entry->variants[0].height == 213);
        assert(entry->variants[2].height == 427);
        for (const auto& variant : entry->variants) {
            assert(variant.width <= entry->width);
            assert(variant.bytes > 0);
        }
        assert(read_text(config.output / "photos/hero-320w.webp") == "webp 320x213 q80");
        assert(!file_exists(config.output / "photos/hero-1280w.webp"));
        assert(out.str().find("Skipping 1280w for photos/hero.jpg") != std::string::npos);
        assert(out.str().find("Generated: photos/hero-640w.avif") != std::string::npos);
    }
    pass("generate");

    section("Existing variants are reused");
    {
        codec.reset_counts();
        const GenerationReport report = generator.generate("photos/hero.jpg");
        assert(report.ok);
        assert(report.encoded == 0);
        assert(report.reused == 4);
        assert(codec.transform_calls() == 0);
        const auto entry = manifest.find("photos/hero.jpg");
        assert(entry->variants.size() == 4);
        assert(entry->variants[0].bytes == std::string("webp 320x213 q80").size());
    }
    pass("skip existing");

    section("skip_existing off re-encodes");
    {
        config.skip_existing = false;
        codec.reset_counts();
        const GenerationReport report = generator.generate("photos/hero.jpg");
        assert(report.encoded == 4);
        assert(codec.transform_calls() == 4);
        config.skip_existing = true;
    }
    pass("no skip existing");

    section("Encoder failures skip single variants");
    {
        FakeCodec failing;
        failing.fail_format(ImageFormat::Avif);
        ManifestStore local_manifest;
        VariantGenerator local(config, failing, local_manifest, locks, log);
        write_source(config.input, "banner.png", 700, 100);
        const GenerationReport report = local.generate("banner.png");
        assert(report.ok);
        assert(report.failed == 2);
        assert(report.encoded == 2);
        for (const auto& outcome : report.outcomes) {
            if (outcome.status == VariantStatus::Failed) {
                assert(outcome.format == ImageFormat::Avif);
                assert(outcome.error_kind == ErrorKind::EncodeFailed);
                assert(!outcome.error.empty());
            }
        }
        const auto entry = local_manifest.find("banner.png");
        assert(entry->variants.size() == 2);
        assert(entry->variants[0].format == ImageFormat::WebP);
        assert(!file_exists(config.output / "banner-320w.avif"));
    }
    pass("encode failure");

    section("Unreadable sources leave the manifest alone");
    {
        manifest.upsert_entry("broken.jpg", ManifestEntry{"broken.jpg", 10, 10, {}});
        imgopt::test::write_text(config.input / "broken.jpg", "garbage");
        const GenerationReport report = generator.generate("broken.jpg");
        assert(!report.ok);
        assert(report.error_kind == ErrorKind::SourceUnreadable);
        assert(report.outcomes.empty());
        const auto entry = manifest.find("broken.jpg");
        assert(entry.has_value() && entry->width == 10);
        assert(err.str().find("broken.jpg") != std::string::npos);
    }
    pass("source unreadable");

    section("Keep original and PNG parameters");
    {
        config.keep_original = true;
        config.formats = {ImageFormat::Png};
        config.sizes = {320};
        write_source(config.input, "icons/logo.jpg", 640, 640);
        const GenerationReport report = generator.generate("icons/logo.jpg");
        assert(report.ok && report.encoded == 1);
        assert(read_text(config.output / "icons/logo.jpg") == "640x640");
        assert(read_text(config.output / "icons/logo-320w.png") == "png 320x320 q0");
    }
    pass("keep original / png");

    assert(std::string(variant_status_name(VariantStatus::SkippedUpscale)) == "skipped (wider than source)");
    std::cout << "[Test] variant_generator_test completed." << std::endl;
    return 0;
}
