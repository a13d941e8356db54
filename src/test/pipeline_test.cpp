#include <cassert>
#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

#include <nlohmann/json.hpp>

#include "core/file_utils.h"
#include "core/pipeline.h"
#include "fake_codec.h"
#include "test_support.h"

using namespace imgopt::core;
using imgopt::test::FakeCodec;
using imgopt::test::pass;
using imgopt::test::read_text;
using imgopt::test::ScratchDir;
using imgopt::test::section;
using imgopt::test::set_mtime;
using imgopt::test::write_source;

namespace fs = std::filesystem;

namespace {

OptimizerConfig make_config(const ScratchDir& scratch) {
    OptimizerConfig config;
    config.input = scratch / "in";
    config.output = scratch / "out";
    config.formats = {ImageFormat::WebP};
    config.sizes = {320, 640};
    config.threads = 1;
    return config;
}

void age(const fs::path& path) {
    set_mtime(path, fs::file_time_type::clock::now() - std::chrono::hours(1));
}

} // namespace

int main() {
    std::ostringstream out;
    std::ostringstream err;
    Logger log(out, err);

    section("Manifest shape");
    {
        ScratchDir scratch("pipeline_shape");
        write_source(scratch / "in", "a/b.jpg", 1000, 667);
        age(scratch / "in/a/b.jpg");
        FakeCodec codec;
        Pipeline pipeline(make_config(scratch), codec, log);

        BatchSummary summary;
        std::string error;
        assert(pipeline.process_all(false, summary, error));
        assert(summary.discovered == 1 && summary.processed == 1 && summary.encoded == 2);
        assert(summary.manifest_written);

        const auto root = nlohmann::json::parse(read_text(scratch / "out/manifest.json"));
        const auto& variants = root.at("images").at("a/b.jpg").at("variants");
        assert(variants.size() == 2);
        assert(variants[0].at("path") == "a/b-320w.webp");
        assert(variants[1].at("path") == "a/b-640w.webp");
        assert(variants[1].at("height") == 427);
        assert(!root.at("generatedAt").get<std::string>().empty());
    }
    pass("a/b.jpg -> a/b-320w.webp, a/b-640w.webp");

    section("Idempotence and staleness round-trip");
    {
        ScratchDir scratch("pipeline_idempotent");
        write_source(scratch / "in", "hero.jpg", 1000, 500);
        write_source(scratch / "in", "small.png", 500, 250);
        age(scratch / "in/hero.jpg");
        age(scratch / "in/small.png");
        FakeCodec codec;
        Pipeline pipeline(make_config(scratch), codec, log);

        BatchSummary summary;
        std::string error;
        assert(pipeline.process_all(false, summary, error));
        assert(summary.encoded == 3);
        // no upscaling: small.png is 500 wide
        assert(!file_exists(scratch / "out/small-640w.webp"));
        assert(file_exists(scratch / "out/small-320w.webp"));
        const std::string stamp = pipeline.manifest().generated_at();

        codec.reset_counts();
        assert(pipeline.process_all(false, summary, error));
        assert(codec.transform_calls() == 0);
        assert(summary.up_to_date == 2 && summary.processed == 0);
        assert(pipeline.manifest().generated_at() == stamp);

        fs::remove(scratch / "out/hero-640w.webp");
        assert(pipeline.process_all(false, summary, error));
        assert(summary.processed == 1 && summary.encoded == 1);
        assert(codec.transform_calls() == 1);
        assert(file_exists(scratch / "out/hero-640w.webp"));
        assert(pipeline.manifest().find("hero.jpg")->variants.size() == 2);

        // a reloaded pipeline sees the same inventory as fresh
        Pipeline reloaded(make_config(scratch), codec, log);
        assert(reloaded.load_manifest());
        codec.reset_counts();
        assert(reloaded.process_all(false, summary, error));
        assert(codec.transform_calls() == 0);

        set_mtime(scratch / "in/hero.jpg", fs::file_time_type::clock::now() + std::chrono::hours(1));
        assert(reloaded.process_all(false, summary, error));
        assert(summary.processed == 1);

        codec.reset_counts();
        assert(reloaded.process_all(true, summary, error));
        assert(summary.processed == 2);
        // forced runs still honour skip_existing
        assert(codec.transform_calls() == 0);
    }
    pass("idempotence / staleness round-trip");

    section("Missing input directory");
    {
        ScratchDir scratch("pipeline_missing");
        FakeCodec codec;
        Pipeline pipeline(make_config(scratch), codec, log);
        BatchSummary summary;
        std::string error;
        assert(!pipeline.process_all(false, summary, error));
        assert(summary.error_kind == ErrorKind::InputDirectoryMissing);
        assert(error.find("input directory") != std::string::npos);
        assert(!pipeline.is_processing());
        assert(!fs::exists(scratch / "out"));
    }
    pass("input directory missing");

    section("Empty input and disabled manifest");
    {
        ScratchDir scratch("pipeline_empty");
        fs::create_directories(scratch / "in");
        imgopt::test::write_text(scratch / "in/readme.txt", "not an image");
        FakeCodec codec;
        Pipeline empty(make_config(scratch), codec, log);
        BatchSummary summary;
        std::string error;
        assert(empty.process_all(false, summary, error));
        assert(summary.discovered == 0);
        assert(!fs::exists(scratch / "out/manifest.json"));

        write_source(scratch / "in", "x.jpg", 400, 400);
        OptimizerConfig config = make_config(scratch);
        config.generate_manifest = false;
        Pipeline no_manifest(config, codec, log);
        assert(no_manifest.process_all(false, summary, error));
        assert(summary.encoded == 1 && !summary.manifest_written);
        assert(!fs::exists(scratch / "out/manifest.json"));
    }
    pass("empty input / generate_manifest off");

    section("Single flight");
    {
        ScratchDir scratch("pipeline_single_flight");
        for (int i = 0; i < 4; ++i) {
            write_source(scratch / "in", "img" + std::to_string(i) + ".jpg", 800, 600);
        }
        FakeCodec codec;
        codec.hold();
        Pipeline pipeline(make_config(scratch), codec, log);

        BatchSummary first;
        std::string first_error;
        bool first_ok = false;
        std::thread runner([&]() { first_ok = pipeline.process_all(true, first, first_error); });
        // the first run is parked inside its first encode
        assert(codec.wait_for_blocked(1, std::chrono::seconds(10)));
        assert(pipeline.is_processing());

        BatchSummary second;
        std::string error;
        assert(pipeline.process_all(true, second, error));
        assert(second.already_running);
        assert(second.processed == 0);
        codec.release();
        runner.join();
        assert(first_ok && !first.already_running);
        assert(first.encoded == 8);
        assert(!pipeline.is_processing());
    }
    pass("concurrent process_all is a no-op");

    section("Worker pool");
    {
        ScratchDir scratch("pipeline_workers");
        for (int i = 0; i < 12; ++i) {
            write_source(scratch / "in", "set/img" + std::to_string(i) + ".png", 1280, 720);
        }
        OptimizerConfig config = make_config(scratch);
        config.threads = 4;
        config.formats = {ImageFormat::WebP, ImageFormat::Jpeg};
        FakeCodec codec;
        Pipeline pipeline(config, codec, log);
        BatchSummary summary;
        std::string error;
        assert(pipeline.process_all(false, summary, error));
        assert(summary.processed == 12 && summary.encoded == 48);
        assert(summary.failed_originals == 0 && summary.failed_variants == 0);
        assert(pipeline.manifest().size() == 12);
        assert(file_exists(scratch / "out/set/img11-640w.jpeg"));
    }
    pass("parallel batch");

    section("Corrupt manifest, targeted regeneration and clean");
    {
        ScratchDir scratch("pipeline_clean");
        write_source(scratch / "in", "a.jpg", 900, 900);
        write_source(scratch / "in", "b.jpg", 900, 900);
        imgopt::test::write_text(scratch / "out/manifest.json", "{broken");
        FakeCodec codec;
        Pipeline pipeline(make_config(scratch), codec, log);
        assert(!pipeline.load_manifest());
        assert(err.str().find("corrupt manifest") != std::string::npos);

        BatchSummary summary;
        std::string error;
        assert(pipeline.process_all(false, summary, error));
        assert(summary.processed == 2);

        codec.reset_counts();
        OptimizerConfig config = make_config(scratch);
        config.skip_existing = false;
        Pipeline targeted(config, codec, log);
        assert(targeted.load_manifest());
        assert(targeted.process_paths({"b.jpg"}, summary, error));
        assert(summary.processed == 1 && codec.transform_calls() == 2);
        assert(targeted.manifest().size() == 2);

        assert(targeted.clean(error));
        assert(!fs::exists(scratch / "out"));
        assert(targeted.manifest().size() == 0);
        assert(fs::exists(scratch / "in/a.jpg"));
    }
    pass("corrupt manifest / process_paths / clean");

    section("File names that are not UTF-8");
    {
        ScratchDir scratch("pipeline_utf8");
        write_source(scratch / "in", "caf\xE9.jpg", 800, 600);
        write_source(scratch / "in", "ok.jpg", 800, 600);
        FakeCodec codec;
        OptimizerConfig config = make_config(scratch);
        config.sizes = {320};
        Pipeline pipeline(config, codec, log);

        BatchSummary summary;
        std::string error;
        assert(pipeline.process_all(false, summary, error));
        assert(summary.discovered == 2);
        assert(summary.failed_originals == 1);
        assert(summary.processed == 1 && summary.encoded == 1);
        bool unreadable_reported = false;
        for (const auto& report : summary.reports) {
            if (report.error_kind == ErrorKind::SourceUnreadable) {
                unreadable_reported = true;
            }
        }
        assert(unreadable_reported);

        const auto manifest = nlohmann::json::parse(read_text(scratch / "out/manifest.json"));
        assert(manifest.at("images").size() == 1);
        assert(manifest.at("images").contains("ok.jpg"));

        const GenerationReport direct = pipeline.process_image("caf\xE9.jpg");
        assert(!direct.ok && direct.error_kind == ErrorKind::SourceUnreadable);
        assert(pipeline.manifest().size() == 1);
        assert(pipeline.persist(error));
    }
    pass("undecodable names are reported, the manifest still saves");

    section("Originals without a decoder");
    {
        ScratchDir scratch("pipeline_undecodable");
        write_source(scratch / "in", "a.jpg", 800, 600);
        write_source(scratch / "in", "scan.tiff", 800, 600);
        age(scratch / "in/a.jpg");
        age(scratch / "in/scan.tiff");
        FakeCodec codec;
        codec.set_undecodable("tiff");
        OptimizerConfig config = make_config(scratch);
        config.sizes = {320};
        Pipeline pipeline(config, codec, log);

        BatchSummary summary;
        std::string error;
        assert(pipeline.process_all(false, summary, error));
        assert(summary.discovered == 2 && summary.unsupported == 1);
        assert(summary.processed == 1 && summary.failed_originals == 0);
        assert(codec.transform_calls() == 1);
        assert(!pipeline.manifest().find("scan.tiff").has_value());

        codec.reset_counts();
        assert(pipeline.process_all(false, summary, error));
        assert(summary.unsupported == 1 && summary.up_to_date == 1);
        assert(summary.processed == 0 && summary.failed_originals == 0);
        assert(codec.probe_calls() == 0 && codec.transform_calls() == 0);

        assert(pipeline.process_paths({"scan.tiff"}, summary, error));
        assert(summary.unsupported == 1 && summary.processed == 0);

        const GenerationReport direct = pipeline.process_image("scan.tiff");
        assert(!direct.ok && direct.error_kind == ErrorKind::UnsupportedSource);
    }
    pass("undecodable originals are skipped without failing the run");

    std::cout << "[Test] pipeline_test completed." << std::endl;
    return 0;
}
