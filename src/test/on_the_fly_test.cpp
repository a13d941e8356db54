#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "core/file_utils.h"
#include "core/on_the_fly.h"
#include "core/pipeline.h"
#include "fake_codec.h"
#include "test_support.h"

using namespace imgopt::core;
using imgopt::test::FakeCodec;
using imgopt::test::pass;
using imgopt::test::read_text;
using imgopt::test::ScratchDir;
using imgopt::test::section;
using imgopt::test::write_source;
using imgopt::test::write_text;

namespace fs = std::filesystem;

namespace {

OptimizerConfig make_config(const ScratchDir& scratch) {
    OptimizerConfig config;
    config.input = scratch / "in";
    config.output = scratch / "out";
    config.formats = {ImageFormat::Avif, ImageFormat::WebP};
    config.sizes = {320, 640};
    config.quality = 70;
    return config;
}

std::string body_of(const Response& response) {
    return std::string(response.body.begin(), response.body.end());
}

bool has_header(const Response& response, const std::string& name, const std::string& value) {
    const std::string* found = response.header(name);
    return found != nullptr && *found == value;
}

size_t count_files(const fs::path& root) {
    size_t n = 0;
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return 0;
    }
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            ++n;
        }
    }
    return n;
}

} // namespace

int main() {
    std::ostringstream out;
    std::ostringstream err;
    Logger log(out, err);

    section("Variant filename fallback");
    {
        ScratchDir scratch("otf_variant");
        write_source(scratch / "in", "hero.jpg", 1000, 600);
        FakeCodec codec;
        Pipeline pipeline(make_config(scratch), codec, log);
        OnTheFlyResolver resolver(pipeline);

        const Response first = resolver.handle("/optimized/hero-640w.webp");
        assert(first.status == 200);
        assert(first.content_type == "image/webp");
        assert(first.delivery == Delivery::Generated);
        assert(has_header(first, k_optimized_header, "on-the-fly"));
        assert(has_header(first, "Cache-Control", k_immutable_cache_control));
        assert(body_of(first) == "webp 640x384 q70");
        assert(codec.transform_calls() == 1);
        assert(read_text(scratch / "out/hero-640w.webp") == "webp 640x384 q70");
        // the request path does not touch the manifest
        assert(pipeline.manifest().size() == 0);

        const Response second = resolver.handle("/optimized/hero-640w.webp");
        assert(second.status == 200);
        assert(second.delivery == Delivery::PreProcessed);
        assert(has_header(second, k_optimized_header, "pre-processed"));
        assert(body_of(second) == body_of(first));
        assert(codec.transform_calls() == 1);

        // width is clamped to the original
        const Response wide = resolver.handle("/optimized/hero-4000w.jpg");
        assert(wide.status == 200);
        assert(wide.content_type == "image/jpeg");
        assert(body_of(wide) == "jpeg 1000x600 q70");
        assert(file_exists(scratch / "out/hero-4000w.jpg"));

        const Response missing = resolver.handle("/optimized/nothere-640w.webp");
        assert(missing.status == 404);
        assert(missing.error_kind == ErrorKind::NotFound);
        assert(body_of(missing) == "Source image not found");
    }
    pass("hero-640w.webp generated once, then served from disk");

    section("Source lookup order");
    {
        ScratchDir scratch("otf_lookup");
        write_source(scratch / "in", "gallery/pic.png", 400, 400);
        write_source(scratch / "in", "gallery/pic.webp", 800, 800);
        FakeCodec codec;
        Pipeline pipeline(make_config(scratch), codec, log);
        OnTheFlyResolver resolver(pipeline);
        const Response response = resolver.handle("/optimized/gallery/pic-320w.avif");
        assert(response.status == 200);
        assert(response.content_type == "image/avif");
        // png is tried before webp
        assert(body_of(response) == "avif 320x320 q70");

        // sources the codec cannot decode are passed over
        codec.set_undecodable("png");
        const Response from_webp = resolver.handle("/optimized/gallery/pic-640w.avif");
        assert(from_webp.status == 200);
        assert(body_of(from_webp) == "avif 640x640 q70");
    }
    pass("jpg, jpeg, png, webp, avif");

    section("Query parameters");
    {
        ScratchDir scratch("otf_query");
        write_source(scratch / "in", "hero.jpg", 1000, 600);
        FakeCodec codec;
        Pipeline pipeline(make_config(scratch), codec, log);
        OnTheFlyResolver resolver(pipeline);

        const Response a = resolver.handle("/optimized/hero.jpg?w=800&format=avif");
        const Response b = resolver.handle("/optimized/hero.jpg?w=800&format=avif");
        assert(a.status == 200 && b.status == 200);
        assert(a.content_type == "image/avif");
        assert(body_of(a) == "avif 800x480 q70");
        assert(has_header(a, k_optimized_header, "on-the-fly"));
        assert(has_header(a, "Cache-Control", k_short_cache_control));
        assert(codec.transform_calls() == 2);
        assert(count_files(scratch / "out") == 0);

        // defaults: original width, first configured format, clamped quality
        const Response q = resolver.handle("/optimized/hero.jpg?q=500");
        assert(body_of(q) == "avif 1000x600 q100");
        const Response fmt = resolver.handle("/optimized/hero.jpg?format=jpg&w=100&q=0");
        assert(body_of(fmt) == "jpeg 100x60 q1");

        assert(resolver.handle("/optimized/hero.jpg?w=abc").status == 400);
        assert(resolver.handle("/optimized/hero.jpg?w=-5").status == 400);
        assert(resolver.handle("/optimized/hero.jpg?w=0").status == 400);
        assert(resolver.handle("/optimized/hero.jpg?q=high").status == 400);
        assert(resolver.handle("/optimized/hero.jpg?format=bmp").status == 400);
        assert(resolver.handle("/optimized/gone.jpg?w=100").status == 404);
        assert(count_files(scratch / "out") == 0);
    }
    pass("query path never caches");

    section("Plain requests");
    {
        ScratchDir scratch("otf_plain");
        write_source(scratch / "in", "photo one.jpg", 300, 200);
        write_text(scratch / "out/cached.png", "cached bytes");
        write_source(scratch / "in", "cached.png", 300, 200);
        FakeCodec codec;
        Pipeline pipeline(make_config(scratch), codec, log);
        OnTheFlyResolver resolver(pipeline);

        const Response original = resolver.handle("/optimized/photo%20one.jpg?w=");
        assert(original.status == 200);
        assert(original.delivery == Delivery::Original);
        assert(original.content_type == "image/jpeg");
        assert(original.header(k_optimized_header) == nullptr);
        assert(has_header(original, "Cache-Control", k_short_cache_control));
        assert(body_of(original) == "300x200");

        const Response cached = resolver.handle("/optimized/cached.png");
        assert(cached.delivery == Delivery::PreProcessed);
        assert(body_of(cached) == "cached bytes");
        assert(has_header(cached, k_optimized_header, "pre-processed"));

        assert(codec.transform_calls() == 0);
        assert(resolver.handle("/optimized/none.jpg").status == 404);
        assert(resolver.handle("/elsewhere/photo%20one.jpg").status == 404);
        assert(resolver.handle("/optimized/").status == 404);
        assert(resolver.handle("/optimizedphoto.jpg").status == 404);
        assert(resolver.handle("/optimized/../in/cached.png").status == 404);
        assert(resolver.handle("/optimized/%2e%2e/in/cached.png").status == 404);
        assert(resolver.handle("/optimized/notes.txt").status == 404);

        // an embedded NUL must not truncate the path to in/hero
        write_source(scratch / "in", "hero", 300, 200);
        codec.reset_counts();
        assert(resolver.handle("/optimized/hero%00.jpg").status == 404);
        assert(resolver.handle("/optimized/hero%00.jpg?w=100").status == 404);
        assert(resolver.handle("/optimized/hero%00-100w.webp").status == 404);
        assert(resolver.handle("/optimized/a%0Ab.jpg").status == 404);
        assert(codec.probe_calls() == 0 && codec.transform_calls() == 0);
    }
    pass("original / pre-processed / not found");

    section("Failures and cancellation");
    {
        ScratchDir scratch("otf_failures");
        write_source(scratch / "in", "hero.jpg", 1000, 600);
        FakeCodec codec;
        codec.fail_format(ImageFormat::Avif);
        Pipeline pipeline(make_config(scratch), codec, log);
        OnTheFlyResolver resolver(pipeline);

        const Response failed = resolver.handle("/optimized/hero-320w.avif");
        assert(failed.status == 500);
        assert(failed.error_kind == ErrorKind::TransformFailed);
        assert(body_of(failed) == "Failed to process image");
        assert(!file_exists(scratch / "out/hero-320w.avif"));
        assert(resolver.handle("/optimized/hero.jpg?w=10").status == 500);

        CancellationToken token;
        token.cancel();
        const Response cancelled = resolver.handle("/optimized/hero-320w.webp", &token);
        assert(cancelled.status == k_status_client_closed);
        assert(count_files(scratch / "out") == 0);
        assert(std::string(status_text(cancelled.status)) == "Client Closed Request");
    }
    pass("500 on codec failure, 499 on cancellation");

    section("Concurrent requests for one variant");
    {
        ScratchDir scratch("otf_concurrent");
        write_source(scratch / "in", "hero.jpg", 1000, 600);
        FakeCodec codec;
        codec.set_delay(std::chrono::milliseconds(20));
        Pipeline pipeline(make_config(scratch), codec, log);
        OnTheFlyResolver resolver(pipeline);

        std::vector<std::thread> threads;
        std::vector<int> statuses(6, 0);
        for (size_t i = 0; i < statuses.size(); ++i) {
            threads.emplace_back([&, i]() { statuses[i] = resolver.handle("/optimized/hero-320w.webp").status; });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        for (int status : statuses) {
            assert(status == 200);
        }
        assert(codec.transform_calls() == 1);
        assert(count_files(scratch / "out") == 1);
    }
    pass("per-original lock prevents duplicate encodes");

    assert(std::string(delivery_name(Delivery::Generated)) == "on-the-fly");
    std::cout << "[Test] on_the_fly_test completed." << std::endl;
    return 0;
}
