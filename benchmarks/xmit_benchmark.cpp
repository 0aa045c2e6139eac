// xmit-cpp benchmarks: hashing, bundle assembly, chunk planning and framing.

#include <xmit-cpp/bundle.hpp>
#include <xmit-cpp/chunked_uploader.hpp>
#include <xmit-cpp/types.hpp>
#include <xmit-cpp/wire.hpp>
#include "src/encoding/cbor.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

#include <unistd.h>

using namespace xmit_cpp;

static auto make_blob(std::size_t size, std::uint32_t seed) -> Bytes {
    auto rng = std::mt19937{seed};
    auto blob = Bytes(size);
    for (auto& b : blob) b = static_cast<std::byte>(rng() & 0xFF);
    return blob;
}

// A site-shaped tree: a few directories, many small files, some large ones.
class SiteFixture {
public:
    SiteFixture(int files, std::size_t file_size) {
        root_ = std::filesystem::temp_directory_path() /
                ("xmit-cpp-bench-" + std::to_string(::getpid()) + "-" + std::to_string(files));
        std::filesystem::remove_all(root_);
        for (int i = 0; i < files; ++i) {
            auto dir = root_ / ("dir" + std::to_string(i % 8));
            std::filesystem::create_directories(dir);
            auto blob = make_blob(file_size, static_cast<std::uint32_t>(i));
            auto out = std::ofstream{dir / ("file" + std::to_string(i) + ".bin"), std::ios::binary};
            out.write(reinterpret_cast<const char*>(blob.data()),
                      static_cast<std::streamsize>(blob.size()));
        }
    }

    ~SiteFixture() {
        auto ec = std::error_code{};
        std::filesystem::remove_all(root_, ec);
    }

    auto root() const -> const std::filesystem::path& { return root_; }

private:
    std::filesystem::path root_;
};

// =============================================================================
// Hashing
// =============================================================================

static void bm_hash_content(benchmark::State& state) {
    auto blob = make_blob(static_cast<std::size_t>(state.range(0)), 1);
    for (auto _ : state) {
        auto hash = hash_content(blob);
        benchmark::DoNotOptimize(hash);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_hash_content)->Range(1 << 10, 16 << 20);

// =============================================================================
// Bundle assembly
// =============================================================================

static void bm_build_bundle(benchmark::State& state) {
    auto site = SiteFixture{static_cast<int>(state.range(0)), 16 * 1024};
    for (auto _ : state) {
        auto bundle = build_bundle(site.root());
        benchmark::DoNotOptimize(bundle);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_build_bundle)->Arg(64)->Arg(512)->Unit(benchmark::kMillisecond);

static void bm_build_bundle_single_thread(benchmark::State& state) {
    auto site = SiteFixture{static_cast<int>(state.range(0)), 16 * 1024};
    for (auto _ : state) {
        auto bundle = build_bundle(site.root(), 1);
        benchmark::DoNotOptimize(bundle);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_build_bundle_single_thread)->Arg(512)->Unit(benchmark::kMillisecond);

static void bm_encode_bundle_node(benchmark::State& state) {
    auto children = BundleNode::Children{};
    for (int i = 0; i < state.range(0); ++i) {
        children.emplace("file" + std::to_string(i) + ".html",
                         BundleNode::file(hash_content(make_blob(8, static_cast<std::uint32_t>(i)))));
    }
    auto root = BundleNode::directory(std::move(children));
    for (auto _ : state) {
        auto encoded = encode_bundle_node(root);
        benchmark::DoNotOptimize(encoded);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_encode_bundle_node)->Range(16, 4096);

// =============================================================================
// Chunk planning
// =============================================================================

static void bm_plan_chunks(benchmark::State& state) {
    auto rng = std::mt19937{42};
    auto dist = std::uniform_int_distribution<std::size_t>{1, 4 * 1024 * 1024};
    auto sizes = std::vector<std::size_t>(static_cast<std::size_t>(state.range(0)));
    for (auto& s : sizes) s = dist(rng);
    for (auto _ : state) {
        auto plan = plan_chunks(sizes);
        benchmark::DoNotOptimize(plan);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_plan_chunks)->Range(8, 8192);

// =============================================================================
// Wire framing
// =============================================================================

static void bm_cbor_encode_parts(benchmark::State& state) {
    auto parts = cbor::Value::Array{};
    for (int i = 0; i < state.range(0); ++i) {
        parts.emplace_back(make_blob(4096, static_cast<std::uint32_t>(i)));
    }
    auto request = cbor::Value{cbor::Value::Map{
        {cbor::Value{std::uint64_t{1}}, cbor::Value{"key"}},
        {cbor::Value{std::uint64_t{7}}, cbor::Value{std::move(parts)}},
    }};
    for (auto _ : state) {
        auto bytes = cbor::encode(request);
        benchmark::DoNotOptimize(bytes);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0) * 4096);
}
BENCHMARK(bm_cbor_encode_parts)->Range(1, 256);

static void bm_frame_body(benchmark::State& state) {
    // Text compresses like typical site content
    auto text = std::string{};
    while (text.size() < static_cast<std::size_t>(state.range(0))) {
        text += "<div class=\"card\"><p>Hello from xmit-cpp</p></div>\n";
    }
    auto body = to_bytes(text);
    for (auto _ : state) {
        auto framed = frame_body(body);
        benchmark::DoNotOptimize(framed);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) *
                            static_cast<std::int64_t>(body.size()));
}
BENCHMARK(bm_frame_body)->Range(1 << 10, 4 << 20);
