#include <benchmark/benchmark.h>
#include <decoding/batch_event_parser.hpp>
#include <decoding/stream_event_parser.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace {

using namespace imgen_core;
using json = nlohmann::json;

constexpr std::array<uint8_t, 8> PNG_SIGNATURE = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
constexpr std::array<uint8_t, 2> JPEG_SIGNATURE = {0xFF, 0xD8};

// Signature followed by random filler; the parser only inspects the signature.
std::vector<uint8_t> make_image(std::span<const uint8_t> signature, size_t size, std::mt19937& rng) {
    std::vector<uint8_t> image(signature.begin(), signature.end());
    std::uniform_int_distribution<int> byte(0, 255);
    while (image.size() < size) {
        image.push_back(static_cast<uint8_t>(byte(rng)));
    }
    return image;
}

void append_frame(std::vector<uint8_t>& out, const json& record) {
    const std::vector<uint8_t> payload = json::to_msgpack(record);
    const auto length = static_cast<uint32_t>(payload.size());
    out.push_back(static_cast<uint8_t>(length >> 24));
    out.push_back(static_cast<uint8_t>(length >> 16));
    out.push_back(static_cast<uint8_t>(length >> 8));
    out.push_back(static_cast<uint8_t>(length));
    out.insert(out.end(), payload.begin(), payload.end());
}

// One sample of `steps` JPEG previews followed by a PNG final, sized like real responses.
std::vector<uint8_t> make_event_stream(int64_t steps, size_t preview_bytes, size_t final_bytes) {
    std::mt19937 rng(42);
    std::vector<uint8_t> stream;
    for (int64_t step = 0; step < steps; ++step) {
        append_frame(stream, {
            {"event_type", "intermediate"},
            {"samp_ix", 0},
            {"step_ix", step},
            {"gen_id", "bench"},
            {"sigma", 14.6 / static_cast<double>(step + 1)},
            {"image", json::binary(make_image(JPEG_SIGNATURE, preview_bytes, rng))},
        });
    }
    append_frame(stream, {
        {"event_type", "final"},
        {"samp_ix", 0},
        {"gen_id", "bench"},
        {"image", json::binary(make_image(PNG_SIGNATURE, final_bytes, rng))},
    });
    return stream;
}

static void BM_StreamEventParser_ChunkedFeed(benchmark::State& state) {
    const auto steps = state.range(0);
    const auto chunk_size = static_cast<size_t>(state.range(1));
    const std::vector<uint8_t> stream = make_event_stream(steps, 64 * 1024, 1536 * 1024);

    state.counters["StreamSize_MB"] = static_cast<double>(stream.size()) / (1024.0 * 1024.0);
    state.counters["ChunkSize_KB"] = static_cast<double>(chunk_size) / 1024.0;

    for (auto _ : state) {
        decoding::StreamEventParser parser;
        size_t events = 0;
        for (size_t offset = 0; offset < stream.size(); offset += chunk_size) {
            const size_t n = std::min(chunk_size, stream.size() - offset);
            events += parser.feed_chunk(std::span<const uint8_t>(stream.data() + offset, n)).size();
        }
        benchmark::DoNotOptimize(events);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * (steps + 1));
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(stream.size()));
}

static void BM_BatchEventParser_ExtractFinalImages(benchmark::State& state) {
    const auto steps = state.range(0);
    const std::vector<uint8_t> stream = make_event_stream(steps, 64 * 1024, 1536 * 1024);

    state.counters["StreamSize_MB"] = static_cast<double>(stream.size()) / (1024.0 * 1024.0);

    for (auto _ : state) {
        auto images = decoding::extract_final_images(stream);
        benchmark::DoNotOptimize(images.data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * (steps + 1));
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(stream.size()));
}

BENCHMARK(BM_StreamEventParser_ChunkedFeed)
    ->Args({28, 1024})
    ->Args({28, 16 * 1024})
    ->Args({28, 256 * 1024})
    ->Args({50, 16 * 1024})
    ->UseRealTime()
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_BatchEventParser_ExtractFinalImages)
    ->Arg(28)
    ->Arg(50)
    ->UseRealTime()
    ->Unit(benchmark::kMillisecond);

} // anonymous namespace
