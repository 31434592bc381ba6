/**
 * @file bench_range_streaming.cpp
 * @brief Benchmarks for streaming file ranges as RESPONSE frames
 */

#include <benchmark/benchmark.h>

#include <usb_responder/core/transfer_engine.h>

#include "utils/benchmark_helpers.h"

namespace usb_responder::benchmark {

namespace {

auto stream_whole_file(const file_catalog& catalog, transfer_engine& engine,
                       discard_transport& transport, ::benchmark::State& state) -> bool {
    const auto size = catalog.entries()[0].size;
    transfer_request request{0, 0, static_cast<uint32_t>(size)};

    auto reader = catalog.open_range_reader(0, 0, size);
    if (!reader.has_value()) {
        state.SkipWithError(reader.error().message.c_str());
        return false;
    }

    cancellation_token token;
    auto outcome = engine.stream(request, reader.value(), transport, token,
                                 [](const progress_event&) {});
    if (!outcome.has_value()) {
        state.SkipWithError(outcome.error().message.c_str());
        return false;
    }
    ::benchmark::DoNotOptimize(outcome.value().bytes_sent);
    return true;
}

}  // namespace

/**
 * @brief Benchmark streaming one file with varying segment sizes
 */
static void BM_StreamRange_SegmentSize(::benchmark::State& state) {
    const auto segment_size = static_cast<std::size_t>(state.range(0));
    const std::size_t file_size = sizes::medium_file;

    temp_file_manager temp_mgr;
    auto path = temp_mgr.create_random_file("stream_segment.bin", file_size, 42);
    file_catalog catalog({{path, file_size}});

    frame_codec codec;
    transfer_engine engine(codec, segment_config(segment_size));
    discard_transport transport;
    if (!transport.connect().has_value()) {
        state.SkipWithError("connect failed");
        return;
    }

    for (auto _ : state) {
        if (!stream_whole_file(catalog, engine, transport, state)) {
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * file_size));
    state.SetItemsProcessed(
        static_cast<int64_t>(state.iterations() * ((file_size + segment_size - 1) / segment_size)));
    state.SetLabel(format_bytes(segment_size) + " segments");
}
BENCHMARK(BM_StreamRange_SegmentSize)
    ->Arg(sizes::min_segment)
    ->Arg(sizes::small_segment)
    ->Arg(256 * sizes::KB)
    ->Arg(sizes::default_segment)
    ->Arg(sizes::max_segment)
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Benchmark streaming files of varying size with the default segment
 */
static void BM_StreamRange_FileSize(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_mgr;
    auto path = temp_mgr.create_random_file("stream_size.bin", file_size, 42);
    file_catalog catalog({{path, file_size}});

    frame_codec codec;
    transfer_engine engine(codec);
    discard_transport transport;
    if (!transport.connect().has_value()) {
        state.SkipWithError("connect failed");
        return;
    }

    for (auto _ : state) {
        if (!stream_whole_file(catalog, engine, transport, state)) {
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * file_size));
    state.SetLabel(format_bytes(file_size));
}
BENCHMARK(BM_StreamRange_FileSize)
    ->Arg(sizes::small_file)
    ->Arg(sizes::MB)
    ->Arg(sizes::medium_file)
    ->Arg(sizes::large_file)
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Benchmark opening a range reader and reading one small segment
 *
 * Models the per-request overhead of many small FILE_RANGE requests.
 */
static void BM_OpenRangeReader(::benchmark::State& state) {
    const std::size_t file_size = sizes::MB;
    const auto read_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_mgr;
    auto path = temp_mgr.create_random_file("open_reader.bin", file_size, 42);
    file_catalog catalog({{path, file_size}});

    std::vector<std::byte> buffer(read_size);
    uint64_t offset = 0;

    for (auto _ : state) {
        auto reader = catalog.open_range_reader(0, offset, read_size);
        if (!reader.has_value()) {
            state.SkipWithError(reader.error().message.c_str());
            return;
        }
        auto read = reader.value().read(buffer);
        if (!read.has_value()) {
            state.SkipWithError(read.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(read.value());
        offset = (offset + read_size) % (file_size - read_size);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * read_size));
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_OpenRangeReader)
    ->Arg(512)
    ->Arg(sizes::min_segment)
    ->Arg(sizes::small_segment)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace usb_responder::benchmark
