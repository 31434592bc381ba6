/**
 * @file bench_frame_codec.cpp
 * @brief Benchmarks for frame encoding and decoding
 */

#include <benchmark/benchmark.h>

#include <usb_responder/core/frame_codec.h>

#include "utils/benchmark_helpers.h"

namespace usb_responder::benchmark {

/**
 * @brief Benchmark encoding RESPONSE frames into a reused buffer
 */
static void BM_EncodeInto_Response(::benchmark::State& state) {
    const auto payload_size = static_cast<std::size_t>(state.range(0));
    auto payload = test_data_generator::generate_random_data(payload_size, 42);

    frame_codec codec;
    std::vector<std::byte> out;

    for (auto _ : state) {
        codec.encode_into(out, frame_type::response, command_id::file_range, payload);
        ::benchmark::DoNotOptimize(out.data());
        ::benchmark::ClobberMemory();
    }

    state.SetBytesProcessed(
        static_cast<int64_t>(state.iterations() * (payload_size + frame_header::size)));
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_EncodeInto_Response)
    ->Arg(0)
    ->Arg(sizes::min_segment)
    ->Arg(sizes::small_segment)
    ->Arg(sizes::default_segment);

/**
 * @brief Benchmark encoding RESPONSE frames into a fresh buffer each time
 */
static void BM_Encode_Response(::benchmark::State& state) {
    const auto payload_size = static_cast<std::size_t>(state.range(0));
    auto payload = test_data_generator::generate_random_data(payload_size, 42);

    frame_codec codec;

    for (auto _ : state) {
        auto bytes = codec.encode(frame_type::response, command_id::file_range, payload);
        ::benchmark::DoNotOptimize(bytes.data());
    }

    state.SetBytesProcessed(
        static_cast<int64_t>(state.iterations() * (payload_size + frame_header::size)));
}
BENCHMARK(BM_Encode_Response)
    ->Arg(sizes::min_segment)
    ->Arg(sizes::small_segment)
    ->Arg(sizes::default_segment);

/**
 * @brief Benchmark decoding a FILE_RANGE request and its payload
 */
static void BM_Decode_FileRangeRequest(::benchmark::State& state) {
    frame_codec codec;
    auto bytes = codec.encode(frame_type::request, command_id::file_range,
                              frame_codec::encode_transfer_request({3, 1024 * 1024, 65536}));

    for (auto _ : state) {
        memory_byte_source source(bytes);
        auto decoded = codec.decode(source);
        if (!decoded.has_value()) {
            state.SkipWithError(decoded.error().message.c_str());
            return;
        }
        auto request = frame_codec::decode_transfer_request(decoded.value().payload);
        if (!request.has_value()) {
            state.SkipWithError(request.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(request.value().length);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Decode_FileRangeRequest);

/**
 * @brief Benchmark decoding a batch of back-to-back small requests
 */
static void BM_Decode_RequestBatch(::benchmark::State& state) {
    const auto frame_count = static_cast<std::size_t>(state.range(0));

    frame_codec codec;
    std::vector<std::byte> batch;
    for (std::size_t i = 0; i < frame_count; ++i) {
        auto bytes = codec.encode(frame_type::request, command_id::file_size,
                                  frame_codec::encode_u32(static_cast<uint32_t>(i)));
        batch.insert(batch.end(), bytes.begin(), bytes.end());
    }

    for (auto _ : state) {
        memory_byte_source source(batch);
        for (std::size_t i = 0; i < frame_count; ++i) {
            auto decoded = codec.decode(source);
            if (!decoded.has_value()) {
                state.SkipWithError(decoded.error().message.c_str());
                return;
            }
            ::benchmark::DoNotOptimize(decoded.value().header.payload_length);
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * batch.size()));
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * frame_count));
}
BENCHMARK(BM_Decode_RequestBatch)->Arg(1)->Arg(16)->Arg(256);

}  // namespace usb_responder::benchmark
