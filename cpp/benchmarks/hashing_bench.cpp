#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <benchmark/benchmark.h>

#include "waypoint/storage/hashing.hpp"

using waypoint::core::u8;

static std::vector<u8> pattern(size_t n) {
    std::vector<u8> buf(n);
    for (size_t i = 0; i < n; ++i) {
        buf[i] = static_cast<u8>(i & 0xffu);
    }
    return buf;
}

static void BM_HashCompute(benchmark::State& state) {
    const std::vector<u8> buf = pattern(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        waypoint::core::Hash256 out{};
        waypoint::core::Status s = waypoint::storage::hash_compute(waypoint::storage::as_view(buf), &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}

BENCHMARK(BM_HashCompute)->Arg(0)->Arg(64)->Arg(4096)->Arg(1 << 20);

// Same bytes fed in 4 KiB pieces.
static void BM_HasherStreaming(benchmark::State& state) {
    const std::vector<u8> buf = pattern(static_cast<size_t>(state.range(0)));
    constexpr size_t kChunk = 4096;

    for (auto _ : state) {
        waypoint::storage::Hasher h;
        for (size_t off = 0; off < buf.size(); off += kChunk) {
            const size_t n = std::min(kChunk, buf.size() - off);
            h.update(waypoint::storage::BufferView{buf.data() + off, static_cast<waypoint::core::u64>(n)});
        }
        waypoint::core::Hash256 out{};
        waypoint::core::Status s = h.finalize(&out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}

BENCHMARK(BM_HasherStreaming)->Arg(64 << 10)->Arg(1 << 20);

static void BM_HashToHex(benchmark::State& state) {
    waypoint::core::Hash256 h{};
    for (size_t i = 0; i < h.b.size(); ++i) {
        h.b[i] = static_cast<u8>(i * 7);
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(waypoint::storage::hash_to_hex(h));
    }
}

BENCHMARK(BM_HashToHex);
