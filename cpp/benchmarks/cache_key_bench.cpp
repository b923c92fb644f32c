#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include "waypoint/cache/cache_manager.hpp"

using waypoint::cache::InputDescriptor;

// Step-shaped key: scalar identity fields plus one input hash per prior run.
static std::vector<InputDescriptor> step_inputs(int prior_outputs) {
    std::vector<std::string> hashes;
    for (int i = 0; i < prior_outputs; ++i) {
        hashes.push_back(std::string(64, static_cast<char>('a' + (i % 6))));
    }
    return {InputDescriptor::scalar("agent", "Writer"),
            InputDescriptor::scalar("model", "model-large"),
            InputDescriptor::scalar("run", "0"),
            InputDescriptor::scalar("param.temperature", "0.7"),
            InputDescriptor::sequence("inputs", std::move(hashes))};
}

static void BM_CacheKey(benchmark::State& state) {
    const auto inputs = step_inputs(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        std::string key;
        waypoint::core::Status s = waypoint::cache::compute_cache_key("step", inputs, &key);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(key);
    }
}

BENCHMARK(BM_CacheKey)->Arg(0)->Arg(4)->Arg(64);

static void BM_CacheKeyUnorderedSet(benchmark::State& state) {
    std::vector<std::string> values;
    for (int i = 0; i < state.range(0); ++i) {
        values.push_back("resource_" + std::to_string(state.range(0) - i));
    }
    const std::vector<InputDescriptor> inputs = {InputDescriptor::set("resources", values)};
    for (auto _ : state) {
        std::string key;
        waypoint::core::Status s = waypoint::cache::compute_cache_key("step", inputs, &key);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(key);
    }
}

BENCHMARK(BM_CacheKeyUnorderedSet)->Arg(8)->Arg(256);
