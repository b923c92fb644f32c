#include <string>

#include <benchmark/benchmark.h>

#include "waypoint/workflow/snapshot.hpp"

using namespace waypoint::workflow;
using namespace waypoint::core;

// Snapshot of a workflow with `steps` steps, all completed, three runs each.
static StateSnapshot make_snapshot(u32 steps) {
    StateSnapshot snap;
    snap.session_id = "session_20240102_030405_0a1b2c3d";
    snap.status = SnapshotStatus::Completed;
    snap.completed_step_index = steps;
    snap.current_step = steps;
    for (u32 i = 1; i <= steps; ++i) {
        WorkflowStep step;
        step.agent = "Agent" + std::to_string(i);
        step.runs = 3;
        snap.workflow.push_back(step);
        for (u32 r = 0; r < 3; ++r) {
            Hash256 h{};
            h.b[0] = static_cast<u8>(i);
            h.b[1] = static_cast<u8>(r);
            snap.step_outputs[i].push_back(h);
        }
    }
    return snap;
}

static void BM_SnapshotToJson(benchmark::State& state) {
    const StateSnapshot snap = make_snapshot(static_cast<u32>(state.range(0)));
    for (auto _ : state) {
        std::string text;
        Status s = snapshot_to_json(snap, &text);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(text.data());
    }
}
BENCHMARK(BM_SnapshotToJson)->Arg(4)->Arg(64);

static void BM_SnapshotFromJson(benchmark::State& state) {
    std::string text;
    if (!is_ok(snapshot_to_json(make_snapshot(static_cast<u32>(state.range(0))), &text))) {
        state.SkipWithError("Serialize failed");
        return;
    }
    for (auto _ : state) {
        StateSnapshot snap;
        Status s = snapshot_from_json(text, &snap);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(snap.workflow.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_SnapshotFromJson)->Arg(4)->Arg(64);

static void BM_ResumeStepFromFilename(benchmark::State& state) {
    const std::string names[] = {"state_after_step_12_Reviewer.json", "state_step_7_partial.json", "notes.json"};
    for (auto _ : state) {
        for (const auto& n : names) {
            benchmark::DoNotOptimize(determine_resume_step(n));
        }
    }
}
BENCHMARK(BM_ResumeStepFromFilename);
