#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>

#include "test_support.hpp"
#include "waypoint/storage/hashing.hpp"
#include "waypoint/storage/layout.hpp"
#include "waypoint/workflow/snapshot.hpp"

using namespace waypoint::workflow;
using namespace waypoint::core;
namespace fs = std::filesystem;

namespace {

Workflow three_steps() {
    Workflow wf(3);
    wf[0].agent = "AgentA";
    wf[1].agent = "AgentB";
    wf[1].model = "m1";
    wf[1].runs = 2;
    wf[2].agent = "Agent C";
    return wf;
}

StateSnapshot sample_snapshot() {
    StateSnapshot snap;
    snap.session_id = "s1";
    snap.status = SnapshotStatus::Completed;
    snap.completed_step_index = 1;
    snap.current_step = 1;
    snap.workflow = three_steps();
    Hash256 h{};
    EXPECT_EQ(waypoint::storage::hash_compute(waypoint::storage::as_view("out"), &h).code, StatusCode::Ok);
    snap.step_outputs[1] = {h, h};
    snap.resources = {{"Framework file", "framework.md"}};
    snap.project_root = "/project";
    snap.created_at = 1234;
    return snap;
}

void set_mtime(const fs::path& p, int seconds_ago) {
    fs::last_write_time(p, fs::file_time_type::clock::now() - std::chrono::seconds(seconds_ago));
}

} // namespace

// ============================================================================
// Naming and resume arithmetic
// ============================================================================

TEST(SnapshotNaming, FileNames) {
    EXPECT_EQ(partial_snapshot_filename(2), "state_step_2_partial.json");
    EXPECT_EQ(completed_snapshot_filename(1, "AgentX"), "state_after_step_1_AgentX.json");
    EXPECT_EQ(completed_snapshot_filename(3, "Agent C/v2"), "state_after_step_3_Agent_C_v2.json");
    EXPECT_EQ(sanitize_agent_name(""), "step");
}

TEST(SnapshotNaming, ResumeArithmetic) {
    EXPECT_EQ(determine_resume_step("state_after_step_1_AgentX"), 2u);
    EXPECT_EQ(determine_resume_step("state_after_step_1_AgentX.json"), 2u);
    EXPECT_EQ(determine_resume_step("state_step_1_partial"), 1u);
    EXPECT_EQ(determine_resume_step("state_step_3_partial.json"), 3u);
    EXPECT_EQ(determine_resume_step("something_else.json"), 1u);
    EXPECT_EQ(determine_resume_step(""), 1u);
}

TEST(SnapshotNaming, ParseFailuresFallBackToStepOne) {
    EXPECT_EQ(parse_snapshot_filename("state_step_x_partial.json").kind, SnapshotNameKind::Unrecognized);
    EXPECT_EQ(parse_snapshot_filename("state_after_step_2.json").kind, SnapshotNameKind::Unrecognized);
    EXPECT_EQ(parse_snapshot_filename("state_step_99999999999_partial.json").kind, SnapshotNameKind::Unrecognized);
    EXPECT_EQ(determine_resume_step("state_step_0_partial.json"), 1u);
}

TEST(SnapshotNaming, PatternIsFoundAnywhereInTheName) {
    const SnapshotName n = parse_snapshot_filename("backup_state_after_step_4_Agent.json");
    EXPECT_EQ(n.kind, SnapshotNameKind::Completed);
    EXPECT_EQ(n.step, 4u);

    // The partial form wins when both appear.
    const SnapshotName both = parse_snapshot_filename("state_after_step_2_state_step_5_partial.json");
    EXPECT_EQ(both.kind, SnapshotNameKind::Partial);
    EXPECT_EQ(both.step, 5u);
}

TEST(SnapshotNaming, GeneratedNamesParseBack) {
    for (u32 step : {1u, 7u, 120u}) {
        EXPECT_EQ(determine_resume_step(partial_snapshot_filename(step)), step);
        EXPECT_EQ(determine_resume_step(completed_snapshot_filename(step, "Some Agent")), step + 1);
    }
}

// ============================================================================
// Serialization
// ============================================================================

TEST(SnapshotJson, WriteThenLoad) {
    waypoint::test::TempDir dir;
    const StateSnapshot snap = sample_snapshot();

    fs::path written;
    std::string body;
    ASSERT_EQ(write_snapshot(dir.path(), snap, &written, &body).code, StatusCode::Ok);
    EXPECT_EQ(written.filename(), "state_after_step_1_AgentA.json");
    EXPECT_EQ(waypoint::test::read_text(written), body);

    StateSnapshot back;
    ASSERT_EQ(load_snapshot(written, &back).code, StatusCode::Ok);
    EXPECT_EQ(back.session_id, "s1");
    EXPECT_EQ(back.status, SnapshotStatus::Completed);
    EXPECT_EQ(back.completed_step_index, 1u);
    ASSERT_EQ(back.workflow.size(), 3u);
    EXPECT_EQ(back.workflow[1].model, "m1");
    EXPECT_EQ(back.workflow[1].runs, 2u);
    ASSERT_EQ(back.step_outputs.count(1), 1u);
    EXPECT_EQ(back.step_outputs.at(1), snap.step_outputs.at(1));
    ASSERT_EQ(back.resources.size(), 1u);
    EXPECT_EQ(back.resources[0].label, "Framework file");
    EXPECT_EQ(back.project_root, "/project");
}

TEST(SnapshotJson, PartialSnapshotIsNamedByCurrentStep) {
    waypoint::test::TempDir dir;
    StateSnapshot snap = sample_snapshot();
    snap.status = SnapshotStatus::InProgress;
    snap.current_step = 2;

    fs::path written;
    ASSERT_EQ(write_snapshot(dir.path(), snap, &written).code, StatusCode::Ok);
    EXPECT_EQ(written.filename(), "state_step_2_partial.json");
}

TEST(SnapshotJson, RejectsCorruptDocuments) {
    StateSnapshot out;
    EXPECT_EQ(snapshot_from_json("{ not json", &out).code, StatusCode::Corrupt);
    EXPECT_EQ(snapshot_from_json("[]", &out).code, StatusCode::Corrupt);
    EXPECT_EQ(snapshot_from_json(R"({"session_id":"s"})", &out).code, StatusCode::Corrupt);
    EXPECT_EQ(snapshot_from_json(R"({"schema_version":1,"session_id":"s","status":"paused",
                                     "completed_step_index":0,"current_step":1,"workflow":[]})", &out).code,
              StatusCode::Corrupt);
    EXPECT_EQ(snapshot_from_json(R"({"schema_version":1,"session_id":"s","status":"completed",
                                     "completed_step_index":1,"current_step":1,"workflow":[{"agent":"A"}],
                                     "step_outputs":{"1":["nothex"]}})", &out).code,
              StatusCode::Corrupt);
}

TEST(SnapshotJson, StepIndicesBeyondU32AreCorrupt) {
    StateSnapshot out;
    Status s = snapshot_from_json(R"({"schema_version":1,"session_id":"s","status":"completed",
                                      "completed_step_index":4294967296,"current_step":1,
                                      "workflow":[{"agent":"A"}]})", &out);
    EXPECT_EQ(s.domain, StatusDomain::Workflow);
    EXPECT_EQ(s.code, StatusCode::Corrupt);

    s = snapshot_from_json(R"({"schema_version":1,"session_id":"s","status":"in_progress",
                               "completed_step_index":0,"current_step":4294967297,
                               "workflow":[{"agent":"A"}]})", &out);
    EXPECT_EQ(s.domain, StatusDomain::Workflow);
    EXPECT_EQ(s.code, StatusCode::Corrupt);

    s = snapshot_from_json(R"({"schema_version":4294967297,"session_id":"s"})", &out);
    EXPECT_EQ(s.code, StatusCode::Corrupt);

    ASSERT_EQ(snapshot_from_json(R"({"schema_version":1,"session_id":"s","status":"completed",
                                     "completed_step_index":4294967295,"current_step":4294967295,
                                     "workflow":[{"agent":"A"}]})", &out).code,
              StatusCode::Ok);
    EXPECT_EQ(out.completed_step_index, 4294967295u);
    EXPECT_EQ(out.current_step, 4294967295u);
}

TEST(SnapshotJson, NewerSchemaIsUnsupported) {
    StateSnapshot out;
    const Status s = snapshot_from_json(R"({"schema_version":99,"session_id":"s"})", &out);
    EXPECT_EQ(s.code, StatusCode::Unsupported);
    EXPECT_EQ(s.aux, 99u);
}

TEST(SnapshotJson, LoadMissingIsNotFound) {
    waypoint::test::TempDir dir;
    StateSnapshot out;
    EXPECT_EQ(load_snapshot(dir.path() / "nope.json", &out).code, StatusCode::NotFound);
}

// ============================================================================
// Discovery
// ============================================================================

TEST(SnapshotDiscovery, NewestByModificationTime) {
    waypoint::test::TempDir dir;
    const fs::path state = dir.path() / "state";
    waypoint::test::write_text(state / "state_after_step_1_A.json", "{}");
    waypoint::test::write_text(state / "state_step_2_partial.json", "{}");
    waypoint::test::write_text(state / "notes.txt", "ignored");
    set_mtime(state / "state_after_step_1_A.json", 20);
    set_mtime(state / "state_step_2_partial.json", 10);

    fs::path latest;
    ASSERT_EQ(find_latest_snapshot_in(state, &latest).code, StatusCode::Ok);
    EXPECT_EQ(latest.filename(), "state_step_2_partial.json");

    set_mtime(state / "state_after_step_1_A.json", 5);
    ASSERT_EQ(find_latest_snapshot_in(state, &latest).code, StatusCode::Ok);
    EXPECT_EQ(latest.filename(), "state_after_step_1_A.json");
}

TEST(SnapshotDiscovery, EqualTimesPreferLaterResumeStep) {
    waypoint::test::TempDir dir;
    const fs::path state = dir.path() / "state";
    waypoint::test::write_text(state / "state_step_2_partial.json", "{}");
    waypoint::test::write_text(state / "state_after_step_2_B.json", "{}");
    const auto t = fs::file_time_type::clock::now() - std::chrono::seconds(30);
    fs::last_write_time(state / "state_step_2_partial.json", t);
    fs::last_write_time(state / "state_after_step_2_B.json", t);

    fs::path latest;
    ASSERT_EQ(find_latest_snapshot_in(state, &latest).code, StatusCode::Ok);
    EXPECT_EQ(latest.filename(), "state_after_step_2_B.json");
}

TEST(SnapshotDiscovery, AcrossSessionsAndEmpty) {
    waypoint::test::TempDir dir;
    fs::path latest;
    EXPECT_EQ(find_latest_snapshot(dir.path(), &latest).code, StatusCode::NotFound);
    EXPECT_EQ(find_latest_snapshot_in(dir.path() / "missing", &latest).code, StatusCode::NotFound);

    const fs::path a = waypoint::storage::session_state_dir(dir.path() / "a");
    const fs::path b = waypoint::storage::session_state_dir(dir.path() / "b");
    waypoint::test::write_text(a / "state_after_step_1_A.json", "{}");
    waypoint::test::write_text(b / "state_after_step_1_A.json", "{}");
    set_mtime(a / "state_after_step_1_A.json", 50);
    set_mtime(b / "state_after_step_1_A.json", 40);

    ASSERT_EQ(find_latest_snapshot(dir.path(), &latest).code, StatusCode::Ok);
    EXPECT_EQ(latest, b / "state_after_step_1_A.json");
}
