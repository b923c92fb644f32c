#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "waypoint/core/errors.hpp"
#include "waypoint/core/models.hpp"
#include "waypoint/core/types.hpp"

namespace waypoint::workflow {

using u8 = waypoint::core::u8;
using u32 = waypoint::core::u32;

inline constexpr u32 kSnapshotSchemaVersion = 1;
inline constexpr const char* kSnapshotExtension = ".json";

enum class SnapshotStatus : u8 {
    InProgress = 0,  // written before step `current_step` runs
    Completed = 1,   // written after step `current_step` persisted its outputs
};

[[nodiscard]] const char* snapshot_status_name(SnapshotStatus s) noexcept;

// Step outputs by reference, keyed by 1-based step index. One hash per run.
using StepOutputs = std::map<u32, std::vector<waypoint::core::Hash256>>;

struct StateSnapshot {
    std::string session_id;
    SnapshotStatus status{SnapshotStatus::InProgress};
    u32 completed_step_index{0};
    u32 current_step{0};
    waypoint::core::Workflow workflow;
    StepOutputs step_outputs;
    std::vector<waypoint::core::ResourceRef> resources;
    std::string project_root;
    waypoint::core::Timestamp created_at{0};
};

// ============================================================================
// File naming
// ============================================================================
//
// state_step_<N>_partial.json        in progress at step N   -> resume at N
// state_after_step_<N>_<agent>.json  completed through step N -> resume at N+1
// anything else                                                 -> resume at 1

enum class SnapshotNameKind : u8 {
    Unrecognized = 0,
    Partial = 1,
    Completed = 2,
};

struct SnapshotName {
    SnapshotNameKind kind{SnapshotNameKind::Unrecognized};
    u32 step{0};
};

// Characters outside [A-Za-z0-9_-] become '_'; an empty name becomes "step".
[[nodiscard]] std::string sanitize_agent_name(std::string_view agent);

[[nodiscard]] std::string partial_snapshot_filename(u32 step);
[[nodiscard]] std::string completed_snapshot_filename(u32 step, std::string_view agent);

// Searches the bare filename for either convention; the partial form wins
// when both appear.
[[nodiscard]] SnapshotName parse_snapshot_filename(std::string_view filename) noexcept;

[[nodiscard]] u32 determine_resume_step(std::string_view filename) noexcept;

// ============================================================================
// Serialization
// ============================================================================

[[nodiscard]] waypoint::core::Status snapshot_to_json(const StateSnapshot& snap, std::string* out) noexcept;

// {Corrupt, Workflow} for unparsable text or a document missing required
// fields; {Unsupported, Workflow} for a newer schema_version.
[[nodiscard]] waypoint::core::Status snapshot_from_json(std::string_view text, StateSnapshot* out) noexcept;

// Writes the snapshot under `state_dir` with the name its status implies
// (temp file, fsync, rename). Re-running a step replaces its earlier file
// of the same name as a whole; no file is modified in place. `body`, if
// given, receives the serialized document.
[[nodiscard]] waypoint::core::Status write_snapshot(const std::filesystem::path& state_dir,
                                                   const StateSnapshot& snap,
                                                   std::filesystem::path* written,
                                                   std::string* body = nullptr) noexcept;

// {NotFound, Workflow} if the file is absent, otherwise as snapshot_from_json.
[[nodiscard]] waypoint::core::Status load_snapshot(const std::filesystem::path& path, StateSnapshot* out) noexcept;

// ============================================================================
// Discovery
// ============================================================================

// Newest *.json snapshot in one state directory by modification time; ties
// go to the file with the later resume step. {NotFound, Workflow} if none.
[[nodiscard]] waypoint::core::Status find_latest_snapshot_in(const std::filesystem::path& state_dir,
                                                             std::filesystem::path* out) noexcept;

// Same rule across every <sessions_root>/<session>/state directory.
[[nodiscard]] waypoint::core::Status find_latest_snapshot(const std::filesystem::path& sessions_root,
                                                          std::filesystem::path* out) noexcept;

} // namespace waypoint::workflow
