#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "waypoint/core/errors.hpp"
#include "waypoint/core/models.hpp"
#include "waypoint/workflow/snapshot.hpp"

namespace waypoint::workflow {

// NoStateFound, CorruptedState, NoWorkflow and InvalidStep block
// resumption; every other strategy is advisory.
enum class ResumeStrategy : u8 {
    NoStateFound = 0,
    CorruptedState,
    NoWorkflow,
    InvalidStep,
    Continue,
    WorkflowChanged,
    ResourceWarnings,
    WorkflowChangedWithResourceWarnings,
    NoRemainingSteps,
};

[[nodiscard]] const char* resume_strategy_name(ResumeStrategy s) noexcept;

struct WorkflowChange {
    u32 step{0};  // first 1-based step the change touches
    std::string message;
};

struct ResumeAnalysis {
    bool can_resume{false};
    std::filesystem::path state_file;
    u32 resume_step{0};
    u32 total_steps{0};
    std::vector<std::string> workflow_changes;   // at or before the resume step
    std::vector<std::string> upcoming_changes;   // after the resume step; informational
    std::vector<std::string> resource_warnings;
    ResumeStrategy strategy{ResumeStrategy::NoStateFound};
    std::string user_guidance;
    bool state_integrity{false};
    std::vector<std::string> completed_steps;    // "Step i: Agent"
    std::vector<std::string> remaining_steps;
    std::optional<StateSnapshot> snapshot;        // set whenever the state file parsed
};

struct ResumeRequest {
    // Searched when no explicit file is given: the session's state
    // directory, or every session under sessions_root when session_dir is empty.
    std::filesystem::path sessions_root;
    std::filesystem::path session_dir;
    std::optional<std::filesystem::path> state_file;
    std::optional<u32> from_step;
    // Live experiment configuration; nullopt when it could not be loaded.
    std::optional<waypoint::core::Workflow> current_workflow;
};

// Every agent/model/runs/length difference, in step order:
//   "Workflow length changed: was 3 steps, now 4 steps"
//   "Step 2 agent changed: was B, now D"
//   "Step 2 model changed: was m1, now m2"   (only when both name a model)
//   "Step 2 runs changed: was 1, now 3"
[[nodiscard]] std::vector<WorkflowChange> diff_workflows(const waypoint::core::Workflow& original,
                                                         const waypoint::core::Workflow& current);

// "<label> not found: <path>" for each recorded resource that no longer
// exists. Relative paths resolve against the snapshot's project_root.
[[nodiscard]] std::vector<std::string> validate_resources(const StateSnapshot& snap);

// One of four fixed texts chosen by (changes present, warnings present).
[[nodiscard]] std::string resume_guidance(const std::vector<std::string>& workflow_changes,
                                          const std::vector<std::string>& resource_warnings);

[[nodiscard]] bool resume_strategy_blocks(ResumeStrategy s) noexcept;

// Read-only: never writes to the session. Findings are data; the call
// fails only on bad arguments, directory I/O errors or allocation failure.
class ResumptionAnalyzer {
public:
    [[nodiscard]] waypoint::core::Status analyze(const ResumeRequest& request, ResumeAnalysis* out) const noexcept;
};

} // namespace waypoint::workflow
