#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "waypoint/core/errors.hpp"
#include "waypoint/core/models.hpp"
#include "waypoint/workflow/snapshot.hpp"
#include "waypoint/workflow/step_handler.hpp"

namespace waypoint::storage {
class ArtifactStore;
}
namespace waypoint::cache {
class CacheManager;
}
namespace waypoint::audit {
class AuditLog;
}

namespace waypoint::workflow {

using i64 = waypoint::core::i64;

struct OrchestratorOptions {
    u32 max_concurrency{4};
    bool use_cache{true};
    // Called after step N's outputs are persisted and before its completed
    // snapshot is written. A non-Ok return stops the run right there, as a
    // crash at that point would.
    std::function<waypoint::core::Status(u32 step)> after_outputs_persisted;
};

struct SessionContext {
    std::string session_id;
    std::filesystem::path session_root;
    std::vector<waypoint::core::ResourceRef> resources;
    std::string project_root;
};

struct StepReport {
    u32 step{0};
    std::string agent;
    i64 duration_ms{0};
    bool cache_hit{false};  // every run came from the cache
    std::vector<waypoint::core::Hash256> outputs;
    u32 failed_runs{0};
};

struct RunReport {
    std::string session_id;
    u32 start_step{1};
    u32 completed_through{0};
    std::vector<StepReport> steps;
    bool halted{false};
    u32 failed_step{0};
    std::string failure_detail;
    std::filesystem::path last_snapshot;
    StepOutputs outputs;
    waypoint::core::u64 audit_errors{0};  // events the audit log refused
};

// Runs a workflow one step at a time. Per step:
//   partial snapshot -> handler runs (fan-out) -> outputs persisted ->
//   completed snapshot -> next step
// A failed step halts the run with {StepFailed, Workflow, aux = step} and
// leaves its partial snapshot as the newest state.
class Orchestrator {
public:
    Orchestrator(waypoint::storage::ArtifactStore& store,
                 waypoint::cache::CacheManager& cache,
                 waypoint::audit::AuditLog& audit,
                 const HandlerRegistry& handlers,
                 OrchestratorOptions options = {});

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    [[nodiscard]] waypoint::core::Status run(const SessionContext& session,
                                             const waypoint::core::Workflow& workflow,
                                             RunReport* report) noexcept;

    // Continues at `resume_step` with `prior` holding the outputs of the
    // steps before it (from the resumed snapshot). Prior output hashes must
    // still be retrievable from the store.
    [[nodiscard]] waypoint::core::Status resume(const SessionContext& session,
                                                const waypoint::core::Workflow& workflow,
                                                u32 resume_step,
                                                const StepOutputs& prior,
                                                RunReport* report) noexcept;

private:
    [[nodiscard]] waypoint::core::Status run_from(const SessionContext& session,
                                                  const waypoint::core::Workflow& workflow,
                                                  u32 start_step,
                                                  StepOutputs outputs,
                                                  RunReport* report);

    [[nodiscard]] waypoint::core::Status execute_step(const SessionContext& session,
                                                      const waypoint::core::WorkflowStep& step,
                                                      u32 step_index,
                                                      const StepOutputs& outputs,
                                                      StepReport* step_report,
                                                      std::string* failure_detail);

    [[nodiscard]] waypoint::core::Status write_state(const SessionContext& session,
                                                     const waypoint::core::Workflow& workflow,
                                                     SnapshotStatus status,
                                                     u32 step_index,
                                                     const StepOutputs& outputs,
                                                     std::filesystem::path* written);

    void record(std::string_view event_type, const nlohmann::json& payload) noexcept;

    waypoint::storage::ArtifactStore& store_;
    waypoint::cache::CacheManager& cache_;
    waypoint::audit::AuditLog& audit_;
    const HandlerRegistry& handlers_;
    OrchestratorOptions options_;
    waypoint::core::u64 audit_errors_{0};
};

} // namespace waypoint::workflow
