#include "waypoint/workflow/orchestrator.hpp"
#include "waypoint/audit/audit_log.hpp"
#include "waypoint/cache/cache_manager.hpp"
#include "waypoint/storage/artifact_store.hpp"
#include "waypoint/storage/hashing.hpp"
#include "waypoint/storage/layout.hpp"
#include "waypoint/workflow/fanout.hpp"

#include <chrono>
#include <exception>
#include <new>

namespace waypoint::workflow {

using namespace waypoint::core;
using json = nlohmann::json;
using waypoint::cache::InputDescriptor;
using waypoint::storage::hash_to_hex;

namespace {
    [[nodiscard]] Status step_failed(u32 step) noexcept {
        return make_status(StatusDomain::Workflow, StatusCode::StepFailed, step);
    }

    json hashes_to_json(const std::vector<Hash256>& hashes) {
        json arr = json::array();
        for (const auto& h : hashes) {
            arr.push_back(hash_to_hex(h));
        }
        return arr;
    }

    // Per-run slot filled by exactly one fan-out task.
    struct RunResult {
        Hash256 hash{};
        bool ok{false};
        bool cache_hit{false};
        std::string detail;
    };
}

Orchestrator::Orchestrator(waypoint::storage::ArtifactStore& store,
                           waypoint::cache::CacheManager& cache,
                           waypoint::audit::AuditLog& audit,
                           const HandlerRegistry& handlers,
                           OrchestratorOptions options)
    : store_(store), cache_(cache), audit_(audit), handlers_(handlers), options_(std::move(options)) {}

void Orchestrator::record(std::string_view event_type, const json& payload) noexcept {
    const Status s = audit_.append(audit::kComponentOrchestrator, event_type, payload);
    if (!is_ok(s)) {
        ++audit_errors_;
    }
}

Status Orchestrator::run(const SessionContext& session, const Workflow& workflow, RunReport* report) noexcept {
    if (!report) {
        return make_status(StatusDomain::Workflow, StatusCode::Invalid);
    }
    try {
        return run_from(session, workflow, 1, StepOutputs{}, report);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Workflow, StatusCode::Unavailable);
    } catch (const json::exception&) {
        return make_status(StatusDomain::Workflow, StatusCode::Corrupt);
    }
}

Status Orchestrator::resume(const SessionContext& session,
                            const Workflow& workflow,
                            u32 resume_step,
                            const StepOutputs& prior,
                            RunReport* report) noexcept {
    if (!report) {
        return make_status(StatusDomain::Workflow, StatusCode::Invalid);
    }
    if (resume_step < 1 || resume_step > workflow.size() + 1) {
        return make_status(StatusDomain::Workflow, StatusCode::Invalid, resume_step);
    }

    try {
        // Outputs recorded for the resume step or later are recomputed.
        StepOutputs kept;
        for (const auto& [step, hashes] : prior) {
            if (step < resume_step) {
                kept.emplace(step, hashes);
            }
        }
        record("session_resumed", {{"session_id", session.session_id}, {"resume_step", resume_step}});
        return run_from(session, workflow, resume_step, std::move(kept), report);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Workflow, StatusCode::Unavailable);
    } catch (const json::exception&) {
        return make_status(StatusDomain::Workflow, StatusCode::Corrupt);
    }
}

Status Orchestrator::run_from(const SessionContext& session,
                              const Workflow& workflow,
                              u32 start_step,
                              StepOutputs outputs,
                              RunReport* report) {
    if (session.session_id.empty() || session.session_root.empty()) {
        return make_status(StatusDomain::Workflow, StatusCode::Invalid);
    }
    if (workflow.empty()) {
        return make_status(StatusDomain::Workflow, StatusCode::Invalid);
    }

    *report = RunReport{};
    report->session_id = session.session_id;
    report->start_step = start_step;
    report->completed_through = start_step - 1;
    audit_errors_ = 0;

    const u32 total = static_cast<u32>(workflow.size());
    record("run_started", {{"session_id", session.session_id}, {"start_step", start_step}, {"total_steps", total}});

    for (u32 n = start_step; n <= total; ++n) {
        const WorkflowStep& step = workflow[n - 1];

        // In-progress marker first: a crash from here until the completed
        // snapshot lands resumes at this step.
        Status s = write_state(session, workflow, SnapshotStatus::InProgress, n, outputs, &report->last_snapshot);
        if (!is_ok(s)) {
            report->outputs = outputs;
            report->audit_errors = audit_errors_;
            return s;
        }
        record("step_started", {{"step", n}, {"agent", step.agent}, {"runs", step.runs}});

        StepReport step_report;
        std::string failure_detail;
        const auto started = std::chrono::steady_clock::now();
        s = execute_step(session, step, n, outputs, &step_report, &failure_detail);
        step_report.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                      std::chrono::steady_clock::now() - started)
                                      .count();

        if (!is_ok(s)) {
            record("step_failed", {{"step", n},
                                   {"agent", step.agent},
                                   {"duration_ms", step_report.duration_ms},
                                   {"detail", failure_detail},
                                   {"code", status_code_name(s.code)},
                                   {"domain", status_domain_name(s.domain)}});
            report->halted = true;
            report->failed_step = n;
            report->failure_detail = std::move(failure_detail);
            report->steps.push_back(std::move(step_report));
            report->outputs = outputs;
            report->audit_errors = audit_errors_;
            return s.code == StatusCode::StepFailed ? step_failed(n) : s;
        }

        outputs[n] = step_report.outputs;

        if (options_.after_outputs_persisted) {
            s = options_.after_outputs_persisted(n);
            if (!is_ok(s)) {
                report->halted = true;
                report->failed_step = n;
                report->outputs = outputs;
                report->audit_errors = audit_errors_;
                return s;
            }
        }

        s = write_state(session, workflow, SnapshotStatus::Completed, n, outputs, &report->last_snapshot);
        if (!is_ok(s)) {
            report->halted = true;
            report->failed_step = n;
            report->outputs = outputs;
            report->audit_errors = audit_errors_;
            return s;
        }

        record("step_completed", {{"step", n},
                                  {"agent", step.agent},
                                  {"duration_ms", step_report.duration_ms},
                                  {"cache_hit", step_report.cache_hit},
                                  {"failed_runs", step_report.failed_runs},
                                  {"outputs", hashes_to_json(step_report.outputs)}});

        report->completed_through = n;
        report->steps.push_back(std::move(step_report));
    }

    record("run_completed", {{"session_id", session.session_id}, {"completed_through", report->completed_through}});
    report->outputs = std::move(outputs);
    report->audit_errors = audit_errors_;
    return ok_status();
}

Status Orchestrator::execute_step(const SessionContext& session,
                                  const WorkflowStep& step,
                                  u32 step_index,
                                  const StepOutputs& outputs,
                                  StepReport* step_report,
                                  std::string* failure_detail) {
    step_report->step = step_index;
    step_report->agent = step.agent;

    StepHandler* handler = handlers_.find(step.agent);
    if (!handler) {
        *failure_detail = "no handler registered for agent " + step.agent;
        return step_failed(step_index);
    }

    // Accumulated outputs of every earlier step, in step then run order.
    std::vector<std::vector<u8>> inputs;
    std::vector<std::string> input_hashes;
    for (const auto& [prior_step, hashes] : outputs) {
        if (prior_step >= step_index) {
            break;
        }
        for (const auto& h : hashes) {
            std::vector<u8> bytes;
            Status s = store_.get(h, &bytes);
            if (!is_ok(s)) {
                *failure_detail = "input artifact " + hash_to_hex(h) + " from step " + std::to_string(prior_step) +
                                  " is unavailable";
                return s;
            }
            inputs.push_back(std::move(bytes));
            input_hashes.push_back(hash_to_hex(h));
        }
    }

    const u32 runs = step.runs == 0 ? 1 : step.runs;
    std::vector<RunResult> results(runs);

    auto run_one = [&](u32 run) -> Status {
        RunResult& slot = results[run];

        ArtifactMeta meta;
        meta.artifact_type = ArtifactType::StepOutput;
        meta.producer = step.agent;
        meta.tags["session"] = session.session_id;
        meta.tags["step"] = std::to_string(step_index);
        meta.tags["run"] = std::to_string(run);

        StepContext ctx;
        ctx.session_id = session.session_id;
        ctx.step_index = step_index;
        ctx.run_index = run;
        ctx.runs = runs;

        auto compute = [&](std::vector<u8>* out) -> Status {
            StepOutcome outcome;
            Status hs = handler->invoke(step, ctx, inputs, &outcome);
            if (!is_ok(hs)) {
                slot.detail = outcome.error_detail.empty() ? status_code_name(hs.code) : outcome.error_detail;
                return step_failed(step_index);
            }
            if (!outcome.success) {
                slot.detail = outcome.error_detail.empty() ? "step handler reported failure" : outcome.error_detail;
                return step_failed(step_index);
            }
            *out = std::move(outcome.output);
            return ok_status();
        };

        if (!options_.use_cache) {
            std::vector<u8> payload;
            Status s = compute(&payload);
            if (!is_ok(s)) {
                return s;
            }
            waypoint::storage::PutResult put{};
            s = store_.put(waypoint::storage::as_view(payload), meta, &put);
            if (!is_ok(s)) {
                return s;
            }
            slot.hash = put.hash;
            slot.ok = true;
            return ok_status();
        }

        std::vector<InputDescriptor> descriptors;
        descriptors.push_back(InputDescriptor::scalar("agent", step.agent));
        descriptors.push_back(InputDescriptor::scalar("model", step.model));
        descriptors.push_back(InputDescriptor::scalar("command", step.command));
        descriptors.push_back(InputDescriptor::scalar("run", std::to_string(run)));
        descriptors.push_back(InputDescriptor::sequence("inputs", input_hashes));
        for (const auto& [key, value] : step.params) {
            descriptors.push_back(InputDescriptor::scalar("param." + key, value));
        }

        std::string key;
        Status s = cache_.compute_key(descriptors, &key);
        if (!is_ok(s)) {
            return s;
        }

        waypoint::cache::CacheOutcome outcome;
        s = cache_.check_or_compute(key, compute, meta, &outcome);
        if (!is_ok(s)) {
            return s;
        }
        slot.hash = outcome.hash;
        slot.cache_hit = outcome.hit;
        slot.ok = true;
        return ok_status();
    };

    std::vector<Status> statuses;
    Status s = run_bounded(runs, options_.max_concurrency, run_one, &statuses);
    if (!is_ok(s)) {
        return s;
    }

    // A store/registry failure is never a handler failure; surface it as is.
    for (const auto& rs : statuses) {
        if (!is_ok(rs) && rs.code != StatusCode::StepFailed) {
            *failure_detail = std::string("artifact persistence failed: ") + status_code_name(rs.code);
            return rs;
        }
    }

    u32 failed = 0;
    bool all_hits = true;
    for (u32 r = 0; r < runs; ++r) {
        if (!results[r].ok) {
            ++failed;
            if (failure_detail->empty()) {
                *failure_detail = "run " + std::to_string(r) + ": " + results[r].detail;
            }
            continue;
        }
        all_hits = all_hits && results[r].cache_hit;
        step_report->outputs.push_back(results[r].hash);
    }
    step_report->failed_runs = failed;
    step_report->cache_hit = !step_report->outputs.empty() && all_hits;

    if (failed == 0) {
        failure_detail->clear();
        return ok_status();
    }
    if (step.failure_policy == FailurePolicy::ContinuePartial && failed < runs) {
        record("step_partial", {{"step", step_index}, {"failed_runs", failed}, {"detail", *failure_detail}});
        failure_detail->clear();
        return ok_status();
    }
    step_report->outputs.clear();
    return step_failed(step_index);
}

Status Orchestrator::write_state(const SessionContext& session,
                                 const Workflow& workflow,
                                 SnapshotStatus status,
                                 u32 step_index,
                                 const StepOutputs& outputs,
                                 std::filesystem::path* written) {
    StateSnapshot snap;
    snap.session_id = session.session_id;
    snap.status = status;
    snap.completed_step_index = status == SnapshotStatus::Completed ? step_index : step_index - 1;
    snap.current_step = step_index;
    snap.workflow = workflow;
    snap.step_outputs = outputs;
    snap.resources = session.resources;
    snap.project_root = session.project_root;
    snap.created_at = now_ms();

    std::string body;
    Status s = write_snapshot(waypoint::storage::session_state_dir(session.session_root), snap, written, &body);
    if (!is_ok(s)) {
        return s;
    }

    if (status == SnapshotStatus::Completed) {
        ArtifactMeta meta;
        meta.artifact_type = ArtifactType::Snapshot;
        meta.producer = audit::kComponentOrchestrator;
        meta.created_at = snap.created_at;
        meta.tags["session"] = session.session_id;
        meta.tags["step"] = std::to_string(step_index);

        waypoint::storage::PutResult put{};
        s = store_.put(waypoint::storage::as_view(body), meta, &put);
        if (!is_ok(s)) {
            return s;
        }
        record("snapshot_written", {{"step", step_index},
                                    {"status", snapshot_status_name(status)},
                                    {"file", written ? written->filename().string() : std::string()},
                                    {"artifact_hash", hash_to_hex(put.hash)}});
    } else {
        record("snapshot_written", {{"step", step_index},
                                    {"status", snapshot_status_name(status)},
                                    {"file", written ? written->filename().string() : std::string()}});
    }
    return ok_status();
}

} // namespace waypoint::workflow
