#include "waypoint/workflow/resumption.hpp"
#include "waypoint/storage/layout.hpp"

#include <algorithm>
#include <new>
#include <system_error>

namespace waypoint::workflow {

using namespace waypoint::core;
namespace fs = std::filesystem;

namespace {
    constexpr const char* kReadyGuidance = "Ready to resume - no issues detected";

    void append_bullets(std::string* out, const std::vector<std::string>& items) {
        for (const auto& item : items) {
            *out += "   - ";
            *out += item;
            *out += "\n";
        }
    }

    std::string step_label(u32 index, const WorkflowStep& step) {
        std::string label = "Step ";
        label += std::to_string(index);
        label += ": ";
        label += step.agent.empty() ? "Step" + std::to_string(index) : step.agent;
        return label;
    }

    void set_blocked(ResumeAnalysis* out, ResumeStrategy strategy, std::string guidance) {
        out->can_resume = false;
        out->strategy = strategy;
        out->user_guidance = std::move(guidance);
    }
}

const char* resume_strategy_name(ResumeStrategy s) noexcept {
    switch (s) {
        case ResumeStrategy::NoStateFound: return "no_state_found";
        case ResumeStrategy::CorruptedState: return "corrupted_state";
        case ResumeStrategy::NoWorkflow: return "no_workflow";
        case ResumeStrategy::InvalidStep: return "invalid_step";
        case ResumeStrategy::Continue: return "continue";
        case ResumeStrategy::WorkflowChanged: return "workflow_changed";
        case ResumeStrategy::ResourceWarnings: return "resource_warnings";
        case ResumeStrategy::WorkflowChangedWithResourceWarnings: return "workflow_changed_with_resource_warnings";
        case ResumeStrategy::NoRemainingSteps: return "no_remaining_steps";
    }
    return "unknown";
}

bool resume_strategy_blocks(ResumeStrategy s) noexcept {
    switch (s) {
        case ResumeStrategy::NoStateFound:
        case ResumeStrategy::CorruptedState:
        case ResumeStrategy::NoWorkflow:
        case ResumeStrategy::InvalidStep:
            return true;
        default:
            return false;
    }
}

std::vector<WorkflowChange> diff_workflows(const Workflow& original, const Workflow& current) {
    std::vector<WorkflowChange> changes;

    if (original.size() != current.size()) {
        WorkflowChange c;
        c.step = static_cast<u32>(std::min(original.size(), current.size())) + 1;
        c.message = "Workflow length changed: was " + std::to_string(original.size()) + " steps, now " +
                    std::to_string(current.size()) + " steps";
        changes.push_back(std::move(c));
    }

    const size_t common = std::min(original.size(), current.size());
    for (size_t i = 0; i < common; ++i) {
        const u32 step_num = static_cast<u32>(i + 1);
        const WorkflowStep& was = original[i];
        const WorkflowStep& now = current[i];
        const std::string prefix = "Step " + std::to_string(step_num);

        if (was.agent != now.agent) {
            changes.push_back({step_num, prefix + " agent changed: was " + was.agent + ", now " + now.agent});
        }
        if (!was.model.empty() && !now.model.empty() && was.model != now.model) {
            changes.push_back({step_num, prefix + " model changed: was " + was.model + ", now " + now.model});
        }
        if (was.runs != now.runs) {
            changes.push_back({step_num, prefix + " runs changed: was " + std::to_string(was.runs) + ", now " +
                                             std::to_string(now.runs)});
        }
    }

    std::stable_sort(changes.begin(), changes.end(),
                     [](const WorkflowChange& a, const WorkflowChange& b) { return a.step < b.step; });
    return changes;
}

std::vector<std::string> validate_resources(const StateSnapshot& snap) {
    std::vector<std::string> warnings;
    for (const auto& res : snap.resources) {
        fs::path path(res.path);
        if (path.is_relative() && !snap.project_root.empty()) {
            path = fs::path(snap.project_root) / path;
        }
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            const std::string& label = res.label.empty() ? std::string("Resource") : res.label;
            warnings.push_back(label + " not found: " + res.path);
        }
    }
    return warnings;
}

std::string resume_guidance(const std::vector<std::string>& workflow_changes,
                            const std::vector<std::string>& resource_warnings) {
    const bool changed = !workflow_changes.empty();
    const bool warned = !resource_warnings.empty();

    if (!changed && !warned) {
        return kReadyGuidance;
    }

    std::string guidance;
    if (changed) {
        guidance += "Workflow changes detected since interruption:\n";
        append_bullets(&guidance, workflow_changes);
    }
    if (warned) {
        guidance += "Resource warnings detected:\n";
        append_bullets(&guidance, resource_warnings);
    }

    if (changed && warned) {
        guidance += "Consider: verify resources are accessible, then resume with current workflow "
                    "or restart experiment with updated configuration";
    } else if (changed) {
        guidance += "Consider: resume with current workflow, or restart experiment with updated configuration";
    } else {
        guidance += "Verify resources are accessible before resuming";
    }
    return guidance;
}

Status ResumptionAnalyzer::analyze(const ResumeRequest& request, ResumeAnalysis* out) const noexcept {
    if (!out) {
        return make_status(StatusDomain::Workflow, StatusCode::Invalid);
    }

    try {
        *out = ResumeAnalysis{};

        // Discovery
        fs::path state_file;
        if (request.state_file) {
            state_file = *request.state_file;
        } else {
            Status s = request.session_dir.empty()
                           ? find_latest_snapshot(request.sessions_root, &state_file)
                           : find_latest_snapshot_in(waypoint::storage::session_state_dir(request.session_dir), &state_file);
            if (s.code == StatusCode::NotFound) {
                set_blocked(out, ResumeStrategy::NoStateFound,
                            "No state files found for resumption. Verify the session directory contains state "
                            "snapshots.");
                return ok_status();
            }
            if (!is_ok(s)) {
                return s;
            }
        }
        out->state_file = state_file;

        // Integrity check
        StateSnapshot snap;
        Status s = load_snapshot(state_file, &snap);
        if (s.code == StatusCode::NotFound) {
            set_blocked(out, ResumeStrategy::NoStateFound,
                        "State file not found: " + state_file.string());
            return ok_status();
        }
        if (!is_ok(s)) {
            set_blocked(out, ResumeStrategy::CorruptedState,
                        "State file corrupted or unreadable: " + state_file.string() + " (" +
                            status_code_name(s.code) + ")");
            return ok_status();
        }

        if (snap.workflow.empty()) {
            out->snapshot = std::move(snap);
            set_blocked(out, ResumeStrategy::NoWorkflow, "No workflow steps found in state file.");
            return ok_status();
        }

        // The workflow that will actually run from here on.
        const Workflow& effective = request.current_workflow ? *request.current_workflow : snap.workflow;
        const u32 recorded_total = static_cast<u32>(snap.workflow.size());
        const u32 effective_total = static_cast<u32>(effective.size());

        out->state_integrity = true;
        out->total_steps = recorded_total;

        // Resume-step arithmetic
        if (request.from_step) {
            const u32 step = *request.from_step;
            out->resume_step = step;
            if (step < 1 || step > effective_total) {
                out->snapshot = std::move(snap);
                set_blocked(out, ResumeStrategy::InvalidStep,
                            "Invalid resume step " + std::to_string(step) + ". Must be between 1 and " +
                                std::to_string(effective_total) + ".");
                return ok_status();
            }
        } else {
            out->resume_step = determine_resume_step(state_file.filename().string());
        }

        for (u32 i = 1; i <= recorded_total && i < out->resume_step; ++i) {
            out->completed_steps.push_back(step_label(i, snap.workflow[i - 1]));
        }
        for (u32 i = out->resume_step; i <= effective_total; ++i) {
            out->remaining_steps.push_back(step_label(i, effective[i - 1]));
        }

        // Workflow diff
        if (request.current_workflow) {
            for (auto& change : diff_workflows(snap.workflow, *request.current_workflow)) {
                if (change.step <= out->resume_step) {
                    out->workflow_changes.push_back(std::move(change.message));
                } else {
                    out->upcoming_changes.push_back(std::move(change.message));
                }
            }
        } else {
            out->workflow_changes.push_back(
                "Current experiment configuration not found - cannot validate workflow consistency");
        }

        // Resource validation
        out->resource_warnings = validate_resources(snap);

        // Guidance synthesis
        out->can_resume = true;
        if (out->resume_step > effective_total) {
            out->strategy = ResumeStrategy::NoRemainingSteps;
            out->user_guidance = "All " + std::to_string(effective_total) +
                                 " workflow steps already completed - nothing to resume";
        } else {
            const bool changed = !out->workflow_changes.empty();
            const bool warned = !out->resource_warnings.empty();
            if (changed && warned) {
                out->strategy = ResumeStrategy::WorkflowChangedWithResourceWarnings;
            } else if (changed) {
                out->strategy = ResumeStrategy::WorkflowChanged;
            } else if (warned) {
                out->strategy = ResumeStrategy::ResourceWarnings;
            } else {
                out->strategy = ResumeStrategy::Continue;
            }
            out->user_guidance = resume_guidance(out->workflow_changes, out->resource_warnings);
        }

        out->snapshot = std::move(snap);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Workflow, StatusCode::Unavailable);
    }
    return ok_status();
}

} // namespace waypoint::workflow
