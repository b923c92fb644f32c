#pragma once

#include <nlohmann/json.hpp>

#include "waypoint/core/errors.hpp"
#include "waypoint/core/models.hpp"

namespace waypoint::workflow {

// Shared JSON shape of a workflow step, used by snapshots and by the
// experiment configuration:
//   {"agent": "...", "model": "...", "runs": 1, "failure_policy": "propagate",
//    "params": {"k": "v"}, "command": "..."}
// Empty model/command and default params are omitted on output.
[[nodiscard]] nlohmann::json step_to_json(const waypoint::core::WorkflowStep& step);
[[nodiscard]] nlohmann::json workflow_to_json(const waypoint::core::Workflow& workflow);

// {Invalid, domain} on a shape error. Non-string param values are stored
// in their JSON text form.
[[nodiscard]] waypoint::core::Status step_from_json(const nlohmann::json& j,
                                                    waypoint::core::StatusDomain domain,
                                                    waypoint::core::WorkflowStep* out) noexcept;
[[nodiscard]] waypoint::core::Status workflow_from_json(const nlohmann::json& j,
                                                        waypoint::core::StatusDomain domain,
                                                        waypoint::core::Workflow* out) noexcept;

[[nodiscard]] nlohmann::json resources_to_json(const std::vector<waypoint::core::ResourceRef>& resources);
[[nodiscard]] waypoint::core::Status resources_from_json(const nlohmann::json& j,
                                                         waypoint::core::StatusDomain domain,
                                                         std::vector<waypoint::core::ResourceRef>* out) noexcept;

} // namespace waypoint::workflow
