#pragma once

#include <filesystem>
#include <string>

#include "waypoint/workflow/step_handler.hpp"

namespace waypoint::workflow {

// Runs the step's `command` with /bin/sh -c. Prior outputs are written to a
// private temp directory; the child sees
//   WAYPOINT_INPUTS   newline-separated input file paths
//   WAYPOINT_AGENT, WAYPOINT_MODEL, WAYPOINT_SESSION, WAYPOINT_STEP, WAYPOINT_RUN
//   WAYPOINT_PARAM_<NAME>  one per step param (name upper-cased, [A-Z0-9_])
// Its stdout is the step output; a non-zero exit is a step failure.
class CommandStepHandler final : public StepHandler {
public:
    explicit CommandStepHandler(std::filesystem::path work_root = {});

    [[nodiscard]] waypoint::core::Status invoke(const waypoint::core::WorkflowStep& step,
                                                const StepContext& ctx,
                                                const std::vector<std::vector<u8>>& inputs,
                                                StepOutcome* out) noexcept override;

private:
    std::filesystem::path work_root_;
};

// Environment variable name for a step param.
[[nodiscard]] std::string param_env_name(std::string_view param);

} // namespace waypoint::workflow
