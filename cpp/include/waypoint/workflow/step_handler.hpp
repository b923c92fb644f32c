#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "waypoint/core/errors.hpp"
#include "waypoint/core/models.hpp"

namespace waypoint::workflow {

using u8 = waypoint::core::u8;
using u32 = waypoint::core::u32;

struct StepContext {
    std::string_view session_id;
    u32 step_index{0};  // 1-based
    u32 run_index{0};   // 0-based, < runs
    u32 runs{1};
};

struct StepOutcome {
    bool success{false};
    std::vector<u8> output;
    std::string error_detail;
};

// External collaborator that does the actual work of a step. The core
// stores `output` opaquely. A non-Ok Status and success == false are both
// step failures; handlers own their own timeout and retry policy.
class StepHandler {
public:
    virtual ~StepHandler() = default;

    [[nodiscard]] virtual waypoint::core::Status invoke(const waypoint::core::WorkflowStep& step,
                                                        const StepContext& ctx,
                                                        const std::vector<std::vector<u8>>& inputs,
                                                        StepOutcome* out) noexcept = 0;
};

// Agent name -> handler, with an optional fallback for unregistered agents.
class HandlerRegistry {
public:
    void register_handler(std::string agent, std::shared_ptr<StepHandler> handler);
    void set_fallback(std::shared_ptr<StepHandler> handler);

    // nullptr when neither the agent nor a fallback is registered.
    [[nodiscard]] StepHandler* find(std::string_view agent) const noexcept;

private:
    std::map<std::string, std::shared_ptr<StepHandler>, std::less<>> handlers_;
    std::shared_ptr<StepHandler> fallback_;
};

} // namespace waypoint::workflow
