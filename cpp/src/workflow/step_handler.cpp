#include "waypoint/workflow/step_handler.hpp"

namespace waypoint::workflow {

void HandlerRegistry::register_handler(std::string agent, std::shared_ptr<StepHandler> handler) {
    handlers_[std::move(agent)] = std::move(handler);
}

void HandlerRegistry::set_fallback(std::shared_ptr<StepHandler> handler) {
    fallback_ = std::move(handler);
}

StepHandler* HandlerRegistry::find(std::string_view agent) const noexcept {
    auto it = handlers_.find(agent);
    if (it != handlers_.end() && it->second) {
        return it->second.get();
    }
    return fallback_.get();
}

} // namespace waypoint::workflow
