#include "waypoint/workflow/workflow_json.hpp"

#include <new>

namespace waypoint::workflow {

using namespace waypoint::core;
using json = nlohmann::json;

json step_to_json(const WorkflowStep& step) {
    json j = {{"agent", step.agent}, {"runs", step.runs}};
    if (!step.model.empty()) {
        j["model"] = step.model;
    }
    if (step.failure_policy != FailurePolicy::Propagate) {
        j["failure_policy"] = failure_policy_name(step.failure_policy);
    }
    if (!step.params.empty()) {
        j["params"] = step.params;
    }
    if (!step.command.empty()) {
        j["command"] = step.command;
    }
    return j;
}

json workflow_to_json(const Workflow& workflow) {
    json arr = json::array();
    for (const auto& step : workflow) {
        arr.push_back(step_to_json(step));
    }
    return arr;
}

Status step_from_json(const json& j, StatusDomain domain, WorkflowStep* out) noexcept {
    if (!out) {
        return make_status(domain, StatusCode::Invalid);
    }
    if (!j.is_object()) {
        return make_status(domain, StatusCode::Invalid);
    }

    try {
        WorkflowStep step;

        auto agent = j.find("agent");
        if (agent == j.end() || !agent->is_string() || agent->get<std::string>().empty()) {
            return make_status(domain, StatusCode::Invalid);
        }
        step.agent = agent->get<std::string>();

        auto model = j.find("model");
        if (model != j.end() && !model->is_null()) {
            if (!model->is_string()) {
                return make_status(domain, StatusCode::Invalid);
            }
            step.model = model->get<std::string>();
        }

        auto runs = j.find("runs");
        if (runs != j.end() && !runs->is_null()) {
            if (!runs->is_number_integer() || runs->get<i64>() < 1 || runs->get<i64>() > 10000) {
                return make_status(domain, StatusCode::Invalid);
            }
            step.runs = static_cast<u32>(runs->get<i64>());
        }

        auto policy = j.find("failure_policy");
        if (policy != j.end() && !policy->is_null()) {
            if (!policy->is_string() || !parse_failure_policy(policy->get<std::string>(), &step.failure_policy)) {
                return make_status(domain, StatusCode::Invalid);
            }
        }

        auto params = j.find("params");
        if (params != j.end() && !params->is_null()) {
            if (!params->is_object()) {
                return make_status(domain, StatusCode::Invalid);
            }
            for (auto it = params->begin(); it != params->end(); ++it) {
                step.params[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
            }
        }

        auto command = j.find("command");
        if (command != j.end() && !command->is_null()) {
            if (!command->is_string()) {
                return make_status(domain, StatusCode::Invalid);
            }
            step.command = command->get<std::string>();
        }

        *out = std::move(step);
    } catch (const std::bad_alloc&) {
        return make_status(domain, StatusCode::Unavailable);
    } catch (const json::exception&) {
        return make_status(domain, StatusCode::Invalid);
    }
    return ok_status();
}

Status workflow_from_json(const json& j, StatusDomain domain, Workflow* out) noexcept {
    if (!out || !j.is_array()) {
        return make_status(domain, StatusCode::Invalid);
    }

    try {
        Workflow workflow;
        workflow.reserve(j.size());
        u32 position = 0;
        for (const auto& item : j) {
            ++position;
            WorkflowStep step;
            Status s = step_from_json(item, domain, &step);
            if (!is_ok(s)) {
                s.aux = position;
                return s;
            }
            workflow.push_back(std::move(step));
        }
        *out = std::move(workflow);
    } catch (const std::bad_alloc&) {
        return make_status(domain, StatusCode::Unavailable);
    }
    return ok_status();
}

json resources_to_json(const std::vector<ResourceRef>& resources) {
    json arr = json::array();
    for (const auto& r : resources) {
        arr.push_back({{"label", r.label}, {"path", r.path}});
    }
    return arr;
}

Status resources_from_json(const json& j, StatusDomain domain, std::vector<ResourceRef>* out) noexcept {
    if (!out || !j.is_array()) {
        return make_status(domain, StatusCode::Invalid);
    }

    try {
        std::vector<ResourceRef> resources;
        for (const auto& item : j) {
            if (!item.is_object()) {
                return make_status(domain, StatusCode::Invalid);
            }
            auto path = item.find("path");
            if (path == item.end() || !path->is_string() || path->get<std::string>().empty()) {
                return make_status(domain, StatusCode::Invalid);
            }
            ResourceRef ref;
            ref.path = path->get<std::string>();
            auto label = item.find("label");
            ref.label = (label != item.end() && label->is_string()) ? label->get<std::string>() : std::string("Resource");
            resources.push_back(std::move(ref));
        }
        *out = std::move(resources);
    } catch (const std::bad_alloc&) {
        return make_status(domain, StatusCode::Unavailable);
    } catch (const json::exception&) {
        return make_status(domain, StatusCode::Invalid);
    }
    return ok_status();
}

} // namespace waypoint::workflow
