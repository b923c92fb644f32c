#include "waypoint/core/models.hpp"
#include "waypoint/core/errors.hpp"

#include <chrono>

namespace waypoint::core {

Timestamp now_ms() noexcept {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

const char* status_code_name(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::PermissionDenied: return "PermissionDenied";
        case StatusCode::Conflict: return "Conflict";
        case StatusCode::Busy: return "Busy";
        case StatusCode::Corrupt: return "Corrupt";
        case StatusCode::Io: return "Io";
        case StatusCode::Unsupported: return "Unsupported";
        case StatusCode::Unavailable: return "Unavailable";
        case StatusCode::StepFailed: return "StepFailed";
    }
    return "Unknown";
}

const char* status_domain_name(StatusDomain domain) noexcept {
    switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Storage: return "Storage";
        case StatusDomain::Db: return "Db";
        case StatusDomain::Cache: return "Cache";
        case StatusDomain::Audit: return "Audit";
        case StatusDomain::Workflow: return "Workflow";
        case StatusDomain::Config: return "Config";
        case StatusDomain::Cli: return "Cli";
        case StatusDomain::External: return "External";
    }
    return "Unknown";
}

const char* artifact_type_name(ArtifactType t) noexcept {
    switch (t) {
        case ArtifactType::Opaque: return "opaque";
        case ArtifactType::StepOutput: return "step-output";
        case ArtifactType::CacheEntry: return "cache-entry";
        case ArtifactType::Snapshot: return "snapshot";
        case ArtifactType::Manifest: return "manifest";
    }
    return "opaque";
}

bool parse_artifact_type(std::string_view text, ArtifactType* out) noexcept {
    if (out == nullptr) {
        return false;
    }
    static constexpr ArtifactType kAll[] = {
        ArtifactType::Opaque, ArtifactType::StepOutput, ArtifactType::CacheEntry,
        ArtifactType::Snapshot, ArtifactType::Manifest,
    };
    for (ArtifactType t : kAll) {
        if (text == artifact_type_name(t)) {
            *out = t;
            return true;
        }
    }
    return false;
}

const char* failure_policy_name(FailurePolicy p) noexcept {
    switch (p) {
        case FailurePolicy::Propagate: return "propagate";
        case FailurePolicy::ContinuePartial: return "continue_partial";
    }
    return "propagate";
}

bool parse_failure_policy(std::string_view text, FailurePolicy* out) noexcept {
    if (out == nullptr) {
        return false;
    }
    if (text == "propagate") {
        *out = FailurePolicy::Propagate;
        return true;
    }
    if (text == "continue_partial") {
        *out = FailurePolicy::ContinuePartial;
        return true;
    }
    return false;
}

} // namespace waypoint::core
