#pragma once

#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "waypoint/core/types.hpp"

namespace waypoint::core {

    // Artifact categories the core itself understands. Everything a step
    // produces is StepOutput (or Opaque when stored by hand); the core never
    // branches on payload contents.
    enum class ArtifactType : u8 {
        Opaque = 0,
        StepOutput = 1,
        CacheEntry = 2,
        Snapshot = 3,
        Manifest = 4,
    };

    [[nodiscard]] const char* artifact_type_name(ArtifactType t) noexcept;
    [[nodiscard]] bool parse_artifact_type(std::string_view text, ArtifactType* out) noexcept;

    using TagMap = std::map<std::string, std::string>;

    struct ArtifactMeta {
        ArtifactType artifact_type{ArtifactType::Opaque};
        std::string producer;
        Timestamp created_at{0};
        TagMap tags;
    };

    struct ArtifactRecord {
        Hash256 hash{};
        ArtifactMeta meta;
        u64 size_bytes{0};
        std::string fs_path;
        u32 reference_count{0};
    };

    enum class FailurePolicy : u8 {
        Propagate = 0,       // any failed run fails the step
        ContinuePartial = 1, // keep successful runs if at least one succeeded
    };

    [[nodiscard]] const char* failure_policy_name(FailurePolicy p) noexcept;
    [[nodiscard]] bool parse_failure_policy(std::string_view text, FailurePolicy* out) noexcept;

    struct WorkflowStep {
        std::string agent;
        std::string model;
        u32 runs{1};
        std::map<std::string, std::string> params;
        FailurePolicy failure_policy{FailurePolicy::Propagate};
        std::string command;
    };

    using Workflow = std::vector<WorkflowStep>;

    struct ResourceRef {
        std::string label;
        std::string path;
    };

    static_assert(std::is_standard_layout_v<ResourceRef>);

} // namespace waypoint::core
