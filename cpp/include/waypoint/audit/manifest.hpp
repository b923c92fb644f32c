#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "waypoint/audit/audit_log.hpp"
#include "waypoint/core/errors.hpp"
#include "waypoint/core/types.hpp"
#include "waypoint/storage/artifact_store.hpp"

namespace waypoint::audit {

using u32 = waypoint::core::u32;

struct ManifestStep {
    u32 step{0};
    std::string agent;
    u64 duration_ms{0};
    bool cache_hit{false};
    std::vector<std::string> outputs;  // hex hashes, run order
};

// End-of-run summary of one session, derived from its audit stream and the
// registry. Written once.
struct Manifest {
    std::string session_id;
    waypoint::core::Timestamp finalized_at{0};
    u64 cache_hits{0};
    u64 cache_misses{0};
    u64 cache_corruptions{0};
    double hit_rate{0.0};            // hits / lookups; 0 when nothing was looked up
    std::vector<ManifestStep> steps; // ascending step; last completion wins
    u64 artifacts_total{0};
    u64 artifacts_session{0};        // tagged session=<session_id>
    u64 audit_event_count{0};
    u64 audit_malformed{0};
};

[[nodiscard]] waypoint::core::Status build_manifest(const std::filesystem::path& session_root,
                                                    std::string session_id,
                                                    waypoint::storage::ArtifactStore& store,
                                                    Manifest* out) noexcept;

[[nodiscard]] nlohmann::json manifest_to_json(const Manifest& m);

// Builds, writes <session_root>/manifest.json and stores the same bytes as a
// Manifest artifact. {Conflict, Audit} if the session already has one.
// `log` (optional) receives a manifest_finalized event.
[[nodiscard]] waypoint::core::Status finalize_manifest(const std::filesystem::path& session_root,
                                                       const std::string& session_id,
                                                       waypoint::storage::ArtifactStore& store,
                                                       AuditLog* log,
                                                       Manifest* out) noexcept;

} // namespace waypoint::audit
