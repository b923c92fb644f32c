#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "waypoint/core/errors.hpp"
#include "waypoint/core/types.hpp"

namespace waypoint::audit {

using u64 = waypoint::core::u64;

// Component names used by the core when appending.
inline constexpr const char* kComponentStore = "artifact_store";
inline constexpr const char* kComponentCache = "cache_manager";
inline constexpr const char* kComponentOrchestrator = "orchestrator";
inline constexpr const char* kComponentResumption = "resumption";
inline constexpr const char* kComponentManifest = "manifest";

struct AuditEvent {
    waypoint::core::Timestamp timestamp{0};
    std::string component;
    std::string event_type;
    nlohmann::json payload;
};

// Append-only JSON Lines event stream, one file per session. Each event is
// written with a single write(2) so the file can be tailed while it grows.
// The log never reads back what it wrote.
class AuditLog {
public:
    AuditLog() noexcept = default;
    ~AuditLog() noexcept;

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    // Opens (creating if needed) `path` for appending.
    [[nodiscard]] waypoint::core::Status open(const std::filesystem::path& path) noexcept;
    [[nodiscard]] waypoint::core::Status close() noexcept;
    [[nodiscard]] bool is_open() const noexcept;

    [[nodiscard]] waypoint::core::Status append(std::string_view component,
                                                std::string_view event_type,
                                                const nlohmann::json& payload) noexcept;

    // Events appended through this instance.
    [[nodiscard]] u64 appended() const noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
    int fd_{-1};
    u64 appended_{0};
    waypoint::core::Timestamp last_ts_{0};
};

// Forward scan for consumers (manifest, reports). Lines that fail to parse
// are counted in `malformed` rather than returned.
[[nodiscard]] waypoint::core::Status read_audit_events(const std::filesystem::path& path,
                                                       std::vector<AuditEvent>* out,
                                                       u64* malformed) noexcept;

} // namespace waypoint::audit
