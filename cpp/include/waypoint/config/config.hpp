#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "waypoint/core/errors.hpp"
#include "waypoint/core/models.hpp"
#include "waypoint/storage/artifact_store.hpp"

namespace waypoint::config {

using u32 = waypoint::core::u32;
using u64 = waypoint::core::u64;

inline constexpr u32 kDefaultMaxConcurrency = 4;
inline constexpr u32 kExperimentSchemaVersion = 1;

// Process-wide runner settings:
//   WAYPOINT_HOME                root (else $HOME/waypoint, else /tmp/waypoint)
//   WAYPOINT_MAX_CONCURRENCY     fan-out bound (default 4)
//   WAYPOINT_VERIFY_ON_READ      "1"/"true" re-hashes every read
//   WAYPOINT_MAX_ARTIFACT_BYTES  0 = unlimited
//   WAYPOINT_DB_JOURNAL_MODE     SQLite journal mode (default WAL)
struct RunnerConfig {
    std::filesystem::path home;
    std::filesystem::path data_root;      // <home>/objects
    std::filesystem::path db_path;        // <home>/registry.db
    std::filesystem::path sessions_root;  // <home>/sessions
    u32 max_concurrency{kDefaultMaxConcurrency};
    bool verify_on_read{false};
    u64 max_artifact_bytes{0};
    std::string journal_mode;
};

// Points every derived path at `home`.
void set_home(RunnerConfig* cfg, const std::filesystem::path& home);

// {Invalid, Config} for a malformed numeric or boolean variable.
[[nodiscard]] waypoint::core::Status load_runner_config(RunnerConfig* out) noexcept;

[[nodiscard]] waypoint::storage::ArtifactStoreConfig store_config(const RunnerConfig& cfg);

[[nodiscard]] bool parse_bool(std::string_view text, bool* out) noexcept;
[[nodiscard]] bool parse_u64(std::string_view text, u64* out) noexcept;

// Experiment definition: the live workflow a run or resume executes.
struct ExperimentConfig {
    u32 schema_version{kExperimentSchemaVersion};
    std::string name;
    std::vector<waypoint::core::ResourceRef> resources;
    waypoint::core::Workflow workflow;
    std::filesystem::path source;        // file it was loaded from
    std::filesystem::path project_root;  // directory of `source`; resource paths resolve here
};

// {Corrupt, Config} for text that is not JSON; {Invalid, Config} for a
// missing or empty workflow, a step without an agent, or runs < 1
// (aux = offending 1-based step); {Unsupported, Config} for a newer schema.
[[nodiscard]] waypoint::core::Status parse_experiment(std::string_view text, ExperimentConfig* out) noexcept;

// As parse_experiment; {NotFound, Config} if the file is absent.
[[nodiscard]] waypoint::core::Status load_experiment(const std::filesystem::path& path, ExperimentConfig* out) noexcept;

} // namespace waypoint::config
