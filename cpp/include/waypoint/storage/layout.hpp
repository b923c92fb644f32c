#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "waypoint/core/errors.hpp"
#include "waypoint/core/types.hpp"

namespace waypoint::storage {
    using u32 = waypoint::core::u32;

    constexpr u32 kLayoutVersion = 1;

    // Payload location: {data_root}/{hash[0:2]}/{hash[2:4]}/{hash}.dat
    [[nodiscard]] std::filesystem::path blob_path(const std::filesystem::path& data_root,
                                                  const waypoint::core::Hash256& hash);

    // Session layout:
    //   {sessions_root}/{session_id}/state/   snapshot files
    //   {sessions_root}/{session_id}/audit.jsonl
    //   {sessions_root}/{session_id}/manifest.json
    [[nodiscard]] std::filesystem::path session_dir(const std::filesystem::path& sessions_root,
                                                    std::string_view session_id);
    [[nodiscard]] std::filesystem::path session_state_dir(const std::filesystem::path& session_root);
    [[nodiscard]] std::filesystem::path session_audit_path(const std::filesystem::path& session_root);
    [[nodiscard]] std::filesystem::path session_manifest_path(const std::filesystem::path& session_root);

    // Letters, digits, '_', '-' and '.'; never "." or "..".
    [[nodiscard]] bool session_id_valid(std::string_view session_id) noexcept;

    // session_<YYYYMMDD>_<HHMMSS>_<8 hex>
    [[nodiscard]] std::string make_session_id(waypoint::core::Timestamp at_ms);

    // Creates every missing parent directory of `path`.
    [[nodiscard]] waypoint::core::Status ensure_parent_dirs(const std::filesystem::path& path) noexcept;

    // Writes `bytes` to `path` through a sibling temp file, fsync and rename.
    [[nodiscard]] waypoint::core::Status write_file_atomic(const std::filesystem::path& path,
                                                           std::string_view bytes,
                                                           waypoint::core::StatusDomain domain) noexcept;

} // namespace waypoint::storage
