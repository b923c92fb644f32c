#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "waypoint/core/errors.hpp"
#include "waypoint/core/models.hpp"
#include "waypoint/core/types.hpp"
#include "waypoint/db/db.hpp"
#include "waypoint/storage/buffer.hpp"

namespace waypoint::storage {

using u32 = waypoint::core::u32;

// Artifact store configuration
struct ArtifactStoreConfig {
    std::filesystem::path data_root;    // Root directory for payloads (e.g., "~/waypoint/objects")
    std::filesystem::path db_path;      // Registry database; empty opens an in-memory registry
    u64 max_artifact_bytes{0};          // Maximum payload size (0 = unlimited)
    bool verify_on_read{false};         // Re-hash payload on every get (slow)
    const char* journal_mode{nullptr};  // SQLite journal mode override
};

// Result from putting an artifact
struct PutResult {
    waypoint::core::Hash256 hash{};
    u64 size_bytes{0};
    bool deduplicated{false};           // true if the payload already existed
};

// Content-addressable artifact store over a SQLite registry.
// Instances own their registry connection; share one store by reference
// between every component of a run.
class ArtifactStore {
public:
    ArtifactStore() noexcept = default;
    ~ArtifactStore() noexcept;

    ArtifactStore(const ArtifactStore&) = delete;
    ArtifactStore& operator=(const ArtifactStore&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    [[nodiscard]] waypoint::core::Status open(const ArtifactStoreConfig& cfg) noexcept;
    [[nodiscard]] waypoint::core::Status close() noexcept;
    [[nodiscard]] bool is_open() const noexcept { return open_; }
    [[nodiscard]] const ArtifactStoreConfig& config() const noexcept { return cfg_; }

    // ========================================================================
    // Artifact Operations
    // ========================================================================

    // Put an artifact into the store
    // - Computes content hash (BLAKE3)
    // - On duplicate content: merges tags, records a reference, and rewrites the
    //   payload only if it has gone missing
    // - Otherwise writes the payload to {data_root}/{hash[0:2]}/{hash[2:4]}/{hash}.dat
    //   and appends a registry entry
    // The registry check and insert run as one serialized transaction.
    [[nodiscard]] waypoint::core::Status put(BufferView payload,
                                             const waypoint::core::ArtifactMeta& meta,
                                             PutResult* result) noexcept;

    // Record another use of an already registered artifact: merges `meta.tags`
    // and appends a reference row in one transaction. {NotFound, Storage}
    // when the hash is not registered. The payload is not touched.
    [[nodiscard]] waypoint::core::Status add_reference(const waypoint::core::Hash256& hash,
                                                       const waypoint::core::ArtifactMeta& meta) noexcept;

    // {NotFound, Storage} when the hash is not registered.
    // {Corrupt, Storage} when the registered payload is missing, short, or
    // (with verify_on_read) does not hash back to `hash`.
    [[nodiscard]] waypoint::core::Status get(const waypoint::core::Hash256& hash,
                                             std::vector<u8>* out) noexcept;

    // true only if the hash is registered and its payload file is present
    // with the registered size. Never reads the payload.
    [[nodiscard]] waypoint::core::Status exists(const waypoint::core::Hash256& hash, bool* out) noexcept;

    [[nodiscard]] waypoint::core::Status metadata(const waypoint::core::Hash256& hash,
                                                  waypoint::core::ArtifactRecord* out) noexcept;

    // ========================================================================
    // Query Operations
    // ========================================================================

    // Hashes tagged (key, value), newest first.
    [[nodiscard]] waypoint::core::Status find_by_tag(const std::string& key,
                                                     const std::string& value,
                                                     std::vector<waypoint::core::Hash256>* out) noexcept;

    // Registry entries in insertion order (limit 0 = all). Tags and
    // reference counts are filled in.
    [[nodiscard]] waypoint::core::Status scan(u64 limit, std::vector<waypoint::core::ArtifactRecord>* out) noexcept;

    [[nodiscard]] waypoint::core::Status count(u64* out) noexcept;

    // Checks every value of `key`, not only the one metadata() reports.
    [[nodiscard]] waypoint::core::Status has_tag(const waypoint::core::Hash256& hash,
                                                 const std::string& key,
                                                 const std::string& value,
                                                 bool* out) noexcept;

    // ========================================================================
    // Maintenance Operations
    // ========================================================================

    // Re-reads and re-hashes the payload. `valid` is false on a missing,
    // short or mismatched payload; the call itself fails only for an
    // unregistered hash or a registry error.
    [[nodiscard]] waypoint::core::Status verify(const waypoint::core::Hash256& hash, bool* valid) noexcept;

private:
    [[nodiscard]] waypoint::core::Status read_payload(const db::DbArtifactRow& row,
                                                      std::vector<u8>* out) noexcept;
    [[nodiscard]] waypoint::core::Status fill_record(const db::DbArtifactRow& row,
                                                     waypoint::core::ArtifactRecord* out) noexcept;

    ArtifactStoreConfig cfg_{};
    db::Database db_;
    bool open_{false};
};

} // namespace waypoint::storage
