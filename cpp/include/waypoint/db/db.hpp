#pragma once

#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

#include "waypoint/core/errors.hpp"
#include "waypoint/core/models.hpp"
#include "waypoint/core/types.hpp"

struct sqlite3;

namespace waypoint::db {
    using u32 = waypoint::core::u32;
    using u64 = waypoint::core::u64;

    constexpr u32 kSchemaVersion = 1;

    struct DbConfig {
        const char* path{nullptr};          // nullptr or "" opens an in-memory database
        const char* journal_mode{nullptr};  // nullptr uses $WAYPOINT_DB_JOURNAL_MODE, then WAL
    };

    struct DbArtifactInsertParams {
        waypoint::core::Hash256 hash{};
        waypoint::core::ArtifactType artifact_type{waypoint::core::ArtifactType::Opaque};
        const char* producer{nullptr};
        u64 size_bytes{0};
        const char* fs_path{nullptr};
        waypoint::core::Timestamp created_at{0};
    };

    struct DbArtifactRow {
        waypoint::core::Hash256 hash{};
        waypoint::core::ArtifactType artifact_type{waypoint::core::ArtifactType::Opaque};
        std::string producer;
        u64 size_bytes{0};
        std::string fs_path;
        waypoint::core::Timestamp created_at{0};
    };

    struct DbTag {
        std::string key;
        std::string value;
    };

    static_assert(std::is_trivially_copyable_v<DbConfig>);
    static_assert(std::is_standard_layout_v<DbConfig>);

    // Registry database. One connection per instance; every call is
    // serialized on the instance mutex.
    class Database {
    public:
        Database() noexcept = default;
        ~Database() noexcept;

        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        [[nodiscard]] waypoint::core::Status open(const DbConfig& cfg) noexcept;
        [[nodiscard]] waypoint::core::Status close() noexcept;
        [[nodiscard]] bool is_open() const noexcept;

        // Transactions hold the instance mutex from begin to commit/rollback
        // on the calling thread, so a put's check-then-insert is one
        // critical section.
        [[nodiscard]] waypoint::core::Status txn_begin() noexcept;
        [[nodiscard]] waypoint::core::Status txn_commit() noexcept;
        [[nodiscard]] waypoint::core::Status txn_rollback() noexcept;

        [[nodiscard]] waypoint::core::Status artifact_exists(const waypoint::core::Hash256& hash, bool* out) noexcept;
        [[nodiscard]] waypoint::core::Status artifact_insert(const DbArtifactInsertParams& params) noexcept;
        [[nodiscard]] waypoint::core::Status artifact_get(const waypoint::core::Hash256& hash, DbArtifactRow* out) noexcept;
        [[nodiscard]] waypoint::core::Status artifact_list(u64 limit, std::vector<DbArtifactRow>* out) noexcept;
        [[nodiscard]] waypoint::core::Status artifact_count(u64* out) noexcept;

        // Every put (first or duplicate) records one reference row.
        [[nodiscard]] waypoint::core::Status reference_add(const waypoint::core::Hash256& hash,
                                                           waypoint::core::ArtifactType artifact_type,
                                                           const char* producer,
                                                           waypoint::core::Timestamp created_at) noexcept;
        [[nodiscard]] waypoint::core::Status reference_count(const waypoint::core::Hash256& hash, u32* out) noexcept;

        // Tags are merged: existing (key, value) pairs are kept, new pairs added.
        [[nodiscard]] waypoint::core::Status tags_merge(const waypoint::core::Hash256& hash,
                                                        const waypoint::core::TagMap& tags) noexcept;
        [[nodiscard]] waypoint::core::Status tags_get(const waypoint::core::Hash256& hash, std::vector<DbTag>* out) noexcept;

        // Hashes carrying tag (key, value), newest first.
        [[nodiscard]] waypoint::core::Status find_by_tag(const char* key,
                                                         const char* value,
                                                         std::vector<waypoint::core::Hash256>* out) noexcept;

        [[nodiscard]] waypoint::core::Status schema_version(u32* out) noexcept;
        [[nodiscard]] waypoint::core::Status filename(std::string* out) noexcept;

    private:
        [[nodiscard]] bool holds_txn() const noexcept;

        sqlite3* db_{nullptr};
        std::recursive_mutex mutex_;
        std::unique_lock<std::recursive_mutex> txn_lock_;
    };

} // namespace waypoint::db
