#include "waypoint/db/db.hpp"
#include <sqlite3.h>
#include <cstring>
#include <cstdlib>
#include <string>
#include <mutex>
#include <algorithm>
#include <new>

namespace waypoint::db {

using namespace waypoint::core;

namespace {
    // SQL schema embedded
    constexpr const char* kSchemaSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS schema_info (
            id INTEGER PRIMARY KEY CHECK (id = 1),
            version INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS artifacts (
            content_hash BLOB PRIMARY KEY,
            artifact_type TEXT NOT NULL,
            producer TEXT NOT NULL DEFAULT '',
            size_bytes INTEGER NOT NULL,
            fs_path TEXT NOT NULL,
            created_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_artifacts_type ON artifacts(artifact_type);
        CREATE INDEX IF NOT EXISTS idx_artifacts_created ON artifacts(created_at);

        CREATE TABLE IF NOT EXISTS artifact_tags (
            content_hash BLOB NOT NULL,
            tag_key TEXT NOT NULL,
            tag_value TEXT NOT NULL,
            UNIQUE (content_hash, tag_key, tag_value),
            FOREIGN KEY (content_hash) REFERENCES artifacts(content_hash)
        );
        CREATE INDEX IF NOT EXISTS idx_tags_kv ON artifact_tags(tag_key, tag_value);

        CREATE TABLE IF NOT EXISTS artifact_refs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            content_hash BLOB NOT NULL,
            artifact_type TEXT NOT NULL,
            producer TEXT NOT NULL DEFAULT '',
            created_at INTEGER NOT NULL,
            FOREIGN KEY (content_hash) REFERENCES artifacts(content_hash)
        );
        CREATE INDEX IF NOT EXISTS idx_refs_hash ON artifact_refs(content_hash);
    )SQL";

    [[nodiscard]] bool exec_sql(sqlite3* db, const char* sql) noexcept {
        if (!db || !sql) return false;
        char* err_msg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
        if (err_msg) sqlite3_free(err_msg);
        return rc == SQLITE_OK;
    }

    [[nodiscard]] Status db_error(StatusCode code = StatusCode::Unknown) noexcept {
        return make_status(StatusDomain::Db, code);
    }

    [[nodiscard]] Status step_error(int rc) noexcept {
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            return make_status(StatusDomain::Db, StatusCode::Busy, static_cast<u32>(rc));
        }
        if (rc == SQLITE_CONSTRAINT) {
            return make_status(StatusDomain::Db, StatusCode::Conflict, static_cast<u32>(rc));
        }
        if (rc == SQLITE_CORRUPT || rc == SQLITE_NOTADB) {
            return make_status(StatusDomain::Db, StatusCode::Corrupt, static_cast<u32>(rc));
        }
        return make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<u32>(rc));
    }

    std::string column_string(sqlite3_stmt* stmt, int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
        return text ? std::string(text) : std::string();
    }

    void column_hash(sqlite3_stmt* stmt, int col, Hash256* out) noexcept {
        const void* blob = sqlite3_column_blob(stmt, col);
        const int len = sqlite3_column_bytes(stmt, col);
        if (blob && len == static_cast<int>(out->b.size())) {
            std::memcpy(out->b.data(), blob, out->b.size());
        } else {
            *out = Hash256{};
        }
    }

    [[nodiscard]] ArtifactType column_artifact_type(sqlite3_stmt* stmt, int col) {
        ArtifactType t = ArtifactType::Opaque;
        const std::string name = column_string(stmt, col);
        if (!parse_artifact_type(name, &t)) {
            t = ArtifactType::Opaque;
        }
        return t;
    }

    void read_artifact_row(sqlite3_stmt* stmt, DbArtifactRow* out) {
        column_hash(stmt, 0, &out->hash);
        out->artifact_type = column_artifact_type(stmt, 1);
        out->producer = column_string(stmt, 2);
        out->size_bytes = static_cast<u64>(sqlite3_column_int64(stmt, 3));
        out->fs_path = column_string(stmt, 4);
        out->created_at = sqlite3_column_int64(stmt, 5);
    }
}

Database::~Database() noexcept {
    (void)close();
}

// ============================================================================
// Database Lifecycle
// ============================================================================

Status Database::open(const DbConfig& cfg) noexcept {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    // Close existing connection if any
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    const char* path = (cfg.path && cfg.path[0] != '\0') ? cfg.path : ":memory:";
    int rc = sqlite3_open_v2(path, &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
    }

    sqlite3_busy_timeout(db_, 5000);

    // Enable WAL mode (configurable).
    const char* journal_mode = cfg.journal_mode;
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = std::getenv("WAYPOINT_DB_JOURNAL_MODE");
    }
    if (!journal_mode || journal_mode[0] == '\0') {
        journal_mode = "WAL";
    }
    std::string journal_sql = "PRAGMA journal_mode=";
    journal_sql += journal_mode;
    // Continue even if WAL fails (in-memory DB)
    (void)exec_sql(db_, journal_sql.c_str());

    (void)exec_sql(db_, "PRAGMA synchronous=NORMAL");
    (void)exec_sql(db_, "PRAGMA foreign_keys=ON");
    (void)exec_sql(db_, "PRAGMA temp_store=MEMORY");

    if (!exec_sql(db_, kSchemaSQL)) {
        sqlite3_close(db_);
        db_ = nullptr;
        return db_error();
    }

    // Stamp a fresh database; refuse one written by a newer schema.
    sqlite3_stmt* stmt = nullptr;
    rc = sqlite3_prepare_v2(db_, "SELECT version FROM schema_info WHERE id = 1", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db_);
        db_ = nullptr;
        return db_error();
    }
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const u32 version = static_cast<u32>(sqlite3_column_int(stmt, 0));
        sqlite3_finalize(stmt);
        if (version > kSchemaVersion) {
            sqlite3_close(db_);
            db_ = nullptr;
            return make_status(StatusDomain::Db, StatusCode::Unsupported, version);
        }
    } else {
        sqlite3_finalize(stmt);
        std::string stamp = "INSERT INTO schema_info (id, version) VALUES (1, ";
        stamp += std::to_string(kSchemaVersion);
        stamp += ")";
        if (!exec_sql(db_, stamp.c_str())) {
            sqlite3_close(db_);
            db_ = nullptr;
            return db_error();
        }
    }

    return ok_status();
}

Status Database::close() noexcept {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    if (holds_txn()) {
        (void)exec_sql(db_, "ROLLBACK");
        txn_lock_.unlock();
        txn_lock_ = std::unique_lock<std::recursive_mutex>();
    }

    sqlite3_close(db_);
    db_ = nullptr;
    return ok_status();
}

bool Database::is_open() const noexcept {
    return db_ != nullptr;
}

bool Database::holds_txn() const noexcept {
    return txn_lock_.owns_lock();
}

// ============================================================================
// Transaction Management
// ============================================================================

Status Database::txn_begin() noexcept {
    std::unique_lock<std::recursive_mutex> lock(mutex_);

    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (holds_txn()) {
        return make_status(StatusDomain::Db, StatusCode::Conflict);
    }

    if (!exec_sql(db_, "BEGIN IMMEDIATE TRANSACTION")) {
        return make_status(StatusDomain::Db, StatusCode::Busy);
    }

    txn_lock_ = std::move(lock);
    return ok_status();
}

Status Database::txn_commit() noexcept {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!db_ || !holds_txn()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const bool committed = exec_sql(db_, "COMMIT");
    if (!committed) {
        (void)exec_sql(db_, "ROLLBACK");
    }
    txn_lock_.unlock();
    txn_lock_ = std::unique_lock<std::recursive_mutex>();

    return committed ? ok_status() : db_error();
}

Status Database::txn_rollback() noexcept {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!db_ || !holds_txn()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const bool rolled_back = exec_sql(db_, "ROLLBACK");
    txn_lock_.unlock();
    txn_lock_ = std::unique_lock<std::recursive_mutex>();

    return rolled_back ? ok_status() : db_error();
}

// ============================================================================
// Artifact Operations
// ============================================================================

Status Database::artifact_exists(const Hash256& hash, bool* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "SELECT 1 FROM artifacts WHERE content_hash = ? LIMIT 1";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }

    sqlite3_bind_blob(stmt, 1, hash.b.data(), static_cast<int>(hash.b.size()), SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return step_error(rc);
    }
    *out = (rc == SQLITE_ROW);
    return ok_status();
}

Status Database::artifact_insert(const DbArtifactInsertParams& params) noexcept {
    if (!params.fs_path) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "INSERT INTO artifacts (content_hash, artifact_type, producer, size_bytes, fs_path, created_at) "
                      "VALUES (?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }

    sqlite3_bind_blob(stmt, 1, params.hash.b.data(), static_cast<int>(params.hash.b.size()), SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, artifact_type_name(params.artifact_type), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, params.producer ? params.producer : "", -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(params.size_bytes));
    sqlite3_bind_text(stmt, 5, params.fs_path, -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 6, params.created_at);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return step_error(rc);
    }
    return ok_status();
}

Status Database::artifact_get(const Hash256& hash, DbArtifactRow* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "SELECT content_hash, artifact_type, producer, size_bytes, fs_path, created_at "
                      "FROM artifacts WHERE content_hash = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }

    sqlite3_bind_blob(stmt, 1, hash.b.data(), static_cast<int>(hash.b.size()), SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        try {
            read_artifact_row(stmt, out);
        } catch (const std::bad_alloc&) {
            sqlite3_finalize(stmt);
            return make_status(StatusDomain::Db, StatusCode::Unavailable);
        }
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return step_error(rc);
    }
    return make_status(StatusDomain::Db, StatusCode::NotFound);
}

Status Database::artifact_list(u64 limit, std::vector<DbArtifactRow>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT content_hash, artifact_type, producer, size_bytes, fs_path, created_at "
                      "FROM artifacts ORDER BY created_at ASC, rowid ASC";
    if (limit > 0) {
        sql += " LIMIT ?";
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }
    if (limit > 0) {
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));
    }

    out->clear();
    try {
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            DbArtifactRow row;
            read_artifact_row(stmt, &row);
            out->push_back(std::move(row));
        }
    } catch (const std::bad_alloc&) {
        sqlite3_finalize(stmt);
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return step_error(rc);
    }
    return ok_status();
}

Status Database::artifact_count(u64* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM artifacts", -1, &stmt, nullptr);
    if (rc != SQLITE_OK || !stmt) {
        return db_error();
    }

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        *out = static_cast<u64>(sqlite3_column_int64(stmt, 0));
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    return step_error(rc);
}

// ============================================================================
// References
// ============================================================================

Status Database::reference_add(const Hash256& hash,
                               ArtifactType artifact_type,
                               const char* producer,
                               Timestamp created_at) noexcept {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "INSERT INTO artifact_refs (content_hash, artifact_type, producer, created_at) "
                      "VALUES (?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }

    sqlite3_bind_blob(stmt, 1, hash.b.data(), static_cast<int>(hash.b.size()), SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, artifact_type_name(artifact_type), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, producer ? producer : "", -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 4, created_at);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return step_error(rc);
    }
    return ok_status();
}

Status Database::reference_count(const Hash256& hash, u32* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM artifact_refs WHERE content_hash = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }
    sqlite3_bind_blob(stmt, 1, hash.b.data(), static_cast<int>(hash.b.size()), SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        *out = static_cast<u32>(sqlite3_column_int64(stmt, 0));
        sqlite3_finalize(stmt);
        return ok_status();
    }
    sqlite3_finalize(stmt);
    return step_error(rc);
}

// ============================================================================
// Tags
// ============================================================================

Status Database::tags_merge(const Hash256& hash, const TagMap& tags) noexcept {
    if (tags.empty()) {
        return ok_status();
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "INSERT OR IGNORE INTO artifact_tags (content_hash, tag_key, tag_value) VALUES (?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }

    for (const auto& [key, value] : tags) {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        sqlite3_bind_blob(stmt, 1, hash.b.data(), static_cast<int>(hash.b.size()), SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, value.c_str(), -1, SQLITE_STATIC);

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            return step_error(rc);
        }
    }

    sqlite3_finalize(stmt);
    return ok_status();
}

Status Database::tags_get(const Hash256& hash, std::vector<DbTag>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "SELECT tag_key, tag_value FROM artifact_tags WHERE content_hash = ? "
                      "ORDER BY tag_key ASC, tag_value ASC";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }
    sqlite3_bind_blob(stmt, 1, hash.b.data(), static_cast<int>(hash.b.size()), SQLITE_STATIC);

    out->clear();
    try {
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            out->push_back(DbTag{column_string(stmt, 0), column_string(stmt, 1)});
        }
    } catch (const std::bad_alloc&) {
        sqlite3_finalize(stmt);
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return step_error(rc);
    }
    return ok_status();
}

Status Database::find_by_tag(const char* key, const char* value, std::vector<Hash256>* out) noexcept {
    if (!key || !value || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "SELECT t.content_hash FROM artifact_tags t "
                      "JOIN artifacts a ON a.content_hash = t.content_hash "
                      "WHERE t.tag_key = ? AND t.tag_value = ? "
                      "ORDER BY a.created_at DESC, a.rowid DESC";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }
    sqlite3_bind_text(stmt, 1, key, -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, value, -1, SQLITE_STATIC);

    out->clear();
    try {
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            Hash256 h{};
            column_hash(stmt, 0, &h);
            out->push_back(h);
        }
    } catch (const std::bad_alloc&) {
        sqlite3_finalize(stmt);
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return step_error(rc);
    }
    return ok_status();
}

Status Database::schema_version(u32* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "SELECT version FROM schema_info WHERE id = 1", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return db_error();
    }
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        *out = static_cast<u32>(sqlite3_column_int(stmt, 0));
        sqlite3_finalize(stmt);
        return ok_status();
    }
    sqlite3_finalize(stmt);
    return make_status(StatusDomain::Db, StatusCode::Corrupt);
}

Status Database::filename(std::string* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!db_) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* path = sqlite3_db_filename(db_, "main");
    try {
        *out = path ? path : "";
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }
    return ok_status();
}

} // namespace waypoint::db
