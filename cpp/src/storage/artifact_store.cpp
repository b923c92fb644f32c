#include "waypoint/storage/artifact_store.hpp"
#include "waypoint/storage/hashing.hpp"
#include "waypoint/storage/layout.hpp"

#include <algorithm>
#include <cerrno>
#include <new>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace waypoint::storage {

using namespace waypoint::core;
namespace fs = std::filesystem;

// ========================================================================
// Internal Helpers
// ========================================================================

namespace {
    // Registry-level NotFound surfaces as the store's NotFound; everything
    // else keeps the registry's domain so db errors stay distinguishable.
    [[nodiscard]] Status map_lookup_status(Status s) noexcept {
        if (s.code == StatusCode::NotFound) {
            return make_status(StatusDomain::Storage, StatusCode::NotFound);
        }
        return s;
    }

    [[nodiscard]] bool file_has_size(const std::string& path, u64 expected) noexcept {
        struct stat st {};
        if (::stat(path.c_str(), &st) != 0) {
            return false;
        }
        return S_ISREG(st.st_mode) && static_cast<u64>(st.st_size) == expected;
    }

    // Undo a transaction that is being abandoned; the original failure wins.
    [[nodiscard]] Status abort_txn(db::Database& db, Status cause) noexcept {
        const Status rb = db.txn_rollback();
        if (!is_ok(rb) && is_ok(cause)) {
            return rb;
        }
        return cause;
    }
}

// ========================================================================
// Lifecycle
// ========================================================================

ArtifactStore::~ArtifactStore() noexcept {
    if (open_) {
        (void)close();
    }
}

Status ArtifactStore::open(const ArtifactStoreConfig& cfg) noexcept {
    if (open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (cfg.data_root.empty()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    std::error_code ec;
    fs::create_directories(cfg.data_root, ec);
    if (ec) {
        return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(ec.value()));
    }

    std::string db_path;
    try {
        cfg_ = cfg;
        db_path = cfg.db_path.string();
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unavailable);
    }

    if (!cfg.db_path.empty()) {
        Status s = ensure_parent_dirs(cfg.db_path);
        if (!is_ok(s)) {
            return s;
        }
    }

    db::DbConfig db_cfg{};
    db_cfg.path = db_path.empty() ? nullptr : db_path.c_str();
    db_cfg.journal_mode = cfg.journal_mode;

    Status s = db_.open(db_cfg);
    if (!is_ok(s)) {
        return s;
    }

    open_ = true;
    return ok_status();
}

Status ArtifactStore::close() noexcept {
    if (!open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    open_ = false;
    return db_.close();
}

// ========================================================================
// Artifact Operations
// ========================================================================

Status ArtifactStore::put(BufferView payload, const ArtifactMeta& meta, PutResult* result) noexcept {
    if (!result) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!payload.data && payload.len > 0) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (cfg_.max_artifact_bytes > 0 && payload.len > cfg_.max_artifact_bytes) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid, static_cast<u32>(payload.len));
    }

    // Compute content hash
    Hash256 content_hash{};
    Status s = hash_compute(payload, &content_hash);
    if (!is_ok(s)) {
        return s;
    }

    const Timestamp created_at = meta.created_at != 0 ? meta.created_at : now_ms();

    std::string fs_path;
    try {
        fs_path = blob_path(cfg_.data_root, content_hash).string();
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unavailable);
    }

    // Single writer from here to commit.
    s = db_.txn_begin();
    if (!is_ok(s)) {
        return s;
    }

    bool exists = false;
    s = db_.artifact_exists(content_hash, &exists);
    if (!is_ok(s)) {
        return abort_txn(db_, s);
    }

    const std::string_view bytes(reinterpret_cast<const char*>(payload.data), static_cast<size_t>(payload.len));
    bool wrote_payload = false;
    if (exists && !file_has_size(fs_path, payload.len)) {
        // Same content, so rewriting a lost payload restores the entry.
        s = write_file_atomic(fs_path, bytes, StatusDomain::Storage);
        if (!is_ok(s)) {
            return abort_txn(db_, s);
        }
    }
    if (!exists) {
        s = write_file_atomic(fs_path, bytes, StatusDomain::Storage);
        if (!is_ok(s)) {
            return abort_txn(db_, s);
        }
        wrote_payload = true;

        db::DbArtifactInsertParams params{};
        params.hash = content_hash;
        params.artifact_type = meta.artifact_type;
        params.producer = meta.producer.c_str();
        params.size_bytes = payload.len;
        params.fs_path = fs_path.c_str();
        params.created_at = created_at;

        s = db_.artifact_insert(params);
    }

    if (is_ok(s)) {
        s = db_.tags_merge(content_hash, meta.tags);
    }
    if (is_ok(s)) {
        s = db_.reference_add(content_hash, meta.artifact_type, meta.producer.c_str(), created_at);
    }
    if (is_ok(s)) {
        s = db_.txn_commit();
    } else {
        s = abort_txn(db_, s);
    }

    if (!is_ok(s)) {
        if (wrote_payload) {
            // Cleanup filesystem blob on registry error
            ::unlink(fs_path.c_str());
        }
        return s;
    }

    result->hash = content_hash;
    result->size_bytes = payload.len;
    result->deduplicated = exists;
    return ok_status();
}

Status ArtifactStore::add_reference(const Hash256& hash, const ArtifactMeta& meta) noexcept {
    if (!open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    const Timestamp created_at = meta.created_at != 0 ? meta.created_at : now_ms();

    Status s = db_.txn_begin();
    if (!is_ok(s)) {
        return s;
    }

    bool exists = false;
    s = db_.artifact_exists(hash, &exists);
    if (is_ok(s) && !exists) {
        s = make_status(StatusDomain::Storage, StatusCode::NotFound);
    }
    if (is_ok(s)) {
        s = db_.tags_merge(hash, meta.tags);
    }
    if (is_ok(s)) {
        s = db_.reference_add(hash, meta.artifact_type, meta.producer.c_str(), created_at);
    }
    if (is_ok(s)) {
        return db_.txn_commit();
    }
    return abort_txn(db_, s);
}

Status ArtifactStore::get(const Hash256& hash, std::vector<u8>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    db::DbArtifactRow row;
    Status s = db_.artifact_get(hash, &row);
    if (!is_ok(s)) {
        return map_lookup_status(s);
    }

    s = read_payload(row, out);
    if (!is_ok(s)) {
        return s;
    }

    if (cfg_.verify_on_read) {
        Hash256 computed{};
        s = hash_compute(as_view(*out), &computed);
        if (!is_ok(s)) {
            return s;
        }
        if (computed != hash) {
            out->clear();
            return make_status(StatusDomain::Storage, StatusCode::Corrupt);
        }
    }

    return ok_status();
}

Status ArtifactStore::exists(const Hash256& hash, bool* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    db::DbArtifactRow row;
    Status s = db_.artifact_get(hash, &row);
    if (s.code == StatusCode::NotFound) {
        *out = false;
        return ok_status();
    }
    if (!is_ok(s)) {
        return s;
    }

    *out = file_has_size(row.fs_path, row.size_bytes);
    return ok_status();
}

Status ArtifactStore::metadata(const Hash256& hash, ArtifactRecord* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    db::DbArtifactRow row;
    Status s = db_.artifact_get(hash, &row);
    if (!is_ok(s)) {
        return map_lookup_status(s);
    }
    return fill_record(row, out);
}

// ========================================================================
// Query Operations
// ========================================================================

Status ArtifactStore::find_by_tag(const std::string& key,
                                  const std::string& value,
                                  std::vector<Hash256>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    return db_.find_by_tag(key.c_str(), value.c_str(), out);
}

Status ArtifactStore::scan(u64 limit, std::vector<ArtifactRecord>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    std::vector<db::DbArtifactRow> rows;
    Status s = db_.artifact_list(limit, &rows);
    if (!is_ok(s)) {
        return s;
    }

    out->clear();
    try {
        out->reserve(rows.size());
        for (const auto& row : rows) {
            ArtifactRecord rec;
            s = fill_record(row, &rec);
            if (!is_ok(s)) {
                return s;
            }
            out->push_back(std::move(rec));
        }
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unavailable);
    }
    return ok_status();
}

Status ArtifactStore::count(u64* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    return db_.artifact_count(out);
}

Status ArtifactStore::has_tag(const Hash256& hash,
                              const std::string& key,
                              const std::string& value,
                              bool* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    std::vector<db::DbTag> tags;
    Status s = db_.tags_get(hash, &tags);
    if (!is_ok(s)) {
        return s;
    }

    *out = std::any_of(tags.begin(), tags.end(),
                       [&](const db::DbTag& t) { return t.key == key && t.value == value; });
    return ok_status();
}

// ========================================================================
// Maintenance Operations
// ========================================================================

Status ArtifactStore::verify(const Hash256& hash, bool* valid) noexcept {
    if (!valid) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    db::DbArtifactRow row;
    Status s = db_.artifact_get(hash, &row);
    if (!is_ok(s)) {
        return map_lookup_status(s);
    }

    std::vector<u8> bytes;
    s = read_payload(row, &bytes);
    if (s.code == StatusCode::Corrupt) {
        *valid = false;
        return ok_status();
    }
    if (!is_ok(s)) {
        return s;
    }

    Hash256 computed{};
    s = hash_compute(as_view(bytes), &computed);
    if (!is_ok(s)) {
        return s;
    }

    *valid = (computed == hash);
    return ok_status();
}

// ========================================================================
// Private
// ========================================================================

Status ArtifactStore::read_payload(const db::DbArtifactRow& row, std::vector<u8>* out) noexcept {
    // Open file from filesystem; a registered hash without a payload is corruption.
    int fd = ::open(row.fs_path.c_str(), O_RDONLY);
    if (fd < 0) {
        if (errno == ENOENT) {
            return make_status(StatusDomain::Storage, StatusCode::Corrupt, static_cast<u32>(ENOENT));
        }
        return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
    }

    try {
        // One extra byte detects payloads that grew past the registered size.
        out->resize(static_cast<size_t>(row.size_bytes) + 1);
    } catch (const std::bad_alloc&) {
        ::close(fd);
        return make_status(StatusDomain::Storage, StatusCode::Unavailable);
    }

    u64 bytes_read = 0;
    while (bytes_read < row.size_bytes + 1) {
        ssize_t n = ::read(fd, out->data() + bytes_read, static_cast<size_t>(row.size_bytes + 1 - bytes_read));
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd);
            out->clear();
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(err));
        }
        if (n == 0) break;  // EOF
        bytes_read += static_cast<u64>(n);
    }
    ::close(fd);

    if (bytes_read != row.size_bytes) {
        out->clear();
        return make_status(StatusDomain::Storage, StatusCode::Corrupt);
    }

    out->resize(static_cast<size_t>(row.size_bytes));
    return ok_status();
}

Status ArtifactStore::fill_record(const db::DbArtifactRow& row, ArtifactRecord* out) noexcept {
    std::vector<db::DbTag> tags;
    Status s = db_.tags_get(row.hash, &tags);
    if (!is_ok(s)) {
        return s;
    }

    u32 refs = 0;
    s = db_.reference_count(row.hash, &refs);
    if (!is_ok(s)) {
        return s;
    }

    try {
        out->hash = row.hash;
        out->meta.artifact_type = row.artifact_type;
        out->meta.producer = row.producer;
        out->meta.created_at = row.created_at;
        out->meta.tags.clear();
        for (const auto& tag : tags) {
            // Multiple values for one key keep the first (lexicographic) value.
            out->meta.tags.emplace(tag.key, tag.value);
        }
        out->size_bytes = row.size_bytes;
        out->fs_path = row.fs_path;
        out->reference_count = refs;
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unavailable);
    }
    return ok_status();
}

} // namespace waypoint::storage
