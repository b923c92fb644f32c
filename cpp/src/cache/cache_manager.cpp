#include "waypoint/cache/cache_manager.hpp"
#include "waypoint/audit/audit_log.hpp"
#include "waypoint/storage/hashing.hpp"

#include <algorithm>
#include <exception>
#include <new>
#include <set>

namespace waypoint::cache {

using namespace waypoint::core;
using waypoint::storage::BufferView;
using waypoint::storage::PutResult;

// ========================================================================
// Descriptors
// ========================================================================

InputDescriptor InputDescriptor::scalar(std::string name, std::string value) {
    InputDescriptor d;
    d.name = std::move(name);
    d.kind = InputKind::Scalar;
    d.values.push_back(std::move(value));
    return d;
}

InputDescriptor InputDescriptor::sequence(std::string name, std::vector<std::string> values) {
    return InputDescriptor{std::move(name), InputKind::Sequence, std::move(values)};
}

InputDescriptor InputDescriptor::set(std::string name, std::vector<std::string> values) {
    return InputDescriptor{std::move(name), InputKind::Set, std::move(values)};
}

namespace {
    const char* kind_tag(InputKind kind) noexcept {
        switch (kind) {
            case InputKind::Scalar: return "s";
            case InputKind::Sequence: return "q";
            case InputKind::Set: return "u";
        }
        return "?";
    }

    // <len>:<bytes> so no value can run into the next one.
    void feed_field(waypoint::storage::Hasher& h, std::string_view field) {
        const std::string len = std::to_string(field.size());
        h.update(std::string_view(len));
        h.update(std::string_view(":"));
        h.update(field);
    }
}

Status compute_cache_key(std::string_view ns, const std::vector<InputDescriptor>& inputs, std::string* out) noexcept {
    if (!out || ns.empty()) {
        return make_status(StatusDomain::Cache, StatusCode::Invalid);
    }

    try {
        std::vector<const InputDescriptor*> ordered;
        ordered.reserve(inputs.size());
        for (const auto& d : inputs) {
            if (d.kind == InputKind::Scalar && d.values.size() != 1) {
                return make_status(StatusDomain::Cache, StatusCode::Invalid);
            }
            ordered.push_back(&d);
        }
        std::stable_sort(ordered.begin(), ordered.end(),
                         [](const InputDescriptor* a, const InputDescriptor* b) { return a->name < b->name; });
        for (size_t i = 1; i < ordered.size(); ++i) {
            if (ordered[i - 1]->name == ordered[i]->name) {
                return make_status(StatusDomain::Cache, StatusCode::Invalid);
            }
        }

        waypoint::storage::Hasher hasher;
        feed_field(hasher, "waypoint-cache-key/v1");
        feed_field(hasher, std::to_string(ordered.size()));
        for (const InputDescriptor* d : ordered) {
            feed_field(hasher, d->name);
            feed_field(hasher, kind_tag(d->kind));

            if (d->kind == InputKind::Set) {
                const std::set<std::string> unique(d->values.begin(), d->values.end());
                feed_field(hasher, std::to_string(unique.size()));
                for (const auto& v : unique) {
                    feed_field(hasher, v);
                }
            } else {
                feed_field(hasher, std::to_string(d->values.size()));
                for (const auto& v : d->values) {
                    feed_field(hasher, v);
                }
            }
        }

        Hash256 digest{};
        Status s = hasher.finalize(&digest);
        if (!is_ok(s)) {
            return s;
        }

        std::string key(ns);
        key += "_";
        key += waypoint::storage::hash_to_hex(digest);
        *out = std::move(key);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Cache, StatusCode::Unavailable);
    }
    return ok_status();
}

// ========================================================================
// CacheManager
// ========================================================================

CacheManager::CacheManager(waypoint::storage::ArtifactStore& store, waypoint::audit::AuditLog* audit, std::string ns)
    : store_(store), audit_(audit), ns_(ns.empty() ? std::string(kDefaultNamespace) : std::move(ns)) {}

Status CacheManager::compute_key(const std::vector<InputDescriptor>& inputs, std::string* out) const noexcept {
    return compute_cache_key(ns_, inputs, out);
}

void CacheManager::record(std::string_view event_type, const std::string& key, const Hash256* hash) noexcept {
    if (!audit_) {
        return;
    }
    Status s = ok_status();
    try {
        nlohmann::json payload = {{"cache_key", key}};
        if (hash) {
            payload["artifact_hash"] = waypoint::storage::hash_to_hex(*hash);
        }
        s = audit_->append(audit::kComponentCache, event_type, payload);
    } catch (const std::bad_alloc&) {
        s = make_status(StatusDomain::Cache, StatusCode::Unavailable);
    }
    if (!is_ok(s)) {
        audit_errors_.fetch_add(1, std::memory_order_relaxed);
    }
}

Status CacheManager::lookup(const std::string& key, CacheResult* out) noexcept {
    if (!out || key.empty()) {
        return make_status(StatusDomain::Cache, StatusCode::Invalid);
    }

    std::vector<Hash256> tagged;
    Status s = store_.find_by_tag(kTagCacheKey, key, &tagged);
    if (!is_ok(s)) {
        return s;
    }

    // Only artifacts written as cache entries serve a key.
    std::vector<Hash256> candidates;
    try {
        const std::string entry_type = artifact_type_name(ArtifactType::CacheEntry);
        for (const auto& hash : tagged) {
            bool is_entry = false;
            s = store_.has_tag(hash, kTagType, entry_type, &is_entry);
            if (!is_ok(s)) {
                return s;
            }
            if (is_entry) {
                candidates.push_back(hash);
            }
        }
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Cache, StatusCode::Unavailable);
    }

    *out = CacheResult{};
    if (candidates.empty()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        record("cache_miss", key, nullptr);
        return ok_status();
    }

    // Newest entry first; an older intact entry still serves the key.
    for (const auto& candidate : candidates) {
        bool present = false;
        s = store_.exists(candidate, &present);
        if (!is_ok(s)) {
            return s;
        }
        if (present) {
            out->kind = CacheResultKind::Hit;
            out->hit = true;
            out->artifact_hash = candidate;
            hits_.fetch_add(1, std::memory_order_relaxed);
            record("cache_hit", key, &candidate);
            return ok_status();
        }
    }

    out->kind = CacheResultKind::Corrupt;
    out->hit = false;
    out->artifact_hash = candidates.front();
    corruptions_.fetch_add(1, std::memory_order_relaxed);
    record("cache_corruption", key, &candidates.front());
    return ok_status();
}

Status CacheManager::entry_meta(const std::string& key, const ArtifactMeta& extra, ArtifactMeta* out) noexcept {
    try {
        *out = extra;
        if (out->artifact_type == ArtifactType::Opaque) {
            out->artifact_type = ArtifactType::CacheEntry;
        }
        out->tags[kTagType] = artifact_type_name(ArtifactType::CacheEntry);
        out->tags[kTagCacheKey] = key;
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Cache, StatusCode::Unavailable);
    }
    return ok_status();
}

Status CacheManager::store(const std::string& key,
                           BufferView payload,
                           const ArtifactMeta& extra,
                           PutResult* result) noexcept {
    if (!result || key.empty()) {
        return make_status(StatusDomain::Cache, StatusCode::Invalid);
    }

    ArtifactMeta meta;
    Status s = entry_meta(key, extra, &meta);
    if (!is_ok(s)) {
        return s;
    }

    s = store_.put(payload, meta, result);
    if (!is_ok(s)) {
        return s;
    }

    stores_.fetch_add(1, std::memory_order_relaxed);
    record("cache_store", key, &result->hash);
    return ok_status();
}

Status CacheManager::check_or_compute(const std::string& key,
                                      const ComputeFn& compute,
                                      const ArtifactMeta& extra,
                                      CacheOutcome* out) noexcept {
    if (!out || !compute) {
        return make_status(StatusDomain::Cache, StatusCode::Invalid);
    }

    CacheResult cached;
    Status s = lookup(key, &cached);
    if (!is_ok(s)) {
        return s;
    }

    if (cached.hit && cached.artifact_hash) {
        // The reusing caller's tags and reference land on the cached entry.
        ArtifactMeta meta;
        s = entry_meta(key, extra, &meta);
        if (!is_ok(s)) {
            return s;
        }
        s = store_.add_reference(*cached.artifact_hash, meta);
        if (!is_ok(s)) {
            return s;
        }
        out->hash = *cached.artifact_hash;
        out->lookup = cached.kind;
        out->hit = true;
        return ok_status();
    }

    std::vector<u8> payload;
    try {
        s = compute(&payload);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Cache, StatusCode::Unavailable);
    } catch (const std::exception&) {
        return make_status(StatusDomain::External, StatusCode::Unknown);
    }
    if (!is_ok(s)) {
        return s;
    }

    PutResult put{};
    s = store(key, waypoint::storage::as_view(payload), extra, &put);
    if (!is_ok(s)) {
        return s;
    }

    out->hash = put.hash;
    out->lookup = cached.kind;
    out->hit = false;
    return ok_status();
}

CacheStats CacheManager::stats() const noexcept {
    CacheStats st;
    st.hits = hits_.load(std::memory_order_relaxed);
    st.misses = misses_.load(std::memory_order_relaxed);
    st.corruptions = corruptions_.load(std::memory_order_relaxed);
    st.stores = stores_.load(std::memory_order_relaxed);
    st.audit_errors = audit_errors_.load(std::memory_order_relaxed);
    return st;
}

} // namespace waypoint::cache
