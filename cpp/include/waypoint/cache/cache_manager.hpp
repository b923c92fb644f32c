#pragma once

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "waypoint/core/errors.hpp"
#include "waypoint/core/models.hpp"
#include "waypoint/core/types.hpp"
#include "waypoint/storage/artifact_store.hpp"

namespace waypoint::audit {
class AuditLog;
}

namespace waypoint::cache {

using u8 = waypoint::core::u8;
using u64 = waypoint::core::u64;

inline constexpr const char* kDefaultNamespace = "cache";
inline constexpr const char* kTagCacheKey = "cache_key";
inline constexpr const char* kTagType = "type";

// How a descriptor's values take part in the key.
enum class InputKind : u8 {
    Scalar = 0,    // exactly one value
    Sequence = 1,  // ordered; position matters
    Set = 2,       // unordered; sorted and de-duplicated before hashing
};

struct InputDescriptor {
    std::string name;
    InputKind kind{InputKind::Scalar};
    std::vector<std::string> values;

    static InputDescriptor scalar(std::string name, std::string value);
    static InputDescriptor sequence(std::string name, std::vector<std::string> values);
    static InputDescriptor set(std::string name, std::vector<std::string> values);
};

enum class CacheResultKind : u8 {
    Miss = 0,
    Hit = 1,
    Corrupt = 2,  // entry found but its artifact is unreadable; callers treat it as a miss
};

struct CacheResult {
    CacheResultKind kind{CacheResultKind::Miss};
    bool hit{false};
    std::optional<waypoint::core::Hash256> artifact_hash;
};

struct CacheStats {
    u64 hits{0};
    u64 misses{0};
    u64 corruptions{0};
    u64 stores{0};
    u64 audit_errors{0};  // events the audit log refused
};

struct CacheOutcome {
    waypoint::core::Hash256 hash{};
    CacheResultKind lookup{CacheResultKind::Miss};
    bool hit{false};
};

// Produces the payload on a miss. Must report failure through the Status.
using ComputeFn = std::function<waypoint::core::Status(std::vector<u8>* out)>;

// Canonicalizes descriptors (ordered by name; set values sorted and unique),
// hashes the length-prefixed encoding with BLAKE3 and renders
// "<ns>_<64 hex>". Duplicate descriptor names and scalars without exactly
// one value are {Invalid, Cache}.
[[nodiscard]] waypoint::core::Status compute_cache_key(std::string_view ns,
                                                       const std::vector<InputDescriptor>& inputs,
                                                       std::string* out) noexcept;

// Keyed cache over an ArtifactStore. Entries are tags on stored artifacts,
// so they are exactly as durable as the registry.
class CacheManager {
public:
    explicit CacheManager(waypoint::storage::ArtifactStore& store,
                          waypoint::audit::AuditLog* audit = nullptr,
                          std::string ns = kDefaultNamespace);

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    [[nodiscard]] waypoint::core::Status compute_key(const std::vector<InputDescriptor>& inputs,
                                                     std::string* out) const noexcept;

    // Candidates are artifacts tagged {type: cache-entry, cache_key: key}.
    // A miss is data, not an error. An entry whose artifact fails `exists`
    // comes back as Corrupt (hit = false) and is logged as cache_corruption.
    [[nodiscard]] waypoint::core::Status lookup(const std::string& key, CacheResult* out) noexcept;

    // Puts `payload` tagged {type: cache-entry, cache_key: key} plus any tags
    // in `extra`. extra.artifact_type Opaque is stored as CacheEntry.
    [[nodiscard]] waypoint::core::Status store(const std::string& key,
                                               waypoint::storage::BufferView payload,
                                               const waypoint::core::ArtifactMeta& extra,
                                               waypoint::storage::PutResult* result) noexcept;

    // lookup, then compute + store on Miss or Corrupt. A Hit records `extra`
    // against the cached artifact as a new reference.
    [[nodiscard]] waypoint::core::Status check_or_compute(const std::string& key,
                                                          const ComputeFn& compute,
                                                          const waypoint::core::ArtifactMeta& extra,
                                                          CacheOutcome* out) noexcept;

    [[nodiscard]] CacheStats stats() const noexcept;
    [[nodiscard]] const std::string& key_namespace() const noexcept { return ns_; }

private:
    [[nodiscard]] static waypoint::core::Status entry_meta(const std::string& key,
                                                           const waypoint::core::ArtifactMeta& extra,
                                                           waypoint::core::ArtifactMeta* out) noexcept;
    void record(std::string_view event_type, const std::string& key,
                const waypoint::core::Hash256* hash) noexcept;

    waypoint::storage::ArtifactStore& store_;
    waypoint::audit::AuditLog* audit_{nullptr};
    std::string ns_;

    std::atomic<u64> hits_{0};
    std::atomic<u64> misses_{0};
    std::atomic<u64> corruptions_{0};
    std::atomic<u64> stores_{0};
    std::atomic<u64> audit_errors_{0};
};

} // namespace waypoint::cache
