#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "waypoint/audit/audit_log.hpp"
#include "waypoint/cache/cache_manager.hpp"
#include "waypoint/storage/artifact_store.hpp"
#include "waypoint/storage/layout.hpp"

using namespace waypoint::cache;
using namespace waypoint::core;
using waypoint::storage::as_view;
namespace fs = std::filesystem;

namespace {

std::string key_of(const std::vector<InputDescriptor>& inputs, std::string_view ns = kDefaultNamespace) {
    std::string key;
    EXPECT_EQ(compute_cache_key(ns, inputs, &key).code, StatusCode::Ok);
    return key;
}

class CacheManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg_.data_root = dir_.path() / "objects";
        ASSERT_EQ(store_.open(cfg_).code, StatusCode::Ok);
        ASSERT_EQ(log_.open(dir_.path() / "audit.jsonl").code, StatusCode::Ok);
    }

    void TearDown() override {
        EXPECT_EQ(log_.close().code, StatusCode::Ok);
        EXPECT_EQ(store_.close().code, StatusCode::Ok);
    }

    std::vector<std::string> event_types() {
        std::vector<waypoint::audit::AuditEvent> events;
        u64 malformed = 0;
        EXPECT_EQ(waypoint::audit::read_audit_events(dir_.path() / "audit.jsonl", &events, &malformed).code,
                  StatusCode::Ok);
        std::vector<std::string> types;
        for (const auto& e : events) {
            types.push_back(e.event_type);
        }
        return types;
    }

    waypoint::test::TempDir dir_;
    waypoint::storage::ArtifactStoreConfig cfg_;
    waypoint::storage::ArtifactStore store_;
    waypoint::audit::AuditLog log_;
};

ComputeFn returning(const std::string& text, int* calls) {
    return [text, calls](std::vector<u8>* out) {
        ++*calls;
        out->assign(text.begin(), text.end());
        return ok_status();
    };
}

} // namespace

// ============================================================================
// Key canonicalization
// ============================================================================

TEST(CacheKey, SetInputsAreOrderIndependent) {
    const std::string k1 = key_of({InputDescriptor::set("inputs", {"h1", "h2", "h3"})});
    const std::string k2 = key_of({InputDescriptor::set("inputs", {"h3", "h1", "h2"})});
    const std::string k3 = key_of({InputDescriptor::set("inputs", {"h2", "h3", "h1", "h1"})});
    EXPECT_EQ(k1, k2);
    EXPECT_EQ(k1, k3);

    EXPECT_NE(k1, key_of({InputDescriptor::set("inputs", {"h1", "h2"})}));
    EXPECT_NE(k1, key_of({InputDescriptor::set("inputs", {"h1", "h2", "h4"})}));
}

TEST(CacheKey, SequenceOrderMatters) {
    EXPECT_NE(key_of({InputDescriptor::sequence("inputs", {"a", "b"})}),
              key_of({InputDescriptor::sequence("inputs", {"b", "a"})}));
}

TEST(CacheKey, DescriptorPresentationOrderNeverMatters) {
    const std::string k1 = key_of({InputDescriptor::scalar("agent", "A"), InputDescriptor::scalar("model", "m")});
    const std::string k2 = key_of({InputDescriptor::scalar("model", "m"), InputDescriptor::scalar("agent", "A")});
    EXPECT_EQ(k1, k2);
}

TEST(CacheKey, FieldBoundariesAreUnambiguous) {
    EXPECT_NE(key_of({InputDescriptor::sequence("x", {"ab", "c"})}),
              key_of({InputDescriptor::sequence("x", {"a", "bc"})}));
    EXPECT_NE(key_of({InputDescriptor::scalar("x", "1")}), key_of({InputDescriptor::sequence("x", {"1"})}));
}

TEST(CacheKey, RenderedWithNamespace) {
    const std::string key = key_of({InputDescriptor::scalar("a", "b")}, "stepcache");
    ASSERT_EQ(key.size(), std::string("stepcache_").size() + 64);
    EXPECT_EQ(key.rfind("stepcache_", 0), 0u);
    EXPECT_NE(key, key_of({InputDescriptor::scalar("a", "b")}));
}

TEST(CacheKey, InvalidDescriptors) {
    std::string key;
    EXPECT_EQ(compute_cache_key("cache", {InputDescriptor::sequence("x", {}), InputDescriptor::scalar("x", "1")},
                                &key).code,
              StatusCode::Invalid);
    InputDescriptor empty_scalar{"s", InputKind::Scalar, {}};
    EXPECT_EQ(compute_cache_key("cache", {empty_scalar}, &key).code, StatusCode::Invalid);
    EXPECT_EQ(compute_cache_key("", {}, &key).code, StatusCode::Invalid);
}

// ============================================================================
// Lookup / store
// ============================================================================

TEST_F(CacheManagerTest, MissThenStoreThenHit) {
    CacheManager cache(store_, &log_);
    std::string key;
    ASSERT_EQ(cache.compute_key({InputDescriptor::scalar("q", "1")}, &key).code, StatusCode::Ok);

    CacheResult result;
    ASSERT_EQ(cache.lookup(key, &result).code, StatusCode::Ok);
    EXPECT_EQ(result.kind, CacheResultKind::Miss);
    EXPECT_FALSE(result.hit);
    EXPECT_FALSE(result.artifact_hash.has_value());

    waypoint::storage::PutResult put{};
    ASSERT_EQ(cache.store(key, as_view("value"), ArtifactMeta{}, &put).code, StatusCode::Ok);

    ASSERT_EQ(cache.lookup(key, &result).code, StatusCode::Ok);
    EXPECT_EQ(result.kind, CacheResultKind::Hit);
    EXPECT_TRUE(result.hit);
    ASSERT_TRUE(result.artifact_hash.has_value());
    EXPECT_EQ(*result.artifact_hash, put.hash);

    ArtifactRecord rec;
    ASSERT_EQ(store_.metadata(put.hash, &rec).code, StatusCode::Ok);
    EXPECT_EQ(rec.meta.artifact_type, ArtifactType::CacheEntry);
    EXPECT_EQ(rec.meta.tags.at(kTagCacheKey), key);

    const CacheStats st = cache.stats();
    EXPECT_EQ(st.misses, 1u);
    EXPECT_EQ(st.hits, 1u);
    EXPECT_EQ(st.stores, 1u);
    EXPECT_EQ(event_types(), (std::vector<std::string>{"cache_miss", "cache_store", "cache_hit"}));
}

TEST_F(CacheManagerTest, CheckOrComputeComputesOnce) {
    CacheManager cache(store_, &log_);
    const std::string key = key_of({InputDescriptor::scalar("q", "2")});

    int calls = 0;
    CacheOutcome first;
    ASSERT_EQ(cache.check_or_compute(key, returning("computed", &calls), ArtifactMeta{}, &first).code,
              StatusCode::Ok);
    EXPECT_FALSE(first.hit);
    EXPECT_EQ(first.lookup, CacheResultKind::Miss);

    CacheOutcome second;
    ASSERT_EQ(cache.check_or_compute(key, returning("computed", &calls), ArtifactMeta{}, &second).code,
              StatusCode::Ok);
    EXPECT_TRUE(second.hit);
    EXPECT_EQ(second.hash, first.hash);
    EXPECT_EQ(calls, 1);
}

TEST_F(CacheManagerTest, DeletedArtifactDegradesToMissNotError) {
    CacheManager cache(store_, &log_);
    const std::string key = key_of({InputDescriptor::scalar("q", "3")});

    waypoint::storage::PutResult put{};
    ASSERT_EQ(cache.store(key, as_view("fragile"), ArtifactMeta{}, &put).code, StatusCode::Ok);
    ASSERT_TRUE(fs::remove(waypoint::storage::blob_path(cfg_.data_root, put.hash)));

    CacheResult result;
    ASSERT_EQ(cache.lookup(key, &result).code, StatusCode::Ok);
    EXPECT_EQ(result.kind, CacheResultKind::Corrupt);
    EXPECT_FALSE(result.hit);

    // Recomputation restores the entry.
    int calls = 0;
    CacheOutcome outcome;
    ASSERT_EQ(cache.check_or_compute(key, returning("fragile", &calls), ArtifactMeta{}, &outcome).code,
              StatusCode::Ok);
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(outcome.hit);
    EXPECT_EQ(outcome.lookup, CacheResultKind::Corrupt);

    ASSERT_EQ(cache.lookup(key, &result).code, StatusCode::Ok);
    EXPECT_EQ(result.kind, CacheResultKind::Hit);

    const CacheStats st = cache.stats();
    EXPECT_EQ(st.corruptions, 2u);
    EXPECT_EQ(st.misses, 0u);

    const auto types = event_types();
    EXPECT_EQ(std::count(types.begin(), types.end(), "cache_corruption"), 2);
    EXPECT_EQ(std::count(types.begin(), types.end(), "cache_miss"), 0);
}

TEST_F(CacheManagerTest, OlderIntactEntryStillServes) {
    CacheManager cache(store_, &log_);
    const std::string key = key_of({InputDescriptor::scalar("q", "4")});

    ArtifactMeta older;
    older.created_at = 1000;
    ArtifactMeta newer;
    newer.created_at = 2000;

    waypoint::storage::PutResult old_put{};
    waypoint::storage::PutResult new_put{};
    ASSERT_EQ(cache.store(key, as_view("v1"), older, &old_put).code, StatusCode::Ok);
    ASSERT_EQ(cache.store(key, as_view("v2"), newer, &new_put).code, StatusCode::Ok);

    CacheResult result;
    ASSERT_EQ(cache.lookup(key, &result).code, StatusCode::Ok);
    ASSERT_TRUE(result.artifact_hash.has_value());
    EXPECT_EQ(*result.artifact_hash, new_put.hash);

    ASSERT_TRUE(fs::remove(waypoint::storage::blob_path(cfg_.data_root, new_put.hash)));
    ASSERT_EQ(cache.lookup(key, &result).code, StatusCode::Ok);
    EXPECT_EQ(result.kind, CacheResultKind::Hit);
    EXPECT_EQ(*result.artifact_hash, old_put.hash);
}

TEST_F(CacheManagerTest, ComputeFailureIsPropagatedAndNothingStored) {
    CacheManager cache(store_);
    const std::string key = key_of({InputDescriptor::scalar("q", "5")});

    CacheOutcome outcome;
    const Status s = cache.check_or_compute(
        key, [](std::vector<u8>*) { return make_status(StatusDomain::External, StatusCode::Unavailable); },
        ArtifactMeta{}, &outcome);
    EXPECT_EQ(s.code, StatusCode::Unavailable);

    const Status thrown = cache.check_or_compute(
        key, [](std::vector<u8>*) -> Status { throw std::runtime_error("boom"); }, ArtifactMeta{}, &outcome);
    EXPECT_EQ(thrown.domain, StatusDomain::External);

    u64 count = 1;
    ASSERT_EQ(store_.count(&count).code, StatusCode::Ok);
    EXPECT_EQ(count, 0u);
}

TEST_F(CacheManagerTest, PlainArtifactCarryingCacheKeyTagIsNotAnEntry) {
    CacheManager cache(store_, &log_);
    const std::string key = key_of({InputDescriptor::scalar("q", "plain")});

    ArtifactMeta meta;
    meta.producer = "user";
    meta.tags[kTagCacheKey] = key;
    waypoint::storage::PutResult plain{};
    ASSERT_EQ(store_.put(as_view("not cached"), meta, &plain).code, StatusCode::Ok);

    CacheResult result;
    ASSERT_EQ(cache.lookup(key, &result).code, StatusCode::Ok);
    EXPECT_EQ(result.kind, CacheResultKind::Miss);
    EXPECT_FALSE(result.artifact_hash.has_value());

    int calls = 0;
    CacheOutcome outcome;
    ASSERT_EQ(cache.check_or_compute(key, returning("cached", &calls), ArtifactMeta{}, &outcome).code,
              StatusCode::Ok);
    EXPECT_FALSE(outcome.hit);
    EXPECT_EQ(calls, 1);
    EXPECT_NE(outcome.hash, plain.hash);

    ASSERT_EQ(cache.lookup(key, &result).code, StatusCode::Ok);
    EXPECT_EQ(result.kind, CacheResultKind::Hit);
    ASSERT_TRUE(result.artifact_hash.has_value());
    EXPECT_EQ(*result.artifact_hash, outcome.hash);
}

TEST_F(CacheManagerTest, HitRecordsCallerMetadataAsReference) {
    CacheManager cache(store_, &log_);
    const std::string key = key_of({InputDescriptor::scalar("q", "shared")});

    ArtifactMeta first_meta;
    first_meta.artifact_type = ArtifactType::StepOutput;
    first_meta.producer = "A";
    first_meta.tags["session"] = "s1";
    int calls = 0;
    CacheOutcome first;
    ASSERT_EQ(cache.check_or_compute(key, returning("shared", &calls), first_meta, &first).code, StatusCode::Ok);

    ArtifactMeta second_meta = first_meta;
    second_meta.tags["session"] = "s2";
    CacheOutcome second;
    ASSERT_EQ(cache.check_or_compute(key, returning("shared", &calls), second_meta, &second).code, StatusCode::Ok);
    ASSERT_TRUE(second.hit);
    EXPECT_EQ(calls, 1);

    std::vector<Hash256> in_s2;
    ASSERT_EQ(store_.find_by_tag("session", "s2", &in_s2).code, StatusCode::Ok);
    ASSERT_EQ(in_s2.size(), 1u);
    EXPECT_EQ(in_s2[0], first.hash);

    ArtifactRecord rec;
    ASSERT_EQ(store_.metadata(first.hash, &rec).code, StatusCode::Ok);
    EXPECT_EQ(rec.reference_count, 2u);
    EXPECT_EQ(rec.meta.tags.at(kTagCacheKey), key);
}
