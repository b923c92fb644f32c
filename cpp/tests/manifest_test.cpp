#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "test_support.hpp"
#include "waypoint/audit/audit_log.hpp"
#include "waypoint/audit/manifest.hpp"
#include "waypoint/storage/artifact_store.hpp"
#include "waypoint/storage/layout.hpp"

using namespace waypoint::audit;
using namespace waypoint::core;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

class ManifestTest : public ::testing::Test {
protected:
    void SetUp() override {
        waypoint::storage::ArtifactStoreConfig cfg;
        cfg.data_root = dir_.path() / "objects";
        ASSERT_EQ(store_.open(cfg).code, StatusCode::Ok);
        session_root_ = dir_.path() / "sessions" / "s1";
        ASSERT_EQ(log_.open(waypoint::storage::session_audit_path(session_root_)).code, StatusCode::Ok);
    }

    void TearDown() override {
        EXPECT_EQ(log_.close().code, StatusCode::Ok);
        EXPECT_EQ(store_.close().code, StatusCode::Ok);
    }

    void put_tagged(const std::string& text, const std::string& session) {
        ArtifactMeta meta;
        meta.tags["session"] = session;
        waypoint::storage::PutResult put{};
        ASSERT_EQ(store_.put(waypoint::storage::as_view(text), meta, &put).code, StatusCode::Ok);
    }

    void append(const char* component, const char* event, const json& payload) {
        ASSERT_EQ(log_.append(component, event, payload).code, StatusCode::Ok);
    }

    // Two lookups hit, one missed; step 1 completed twice (resumed).
    void record_session() {
        append(kComponentCache, "cache_miss", {{"cache_key", "k1"}});
        append(kComponentOrchestrator, "step_completed",
               {{"step", 1}, {"agent", "Planner"}, {"duration_ms", 40}, {"cache_hit", false}, {"outputs", json::array({"aa"})}});
        append(kComponentCache, "cache_hit", {{"cache_key", "k1"}});
        append(kComponentOrchestrator, "step_completed",
               {{"step", 1}, {"agent", "Planner"}, {"duration_ms", 2}, {"cache_hit", true}, {"outputs", json::array({"aa"})}});
        append(kComponentCache, "cache_hit", {{"cache_key", "k2"}});
        append(kComponentOrchestrator, "step_completed",
               {{"step", 2}, {"agent", "Writer"}, {"duration_ms", 5}, {"cache_hit", true}, {"outputs", json::array({"bb", "cc"})}});
    }

    waypoint::test::TempDir dir_;
    waypoint::storage::ArtifactStore store_;
    AuditLog log_;
    fs::path session_root_;
};

} // namespace

TEST_F(ManifestTest, SummarizesAuditStreamAndRegistry) {
    record_session();
    put_tagged("one", "s1");
    put_tagged("two", "s1");
    put_tagged("elsewhere", "s0");

    Manifest m;
    ASSERT_EQ(build_manifest(session_root_, "s1", store_, &m).code, StatusCode::Ok);
    EXPECT_EQ(m.session_id, "s1");
    EXPECT_EQ(m.cache_hits, 2u);
    EXPECT_EQ(m.cache_misses, 1u);
    EXPECT_EQ(m.cache_corruptions, 0u);
    EXPECT_DOUBLE_EQ(m.hit_rate, 2.0 / 3.0);
    ASSERT_EQ(m.steps.size(), 2u);
    EXPECT_EQ(m.steps[0].step, 1u);
    EXPECT_TRUE(m.steps[0].cache_hit);
    EXPECT_EQ(m.steps[0].duration_ms, 2u);
    EXPECT_EQ(m.steps[1].outputs, (std::vector<std::string>{"bb", "cc"}));
    EXPECT_EQ(m.artifacts_total, 3u);
    EXPECT_EQ(m.artifacts_session, 2u);
    EXPECT_EQ(m.audit_event_count, 6u);
    EXPECT_GT(m.finalized_at, 0);
}

TEST_F(ManifestTest, EmptySessionHasZeroHitRate) {
    Manifest m;
    ASSERT_EQ(build_manifest(dir_.path() / "sessions" / "never", "never", store_, &m).code, StatusCode::Ok);
    EXPECT_EQ(m.hit_rate, 0.0);
    EXPECT_TRUE(m.steps.empty());
    EXPECT_EQ(m.audit_event_count, 0u);
}

TEST_F(ManifestTest, FinalizeWritesOnce) {
    record_session();

    Manifest m;
    ASSERT_EQ(finalize_manifest(session_root_, "s1", store_, &log_, &m).code, StatusCode::Ok);

    const fs::path path = waypoint::storage::session_manifest_path(session_root_);
    const json doc = json::parse(waypoint::test::read_text(path));
    EXPECT_EQ(doc.at("session_id"), "s1");
    EXPECT_EQ(doc.at("cache").at("hits"), 2);
    EXPECT_EQ(doc.at("cache").at("misses"), 1);
    EXPECT_EQ(doc.at("steps").size(), 2u);
    EXPECT_EQ(doc.at("audit_event_count"), 6);

    std::vector<Hash256> manifests;
    ASSERT_EQ(store_.find_by_tag("type", "manifest", &manifests).code, StatusCode::Ok);
    ASSERT_EQ(manifests.size(), 1u);
    std::vector<u8> stored;
    ASSERT_EQ(store_.get(manifests[0], &stored).code, StatusCode::Ok);
    EXPECT_EQ(std::string(stored.begin(), stored.end()), waypoint::test::read_text(path));

    const std::string before = waypoint::test::read_text(path);
    const Status again = finalize_manifest(session_root_, "s1", store_, &log_, nullptr);
    EXPECT_EQ(again.code, StatusCode::Conflict);
    EXPECT_EQ(again.domain, StatusDomain::Audit);
    EXPECT_EQ(waypoint::test::read_text(path), before);

    std::vector<AuditEvent> events;
    u64 malformed = 0;
    ASSERT_EQ(read_audit_events(log_.path(), &events, &malformed).code, StatusCode::Ok);
    EXPECT_EQ(events.back().event_type, "manifest_finalized");
}
