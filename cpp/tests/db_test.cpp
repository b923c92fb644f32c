#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "test_support.hpp"
#include "waypoint/db/db.hpp"

using namespace waypoint::db;
using namespace waypoint::core;

namespace {

Hash256 make_hash(u8 fill) {
    Hash256 h{};
    for (auto& b : h.b) {
        b = fill;
    }
    return h;
}

DbArtifactInsertParams make_params(const Hash256& h, Timestamp at, u64 size = 10) {
    DbArtifactInsertParams p;
    p.hash = h;
    p.artifact_type = ArtifactType::StepOutput;
    p.producer = "test";
    p.size_bytes = size;
    p.fs_path = "/tmp/none.dat";
    p.created_at = at;
    return p;
}

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(db_.open(DbConfig{}).code, StatusCode::Ok);
    }

    void TearDown() override {
        EXPECT_EQ(db_.close().code, StatusCode::Ok);
    }

    Database db_;
};

} // namespace

//=============================================================================
// Lifecycle
//=============================================================================

TEST(Database, OpenCloseOnDiskStampsSchemaVersion) {
    waypoint::test::TempDir dir;
    const std::string path = (dir.path() / "registry.db").string();

    Database db;
    ASSERT_EQ(db.open(DbConfig{path.c_str(), "DELETE"}).code, StatusCode::Ok);
    EXPECT_TRUE(db.is_open());

    u32 version = 0;
    ASSERT_EQ(db.schema_version(&version).code, StatusCode::Ok);
    EXPECT_EQ(version, kSchemaVersion);

    ASSERT_EQ(db.close().code, StatusCode::Ok);
    EXPECT_FALSE(db.is_open());
}

TEST(Database, CallsOnClosedDatabaseAreInvalid) {
    Database db;
    bool exists = true;
    EXPECT_EQ(db.artifact_exists(make_hash(1), &exists).code, StatusCode::Invalid);
}

//=============================================================================
// Artifacts
//=============================================================================

TEST_F(DatabaseTest, InsertGetExists) {
    const Hash256 h = make_hash(0xaa);
    bool exists = true;
    ASSERT_EQ(db_.artifact_exists(h, &exists).code, StatusCode::Ok);
    EXPECT_FALSE(exists);

    ASSERT_EQ(db_.artifact_insert(make_params(h, 100, 42)).code, StatusCode::Ok);
    ASSERT_EQ(db_.artifact_exists(h, &exists).code, StatusCode::Ok);
    EXPECT_TRUE(exists);

    DbArtifactRow row;
    ASSERT_EQ(db_.artifact_get(h, &row).code, StatusCode::Ok);
    EXPECT_EQ(row.hash, h);
    EXPECT_EQ(row.artifact_type, ArtifactType::StepOutput);
    EXPECT_EQ(row.producer, "test");
    EXPECT_EQ(row.size_bytes, 42u);
    EXPECT_EQ(row.created_at, 100);
}

TEST_F(DatabaseTest, DuplicateInsertIsConflict) {
    const Hash256 h = make_hash(1);
    ASSERT_EQ(db_.artifact_insert(make_params(h, 1)).code, StatusCode::Ok);
    const Status s = db_.artifact_insert(make_params(h, 2));
    EXPECT_EQ(s.domain, StatusDomain::Db);
    EXPECT_EQ(s.code, StatusCode::Conflict);

    u64 count = 0;
    ASSERT_EQ(db_.artifact_count(&count).code, StatusCode::Ok);
    EXPECT_EQ(count, 1u);
}

TEST_F(DatabaseTest, GetMissingIsNotFound) {
    DbArtifactRow row;
    const Status s = db_.artifact_get(make_hash(9), &row);
    EXPECT_EQ(s.domain, StatusDomain::Db);
    EXPECT_EQ(s.code, StatusCode::NotFound);
}

TEST_F(DatabaseTest, ListInInsertionOrderWithLimit) {
    for (u8 i = 1; i <= 5; ++i) {
        ASSERT_EQ(db_.artifact_insert(make_params(make_hash(i), 10 * i)).code, StatusCode::Ok);
    }
    std::vector<DbArtifactRow> rows;
    ASSERT_EQ(db_.artifact_list(0, &rows).code, StatusCode::Ok);
    ASSERT_EQ(rows.size(), 5u);
    EXPECT_EQ(rows.front().hash, make_hash(1));
    EXPECT_EQ(rows.back().hash, make_hash(5));

    ASSERT_EQ(db_.artifact_list(2, &rows).code, StatusCode::Ok);
    EXPECT_EQ(rows.size(), 2u);
}

//=============================================================================
// Tags and references
//=============================================================================

TEST_F(DatabaseTest, TagsMergeKeepsExistingPairs) {
    const Hash256 h = make_hash(2);
    ASSERT_EQ(db_.artifact_insert(make_params(h, 1)).code, StatusCode::Ok);
    ASSERT_EQ(db_.tags_merge(h, {{"session", "s1"}, {"step", "1"}}).code, StatusCode::Ok);
    ASSERT_EQ(db_.tags_merge(h, {{"session", "s2"}, {"step", "1"}}).code, StatusCode::Ok);

    std::vector<DbTag> tags;
    ASSERT_EQ(db_.tags_get(h, &tags).code, StatusCode::Ok);
    ASSERT_EQ(tags.size(), 3u);
    EXPECT_EQ(tags[0].key, "session");
    EXPECT_EQ(tags[0].value, "s1");
    EXPECT_EQ(tags[1].value, "s2");
    EXPECT_EQ(tags[2].key, "step");
}

TEST_F(DatabaseTest, FindByTagNewestFirst) {
    const Hash256 older = make_hash(3);
    const Hash256 newer = make_hash(4);
    ASSERT_EQ(db_.artifact_insert(make_params(older, 100)).code, StatusCode::Ok);
    ASSERT_EQ(db_.artifact_insert(make_params(newer, 200)).code, StatusCode::Ok);
    ASSERT_EQ(db_.tags_merge(older, {{"cache_key", "k"}}).code, StatusCode::Ok);
    ASSERT_EQ(db_.tags_merge(newer, {{"cache_key", "k"}}).code, StatusCode::Ok);

    std::vector<Hash256> found;
    ASSERT_EQ(db_.find_by_tag("cache_key", "k", &found).code, StatusCode::Ok);
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0], newer);
    EXPECT_EQ(found[1], older);

    ASSERT_EQ(db_.find_by_tag("cache_key", "other", &found).code, StatusCode::Ok);
    EXPECT_TRUE(found.empty());
}

TEST_F(DatabaseTest, ReferencesCountEveryPut) {
    const Hash256 h = make_hash(5);
    ASSERT_EQ(db_.artifact_insert(make_params(h, 1)).code, StatusCode::Ok);
    ASSERT_EQ(db_.reference_add(h, ArtifactType::StepOutput, "a", 1).code, StatusCode::Ok);
    ASSERT_EQ(db_.reference_add(h, ArtifactType::CacheEntry, "b", 2).code, StatusCode::Ok);

    u32 refs = 0;
    ASSERT_EQ(db_.reference_count(h, &refs).code, StatusCode::Ok);
    EXPECT_EQ(refs, 2u);
}

//=============================================================================
// Transactions
//=============================================================================

TEST_F(DatabaseTest, RollbackDiscardsInsert) {
    ASSERT_EQ(db_.txn_begin().code, StatusCode::Ok);
    ASSERT_EQ(db_.artifact_insert(make_params(make_hash(6), 1)).code, StatusCode::Ok);
    ASSERT_EQ(db_.txn_rollback().code, StatusCode::Ok);

    u64 count = 1;
    ASSERT_EQ(db_.artifact_count(&count).code, StatusCode::Ok);
    EXPECT_EQ(count, 0u);
}

TEST_F(DatabaseTest, CommitKeepsInsertAndNestedBeginConflicts) {
    ASSERT_EQ(db_.txn_begin().code, StatusCode::Ok);
    EXPECT_EQ(db_.txn_begin().code, StatusCode::Conflict);
    ASSERT_EQ(db_.artifact_insert(make_params(make_hash(7), 1)).code, StatusCode::Ok);
    ASSERT_EQ(db_.txn_commit().code, StatusCode::Ok);

    u64 count = 0;
    ASSERT_EQ(db_.artifact_count(&count).code, StatusCode::Ok);
    EXPECT_EQ(count, 1u);
    EXPECT_EQ(db_.txn_commit().code, StatusCode::Invalid);
}
