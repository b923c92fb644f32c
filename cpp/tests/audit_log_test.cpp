#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "test_support.hpp"
#include "waypoint/audit/audit_log.hpp"

using namespace waypoint::audit;
using waypoint::core::Status;
using waypoint::core::StatusCode;

TEST(AuditLog, AppendsOneJsonLinePerEvent) {
    waypoint::test::TempDir dir;
    const auto path = dir.path() / "s1" / "audit.jsonl";

    AuditLog log;
    ASSERT_EQ(log.open(path).code, StatusCode::Ok);
    ASSERT_EQ(log.append(kComponentStore, "artifact_put", {{"hash", "ab"}}).code, StatusCode::Ok);
    ASSERT_EQ(log.append(kComponentCache, "cache_miss", nullptr).code, StatusCode::Ok);
    EXPECT_EQ(log.appended(), 2u);
    ASSERT_EQ(log.close().code, StatusCode::Ok);

    std::vector<AuditEvent> events;
    u64 malformed = 0;
    ASSERT_EQ(read_audit_events(path, &events, &malformed).code, StatusCode::Ok);
    EXPECT_EQ(malformed, 0u);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].component, "artifact_store");
    EXPECT_EQ(events[0].event_type, "artifact_put");
    EXPECT_EQ(events[0].payload.at("hash"), "ab");
    EXPECT_TRUE(events[1].payload.is_object());
    EXPECT_LE(events[0].timestamp, events[1].timestamp);
}

TEST(AuditLog, ReopenAppendsRatherThanTruncates) {
    waypoint::test::TempDir dir;
    const auto path = dir.path() / "audit.jsonl";

    for (int round = 0; round < 2; ++round) {
        AuditLog log;
        ASSERT_EQ(log.open(path).code, StatusCode::Ok);
        ASSERT_EQ(log.append(kComponentOrchestrator, "step_started", {{"step", round + 1}}).code, StatusCode::Ok);
        ASSERT_EQ(log.close().code, StatusCode::Ok);
    }

    std::vector<AuditEvent> events;
    u64 malformed = 0;
    ASSERT_EQ(read_audit_events(path, &events, &malformed).code, StatusCode::Ok);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].payload.at("step"), 2);
}

TEST(AuditLog, ConcurrentAppendsNeverInterleave) {
    waypoint::test::TempDir dir;
    const auto path = dir.path() / "audit.jsonl";

    AuditLog log;
    ASSERT_EQ(log.open(path).code, StatusCode::Ok);

    const std::string big(4000, 'x');
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&log, &big, t] {
            for (int i = 0; i < 50; ++i) {
                EXPECT_EQ(log.append(kComponentStore, "artifact_put", {{"t", t}, {"blob", big}}).code,
                          StatusCode::Ok);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    ASSERT_EQ(log.close().code, StatusCode::Ok);

    std::vector<AuditEvent> events;
    u64 malformed = 0;
    ASSERT_EQ(read_audit_events(path, &events, &malformed).code, StatusCode::Ok);
    EXPECT_EQ(malformed, 0u);
    EXPECT_EQ(events.size(), 200u);
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_LE(events[i - 1].timestamp, events[i].timestamp);
    }
}

TEST(AuditLog, ReaderSkipsMalformedLines) {
    waypoint::test::TempDir dir;
    const auto path = dir.path() / "audit.jsonl";
    waypoint::test::write_text(path,
                               "{\"ts\":1,\"component\":\"c\",\"event\":\"a\",\"payload\":{}}\n"
                               "not json\n"
                               "{\"ts\":2,\"component\":\"c\"}\n"
                               "\n"
                               "{\"ts\":3,\"component\":\"c\",\"event\":\"b\",\"payload\":{}}\n");

    std::vector<AuditEvent> events;
    u64 malformed = 0;
    ASSERT_EQ(read_audit_events(path, &events, &malformed).code, StatusCode::Ok);
    EXPECT_EQ(malformed, 2u);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].event_type, "b");
}

TEST(AuditLog, ErrorsAreStatuses) {
    AuditLog log;
    EXPECT_FALSE(log.is_open());
    EXPECT_EQ(log.append(kComponentStore, "x", nullptr).code, StatusCode::Invalid);

    waypoint::test::TempDir dir;
    ASSERT_EQ(log.open(dir.path() / "a.jsonl").code, StatusCode::Ok);
    EXPECT_EQ(log.append("", "x", nullptr).code, StatusCode::Invalid);
    EXPECT_EQ(log.append(kComponentStore, "", nullptr).code, StatusCode::Invalid);
    ASSERT_EQ(log.close().code, StatusCode::Ok);

    std::vector<AuditEvent> events;
    u64 malformed = 0;
    const Status s = read_audit_events(dir.path() / "missing.jsonl", &events, &malformed);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(s.domain, waypoint::core::StatusDomain::Audit);
}
