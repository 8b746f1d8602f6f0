/**
 * @file test_session.cpp
 * @brief Unit tests for SID generation and the session log tree
 */

#include <gtest/gtest.h>
#include "../src/core/include/sgate_session.hpp"
#include "../src/core/include/sgate_errors.hpp"
#include "../src/core/include/sgate_event_log.hpp"
#include "sgate_test_util.hpp"

#include <filesystem>
#include <set>
#include <thread>
#include <vector>

using namespace sgate;
using sgate_test::TempDir;
using sgate_test::slurp;

namespace {

TimePoint at(const std::string& iso) {
    auto tp = parse_iso_utc(iso);
    if (!tp) throw std::runtime_error("bad test timestamp " + iso);
    return *tp;
}

} // anonymous namespace

class SessionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.dir = tmp.sub("sessions");
        config.utc = true;
        config.retry_backoff = std::chrono::milliseconds(1);
        events = std::make_shared<EventLog>();
        registry = std::make_unique<SessionRegistry>(config, events);
    }

    TempDir tmp;
    SessionRegistryConfig config;
    std::shared_ptr<EventLog> events;
    std::unique_ptr<SessionRegistry> registry;
};

// ---- SID generation ----

TEST_F(SessionRegistryTest, SidFormat) {
    EXPECT_EQ(registry->generate_sid("192.168.1.50", "main", at("2025-01-08T14:22:00Z")),
              "192-168-1-50_main_08-JAN'25_14.22");
}

TEST_F(SessionRegistryTest, SecondSessionInSameMinuteGetsSuffix) {
    auto t0 = at("2025-01-08T14:22:00Z");
    auto first = registry->begin("192.168.1.50", "main", t0);
    EXPECT_EQ(first.sid, "192-168-1-50_main_08-JAN'25_14.22");

    std::string next = registry->generate_sid("192.168.1.50", "main", t0 + std::chrono::seconds(1));
    EXPECT_EQ(next, "192-168-1-50_main_08-JAN'25_14.22-1");

    registry->begin("192.168.1.50", "main", t0 + std::chrono::seconds(1));
    EXPECT_EQ(registry->generate_sid("192.168.1.50", "main", t0 + std::chrono::seconds(2)),
              "192-168-1-50_main_08-JAN'25_14.22-2");
}

TEST_F(SessionRegistryTest, ClosedSessionStillReservesSid) {
    auto t0 = at("2025-01-08T14:22:00Z");
    auto s = registry->begin("10.0.0.1", "ops", t0);
    registry->close_session(s.sid, t0 + std::chrono::seconds(5), 0);
    EXPECT_EQ(registry->generate_sid("10.0.0.1", "ops", t0 + std::chrono::seconds(10)),
              s.sid + "-1");
}

TEST_F(SessionRegistryTest, Ipv6AndUnderscorePrincipal) {
    auto t0 = at("2024-12-31T23:59:30Z");
    auto s = registry->begin("2001:db8::1", "build_bot", t0);
    EXPECT_EQ(s.sid, "2001-db8--1_build_bot_31-DEC'24_23.59");
    EXPECT_EQ(s.log_path, config.dir + "/2024/12/31/" + s.sid + ".log");
    ASSERT_TRUE(registry->find(s.sid).has_value());
    EXPECT_EQ(registry->find(s.sid)->principal, "build_bot");
}

TEST_F(SessionRegistryTest, RejectsBadIdentity) {
    auto t0 = at("2025-01-08T14:22:00Z");
    EXPECT_THROW(registry->generate_sid("999.1.1.1", "main", t0), ValidationError);
    EXPECT_THROW(registry->generate_sid("10.0.0.1", "../root", t0), ValidationError);
    EXPECT_THROW(registry->log_path_for("not-a-sid"), ValidationError);
}

TEST_F(SessionRegistryTest, SuffixSpaceExhausted) {
    config.max_suffix = 2;
    SessionRegistry small(config);
    auto t0 = at("2025-01-08T14:22:00Z");
    small.begin("10.0.0.1", "main", t0);
    small.begin("10.0.0.1", "main", t0);
    small.begin("10.0.0.1", "main", t0);
    EXPECT_THROW(small.generate_sid("10.0.0.1", "main", t0), ConflictError);
}

// ---- Open / close ----

TEST_F(SessionRegistryTest, OpenNeverOverwrites) {
    auto t0 = at("2025-01-08T14:22:00Z");
    auto s = registry->begin("10.0.0.1", "main", t0);
    std::string before = slurp(s.log_path);
    EXPECT_THROW(registry->open_session(s.sid, "10.0.0.2", "other", t0), ConflictError);
    EXPECT_EQ(slurp(s.log_path), before);
}

TEST_F(SessionRegistryTest, CloseWritesFooter) {
    auto t0 = at("2025-01-08T14:22:00Z");
    auto s = registry->begin("192.168.1.50", "main", t0);
    registry->append_activity(s.sid, "cmd", "ls -la", t0 + std::chrono::seconds(3));

    auto closed = registry->close_session(s.sid, t0 + std::chrono::seconds(751), 0);
    EXPECT_EQ(closed.state, SessionState::CLOSED);
    EXPECT_EQ(closed.duration(), std::chrono::seconds(751));

    std::string log = slurp(s.log_path);
    EXPECT_EQ(log.rfind("# sgate session log\nSID: " + s.sid + "\n", 0), 0u);
    EXPECT_NE(log.find("2025-01-08T14:22:03Z [cmd] ls -la\n"), std::string::npos);
    EXPECT_NE(log.find("End: 2025-01-08T14:34:31Z\n"), std::string::npos);
    EXPECT_NE(log.find("Duration: 00:12:31\n"), std::string::npos);
    EXPECT_NE(log.find("Exit-Status: 0\n"), std::string::npos);

    auto found = registry->find(s.sid);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->state, SessionState::CLOSED);
    EXPECT_EQ(found->exit_status, std::optional<int>(0));
    EXPECT_EQ(found->source_ip, "192.168.1.50");
}

TEST_F(SessionRegistryTest, DoubleCloseRejected) {
    auto t0 = at("2025-01-08T14:22:00Z");
    auto s = registry->begin("10.0.0.1", "main", t0);
    registry->close_session(s.sid, t0 + std::chrono::seconds(1), 130);
    EXPECT_THROW(registry->close_session(s.sid, t0 + std::chrono::seconds(2), 0), ValidationError);
    EXPECT_THROW(registry->append_activity(s.sid, "cmd", "late"), ValidationError);
}

TEST_F(SessionRegistryTest, UnknownSessionRejectedWithoutSideEffects) {
    auto t0 = at("2025-01-08T14:22:00Z");
    registry->begin("10.0.0.1", "main", t0);
    std::string ghost = "10-0-0-9_main_08-JAN'25_14.22";

    EXPECT_THROW(registry->close_session(ghost, t0, 0), ValidationError);
    EXPECT_THROW(registry->append_activity(ghost, "cmd", "x", t0), ValidationError);
    EXPECT_FALSE(std::filesystem::exists(registry->log_path_for(ghost)));
}

TEST_F(SessionRegistryTest, LongBodyStillFindsFooter) {
    auto t0 = at("2025-01-08T14:22:00Z");
    auto s = registry->begin("10.0.0.1", "main", t0);
    for (int i = 0; i < 200; ++i) {
        registry->append_activity(s.sid, "cmd", "echo line " + std::to_string(i), t0);
    }
    registry->close_session(s.sid, t0 + std::chrono::seconds(60), 1);

    auto found = registry->find(s.sid);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->state, SessionState::CLOSED);
    EXPECT_EQ(found->exit_status, std::optional<int>(1));
}

// ---- Active markers ----

TEST_F(SessionRegistryTest, CurrentFollowsMarker) {
    auto t0 = at("2025-01-08T14:22:00Z");
    EXPECT_FALSE(registry->current("main", "10.0.0.1").has_value());

    auto s = registry->begin("10.0.0.1", "main", t0);
    auto cur = registry->current("main", "10.0.0.1");
    ASSERT_TRUE(cur.has_value());
    EXPECT_EQ(cur->sid, s.sid);

    registry->close_session(s.sid, t0 + std::chrono::seconds(1), 0);
    EXPECT_FALSE(registry->current("main", "10.0.0.1").has_value());
    EXPECT_FALSE(std::filesystem::is_symlink(registry->marker_path("main", "10.0.0.1")));
}

TEST_F(SessionRegistryTest, ClosingOlderSessionKeepsNewerMarker) {
    auto t0 = at("2025-01-08T14:22:00Z");
    auto older = registry->begin("10.0.0.1", "main", t0);
    auto newer = registry->begin("10.0.0.1", "main", t0 + std::chrono::seconds(2));

    registry->close_session(older.sid, t0 + std::chrono::seconds(3), 0);
    auto cur = registry->current("main", "10.0.0.1");
    ASSERT_TRUE(cur.has_value());
    EXPECT_EQ(cur->sid, newer.sid);
}

// ---- Lookup ----

TEST_F(SessionRegistryTest, MalformedDateFilterRejected) {
    registry->begin("10.0.0.1", "alice", at("2025-01-08T09:00:00Z"));
    for (const char* bad : {"2025/01/08", "08-01-2025", "2025-1-8", "2025-13-01", "2025-01-00", "abcd-ef-gh"}) {
        SessionFilter f;
        f.date = bad;
        EXPECT_THROW(registry->lookup(f), ValidationError) << bad;
    }

    SessionFilter empty_day;
    empty_day.date = "2025-02-01";
    EXPECT_NO_THROW(registry->lookup(empty_day));
}

TEST_F(SessionRegistryTest, LookupFilters) {
    auto d1 = at("2025-01-08T09:00:00Z");
    auto d2 = at("2025-01-09T09:00:00Z");
    auto a = registry->begin("10.0.0.1", "alice", d1);
    registry->begin("10.0.0.2", "bob", d1);
    registry->begin("10.0.0.1", "alice", d2);
    registry->close_session(a.sid, d1 + std::chrono::minutes(5), 0);

    auto count = [this](const SessionFilter& f) {
        size_t n = 0;
        for (const auto& s : registry->lookup(f)) {
            (void)s;
            ++n;
        }
        return n;
    };

    EXPECT_EQ(count({}), 3u);

    SessionFilter by_principal;
    by_principal.principal = "alice";
    EXPECT_EQ(count(by_principal), 2u);

    SessionFilter by_date;
    by_date.date = "2025-01-08";
    EXPECT_EQ(count(by_date), 2u);

    SessionFilter open_alice;
    open_alice.principal = "alice";
    open_alice.state = SessionState::OPEN;
    EXPECT_EQ(count(open_alice), 1u);

    SessionFilter by_ip;
    by_ip.source_ip = "10.0.0.2";
    EXPECT_EQ(count(by_ip), 1u);

    SessionFilter nothing;
    nothing.date = "2030-01-01";
    EXPECT_EQ(count(nothing), 0u);
}

TEST_F(SessionRegistryTest, LookupIsRestartable) {
    auto t0 = at("2025-01-08T14:22:00Z");
    registry->begin("10.0.0.1", "main", t0);
    registry->begin("10.0.0.2", "main", t0 + std::chrono::hours(30));

    auto range = registry->lookup();
    std::vector<std::string> first, second;
    for (const auto& s : range) first.push_back(s.sid);
    for (const auto& s : range) second.push_back(s.sid);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first, second);
}

TEST_F(SessionRegistryTest, StrayFilesIgnored) {
    sgate_test::spit(config.dir + "/2025/01/08/notes.log", "not a session\n");
    sgate_test::spit(config.dir + "/2025/01/08/readme.txt", "hello\n");
    auto range = registry->lookup();
    EXPECT_TRUE(range.begin() == range.end());
}

// ---- Concurrency ----

TEST_F(SessionRegistryTest, ConcurrentBeginsGetDistinctSids) {
    auto t0 = at("2025-01-08T14:22:00Z");
    std::vector<std::thread> threads;
    std::vector<std::string> sids(4);
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i] {
            // Concurrent generators may race to the same SID; begin() retries once
            for (int attempt = 0; attempt < 5 && sids[i].empty(); ++attempt) {
                try {
                    sids[i] = registry->begin("10.0.0.1", "main", t0).sid;
                } catch (const ConflictError&) {
                    std::this_thread::yield();
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    std::set<std::string> unique(sids.begin(), sids.end());
    EXPECT_EQ(unique.size(), 4u);
    EXPECT_EQ(unique.count(""), 0u);
}
