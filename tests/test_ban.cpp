/**
 * @file test_ban.cpp
 * @brief Unit tests for ban escalation, the ban stores and the whitelist
 */

#include <gtest/gtest.h>
#include "../src/core/include/sgate_ban.hpp"
#include "../src/core/include/sgate_ban_store.hpp"
#include "../src/core/include/sgate_errors.hpp"
#include "../src/core/include/sgate_event_log.hpp"
#include "../src/core/include/sgate_whitelist.hpp"
#include "sgate_test_util.hpp"

#include <filesystem>
#include <thread>
#include <vector>

using namespace sgate;
using namespace std::chrono_literals;
using sgate_test::TempDir;
using sgate_test::RecordingIpSet;
using sgate_test::slurp;
using sgate_test::spit;

namespace {

const TimePoint T0 = from_unix(1736346120);  // 2025-01-08T14:22:00Z

BanPolicy two_level_policy() {
    BanPolicy p;
    p.thresholds = {3, 6};
    p.durations = {300s, 900s};
    p.decay_window = 3600s;
    p.ipset_retries = 2;
    p.ipset_backoff = 1ms;
    return p;
}

/// Store whose writes always fail.
class BrokenStore : public BanStore {
public:
    std::optional<BanRecord> load(const std::string&) override { return std::nullopt; }
    void save(const BanRecord&) override { throw IOError("disk full", 28); }
    void erase(const std::string&) override {}
    std::vector<BanRecord> all() override { return {}; }
};

/// In-memory store whose saves can be made to fail.
class FlakyStore : public BanStore {
public:
    std::optional<BanRecord> load(const std::string& ip) override { return inner.load(ip); }
    void save(const BanRecord& rec) override {
        if (fail_save) throw IOError("disk full", 28);
        inner.save(rec);
    }
    void erase(const std::string& ip) override { inner.erase(ip); }
    std::vector<BanRecord> all() override { return inner.all(); }

    MemoryBanStore inner;
    bool fail_save = false;
};

} // anonymous namespace

// ==================== Policy ====================

TEST(BanPolicyTest, DefaultsAreValid) {
    BanPolicy p = BanPolicy::defaults();
    EXPECT_NO_THROW(p.validate());
    EXPECT_EQ(p.max_level(), 9u);
    EXPECT_EQ(p.threshold(1), 3u);
    EXPECT_EQ(p.duration(1), 30s);
    EXPECT_EQ(p.duration(9), 86400s);
}

TEST(BanPolicyTest, RejectsInconsistentLevels) {
    BanPolicy p = two_level_policy();
    p.thresholds = {3};
    EXPECT_THROW(p.validate(), ValidationError);

    p = two_level_policy();
    p.thresholds = {6, 3};
    EXPECT_THROW(p.validate(), ValidationError);

    p = two_level_policy();
    p.durations = {900s, 300s};
    EXPECT_THROW(p.validate(), ValidationError);

    p = two_level_policy();
    p.protected_ports = {};
    EXPECT_THROW(p.validate(), ValidationError);
}

TEST(BanPolicyTest, DurationCappedAtMaximum) {
    BanPolicy p = two_level_policy();
    p.max_duration = 600s;
    EXPECT_EQ(p.duration(1), 300s);
    EXPECT_EQ(p.duration(2), 600s);
}

// ==================== Engine ====================

class BanEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<MemoryBanStore>();
        ipset = std::make_shared<RecordingIpSet>();
        whitelist = std::make_shared<StaticWhitelist>();
        whitelist->add("192.168.0.0/16");
        events = std::make_shared<EventLog>();
        audit_path = tmp.sub("audit/ban.log");
        std::filesystem::create_directories(tmp.sub("audit"));
        engine = std::make_unique<BanEngine>(two_level_policy(), store, ipset, whitelist,
                                             audit_path, events);
    }

    BanState fail(const std::string& ip, TimePoint t) {
        return engine->on_failure({ip, t});
    }

    TempDir tmp;
    std::shared_ptr<MemoryBanStore> store;
    std::shared_ptr<RecordingIpSet> ipset;
    std::shared_ptr<StaticWhitelist> whitelist;
    std::shared_ptr<EventLog> events;
    std::string audit_path;
    std::unique_ptr<BanEngine> engine;
};

TEST_F(BanEngineTest, ThirdFailureBansAndFourthKeepsExpiry) {
    EXPECT_EQ(fail("10.0.0.5", T0), BanState::WATCHED);
    EXPECT_EQ(fail("10.0.0.5", T0 + 20s), BanState::WATCHED);
    EXPECT_EQ(fail("10.0.0.5", T0 + 40s), BanState::BANNED);

    auto rec = engine->status("10.0.0.5", T0 + 41s);
    EXPECT_EQ(rec.level, 1u);
    EXPECT_EQ(rec.hits, 3u);
    ASSERT_TRUE(rec.expiry.has_value());
    EXPECT_EQ(*rec.expiry, T0 + 40s + 300s);

    ASSERT_EQ(ipset->calls.size(), 1u);
    EXPECT_EQ(ipset->calls[0].op, "add");
    EXPECT_EQ(ipset->calls[0].set, "ssh_ban");
    EXPECT_EQ(ipset->calls[0].ip, "10.0.0.5");
    EXPECT_EQ(ipset->calls[0].ttl, 300);

    EXPECT_EQ(fail("10.0.0.5", T0 + 50s), BanState::BANNED);
    auto after = engine->status("10.0.0.5", T0 + 51s);
    EXPECT_EQ(after.hits, 4u);
    EXPECT_EQ(after.level, 1u);
    EXPECT_EQ(*after.expiry, T0 + 340s);
    EXPECT_EQ(ipset->count("add"), 1u);
}

TEST_F(BanEngineTest, RepeatOffenderEscalates) {
    for (int i = 0; i < 4; ++i) fail("10.0.0.7", T0 + std::chrono::seconds(i));
    EXPECT_EQ(engine->tick(T0 + 400s), 1u);
    EXPECT_EQ(engine->status("10.0.0.7", T0 + 400s).state, BanState::EXPIRED);
    EXPECT_EQ(ipset->count("remove"), 1u);

    // Fifth failure: below the level 2 threshold, re-banned at level 1
    EXPECT_EQ(fail("10.0.0.7", T0 + 500s), BanState::BANNED);
    EXPECT_EQ(engine->status("10.0.0.7", T0 + 500s).level, 1u);

    engine->tick(T0 + 900s);
    EXPECT_EQ(fail("10.0.0.7", T0 + 1000s), BanState::BANNED);
    auto rec = engine->status("10.0.0.7", T0 + 1000s);
    EXPECT_EQ(rec.level, 2u);
    EXPECT_EQ(*rec.expiry, T0 + 1000s + 900s);
}

TEST_F(BanEngineTest, LevelNeverDecreasesWhileRemembered) {
    uint32_t last_level = 0;
    TimePoint t = T0;
    for (int i = 0; i < 30; ++i) {
        t += 120s;
        fail("10.0.0.8", t);
        engine->tick(t);
        auto rec = engine->status("10.0.0.8", t);
        if (rec.state != BanState::CLEAN) {
            EXPECT_GE(rec.level, last_level) << "iteration " << i;
            last_level = rec.level;
        }
    }
    EXPECT_EQ(last_level, 2u);
}

TEST_F(BanEngineTest, WhitelistedAddressIsNeverBanned) {
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(fail("192.168.1.7", T0 + std::chrono::seconds(i)), BanState::WATCHED);
    }
    auto rec = engine->status("192.168.1.7", T0 + 30s);
    EXPECT_TRUE(rec.whitelisted);
    EXPECT_EQ(rec.hits, 20u);
    EXPECT_EQ(ipset->count("add"), 0u);
    EXPECT_EQ(engine->get_stats().whitelist_hits, 20u);
}

TEST_F(BanEngineTest, WatchedRecordDecaysToClean) {
    fail("10.0.0.9", T0);
    fail("10.0.0.9", T0 + 10s);
    EXPECT_EQ(engine->tick(T0 + 1000s), 0u);
    EXPECT_EQ(store->all().size(), 1u);

    EXPECT_EQ(engine->tick(T0 + 10s + 3600s), 1u);
    EXPECT_TRUE(store->all().empty());

    auto rec = engine->status("10.0.0.9", T0 + 4000s);
    EXPECT_EQ(rec.state, BanState::CLEAN);
    EXPECT_EQ(rec.hits, 0u);
}

TEST_F(BanEngineTest, ExpiredRecordDecaysAfterQuietWindow) {
    for (int i = 0; i < 3; ++i) fail("10.0.0.10", T0);
    engine->tick(T0 + 300s);
    EXPECT_EQ(engine->status("10.0.0.10", T0 + 300s).state, BanState::EXPIRED);

    // Quiet time counts from the expiry, not from the last failure
    EXPECT_EQ(engine->status("10.0.0.10", T0 + 3601s).state, BanState::EXPIRED);
    EXPECT_EQ(engine->status("10.0.0.10", T0 + 3900s).state, BanState::CLEAN);

    // A failure after decay starts from scratch
    EXPECT_EQ(fail("10.0.0.10", T0 + 4000s), BanState::WATCHED);
    EXPECT_EQ(engine->status("10.0.0.10", T0 + 4000s).hits, 1u);
}

TEST_F(BanEngineTest, StatusDoesNotMutate) {
    for (int i = 0; i < 3; ++i) fail("10.0.0.11", T0);
    auto view = engine->status("10.0.0.11", T0 + 1000s);
    EXPECT_EQ(view.state, BanState::EXPIRED);

    auto stored = store->load("10.0.0.11");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->state, BanState::BANNED);
    EXPECT_EQ(ipset->count("remove"), 0u);
}

TEST_F(BanEngineTest, OperatorClear) {
    for (int i = 0; i < 3; ++i) fail("10.0.0.12", T0);
    EXPECT_TRUE(engine->clear("10.0.0.12", T0 + 5s));
    EXPECT_EQ(ipset->count("remove"), 1u);
    EXPECT_FALSE(store->load("10.0.0.12").has_value());
    EXPECT_FALSE(engine->clear("10.0.0.12", T0 + 6s));
    EXPECT_THROW(engine->clear("not-an-ip"), ValidationError);
}

TEST_F(BanEngineTest, MalformedAddressDropped) {
    EXPECT_EQ(fail("300.1.2.3", T0), BanState::CLEAN);
    EXPECT_EQ(fail("", T0), BanState::CLEAN);
    EXPECT_TRUE(store->all().empty());
    EXPECT_THROW(engine->status("300.1.2.3"), ValidationError);
}

TEST_F(BanEngineTest, Ipv6UsesOwnSet) {
    for (int i = 0; i < 3; ++i) fail("2001:db8::5", T0);
    ASSERT_EQ(ipset->calls.size(), 1u);
    EXPECT_EQ(ipset->calls[0].set, "ssh_ban6");
}

TEST_F(BanEngineTest, AuditLogLines) {
    for (int i = 0; i < 3; ++i) fail("10.0.0.5", T0);
    engine->tick(T0 + 300s);

    std::string log = slurp(audit_path);
    EXPECT_NE(log.find("2025-01-08T14:22:00Z 10.0.0.5 1 300 add\n"), std::string::npos);
    EXPECT_NE(log.find("2025-01-08T14:27:00Z 10.0.0.5 1 300 remove\n"), std::string::npos);
}

TEST_F(BanEngineTest, ControlPlaneFailureNeverEscapes) {
    ipset->fail_next = 100;
    BanState state = BanState::CLEAN;
    for (int i = 0; i < 3; ++i) {
        EXPECT_NO_THROW(state = fail("10.0.0.13", T0));
    }
    EXPECT_EQ(state, BanState::BANNED);
    EXPECT_EQ(ipset->attempts, 3);
    EXPECT_EQ(engine->get_stats().control_errors, 1u);
}

TEST_F(BanEngineTest, ControlPlaneRetrySucceeds) {
    ipset->fail_next = 1;
    for (int i = 0; i < 3; ++i) fail("10.0.0.14", T0);
    EXPECT_EQ(ipset->count("add"), 1u);
    EXPECT_EQ(ipset->attempts, 2);
    EXPECT_EQ(engine->get_stats().control_errors, 0u);
}

TEST_F(BanEngineTest, StoreFailureNeverEscapes) {
    BanEngine broken(two_level_policy(), std::make_shared<BrokenStore>(), ipset);
    EXPECT_EQ(broken.on_failure({"10.0.0.15", T0}), BanState::CLEAN);
    EXPECT_EQ(broken.get_stats().store_errors, 1u);
}

TEST_F(BanEngineTest, UnsavedBanIsNeverAnnounced) {
    auto flaky = std::make_shared<FlakyStore>();
    std::string log_path = tmp.sub("audit/flaky.log");
    BanEngine eng(two_level_policy(), flaky, ipset, nullptr, log_path, events);

    eng.on_failure({"10.0.0.17", T0});
    eng.on_failure({"10.0.0.17", T0 + 1s});
    flaky->fail_save = true;
    EXPECT_EQ(eng.on_failure({"10.0.0.17", T0 + 2s}), BanState::CLEAN);
    EXPECT_EQ(ipset->count("add"), 0u);
    EXPECT_FALSE(std::filesystem::exists(log_path));
    EXPECT_EQ(eng.get_stats().bans, 0u);

    flaky->fail_save = false;
    EXPECT_EQ(eng.on_failure({"10.0.0.17", T0 + 3s}), BanState::BANNED);
    EXPECT_EQ(ipset->count("add"), 1u);
    EXPECT_EQ(slurp(log_path), "2025-01-08T14:22:03Z 10.0.0.17 1 300 add\n");
}

TEST_F(BanEngineTest, ChangeCallbackSeesTransitions) {
    std::vector<std::pair<std::string, bool>> seen;
    engine->set_change_callback([&](const BanRecord& r, bool banned) {
        seen.emplace_back(r.ip, banned);
    });
    for (int i = 0; i < 3; ++i) fail("10.0.0.16", T0);
    engine->tick(T0 + 301s);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_TRUE(seen[0].second);
    EXPECT_FALSE(seen[1].second);
    EXPECT_EQ(engine->get_stats().bans, 1u);
    EXPECT_EQ(engine->get_stats().unbans, 1u);
}

TEST_F(BanEngineTest, RenderFragmentPerFamily) {
    for (int i = 0; i < 3; ++i) fail("10.0.0.5", T0);
    for (int i = 0; i < 3; ++i) fail("2001:db8::5", T0);

    std::string v4 = engine->render_fragment(IpFamily::V4, T0 + 10s);
    EXPECT_NE(v4.find("v4 INPUT tcp 22 DROP:ssh_ban\n"), std::string::npos);
    EXPECT_NE(v4.find("# banned 10.0.0.5 level=1 until=2025-01-08T14:27:00Z"), std::string::npos);
    EXPECT_EQ(v4.find("2001:db8::5"), std::string::npos);

    std::string v6 = engine->render_fragment(IpFamily::V6, T0 + 10s);
    EXPECT_NE(v6.find("v6 INPUT tcp 22 DROP:ssh_ban6\n"), std::string::npos);

    // Expired bans are no longer listed
    EXPECT_EQ(engine->render_fragment(IpFamily::V4, T0 + 400s).find("# banned"), std::string::npos);
}

TEST_F(BanEngineTest, ConcurrentFailuresForOneAddressAllCount) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < 25; ++i) fail("10.0.0.20", T0);
        });
    }
    for (auto& th : threads) th.join();

    auto rec = store->load("10.0.0.20");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->hits, 200u);
    EXPECT_EQ(rec->level, 1u);
    EXPECT_EQ(ipset->count("add"), 1u);
}

// ==================== SQLite store ====================

class SqliteBanStoreTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::string db_path() const { return tmp.sub("bans.db"); }
};

TEST_F(SqliteBanStoreTest, SaveLoadErase) {
    SqliteBanStore store(db_path());
    EXPECT_FALSE(store.load("10.0.0.5").has_value());

    BanRecord rec;
    rec.ip = "10.0.0.5";
    rec.hits = 4;
    rec.level = 1;
    rec.state = BanState::BANNED;
    rec.expiry = T0 + 300s;
    rec.first_failure = T0;
    rec.last_failure = T0 + 50s;
    store.save(rec);

    auto loaded = store.load("10.0.0.5");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->hits, 4u);
    EXPECT_EQ(loaded->state, BanState::BANNED);
    EXPECT_EQ(loaded->expiry, rec.expiry);
    EXPECT_EQ(loaded->last_failure, rec.last_failure);
    EXPECT_FALSE(loaded->whitelisted);

    rec.hits = 5;
    store.save(rec);
    EXPECT_EQ(store.load("10.0.0.5")->hits, 5u);
    EXPECT_EQ(store.all().size(), 1u);

    store.erase("10.0.0.5");
    EXPECT_TRUE(store.all().empty());
}

TEST_F(SqliteBanStoreTest, StateSurvivesReopen) {
    {
        auto store = std::make_shared<SqliteBanStore>(db_path());
        BanEngine engine(two_level_policy(), store, nullptr);
        for (int i = 0; i < 3; ++i) engine.on_failure({"10.0.0.5", T0});
    }
    auto store = std::make_shared<SqliteBanStore>(db_path());
    BanEngine engine(two_level_policy(), store, nullptr);
    auto rec = engine.status("10.0.0.5", T0 + 10s);
    EXPECT_EQ(rec.state, BanState::BANNED);
    EXPECT_EQ(rec.level, 1u);
    EXPECT_FALSE(rec.first_failure == std::nullopt);
}

TEST_F(SqliteBanStoreTest, UnopenableDatabase) {
    EXPECT_THROW({ SqliteBanStore store(tmp.sub("missing/dir/bans.db")); }, IOError);
}

// ==================== Whitelist ====================

TEST(WhitelistTest, CidrMatching) {
    StaticWhitelist wl;
    wl.add("10.0.0.0/8");
    wl.add("192.168.1.7");
    wl.add("2001:db8::/32");

    EXPECT_TRUE(wl.contains("10.255.3.4"));
    EXPECT_FALSE(wl.contains("11.0.0.1"));
    EXPECT_TRUE(wl.contains("192.168.1.7"));
    EXPECT_FALSE(wl.contains("192.168.1.8"));
    EXPECT_TRUE(wl.contains("2001:db8:1::9"));
    EXPECT_FALSE(wl.contains("2001:db9::1"));
    EXPECT_FALSE(wl.contains("garbage"));
    EXPECT_EQ(wl.size(), 3u);
}

TEST(WhitelistTest, RejectsBadEntries) {
    StaticWhitelist wl;
    EXPECT_THROW(wl.add("10.0.0.0/33"), ValidationError);
    EXPECT_THROW(wl.add("10.0.0.0/"), ValidationError);
    EXPECT_THROW(wl.add("example.com"), ValidationError);
    EXPECT_THROW(wl.add("::1/129"), ValidationError);
    EXPECT_EQ(wl.size(), 0u);
}

TEST(WhitelistTest, LoadFileReportsBadLine) {
    TempDir tmp;
    std::string path = tmp.sub("whitelist");
    spit(path, "# office\n10.1.0.0/16\n\n192.168.1.300 # typo\n");

    StaticWhitelist wl;
    try {
        wl.load_file(path);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 4u);
    }
}

TEST(WhitelistTest, RenderFragment) {
    StaticWhitelist wl;
    EXPECT_EQ(wl.render_fragment(IpFamily::V4, "ssh_white"),
              "# sgate whitelist fragment family=v4\n");

    wl.add("10.0.0.0/8");
    wl.add("2001:db8::/32");
    EXPECT_EQ(wl.render_fragment(IpFamily::V4, "ssh_white"),
              "# sgate whitelist fragment family=v4\n"
              "v4 INPUT all any ACCEPT:ssh_white\n"
              "# member 10.0.0.0/8\n");
    EXPECT_EQ(wl.entries(IpFamily::V6), std::vector<std::string>{"2001:db8::/32"});
}
