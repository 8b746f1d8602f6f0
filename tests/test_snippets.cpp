/**
 * @file test_snippets.cpp
 * @brief Unit tests for principal fragments and their lifecycle
 */

#include <gtest/gtest.h>
#include "../src/core/include/sgate_snippets.hpp"
#include "../src/core/include/sgate_errors.hpp"
#include "../src/core/include/sgate_event_log.hpp"
#include "sgate_test_util.hpp"

#include <filesystem>

using namespace sgate;
using sgate_test::TempDir;
using sgate_test::slurp;
using sgate_test::spit;

namespace {

/// Fails every validation after `armed` is set.
class ToggleValidator : public ConfigValidator {
public:
    ValidationResult validate(const std::string&) override {
        ++calls;
        if (armed) return {false, "sshd -t: line 3: Bad configuration option"};
        return {};
    }
    bool armed = false;
    int calls = 0;
};

} // anonymous namespace

class SnippetStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.dir = tmp.sub("sshd_config.d");
        config.wrapper_path = "/srv/home/%u/local/bin/gate_login_wrapper";
        validator = std::make_shared<ToggleValidator>();
        events = std::make_shared<EventLog>();
        store = std::make_unique<SnippetStore>(config, validator, events);
    }

    std::string active_path(const std::string& p) const { return config.dir + "/10-user_" + p + ".conf"; }
    std::string inactive_path(const std::string& p) const { return active_path(p) + ".inactive"; }
    std::string disabled_path(const std::string& p) const { return active_path(p) + ".disabled"; }

    TempDir tmp;
    SnippetStoreConfig config;
    std::shared_ptr<ToggleValidator> validator;
    std::shared_ptr<EventLog> events;
    std::unique_ptr<SnippetStore> store;
};

// ---- Provisioning ----

TEST_F(SnippetStoreTest, ProvisionWritesActiveFragment) {
    store->provision("alice", ShellMode::GATE, false);

    ASSERT_TRUE(std::filesystem::exists(active_path("alice")));
    std::string content = slurp(active_path("alice"));
    EXPECT_NE(content.find("Match User alice"), std::string::npos);
    EXPECT_NE(content.find("ForceCommand /srv/home/alice/local/bin/gate_login_wrapper"),
              std::string::npos);
    EXPECT_NE(content.find("X11Forwarding no"), std::string::npos);
    EXPECT_NE(content.find("AllowAgentForwarding no"), std::string::npos);
}

TEST_F(SnippetStoreTest, ProvisionInactive) {
    store->provision("bob", ShellMode::RBASH, true, false);
    EXPECT_FALSE(std::filesystem::exists(active_path("bob")));
    EXPECT_TRUE(std::filesystem::exists(inactive_path("bob")));

    auto p = store->get("bob");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->state, PrincipalState::INACTIVE);
    EXPECT_EQ(p->shell, ShellMode::RBASH);
    EXPECT_TRUE(p->sudo);
}

TEST_F(SnippetStoreTest, ReprovisionKeepsState) {
    store->provision("carol", ShellMode::GATE, false);
    store->disable("carol");
    store->provision("carol", ShellMode::FULL, true);

    auto p = store->get("carol");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->state, PrincipalState::INACTIVE);
    EXPECT_EQ(p->shell, ShellMode::FULL);
    EXPECT_EQ(p->content.find("ForceCommand"), std::string::npos);
}

TEST_F(SnippetStoreTest, InvalidPrincipalRejected) {
    EXPECT_THROW(store->provision("../etc", ShellMode::GATE, false), ValidationError);
    EXPECT_THROW(store->provision("Alice", ShellMode::GATE, false), ValidationError);
    EXPECT_THROW(store->enable(""), ValidationError);
    EXPECT_FALSE(std::filesystem::exists(config.dir));
}

// ---- Enable / disable ----

TEST_F(SnippetStoreTest, DisableThenEnableIsByteIdentical) {
    store->provision("alice", ShellMode::GATE, true);
    // Hand edits must survive the round trip too
    spit(active_path("alice"), slurp(active_path("alice")) + "  # edited by ops\n");
    std::string before = slurp(active_path("alice"));

    store->disable("alice");
    EXPECT_FALSE(std::filesystem::exists(active_path("alice")));
    EXPECT_EQ(slurp(inactive_path("alice")), before);

    store->enable("alice");
    EXPECT_FALSE(std::filesystem::exists(inactive_path("alice")));
    EXPECT_EQ(slurp(active_path("alice")), before);
}

TEST_F(SnippetStoreTest, EnableUnknownPrincipalFails) {
    EXPECT_THROW(store->enable("ghost"), ValidationError);
    store->provision("alice", ShellMode::GATE, false);
    EXPECT_THROW(store->enable("ghost"), ValidationError);
    EXPECT_THROW(store->disable("ghost"), ValidationError);
}

TEST_F(SnippetStoreTest, EnableAndDisableAreIdempotent) {
    store->provision("alice", ShellMode::GATE, false);
    store->enable("alice");
    store->disable("alice");
    store->disable("alice");
    EXPECT_EQ(store->list().at("alice"), PrincipalState::INACTIVE);
}

// ---- Lock / unlock ----

TEST_F(SnippetStoreTest, LockedPrincipalCannotBeEnabled) {
    store->provision("dave", ShellMode::GATE, false);
    store->lock("dave");
    EXPECT_TRUE(std::filesystem::exists(disabled_path("dave")));
    EXPECT_EQ(store->list().at("dave"), PrincipalState::DISABLED);

    EXPECT_THROW(store->enable("dave"), ValidationError);

    store->unlock("dave");
    EXPECT_EQ(store->list().at("dave"), PrincipalState::INACTIVE);
    store->enable("dave");
    EXPECT_EQ(store->list().at("dave"), PrincipalState::ACTIVE);
}

// ---- Remove ----

TEST_F(SnippetStoreTest, RemoveIsIdempotent) {
    store->provision("erin", ShellMode::GATE, false);
    EXPECT_TRUE(store->remove("erin"));
    EXPECT_FALSE(store->remove("erin"));
    EXPECT_FALSE(store->get("erin").has_value());
    EXPECT_TRUE(store->list().empty());
}

TEST_F(SnippetStoreTest, RemoveOnMissingDirectorySucceeds) {
    EXPECT_FALSE(store->remove("nobody"));
}

// ---- Listing ----

TEST_F(SnippetStoreTest, ListReportsEveryState) {
    store->provision("alice", ShellMode::GATE, false);
    store->provision("bob", ShellMode::GATE, false, false);
    store->provision("carol", ShellMode::GATE, false);
    store->lock("carol");
    spit(config.dir + "/00-global.conf", "PasswordAuthentication no\n");

    auto all = store->list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all["alice"], PrincipalState::ACTIVE);
    EXPECT_EQ(all["bob"], PrincipalState::INACTIVE);
    EXPECT_EQ(all["carol"], PrincipalState::DISABLED);
}

TEST_F(SnippetStoreTest, ListAgreesWithGetOnStaleCopies) {
    store->provision("alice", ShellMode::GATE, false);
    store->provision("bob", ShellMode::GATE, false, false);
    // Leftovers from an interrupted rename
    spit(inactive_path("alice"), slurp(active_path("alice")));
    spit(active_path("bob"), slurp(inactive_path("bob")));
    spit(config.dir + "/10-user_bob.conf.disabled", slurp(inactive_path("bob")));

    auto all = store->list();
    for (const char* name : {"alice", "bob"}) {
        auto p = store->get(name);
        ASSERT_TRUE(p.has_value()) << name;
        EXPECT_EQ(all[name], p->state) << name;
    }
    EXPECT_EQ(all["alice"], PrincipalState::ACTIVE);
    EXPECT_EQ(all["bob"], PrincipalState::DISABLED);
}

// ---- Validation and rollback ----

TEST_F(SnippetStoreTest, FailedValidationRollsBackDisable) {
    store->provision("alice", ShellMode::GATE, false);
    std::string before = slurp(active_path("alice"));

    validator->armed = true;
    EXPECT_THROW(store->disable("alice"), FatalConfigError);

    EXPECT_TRUE(std::filesystem::exists(active_path("alice")));
    EXPECT_FALSE(std::filesystem::exists(inactive_path("alice")));
    EXPECT_EQ(slurp(active_path("alice")), before);

    auto recent = events->get_recent_entries(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].type, EventLog::EventType::ROLLBACK);
}

TEST_F(SnippetStoreTest, FailedValidationRollsBackProvision) {
    validator->armed = true;
    EXPECT_THROW(store->provision("frank", ShellMode::GATE, false), FatalConfigError);
    EXPECT_FALSE(store->get("frank").has_value());
}

TEST_F(SnippetStoreTest, FailedValidationRestoresRemovedFragment) {
    store->provision("gina", ShellMode::GATE, false);
    validator->armed = true;
    EXPECT_THROW(store->remove("gina"), FatalConfigError);
    EXPECT_EQ(store->list().at("gina"), PrincipalState::ACTIVE);
}

TEST_F(SnippetStoreTest, DirectiveValidatorRejectsGarbage) {
    auto directive_store = std::make_unique<SnippetStore>(
        config, std::make_shared<DirectiveValidator>());
    directive_store->provision("alice", ShellMode::GATE, false);

    // A broken neighbour fragment makes every further mutation fail
    spit(config.dir + "/20-broken.conf", "Match\n");
    EXPECT_THROW(directive_store->disable("alice"), FatalConfigError);
    EXPECT_EQ(directive_store->list().at("alice"), PrincipalState::ACTIVE);

    // Inactive fragments are not part of the running configuration
    std::filesystem::rename(config.dir + "/20-broken.conf",
                            config.dir + "/20-broken.conf.inactive");
    directive_store->disable("alice");
    EXPECT_EQ(directive_store->list().at("alice"), PrincipalState::INACTIVE);
}

TEST_F(SnippetStoreTest, CommandValidatorUsesExitStatus) {
    CommandValidator ok({"true"});
    CommandValidator bad({"false"});
    CommandValidator missing({"/nonexistent/sshd", "-t"});

    EXPECT_TRUE(ok.validate(config.dir).ok);
    EXPECT_FALSE(bad.validate(config.dir).ok);
    auto r = missing.validate(config.dir);
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.detail.find("could not be executed"), std::string::npos);
}

TEST_F(SnippetStoreTest, ChainValidatorStopsAtFirstFailure) {
    auto second = std::make_shared<ToggleValidator>();
    ChainValidator chain;
    chain.add(std::make_shared<CommandValidator>(std::vector<std::string>{"false"}));
    chain.add(second);

    EXPECT_FALSE(chain.validate(config.dir).ok);
    EXPECT_EQ(second->calls, 0);
}
