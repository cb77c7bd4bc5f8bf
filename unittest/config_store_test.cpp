#include <gtest/gtest.h>
#include "backup/backup_plan.hpp"
#include "common/backup_errors.hpp"
#include "common/service_config.hpp"
#include "store/json_config_store.hpp"
#include "test_support.hpp"

using namespace testsupport;

class JsonConfigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = tmp_.sub("data/config.json");
        store_ = std::make_unique<JsonConfigStore>(path_);
    }

    TempDir tmp_;
    std::string path_;
    std::unique_ptr<JsonConfigStore> store_;
};

// Test that a missing store reads as empty
TEST_F(JsonConfigStoreTest, MissingFileIsEmpty) {
    EXPECT_TRUE(store_->listPlans().empty());
    EXPECT_TRUE(store_->listAgents().empty());
    EXPECT_TRUE(store_->listPairingCodes().empty());
    EXPECT_FALSE(store_->loadToken().has_value());
}

TEST_F(JsonConfigStoreTest, PlansRoundTripThroughFile) {
    auto plan = makePlan("p1", "/srv/data", "/backup/data");
    plan.description = "nightly";
    plan.inlineTransport.port = 2222;
    plan.inlineTransport.privateKey = "-----BEGIN KEY-----";
    plan.preferredTransport = TransportKind::RemoteShell;
    store_->savePlan(plan);

    JsonConfigStore reopened(path_);
    auto loaded = reopened.findPlan("p1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, plan);
}

TEST_F(JsonConfigStoreTest, SaveReplacesExistingPlan) {
    auto plan = makePlan("p1", "/a", "/b");
    store_->savePlan(plan);
    plan.schedule = "@hourly";
    store_->savePlan(plan);

    auto plans = store_->listPlans();
    ASSERT_EQ(plans.size(), 1u);
    EXPECT_EQ(plans[0].schedule, "@hourly");
}

TEST_F(JsonConfigStoreTest, RemovePlan) {
    store_->savePlan(makePlan("p1", "/a", "/b"));
    EXPECT_TRUE(store_->removePlan("p1"));
    EXPECT_FALSE(store_->removePlan("p1"));
    EXPECT_FALSE(store_->findPlan("p1").has_value());
}

TEST_F(JsonConfigStoreTest, EmptyPlanIdIsRejected) {
    EXPECT_THROW(store_->savePlan(makePlan("", "/a", "/b")), ConfigurationError);
}

// Removing an agent detaches the plans that used it
TEST_F(JsonConfigStoreTest, RemoveAgentClearsPlanLinks) {
    Agent agent;
    agent.id = "agent-1";
    agent.address = "office:5001";
    store_->saveAgent(agent);

    auto plan = makePlan("p1", "/a", "/b");
    plan.agentId = agent.id;
    store_->savePlan(plan);
    store_->savePlan(makePlan("p2", "/c", "/d"));

    EXPECT_TRUE(store_->removeAgent("agent-1"));
    EXPECT_FALSE(store_->findAgent("agent-1").has_value());
    EXPECT_FALSE(store_->findPlan("p1")->agentId.has_value());
    EXPECT_EQ(store_->listPlans().size(), 2u);
    EXPECT_FALSE(store_->removeAgent("agent-1"));
}

TEST_F(JsonConfigStoreTest, AgentTokenUpdates) {
    Agent agent;
    agent.id = "agent-1";
    store_->saveAgent(agent);

    EXPECT_TRUE(store_->updateAgentToken("agent-1", std::string("tok")));
    EXPECT_TRUE(store_->findAgent("agent-1")->isPaired());
    EXPECT_TRUE(store_->updateAgentToken("agent-1", std::nullopt));
    EXPECT_FALSE(store_->findAgent("agent-1")->isPaired());
    EXPECT_FALSE(store_->updateAgentToken("ghost", std::string("tok")));
}

TEST_F(JsonConfigStoreTest, PairingStatePersists) {
    PairingCode code;
    code.code = "012345";
    code.createdAt = *utils::parseIso8601("2024-01-01T00:00:00Z");
    code.expiresAt = code.createdAt + std::chrono::minutes(10);
    store_->replacePairingCodes({code});

    AgentToken token;
    token.token = "abcdef";
    token.issuedAt = code.createdAt;
    store_->storeToken(token);

    JsonConfigStore reopened(path_);
    auto codes = reopened.listPairingCodes();
    ASSERT_EQ(codes.size(), 1u);
    EXPECT_EQ(codes[0].code, "012345");
    EXPECT_EQ(codes[0].expiresAt, code.expiresAt);
    ASSERT_TRUE(reopened.loadToken().has_value());
    EXPECT_EQ(reopened.loadToken()->token, "abcdef");

    reopened.storeToken(std::nullopt);
    EXPECT_FALSE(store_->loadToken().has_value());
}

// Test that edits made outside the process are seen on the next read
TEST_F(JsonConfigStoreTest, ExternalEditsAreVisible) {
    store_->savePlan(makePlan("p1", "/a", "/b"));
    {
        std::ofstream file(path_, std::ios::trunc);
        file << R"({"plans": [{"id": "p9", "name": "edited", "active": true, "schedule": "@daily"}]})";
    }

    auto plans = store_->listPlans();
    ASSERT_EQ(plans.size(), 1u);
    EXPECT_EQ(plans[0].id, "p9");
    EXPECT_TRUE(plans[0].active);
    EXPECT_FALSE(plans[0].agentId.has_value());
    EXPECT_TRUE(store_->listAgents().empty());
}

TEST_F(JsonConfigStoreTest, MalformedFileIsConfigurationError) {
    {
        std::ofstream file(path_, std::ios::trunc);
        file << "{ not json";
    }
    EXPECT_THROW(store_->listPlans(), ConfigurationError);
}

TEST_F(JsonConfigStoreTest, UnknownTransportIsConfigurationError) {
    {
        std::ofstream file(path_, std::ios::trunc);
        file << R"({"plans": [{"id": "p1", "transport": "ftp"}]})";
    }
    EXPECT_THROW(store_->listPlans(), ConfigurationError);
}

class ServiceConfigTest : public ::testing::Test {
protected:
    TempDir tmp_;
};

TEST_F(ServiceConfigTest, MissingFileUsesDefaults) {
    auto config = ServiceConfig::loadFromFile(tmp_.sub("absent.json"));
    EXPECT_EQ(config.tickIntervalSeconds, 60);
    EXPECT_EQ(config.pairingCodeTtlMinutes, 10);
    EXPECT_EQ(config.retentionMonths, 0);
    EXPECT_TRUE(config.verifyTls);
    EXPECT_EQ(config.configStorePath(), "/var/lib/syncwarden/config.json");
}

TEST_F(ServiceConfigTest, ValuesAreRead) {
    auto config = ServiceConfig::fromJsonText(R"({
        "dataDir": "/tmp/sw",
        "logLevel": "debug",
        "tickIntervalSeconds": 15,
        "pairingCodeTtlMinutes": 5,
        "retentionMonths": 6,
        "verifyTls": false,
        "caseInsensitiveDestination": true
    })");

    EXPECT_EQ(config.journalDir(), "/tmp/sw/journal");
    EXPECT_EQ(config.logLevel, LogLevel::DEBUG);
    EXPECT_EQ(config.tickIntervalSeconds, 15);
    EXPECT_EQ(config.pairingCodeTtlMinutes, 5);
    EXPECT_EQ(config.retentionMonths, 6);
    EXPECT_FALSE(config.verifyTls);
    EXPECT_TRUE(config.caseInsensitiveDestination);
}

TEST_F(ServiceConfigTest, InvalidValuesAreRejected) {
    EXPECT_THROW(ServiceConfig::fromJsonText("[1, 2]"), ConfigurationError);
    EXPECT_THROW(ServiceConfig::fromJsonText("{"), ConfigurationError);
    EXPECT_THROW(ServiceConfig::fromJsonText(R"({"tickIntervalSeconds": "often"})"), ConfigurationError);
    EXPECT_THROW(ServiceConfig::fromJsonText(R"({"tickIntervalSeconds": 0})"), ConfigurationError);
    EXPECT_THROW(ServiceConfig::fromJsonText(R"({"retentionMonths": -1})"), ConfigurationError);
    EXPECT_THROW(ServiceConfig::fromJsonText(R"({"logLevel": "chatty"})"), ConfigurationError);
    EXPECT_THROW(ServiceConfig::fromJsonText(R"({"dataDir": ""})"), ConfigurationError);
}

class ResolveTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        plan_ = makePlan("p1", "/srv", "/backup");
        agent_.id = "agent-1";
        agent_.name = "office";
        agent_.address = "office.example";
    }

    BackupPlan plan_;
    Agent agent_;
};

TEST_F(ResolveTransportTest, InlineCredentialsWithoutAgent) {
    plan_.inlineTransport.port = 2200;
    auto transport = resolveTransport(plan_, std::nullopt);
    EXPECT_EQ(transport.kind, TransportKind::RemoteShell);
    EXPECT_EQ(transport.address, "source.example");
    EXPECT_EQ(transport.user, "backup");
    EXPECT_EQ(transport.port, 2200);
    EXPECT_EQ(transport.describe(), "ssh backup@source.example:2200");
}

TEST_F(ResolveTransportTest, PairedAgentUsesHttp) {
    agent_.token = std::string("tok");
    auto transport = resolveTransport(plan_, agent_);
    EXPECT_EQ(transport.kind, TransportKind::AgentHttp);
    EXPECT_EQ(transport.token, "tok");
    EXPECT_EQ(transport.describe(), "agent office.example");
}

// Agent credentials take precedence over the plan's inline ones
TEST_F(ResolveTransportTest, AgentShellCredentialsWin) {
    agent_.remoteUser = "svc";
    agent_.port = 2022;
    auto transport = resolveTransport(plan_, agent_);
    EXPECT_EQ(transport.kind, TransportKind::RemoteShell);
    EXPECT_EQ(transport.address, "office.example");
    EXPECT_EQ(transport.user, "svc");
    EXPECT_EQ(transport.port, 2022);
}

TEST_F(ResolveTransportTest, PreferredShellOverridesPairing) {
    agent_.token = std::string("tok");
    agent_.remoteUser = "svc";
    plan_.preferredTransport = TransportKind::RemoteShell;
    EXPECT_EQ(resolveTransport(plan_, agent_).kind, TransportKind::RemoteShell);
}

TEST_F(ResolveTransportTest, UnusableConfigurationsThrow) {
    plan_.inlineTransport = ShellCredentials();
    EXPECT_THROW(resolveTransport(plan_, std::nullopt), ConfigurationError);

    EXPECT_THROW(resolveTransport(plan_, agent_), ConfigurationError);

    plan_.preferredTransport = TransportKind::AgentHttp;
    EXPECT_THROW(resolveTransport(plan_, std::nullopt), ConfigurationError);
    agent_.remoteUser = "svc";
    EXPECT_THROW(resolveTransport(plan_, agent_), ConfigurationError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
