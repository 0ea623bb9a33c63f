#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "common/configuration.h"

using namespace MqBridge;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("REPLICATOR_DIRECTION");
        unsetenv("KAFKA_BOOTSTRAP_SERVERS");
        unsetenv("HEALTH_PORT");
        unsetenv("REPLICATION_MAPPINGS");
        unsetenv("RABBITMQ_PORT");
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("REPLICATOR_DIRECTION");
        unsetenv("KAFKA_BOOTSTRAP_SERVERS");
        unsetenv("HEALTH_PORT");
        unsetenv("REPLICATION_MAPPINGS");
        unsetenv("RABBITMQ_PORT");
        Configuration::getInstance().reset();
    }

    Configuration& config() { return Configuration::getInstance(); }
};

TEST_F(ConfigurationTest, DefaultsAreValid) {
    EXPECT_TRUE(config().validate());
    EXPECT_EQ(config().getDirection(), "K2R");
    EXPECT_EQ(config().getHealthPort(), 8080);
    EXPECT_EQ(config().getHeartbeatIntervalSec(), 60);
    EXPECT_EQ(config().config().kafka.bootstrap_servers.get(), "kafka:9092");
    EXPECT_EQ(config().config().rabbitmq.port.get(), 5672);
    EXPECT_EQ(config().config().replication.max_empty_polls.get(), 100);
    EXPECT_EQ(config().config().replication.delivery_failure_policy.get(), "leave");
}

TEST_F(ConfigurationTest, LoadsYamlSections) {
    ASSERT_TRUE(config().loadFromString(R"(
mqbridge:
  kafka:
    bootstrap_servers: "broker-1:9092,broker-2:9092"
    assign_all_partitions: false
  rabbitmq:
    host: mq.internal
    port: 5673
    prefetch: 50
  replication:
    direction: R2K
    heartbeat_interval_sec: 30
    delivery_failure_policy: requeue
  health:
    port: 9090
)"));
    EXPECT_TRUE(config().validate());
    EXPECT_EQ(config().getDirection(), "R2K");
    EXPECT_EQ(config().config().kafka.bootstrap_servers.get(), "broker-1:9092,broker-2:9092");
    EXPECT_FALSE(config().config().kafka.assign_all_partitions.get());
    EXPECT_EQ(config().config().rabbitmq.host.get(), "mq.internal");
    EXPECT_EQ(config().config().rabbitmq.port.get(), 5673);
    EXPECT_EQ(config().config().rabbitmq.prefetch.get(), 50);
    EXPECT_EQ(config().getHeartbeatIntervalSec(), 30);
    EXPECT_EQ(config().config().replication.delivery_failure_policy.get(), "requeue");
    EXPECT_EQ(config().getHealthPort(), 9090);
}

TEST_F(ConfigurationTest, InlineMappingsAreEmittedAsJson) {
    ASSERT_TRUE(config().loadFromString(R"(
mqbridge:
  replication:
    mappings:
      - kafkaTopic: orders
        rabbitmqQueue: q.orders
    topic_mapping:
      orders: orders-replica
)"));
    const std::string mappings = config().config().replication.mappings.get();
    EXPECT_NE(mappings.find("\"kafkaTopic\""), std::string::npos) << mappings;
    EXPECT_NE(mappings.find("\"orders\""), std::string::npos) << mappings;
    EXPECT_EQ(mappings.front(), '[');
    const std::string topic_mapping = config().config().replication.topic_mapping.get();
    EXPECT_EQ(topic_mapping.front(), '{');
    EXPECT_NE(topic_mapping.find("\"orders-replica\""), std::string::npos) << topic_mapping;
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    ASSERT_TRUE(config().loadFromString(R"(
mqbridge:
  kafka:
    bootstrap_servers: from-file:9092
  health:
    port: 9090
)"));
    setenv("KAFKA_BOOTSTRAP_SERVERS", "from-env:9092", 1);
    setenv("HEALTH_PORT", "7070", 1);
    EXPECT_EQ(config().config().kafka.bootstrap_servers.get(), "from-env:9092");
    EXPECT_EQ(config().getHealthPort(), 7070);
}

TEST_F(ConfigurationTest, CommandLineDirectionWins) {
    setenv("REPLICATOR_DIRECTION", "R2K", 1);
    EXPECT_EQ(config().getDirection(), "R2K");
    config().overrideDirection("K2R");
    EXPECT_EQ(config().getDirection(), "K2R");
}

TEST_F(ConfigurationTest, CommandLineHealthPortWins) {
    setenv("HEALTH_PORT", "7070", 1);
    config().overrideHealthPort(9191);
    EXPECT_EQ(config().getHealthPort(), 9191);

    config().overrideHealthPort(70000);
    EXPECT_FALSE(config().validate()) << "override is validated like any other source";
}

TEST_F(ConfigurationTest, NumericEnvWithTrailingJunkIsIgnored) {
    setenv("RABBITMQ_PORT", "5672x", 1);
    EXPECT_EQ(config().config().rabbitmq.port.get(), 5672) << "falls back to the default";
    config().config().rabbitmq.port.set(5673);
    EXPECT_EQ(config().config().rabbitmq.port.get(), 5673);

    setenv("RABBITMQ_PORT", "5674", 1);
    EXPECT_EQ(config().config().rabbitmq.port.get(), 5674);
}

TEST_F(ConfigurationTest, UnknownDirectionFailsValidation) {
    config().overrideDirection("X2Y");
    EXPECT_FALSE(config().validate());
    ASSERT_FALSE(config().getValidationErrors().empty());
    EXPECT_NE(config().getValidationErrors()[0].find("X2Y"), std::string::npos);
}

TEST_F(ConfigurationTest, LogToLogRequiresBothClusters) {
    config().overrideDirection("S2T");
    EXPECT_FALSE(config().validate());

    config().config().kafka.source_bootstrap_servers.set("src:9092");
    config().config().kafka.target_bootstrap_servers.set("dst:9092");
    EXPECT_TRUE(config().validate());
}

TEST_F(ConfigurationTest, RejectsOutOfRangeSettings) {
    config().config().rabbitmq.port.set(0);
    config().config().replication.heartbeat_interval_sec.set(0);
    config().config().replication.delivery_failure_policy.set("drop");
    EXPECT_FALSE(config().validate());
    EXPECT_EQ(config().getValidationErrors().size(), 3u);
}

TEST_F(ConfigurationTest, MalformedYamlIsRejected) {
    EXPECT_FALSE(config().loadFromString("mqbridge: [unterminated"));
    EXPECT_FALSE(config().loadFromFile("/nonexistent/mqbridge.yaml"));
}
