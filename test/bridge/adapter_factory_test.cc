#include <gtest/gtest.h>

#include <atomic>

#include "bridge/adapter_factory.h"
#include "common/errors.h"

using namespace MqBridge;

class AdapterFactoryTest : public ::testing::Test {
protected:
    AdapterFactoryTest() {
        config_.replication.mappings.set(
            R"([{"kafkaTopic": "orders", "rabbitmqExchange": "events", "rabbitmqQueue": "q.orders",
                 "rabbitmqRoutingKey": "orders.created"}])");
        config_.replication.topic_mapping.set(R"({"orders": "orders-replica"})");
        config_.kafka.source_bootstrap_servers.set("src:9092");
        config_.kafka.target_bootstrap_servers.set("dst:9092");
    }

    MqBridgeConfig config_;
    std::atomic<bool> stop_{false};
};

TEST_F(AdapterFactoryTest, PicksRouteTablePerDirection) {
    MappingTable k2r = BuildMappingTable(Direction::kKafkaToRabbit, config_);
    EXPECT_NE(k2r.Resolve("orders"), nullptr);
    EXPECT_EQ(k2r.Resolve("orders")->destination.exchange, "events");

    MappingTable r2k = BuildMappingTable(Direction::kRabbitToKafka, config_);
    EXPECT_NE(r2k.Resolve("q.orders"), nullptr);

    MappingTable t2s = BuildMappingTable(Direction::kTargetToSource, config_);
    EXPECT_EQ(t2s.Resolve("orders")->destination.topic, "orders-replica");
}

TEST_F(AdapterFactoryTest, CreatesDisconnectedAdapters) {
    struct Case {
        Direction direction;
        const char* source;
        const char* sink;
    };
    const Case cases[] = {
        {Direction::kKafkaToRabbit, "KafkaSource", "RabbitSink"},
        {Direction::kRabbitToKafka, "RabbitSource", "KafkaSink"},
        {Direction::kSourceToTarget, "KafkaSource", "KafkaSink"},
        {Direction::kTargetToSource, "KafkaSource", "KafkaSink"},
    };
    for (const auto& c : cases) {
        MappingTable mappings = BuildMappingTable(c.direction, config_);
        AdapterPair pair = CreateAdapters(c.direction, config_, mappings, &stop_);
        ASSERT_NE(pair.source, nullptr) << DirectionTag(c.direction);
        ASSERT_NE(pair.sink, nullptr) << DirectionTag(c.direction);
        EXPECT_EQ(pair.source->name(), c.source) << DirectionTag(c.direction);
        EXPECT_EQ(pair.sink->name(), c.sink) << DirectionTag(c.direction);
        EXPECT_EQ(pair.source->state(), ConnectionState::kDisconnected);
        EXPECT_EQ(pair.sink->state(), ConnectionState::kDisconnected);
    }
}

TEST_F(AdapterFactoryTest, SupervisorOptionsFollowDirection) {
    config_.replication.delivery_failure_policy.set("requeue");
    config_.replication.heartbeat_interval_sec.set(15);
    SupervisorOptions options = BuildSupervisorOptions(Direction::kRabbitToKafka, config_);
    EXPECT_EQ(options.direction_tag, "R2K");
    EXPECT_EQ(options.dedup_prefix, "r2k");
    EXPECT_EQ(options.failure_policy, DeliveryFailurePolicy::kRequeue);
    EXPECT_EQ(options.heartbeat_interval_sec, 15);

    config_.replication.delivery_failure_policy.set("drop");
    EXPECT_THROW(BuildSupervisorOptions(Direction::kRabbitToKafka, config_), ConfigurationError);
}

TEST_F(AdapterFactoryTest, EmptyRouteTableIsFatal) {
    config_.replication.mappings.set("[]");
    EXPECT_THROW(BuildMappingTable(Direction::kKafkaToRabbit, config_), ConfigurationError);
}
