#include <gtest/gtest.h>

#include <string>

#include "common/errors.h"
#include "replication/mapping_table.h"

using namespace MqBridge;

namespace {

const char* const kK2RMappings = R"([
  {"kafkaTopic": "orders", "rabbitmqExchange": "events", "rabbitmqExchangeType": "topic",
   "rabbitmqQueue": "q.orders", "rabbitmqRoutingKey": "orders.created"},
  {"kafkaTopic": "audit", "rabbitmqQueue": "q.audit"},
  {"kafkaTopic": "payments", "rabbitmqExchange": "events", "rabbitmqRoutingKey": "payments.#"}
])";

} // namespace

TEST(MappingTableTest, KafkaToRabbitResolvesExchangeRoutes) {
    MappingTable table = MappingTable::FromReplicationMappings(Direction::kKafkaToRabbit, kK2RMappings);
    ASSERT_EQ(table.size(), 3u);

    const ReplicationMapping* orders = table.Resolve("orders");
    ASSERT_NE(orders, nullptr);
    EXPECT_EQ(orders->destination.exchange, "events");
    EXPECT_EQ(orders->destination.routing_key, "orders.created");
    EXPECT_TRUE(orders->destination.topic.empty());

    // No exchange: default exchange, routed by queue name.
    const ReplicationMapping* audit = table.Resolve("audit");
    ASSERT_NE(audit, nullptr);
    EXPECT_TRUE(audit->destination.exchange.empty());
    EXPECT_EQ(audit->destination.routing_key, "q.audit");

    EXPECT_EQ(table.Resolve("unknown"), nullptr);
    EXPECT_EQ(table.SourceIdentifiers(), (std::vector<std::string>{"orders", "audit", "payments"}));
}

TEST(MappingTableTest, KafkaToRabbitTopology) {
    MappingTable table = MappingTable::FromReplicationMappings(Direction::kKafkaToRabbit, kK2RMappings);
    Topology topology = table.GetTopology();

    ASSERT_EQ(topology.exchanges.size(), 1u) << "shared exchange is declared once";
    EXPECT_EQ(topology.exchanges[0].name, "events");
    EXPECT_EQ(topology.exchanges[0].kind, "topic");
    EXPECT_EQ(topology.queues, (std::vector<std::string>{"q.orders", "q.audit"}));
    ASSERT_EQ(topology.bindings.size(), 1u);
    EXPECT_EQ(topology.bindings[0].queue, "q.orders");
    EXPECT_EQ(topology.bindings[0].exchange, "events");
    EXPECT_EQ(topology.bindings[0].routing_key, "orders.created");
}

TEST(MappingTableTest, RabbitToKafkaKeysByQueue) {
    MappingTable table = MappingTable::FromReplicationMappings(Direction::kRabbitToKafka, R"([
      {"kafkaTopic": "orders-in", "rabbitmqQueue": "q.orders"},
      {"kafkaTopic": "no-queue", "rabbitmqExchange": "events"}
    ])");
    ASSERT_EQ(table.size(), 1u) << "entries without a queue are skipped";
    const ReplicationMapping* mapping = table.Resolve("q.orders");
    ASSERT_NE(mapping, nullptr);
    EXPECT_EQ(mapping->destination.topic, "orders-in");
    EXPECT_EQ(table.Resolve("orders-in"), nullptr);

    Topology topology = table.GetTopology();
    EXPECT_TRUE(topology.exchanges.empty());
    EXPECT_EQ(topology.queues, (std::vector<std::string>{"q.orders"}));
}

TEST(MappingTableTest, TopicMappingForLogToLog) {
    MappingTable table = MappingTable::FromTopicMapping(Direction::kSourceToTarget,
            R"({"orders": "orders-replica", "audit": "audit-replica"})");
    ASSERT_EQ(table.size(), 2u);
    ASSERT_NE(table.Resolve("orders"), nullptr);
    EXPECT_EQ(table.Resolve("orders")->destination.topic, "orders-replica");
    EXPECT_TRUE(table.GetTopology().empty());
}

TEST(MappingTableTest, RejectsMalformedInput) {
    EXPECT_THROW(MappingTable::FromReplicationMappings(Direction::kKafkaToRabbit, "not json ["),
            ConfigurationError);
    EXPECT_THROW(MappingTable::FromReplicationMappings(Direction::kKafkaToRabbit, R"({"a": "b"})"),
            ConfigurationError);
    EXPECT_THROW(MappingTable::FromReplicationMappings(Direction::kKafkaToRabbit, R"(["orders"])"),
            ConfigurationError);
    EXPECT_THROW(MappingTable::FromReplicationMappings(Direction::kKafkaToRabbit,
                R"([{"rabbitmqQueue": "q"}])"), ConfigurationError) << "kafkaTopic is required";
    EXPECT_THROW(MappingTable::FromReplicationMappings(Direction::kKafkaToRabbit,
                R"([{"kafkaTopic": "orders"}])"), ConfigurationError) << "K2R needs a destination";
    EXPECT_THROW(MappingTable::FromTopicMapping(Direction::kSourceToTarget, R"(["orders"])"),
            ConfigurationError);
}

TEST(MappingTableTest, RejectsEmptyTable) {
    EXPECT_THROW(MappingTable::FromReplicationMappings(Direction::kKafkaToRabbit, "[]"),
            ConfigurationError);
    EXPECT_THROW(MappingTable::FromTopicMapping(Direction::kTargetToSource, "{}"),
            ConfigurationError);
    // Every R2K entry skipped leaves nothing to consume.
    EXPECT_THROW(MappingTable::FromReplicationMappings(Direction::kRabbitToKafka,
                R"([{"kafkaTopic": "orders"}])"), ConfigurationError);
}

TEST(MappingTableTest, RejectsDuplicateSource) {
    EXPECT_THROW(MappingTable::FromReplicationMappings(Direction::kKafkaToRabbit, R"([
      {"kafkaTopic": "orders", "rabbitmqQueue": "q1"},
      {"kafkaTopic": "orders", "rabbitmqQueue": "q2"}
    ])"), ConfigurationError);
}

TEST(MappingTableTest, RejectsTableForWrongDirection) {
    EXPECT_THROW(MappingTable::FromReplicationMappings(Direction::kSourceToTarget, kK2RMappings),
            ConfigurationError);
    EXPECT_THROW(MappingTable::FromTopicMapping(Direction::kKafkaToRabbit, R"({"a": "b"})"),
            ConfigurationError);
}
