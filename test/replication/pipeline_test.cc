#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>

#include "common/stats.h"
#include "replication/fake_adapters.h"
#include "replication/mapping_table.h"
#include "replication/pipeline.h"

using namespace MqBridge;
using namespace MqBridge::testing_support;

namespace {

const HeaderValue* FindHeader(const OutboundMessage& message, const std::string& name) {
    for (const auto& header : message.headers) {
        if (header.name == name) {
            return &header.value;
        }
    }
    return nullptr;
}

} // namespace

class KafkaToRabbitPipelineTest : public ::testing::Test {
protected:
    KafkaToRabbitPipelineTest()
        : mappings_(MappingTable::FromReplicationMappings(Direction::kKafkaToRabbit, R"([
              {"kafkaTopic": "orders", "rabbitmqExchange": "events", "rabbitmqQueue": "q.orders",
               "rabbitmqRoutingKey": "orders.created"},
              {"kafkaTopic": "audit", "rabbitmqQueue": "q.audit"}
          ])")),
          pipeline_("k2r", mappings_, source_, sink_, stats_) {}

    MappingTable mappings_;
    FakeSource source_;
    FakeSink sink_;
    Stats stats_;
    ReplicationPipeline pipeline_;
};

TEST_F(KafkaToRabbitPipelineTest, ReplicatesWithProvenance) {
    InFlightMessage message = KafkaMessage("orders", 0, 42, R"({"id": 1})");
    message.key = "customer-7";

    EXPECT_EQ(pipeline_.Process(message), ProcessResult::kReplicated);

    ASSERT_EQ(sink_.published.size(), 1u);
    const OutboundMessage& out = sink_.published[0];
    EXPECT_EQ(out.destination.exchange, "events");
    EXPECT_EQ(out.destination.routing_key, "orders.created");
    EXPECT_EQ(out.payload, R"({"id": 1})");
    EXPECT_EQ(out.replication_id, "k2r:orders:0:42");

    ASSERT_NE(FindHeader(out, "replicator_id"), nullptr);
    EXPECT_EQ(*FindHeader(out, "replicator_id"), HeaderValue::Text("k2r:orders:0:42"));
    EXPECT_EQ(*FindHeader(out, "kafka_topic"), HeaderValue::Text("orders"));
    EXPECT_EQ(*FindHeader(out, "kafka_partition"), HeaderValue::Int32(0));
    EXPECT_EQ(*FindHeader(out, "kafka_offset"), HeaderValue::Int64(42));
    EXPECT_EQ(*FindHeader(out, "kafka_key"), HeaderValue::Text("customer-7"));

    EXPECT_THAT(source_.acked, ::testing::ElementsAre("orders:0:42"));
    EXPECT_EQ(stats_.messages_processed(), 1u);
    EXPECT_EQ(stats_.errors(), 0u);
    EXPECT_TRUE(pipeline_.dedup_window().Contains("k2r:orders:0:42"));
}

TEST_F(KafkaToRabbitPipelineTest, KeyHeaderReflectsKeyEncoding) {
    InFlightMessage keyless = KafkaMessage("audit", 1, 5, "x");
    pipeline_.Process(keyless);
    InFlightMessage binary = KafkaMessage("audit", 1, 6, "y");
    binary.key = std::string("\xFF\x00", 2);
    pipeline_.Process(binary);

    ASSERT_EQ(sink_.published.size(), 2u);
    EXPECT_EQ(*FindHeader(sink_.published[0], "kafka_key"), HeaderValue::Null());
    EXPECT_EQ(*FindHeader(sink_.published[1], "kafka_key"), HeaderValue::Bytes(std::string("\xFF\x00", 2)));
    EXPECT_EQ(sink_.published[0].destination.routing_key, "q.audit");
    EXPECT_TRUE(sink_.published[0].destination.exchange.empty());
}

TEST_F(KafkaToRabbitPipelineTest, DuplicateIsAcknowledgedWithoutPublish) {
    InFlightMessage message = KafkaMessage("orders", 0, 42, "payload");
    EXPECT_EQ(pipeline_.Process(message), ProcessResult::kReplicated);
    EXPECT_EQ(pipeline_.Process(message), ProcessResult::kDuplicate);

    EXPECT_EQ(sink_.published.size(), 1u);
    EXPECT_EQ(source_.acked.size(), 2u);
    EXPECT_EQ(stats_.messages_processed(), 1u);
}

TEST_F(KafkaToRabbitPipelineTest, UnroutableMessageIsDropped) {
    InFlightMessage message = KafkaMessage("unmapped", 0, 1, "payload");
    EXPECT_EQ(pipeline_.Process(message), ProcessResult::kRouteNotFound);

    EXPECT_TRUE(sink_.published.empty());
    EXPECT_TRUE(source_.acked.empty());
    ASSERT_EQ(source_.rejected.size(), 1u);
    EXPECT_FALSE(source_.rejected[0].requeue);
    EXPECT_EQ(stats_.messages_processed(), 0u);
    EXPECT_EQ(stats_.errors(), 0u);
}

TEST_F(KafkaToRabbitPipelineTest, MissingDestinationIsTreatedAsUnroutable) {
    sink_.failures.push_back(FakeSink::Failure::kRouteNotFound);
    InFlightMessage message = KafkaMessage("orders", 0, 3, "payload");
    EXPECT_EQ(pipeline_.Process(message), ProcessResult::kRouteNotFound);

    ASSERT_EQ(source_.rejected.size(), 1u);
    EXPECT_FALSE(source_.rejected[0].requeue);
    EXPECT_EQ(stats_.errors(), 0u);
    EXPECT_FALSE(pipeline_.dedup_window().Contains("k2r:orders:0:3"));
}

TEST_F(KafkaToRabbitPipelineTest, PreservesSourceOrder) {
    pipeline_.Process(KafkaMessage("orders", 0, 10, "A"));
    pipeline_.Process(KafkaMessage("orders", 0, 11, "B"));
    pipeline_.Process(KafkaMessage("orders", 0, 12, "C"));

    ASSERT_EQ(sink_.published.size(), 3u);
    EXPECT_EQ(sink_.published[0].payload, "A");
    EXPECT_EQ(sink_.published[1].payload, "B");
    EXPECT_EQ(sink_.published[2].payload, "C");
    EXPECT_THAT(source_.acked, ::testing::ElementsAre("orders:0:10", "orders:0:11", "orders:0:12"));
}

class RabbitToKafkaPipelineTest : public ::testing::Test {
protected:
    RabbitToKafkaPipelineTest()
        : mappings_(MappingTable::FromReplicationMappings(Direction::kRabbitToKafka,
              R"([{"kafkaTopic": "orders-in", "rabbitmqQueue": "q.orders"}])")) {}

    MappingTable mappings_;
    FakeSource source_;
    FakeSink sink_;
    Stats stats_;
};

TEST_F(RabbitToKafkaPipelineTest, FailedPublishLeavesMessageForRedelivery) {
    ReplicationPipeline pipeline("r2k", mappings_, source_, sink_, stats_);
    sink_.failures.push_back(FakeSink::Failure::kDelivery);

    InFlightMessage message = RabbitMessage("q.orders", 9, "body");
    EXPECT_EQ(pipeline.Process(message), ProcessResult::kDeliveryFailed);
    EXPECT_TRUE(source_.acked.empty());
    EXPECT_TRUE(source_.rejected.empty()) << "leave policy does not settle the delivery";
    EXPECT_EQ(stats_.errors(), 1u);
    EXPECT_FALSE(pipeline.dedup_window().Contains("r2k:q.orders:9"));
    EXPECT_EQ(pipeline.left_unacknowledged(), 1u);
    EXPECT_FALSE(pipeline.replicated_since_leave());

    // Redelivery of the same message succeeds and is acknowledged once.
    EXPECT_EQ(pipeline.Process(message), ProcessResult::kReplicated);
    EXPECT_THAT(source_.acked, ::testing::ElementsAre("q.orders:9"));
    EXPECT_TRUE(pipeline.replicated_since_leave());
    pipeline.ClearLeftUnacknowledged();
    EXPECT_EQ(pipeline.left_unacknowledged(), 0u);
    ASSERT_EQ(sink_.published.size(), 1u);
    EXPECT_EQ(sink_.published[0].destination.topic, "orders-in");
    EXPECT_EQ(*FindHeader(sink_.published[0], "rabbitmq_queue"), HeaderValue::Text("q.orders"));
    EXPECT_EQ(*FindHeader(sink_.published[0], "rabbitmq_routing_key"), HeaderValue::Text("q.orders"));
    EXPECT_EQ(*FindHeader(sink_.published[0], "replicator_id"), HeaderValue::Text("r2k:q.orders:9"));
    EXPECT_EQ(FindHeader(sink_.published[0], "kafka_key"), nullptr);
}

TEST_F(RabbitToKafkaPipelineTest, FailurePolicyControlsNack) {
    ReplicationPipeline requeue("r2k", mappings_, source_, sink_, stats_, DeliveryFailurePolicy::kRequeue);
    sink_.failures.push_back(FakeSink::Failure::kConnection);
    EXPECT_EQ(requeue.Process(RabbitMessage("q.orders", 1, "a")), ProcessResult::kDeliveryFailed);
    ASSERT_EQ(source_.rejected.size(), 1u);
    EXPECT_TRUE(source_.rejected[0].requeue);

    ReplicationPipeline discard("r2k", mappings_, source_, sink_, stats_, DeliveryFailurePolicy::kDiscard);
    sink_.failures.push_back(FakeSink::Failure::kDelivery);
    EXPECT_EQ(discard.Process(RabbitMessage("q.orders", 2, "b")), ProcessResult::kDeliveryFailed);
    ASSERT_EQ(source_.rejected.size(), 2u);
    EXPECT_FALSE(source_.rejected[1].requeue);
    EXPECT_EQ(stats_.errors(), 2u);
}

TEST(LogToLogPipelineTest, ForwardsHeadersAndKey) {
    MappingTable mappings = MappingTable::FromTopicMapping(Direction::kSourceToTarget,
            R"({"orders": "orders-replica"})");
    FakeSource source;
    FakeSink sink;
    Stats stats;
    ReplicationPipeline pipeline("s2t", mappings, source, sink, stats);

    InFlightMessage message = KafkaMessage("orders", 2, 100, "payload");
    message.key = "k1";
    message.headers.push_back({"trace_id", HeaderValue::Bytes("abc")});
    message.headers.push_back({"kafka_offset", HeaderValue::Bytes("stale")});

    EXPECT_EQ(pipeline.Process(message), ProcessResult::kReplicated);
    ASSERT_EQ(sink.published.size(), 1u);
    const OutboundMessage& out = sink.published[0];
    EXPECT_EQ(out.destination.topic, "orders-replica");
    EXPECT_EQ(out.key, std::optional<std::string>("k1"));
    EXPECT_EQ(*FindHeader(out, "trace_id"), HeaderValue::Bytes("abc"));
    EXPECT_EQ(*FindHeader(out, "kafka_offset"), HeaderValue::Int64(100)) << "stale provenance replaced";
    EXPECT_EQ(FindHeader(out, "kafka_key"), nullptr) << "log destinations keep the record key";
    EXPECT_EQ(*FindHeader(out, "replicator_id"), HeaderValue::Text("s2t:orders:2:100"));
}

TEST(DeliveryFailurePolicyTest, Parse) {
    EXPECT_EQ(ParseDeliveryFailurePolicy("leave"), DeliveryFailurePolicy::kLeave);
    EXPECT_EQ(ParseDeliveryFailurePolicy("requeue"), DeliveryFailurePolicy::kRequeue);
    EXPECT_EQ(ParseDeliveryFailurePolicy("discard"), DeliveryFailurePolicy::kDiscard);
    EXPECT_FALSE(ParseDeliveryFailurePolicy("drop").has_value());
}
