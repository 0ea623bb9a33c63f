#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rabbitmq/rabbit_connection.h"

using namespace MqBridge;

namespace {

amqp_bytes_t Bytes(const std::string& s) {
    amqp_bytes_t b;
    b.len = s.size();
    b.bytes = const_cast<char*>(s.data());
    return b;
}

} // namespace

TEST(AmqpHeaderTableTest, EncodesEveryHeaderKind) {
    AmqpHeaderTable table({
        {"kafka_topic", HeaderValue::Text("orders")},
        {"kafka_partition", HeaderValue::Int32(3)},
        {"kafka_offset", HeaderValue::Int64(1234567890123LL)},
        {"kafka_key", HeaderValue::Null()},
        {"raw", HeaderValue::Bytes(std::string("\x00\x01", 2))},
    });
    amqp_table_t t = table.table();
    ASSERT_EQ(t.num_entries, 5);

    EXPECT_EQ(BytesToString(t.entries[0].key), "kafka_topic");
    EXPECT_EQ(t.entries[0].value.kind, AMQP_FIELD_KIND_UTF8);
    EXPECT_EQ(BytesToString(t.entries[0].value.value.bytes), "orders");
    EXPECT_EQ(t.entries[1].value.kind, AMQP_FIELD_KIND_I32);
    EXPECT_EQ(t.entries[1].value.value.i32, 3);
    EXPECT_EQ(t.entries[2].value.kind, AMQP_FIELD_KIND_I64);
    EXPECT_EQ(t.entries[2].value.value.i64, 1234567890123LL);
    EXPECT_EQ(t.entries[3].value.kind, AMQP_FIELD_KIND_VOID);
    EXPECT_EQ(t.entries[4].value.kind, AMQP_FIELD_KIND_BYTES);
    EXPECT_EQ(BytesToString(t.entries[4].value.value.bytes), std::string("\x00\x01", 2));
}

TEST(AmqpHeaderTableTest, EmptyTable) {
    AmqpHeaderTable table({});
    amqp_table_t t = table.table();
    EXPECT_EQ(t.num_entries, 0);
    EXPECT_EQ(t.entries, nullptr);
}

TEST(AmqpHeaderTableTest, ReceivedTableConvertsToHeaders) {
    const std::string k1 = "kafka_key";
    const std::string v1 = "customer-7";
    const std::string k2 = "retries";
    const std::string k3 = "flag";
    const std::string k4 = "nothing";
    const std::string k5 = "nested";

    amqp_table_entry_t entries[5];
    entries[0].key = Bytes(k1);
    entries[0].value.kind = AMQP_FIELD_KIND_UTF8;
    entries[0].value.value.bytes = Bytes(v1);
    entries[1].key = Bytes(k2);
    entries[1].value.kind = AMQP_FIELD_KIND_U16;
    entries[1].value.value.u16 = 4;
    entries[2].key = Bytes(k3);
    entries[2].value.kind = AMQP_FIELD_KIND_BOOLEAN;
    entries[2].value.value.boolean = 1;
    entries[3].key = Bytes(k4);
    entries[3].value.kind = AMQP_FIELD_KIND_VOID;
    entries[4].key = Bytes(k5);
    entries[4].value.kind = AMQP_FIELD_KIND_ARRAY;
    entries[4].value.value.array.num_entries = 0;
    entries[4].value.value.array.entries = nullptr;

    amqp_table_t table;
    table.num_entries = 5;
    table.entries = entries;

    std::vector<Header> headers = HeadersFromAmqpTable(table);
    ASSERT_EQ(headers.size(), 4u) << "array values are dropped";
    EXPECT_EQ(headers[0].name, "kafka_key");
    EXPECT_EQ(headers[0].value, HeaderValue::Text("customer-7"));
    EXPECT_EQ(headers[1].value, HeaderValue::Int32(4));
    EXPECT_EQ(headers[2].value, HeaderValue::Text("true"));
    EXPECT_EQ(headers[3].value, HeaderValue::Null());
}

TEST(ResolveQueueNameTest, PrefersConsumerTag) {
    absl::flat_hash_map<std::string, std::string> consumers = {{"ctag-1", "q.orders"}};
    bool resolved = false;
    EXPECT_EQ(ResolveQueueName(consumers, "ctag-1", "events", "orders.created", &resolved), "q.orders");
    EXPECT_TRUE(resolved);
}

TEST(ResolveQueueNameTest, DefaultExchangeUsesRoutingKey) {
    absl::flat_hash_map<std::string, std::string> consumers;
    bool resolved = false;
    EXPECT_EQ(ResolveQueueName(consumers, "ctag-9", "", "q.audit", &resolved), "q.audit");
    EXPECT_TRUE(resolved);
}

TEST(ResolveQueueNameTest, FallsBackToConsumerTag) {
    absl::flat_hash_map<std::string, std::string> consumers;
    bool resolved = true;
    EXPECT_EQ(ResolveQueueName(consumers, "ctag-9", "events", "orders.created", &resolved), "ctag-9");
    EXPECT_FALSE(resolved);
    EXPECT_EQ(ResolveQueueName(consumers, "", "events", "rk", &resolved), "unknown");
}
