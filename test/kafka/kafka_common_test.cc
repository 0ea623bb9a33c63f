#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "common/errors.h"
#include "kafka/kafka_common.h"

using namespace MqBridge;

TEST(BuildAssignmentTest, AssignsEveryPartitionInOrder) {
    std::map<std::string, std::vector<int32_t>> metadata = {
        {"orders", {2, 0, 1}},
        {"audit", {0}},
    };
    auto assignment = BuildAssignment({"orders", "audit"}, metadata, true);

    std::vector<TopicPartitionId> expected = {
        {"orders", 0}, {"orders", 1}, {"orders", 2}, {"audit", 0},
    };
    EXPECT_EQ(assignment, expected);
}

TEST(BuildAssignmentTest, FirstPartitionOnly) {
    std::map<std::string, std::vector<int32_t>> metadata = {{"orders", {3, 1, 2}}};
    auto assignment = BuildAssignment({"orders"}, metadata, false);
    ASSERT_EQ(assignment.size(), 1u);
    EXPECT_EQ(assignment[0].partition, 1);
}

TEST(BuildAssignmentTest, UnknownTopicFallsBackToPartitionZero) {
    std::map<std::string, std::vector<int32_t>> metadata = {{"empty", {}}};
    auto assignment = BuildAssignment({"missing", "empty"}, metadata, true);
    std::vector<TopicPartitionId> expected = {{"missing", 0}, {"empty", 0}};
    EXPECT_EQ(assignment, expected);
}

TEST(EstimateLagTest, DistanceToHighWatermark) {
    EXPECT_EQ(EstimateLag(100, 90), 10);
    EXPECT_EQ(EstimateLag(100, 100), 0);
    EXPECT_EQ(EstimateLag(100, 120), 0) << "never negative";
    EXPECT_EQ(EstimateLag(-1, 5), 0) << "unknown watermark";
    EXPECT_EQ(EstimateLag(100, -1001), 0) << "logical offset before first consume";
}

TEST(MakeKafkaConfTest, AcceptsKnownSettings) {
    auto conf = MakeKafkaConf({{"bootstrap.servers", "localhost:9092"}, {"acks", "all"}});
    ASSERT_NE(conf, nullptr);
    std::string value;
    ASSERT_EQ(conf->get("bootstrap.servers", value), RdKafka::Conf::CONF_OK);
    EXPECT_EQ(value, "localhost:9092");
}

TEST(MakeKafkaConfTest, UnknownSettingIsConfigurationError) {
    EXPECT_THROW(MakeKafkaConf({{"no.such.property", "1"}}), ConfigurationError);
}
