#ifndef MQBRIDGE_SRC_KAFKA_KAFKA_COMMON_H_
#define MQBRIDGE_SRC_KAFKA_KAFKA_COMMON_H_

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <librdkafka/rdkafkacpp.h>

namespace MqBridge {

struct TopicPartitionId {
	std::string topic;
	int32_t partition = 0;

	bool operator==(const TopicPartitionId& other) const {
		return topic == other.topic && partition == other.partition;
	}
	template <typename H>
	friend H AbslHashValue(H h, const TopicPartitionId& tp) {
		return H::combine(std::move(h), tp.topic, tp.partition);
	}
};

/**
 * Explicit assignment computed from metadata. `partitions_by_topic` holds
 * what the broker reported; a topic it does not know gets partition 0.
 * With `all_partitions` false only partition 0 of each topic is taken.
 */
std::vector<TopicPartitionId> BuildAssignment(const std::vector<std::string>& topics,
		const std::map<std::string, std::vector<int32_t>>& partitions_by_topic,
		bool all_partitions);

// Messages between the next offset to read and the high watermark.
int64_t EstimateLag(int64_t high_watermark, int64_t next_offset);

// Creates a global conf from key/value pairs. Throws ConfigurationError.
std::unique_ptr<RdKafka::Conf> MakeKafkaConf(
		const std::vector<std::pair<std::string, std::string>>& settings);

// Routes librdkafka errors and logs into glog under a component tag.
class KafkaEventLogger : public RdKafka::EventCb {
public:
	explicit KafkaEventLogger(std::string component) : component_(std::move(component)) {}
	void event_cb(RdKafka::Event& event) override;

private:
	std::string component_;
};

} // namespace MqBridge

#endif // MQBRIDGE_SRC_KAFKA_KAFKA_COMMON_H_
