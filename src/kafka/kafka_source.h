#ifndef MQBRIDGE_SRC_KAFKA_KAFKA_SOURCE_H_
#define MQBRIDGE_SRC_KAFKA_KAFKA_SOURCE_H_

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <librdkafka/rdkafkacpp.h>

#include "absl/container/flat_hash_map.h"

#include "kafka_common.h"
#include "replication/interfaces.h"

namespace MqBridge {

struct KafkaSourceOptions {
	std::string component = "KafkaSource";
	std::string bootstrap_servers;
	std::vector<std::string> topics;
	// Only used as the client's group.id; the consumer never joins or commits.
	std::string consumer_group;
	bool assign_all_partitions = true;
	int max_poll_records = kKafkaMaxPollRecords;
	const std::atomic<bool>* stop = nullptr;
};

/**
 * Kafka consume role. Partitions are assigned explicitly from metadata
 * and every (re)connect starts at the live tail. Offsets are never
 * committed; positions only feed lag estimates.
 */
class KafkaSource : public MessageSource {
	public:
		explicit KafkaSource(KafkaSourceOptions options);
		~KafkaSource() override;

		std::string name() const override { return options_.component; }
		void Connect() override;
		void Close() override;
		bool Probe() override;
		ConnectionState state() const override { return state_; }

		size_t Poll(int timeout_ms, const MessageHandler& handler) override;
		int PollTimeoutMs() const override { return kKafkaPollTimeoutMs; }

		// No per-message acknowledgment exists on the log side.
		void Acknowledge(const InFlightMessage&) override {}
		void Reject(const InFlightMessage&, bool) override {}

		std::vector<PartitionLag> Lag() override;

		const std::vector<TopicPartitionId>& assignment() const { return assignment_; }

	private:
		void ConnectOnce();
		void ReleaseConsumer();
		InFlightMessage ToInFlightMessage(RdKafka::Message& message) const;

		const KafkaSourceOptions options_;
		ConnectionState state_ = ConnectionState::kDisconnected;
		KafkaEventLogger event_logger_;
		std::unique_ptr<RdKafka::KafkaConsumer> consumer_;
		std::vector<TopicPartitionId> assignment_;
		// Next offset to read per assigned partition.
		absl::flat_hash_map<TopicPartitionId, int64_t> positions_;
};

} // namespace MqBridge

#endif // MQBRIDGE_SRC_KAFKA_KAFKA_SOURCE_H_
