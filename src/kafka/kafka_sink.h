#ifndef MQBRIDGE_SRC_KAFKA_KAFKA_SINK_H_
#define MQBRIDGE_SRC_KAFKA_KAFKA_SINK_H_

#include <atomic>
#include <memory>
#include <string>

#include <librdkafka/rdkafkacpp.h>

#include "kafka_common.h"
#include "replication/interfaces.h"

namespace MqBridge {

struct KafkaSinkOptions {
	std::string component = "KafkaSink";
	std::string bootstrap_servers;
	int confirm_timeout_ms = kProduceConfirmTimeoutMs;
	const std::atomic<bool>* stop = nullptr;
};

/**
 * Kafka produce role configured for strong delivery: acks from all
 * replicas, idempotence and a single in-flight request so per-partition
 * order is kept. Publish() waits for the delivery report.
 */
class KafkaSink : public MessageSink {
	public:
		explicit KafkaSink(KafkaSinkOptions options);
		~KafkaSink() override;

		std::string name() const override { return options_.component; }
		void Connect() override;
		void Close() override;
		bool Probe() override;
		ConnectionState state() const override { return state_; }

		void Publish(const OutboundMessage& message) override;
		void Flush(int timeout_ms) override;
		void Service() override;

	private:
		// Filled in by the delivery report callback.
		struct DeliveryState {
			bool done = false;
			RdKafka::ErrorCode err = RdKafka::ERR_NO_ERROR;
			int32_t partition = -1;
			int64_t offset = -1;
		};

		class DeliveryReporter : public RdKafka::DeliveryReportCb {
			public:
				void dr_cb(RdKafka::Message& message) override;
		};

		void ConnectOnce();
		void ReleaseProducer();
		bool CheckFatal();

		const KafkaSinkOptions options_;
		ConnectionState state_ = ConnectionState::kDisconnected;
		KafkaEventLogger event_logger_;
		DeliveryReporter delivery_reporter_;
		std::unique_ptr<RdKafka::Producer> producer_;
};

} // namespace MqBridge

#endif // MQBRIDGE_SRC_KAFKA_KAFKA_SINK_H_
