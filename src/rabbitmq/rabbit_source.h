#ifndef MQBRIDGE_SRC_RABBITMQ_RABBIT_SOURCE_H_
#define MQBRIDGE_SRC_RABBITMQ_RABBIT_SOURCE_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "rabbit_connection.h"
#include "replication/interfaces.h"

namespace MqBridge {

/**
 * RabbitMQ consume role: one manual-ack subscription per mapped queue.
 * Deliveries are acknowledged only through Acknowledge()/Reject().
 */
class RabbitSource : public MessageSource {
	public:
		RabbitSource(RabbitOptions options, std::vector<std::string> queues, Topology topology);

		std::string name() const override { return connection_.options().component; }
		void Connect() override;
		void Close() override;
		bool Probe() override;
		ConnectionState state() const override { return state_; }

		size_t Poll(int timeout_ms, const MessageHandler& handler) override;
		int PollTimeoutMs() const override { return kRabbitEventSliceMs; }

		void Acknowledge(const InFlightMessage& message) override;
		void Reject(const InFlightMessage& message, bool requeue) override;

		// Closing the channel requeues every unacked delivery.
		bool RedeliversUnacknowledgedOnReconnect() const override { return true; }

	private:
		void ConnectOnce();
		void Subscribe();
		void ApplyQos();
		void HandleChannelEvent();
		InFlightMessage ToInFlightMessage(const amqp_envelope_t& envelope) const;

		RabbitConnection connection_;
		const std::vector<std::string> queues_;
		const Topology topology_;
		ConnectionState state_ = ConnectionState::kDisconnected;
		// consumer tag -> queue
		absl::flat_hash_map<std::string, std::string> consumer_queues_;
};

} // namespace MqBridge

#endif // MQBRIDGE_SRC_RABBITMQ_RABBIT_SOURCE_H_
