#ifndef MQBRIDGE_SRC_RABBITMQ_RABBIT_SINK_H_
#define MQBRIDGE_SRC_RABBITMQ_RABBIT_SINK_H_

#include <cstdint>
#include <string>

#include "rabbit_connection.h"
#include "replication/interfaces.h"

namespace MqBridge {

/**
 * RabbitMQ produce role. The channel runs in confirm mode and Publish()
 * returns only after the broker's basic.ack for that message.
 */
class RabbitSink : public MessageSink {
	public:
		RabbitSink(RabbitOptions options, Topology topology,
				int confirm_timeout_ms = kProduceConfirmTimeoutMs);

		std::string name() const override { return connection_.options().component; }
		void Connect() override;
		void Close() override;
		bool Probe() override;
		ConnectionState state() const override { return state_; }

		void Publish(const OutboundMessage& message) override;
		// Confirms are synchronous, so there is nothing left to flush.
		void Flush(int) override {}
		void Service() override;

	private:
		void ConnectOnce();
		void EnableConfirms();
		void WaitForConfirm(uint64_t sequence, const std::string& destination);

		RabbitConnection connection_;
		const Topology topology_;
		const int confirm_timeout_ms_;
		ConnectionState state_ = ConnectionState::kDisconnected;
		// Publish sequence number on the current channel; confirms refer to it.
		uint64_t next_sequence_ = 1;
};

} // namespace MqBridge

#endif // MQBRIDGE_SRC_RABBITMQ_RABBIT_SINK_H_
