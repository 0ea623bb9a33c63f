#include "rabbit_source.h"

#include <algorithm>
#include <chrono>

#include <glog/logging.h>

#include "common/errors.h"

namespace MqBridge {

RabbitSource::RabbitSource(RabbitOptions options, std::vector<std::string> queues, Topology topology)
	: connection_(std::move(options)),
	  queues_(std::move(queues)),
	  topology_(std::move(topology)) {
	connection_.SetChannelSetup([this] { ApplyQos(); });
}

void RabbitSource::Connect() {
	state_ = ConnectionState::kConnecting;
	try {
		ConnectWithRetry(name(), [this] { ConnectOnce(); }, kConnectMaxAttempts,
				kConnectRetryBackoffMs, connection_.options().stop);
	} catch (const BridgeError&) {
		state_ = ConnectionState::kFailed;
		throw;
	}
	state_ = ConnectionState::kConnected;
}

void RabbitSource::ConnectOnce() {
	connection_.Open();
	connection_.DeclareTopology(topology_);
	Subscribe();
}

void RabbitSource::ApplyQos() {
	const int prefetch = connection_.options().prefetch;
	if (prefetch <= 0) {
		return;
	}
	amqp_basic_qos(connection_.handle(), RabbitConnection::kChannel, 0,
			static_cast<uint16_t>(prefetch), 0);
	std::string error;
	if (!connection_.CheckRpc("basic.qos", &error)) {
		LOG(WARNING) << "[" << name() << "] basic.qos prefetch=" << prefetch << " rejected: " << error;
	}
}

void RabbitSource::Subscribe() {
	consumer_queues_.clear();
	for (const auto& queue : queues_) {
		if (connection_.IsQueueUnavailable(queue)) {
			LOG(ERROR) << "[" << name() << "] Not consuming from " << queue << ": declaration failed";
			continue;
		}
		amqp_basic_consume_ok_t* ok = amqp_basic_consume(connection_.handle(), RabbitConnection::kChannel,
				amqp_cstring_bytes(queue.c_str()), amqp_empty_bytes, 0, 0, 0, amqp_empty_table);
		std::string error;
		if (!connection_.CheckRpc("basic.consume " + queue, &error) || ok == nullptr) {
			LOG(ERROR) << "[" << name() << "] Failed to consume from " << queue << ": " << error;
			continue;
		}
		std::string consumer_tag = BytesToString(ok->consumer_tag);
		consumer_queues_[consumer_tag] = queue;
		LOG(INFO) << "[" << name() << "] Started consuming from " << queue << " (consumer tag "
			<< consumer_tag << ")";
	}
	if (consumer_queues_.empty()) {
		throw TopologyError("No RabbitMQ queue could be subscribed");
	}
}

void RabbitSource::Close() {
	connection_.Close();
	consumer_queues_.clear();
	state_ = ConnectionState::kDisconnected;
	LOG(INFO) << "[" << name() << "] Closed";
}

bool RabbitSource::Probe() {
	return state_ == ConnectionState::kConnected && connection_.is_open() && !consumer_queues_.empty();
}

size_t RabbitSource::Poll(int timeout_ms, const MessageHandler& handler) {
	if (!connection_.is_open()) {
		throw ConnectionError(name() + " is not connected");
	}

	const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
	size_t delivered = 0;
	try {
		while (delivered < static_cast<size_t>(kRabbitMaxDeliveriesPerPoll) &&
				state_ == ConnectionState::kConnected) {
			amqp_connection_state_t conn = connection_.handle();
			amqp_maybe_release_buffers(conn);

			// Block for the first delivery only, then drain what is buffered.
			int64_t wait_ms = 0;
			if (delivered == 0) {
				wait_ms = std::max<int64_t>(0, std::chrono::duration_cast<std::chrono::milliseconds>(
							deadline - std::chrono::steady_clock::now()).count());
			}
			struct timeval tv;
			tv.tv_sec = wait_ms / 1000;
			tv.tv_usec = (wait_ms % 1000) * 1000;

			amqp_envelope_t envelope;
			amqp_rpc_reply_t reply = amqp_consume_message(conn, &envelope, &tv, 0);
			if (reply.reply_type == AMQP_RESPONSE_NORMAL) {
				InFlightMessage message = ToInFlightMessage(envelope);
				amqp_destroy_envelope(&envelope);
				++delivered;
				handler(message);
				continue;
			}
			if (reply.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION &&
					reply.library_error == AMQP_STATUS_TIMEOUT) {
				break;
			}
			if (reply.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION &&
					reply.library_error == AMQP_STATUS_UNEXPECTED_STATE) {
				HandleChannelEvent();
				continue;
			}
			throw ConnectionError("Consuming failed: " + DescribeReply(reply));
		}
	} catch (const ConnectionError&) {
		state_ = ConnectionState::kFailed;
		throw;
	}
	return delivered;
}

void RabbitSource::HandleChannelEvent() {
	ChannelEvent event = connection_.WaitEvent(nullptr);
	switch (event.type) {
		case ChannelEvent::Type::kChannelClosed:
			LOG(WARNING) << "[" << name() << "] Subscriptions lost with the channel, resubscribing";
			state_ = ConnectionState::kFailed;
			break;
		case ChannelEvent::Type::kConsumerCancelled: {
			auto it = consumer_queues_.find(event.text);
			LOG(WARNING) << "[" << name() << "] Broker cancelled consumer " << event.text << " of queue "
				<< (it == consumer_queues_.end() ? "unknown" : it->second);
			state_ = ConnectionState::kFailed;
			break;
		}
		default:
			VLOG(1) << "[" << name() << "] Ignoring channel event " << static_cast<int>(event.type);
			break;
	}
}

InFlightMessage RabbitSource::ToInFlightMessage(const amqp_envelope_t& envelope) const {
	const std::string consumer_tag = BytesToString(envelope.consumer_tag);
	const std::string exchange = BytesToString(envelope.exchange);
	const std::string routing_key = BytesToString(envelope.routing_key);

	bool resolved = true;
	std::string queue = ResolveQueueName(consumer_queues_, consumer_tag, exchange, routing_key, &resolved);
	if (!resolved) {
		LOG(WARNING) << "[" << name() << "] Cannot resolve queue for consumer tag " << consumer_tag
			<< ", using the tag as queue name";
	}

	InFlightMessage message;
	message.source = queue;
	message.payload = BytesToString(envelope.message.body);
	if (envelope.message.properties._flags & AMQP_BASIC_HEADERS_FLAG) {
		message.headers = HeadersFromAmqpTable(envelope.message.properties.headers);
	}
	// Set by the K2R leg; restores the record key on the way back.
	for (const auto& header : message.headers) {
		if (header.name == "kafka_key" && header.value.kind != HeaderValue::Kind::kNull) {
			message.key = header.value.ToBytes();
		}
	}

	message.origin.broker = BrokerKind::kRabbitMQ;
	message.origin.rabbitmq.queue = queue;
	message.origin.rabbitmq.delivery_tag = envelope.delivery_tag;
	message.origin.rabbitmq.exchange = exchange;
	message.origin.rabbitmq.routing_key = routing_key;
	message.origin.rabbitmq.consumer_tag = consumer_tag;
	return message;
}

void RabbitSource::Acknowledge(const InFlightMessage& message) {
	int rc = connection_.is_open()
		? amqp_basic_ack(connection_.handle(), RabbitConnection::kChannel,
				message.origin.rabbitmq.delivery_tag, 0)
		: AMQP_STATUS_CONNECTION_CLOSED;
	if (rc != AMQP_STATUS_OK) {
		state_ = ConnectionState::kFailed;
		throw ConnectionError("basic.ack " + DescribeOrigin(message.origin) + ": " + amqp_error_string2(rc));
	}
}

void RabbitSource::Reject(const InFlightMessage& message, bool requeue) {
	int rc = connection_.is_open()
		? amqp_basic_nack(connection_.handle(), RabbitConnection::kChannel,
				message.origin.rabbitmq.delivery_tag, 0, requeue ? 1 : 0)
		: AMQP_STATUS_CONNECTION_CLOSED;
	if (rc != AMQP_STATUS_OK) {
		state_ = ConnectionState::kFailed;
		throw ConnectionError("basic.nack " + DescribeOrigin(message.origin) + ": " + amqp_error_string2(rc));
	}
	VLOG(1) << "[" << name() << "] Nacked " << DescribeOrigin(message.origin)
		<< (requeue ? " with requeue" : " without requeue");
}

} // namespace MqBridge
