#include "rabbit_sink.h"

#include <algorithm>
#include <chrono>

#include <glog/logging.h>

#include "common/errors.h"

namespace MqBridge {

namespace {

// AMQP reply code for a missing exchange or queue.
const uint16_t kReplyNotFound = 404;

// Longest single wait while a confirm is outstanding.
const int kConfirmPollSliceMs = 1000;

} // namespace

RabbitSink::RabbitSink(RabbitOptions options, Topology topology, int confirm_timeout_ms)
	: connection_(std::move(options)),
	  topology_(std::move(topology)),
	  confirm_timeout_ms_(confirm_timeout_ms) {
	connection_.SetChannelSetup([this] { EnableConfirms(); });
}

void RabbitSink::Connect() {
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

void RabbitSink::ConnectOnce() {
	connection_.Open();
	connection_.DeclareTopology(topology_);
}

void RabbitSink::EnableConfirms() {
	amqp_confirm_select(connection_.handle(), RabbitConnection::kChannel);
	std::string error;
	if (!connection_.CheckRpc("confirm.select", &error)) {
		throw ConnectionError("confirm.select rejected: " + error);
	}
	next_sequence_ = 1;
}

void RabbitSink::Close() {
	connection_.Close();
	state_ = ConnectionState::kDisconnected;
	LOG(INFO) << "[" << name() << "] Closed";
}

bool RabbitSink::Probe() {
	return state_ == ConnectionState::kConnected && connection_.is_open();
}

void RabbitSink::Publish(const OutboundMessage& message) {
	const Destination& destination = message.destination;
	if (!destination.exchange.empty() && connection_.IsExchangeUnavailable(destination.exchange)) {
		throw RouteNotFoundError("Exchange " + destination.exchange + " was not declared");
	}
	if (destination.exchange.empty() && connection_.IsQueueUnavailable(destination.routing_key)) {
		throw RouteNotFoundError("Queue " + destination.routing_key + " was not declared");
	}
	if (!connection_.is_open()) {
		state_ = ConnectionState::kFailed;
		throw ConnectionError(name() + " is not connected");
	}

	AmqpHeaderTable headers(message.headers);
	amqp_basic_properties_t props;
	props._flags = AMQP_BASIC_DELIVERY_MODE_FLAG | AMQP_BASIC_HEADERS_FLAG;
	props.delivery_mode = AMQP_DELIVERY_PERSISTENT;
	props.headers = headers.table();

	amqp_bytes_t body;
	body.len = message.payload.size();
	body.bytes = const_cast<char*>(message.payload.data());

	try {
		int rc = amqp_basic_publish(connection_.handle(), RabbitConnection::kChannel,
				amqp_cstring_bytes(destination.exchange.c_str()),
				amqp_cstring_bytes(destination.routing_key.c_str()), 0, 0, &props, body);
		connection_.CheckStatus(rc, "basic.publish");
		WaitForConfirm(next_sequence_++, DescribeDestination(destination));
	} catch (const ConnectionError&) {
		state_ = ConnectionState::kFailed;
		throw;
	}
	VLOG(2) << "[" << name() << "] Confirmed " << message.replication_id << " on "
		<< DescribeDestination(destination);
}

void RabbitSink::WaitForConfirm(uint64_t sequence, const std::string& destination) {
	const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(confirm_timeout_ms_);
	while (true) {
		auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
				deadline - std::chrono::steady_clock::now()).count();
		if (remaining <= 0) {
			throw DeliveryError("Publish to " + destination + " not confirmed within " +
					std::to_string(confirm_timeout_ms_ / 1000) + "s");
		}
		int64_t slice = std::min<int64_t>(remaining, kConfirmPollSliceMs);
		struct timeval tv;
		tv.tv_sec = slice / 1000;
		tv.tv_usec = (slice % 1000) * 1000;

		ChannelEvent event = connection_.WaitEvent(&tv);
		switch (event.type) {
			case ChannelEvent::Type::kAck:
				// Older tags belong to publishes that already timed out.
				if (event.delivery_tag == sequence || (event.multiple && event.delivery_tag >= sequence)) {
					return;
				}
				break;
			case ChannelEvent::Type::kNack:
				if (event.delivery_tag == sequence || (event.multiple && event.delivery_tag >= sequence)) {
					throw DeliveryError("Broker rejected publish to " + destination);
				}
				break;
			case ChannelEvent::Type::kChannelClosed:
				if (event.reply_code == kReplyNotFound) {
					throw RouteNotFoundError("Publish to " + destination + " refused: " + event.text);
				}
				throw DeliveryError("Channel closed while publishing to " + destination + ": " +
						std::to_string(event.reply_code) + " " + event.text);
			case ChannelEvent::Type::kReturn:
				LOG(WARNING) << "[" << name() << "] Broker returned a message: " << event.reply_code
					<< " " << event.text;
				break;
			default:
				break;
		}
	}
}

void RabbitSink::Service() {
	if (state_ != ConnectionState::kConnected || !connection_.is_open()) {
		return;
	}
	// Drain whatever arrived while idle so heartbeats keep flowing.
	try {
		while (true) {
			struct timeval tv = {0, 0};
			ChannelEvent event = connection_.WaitEvent(&tv);
			if (event.type == ChannelEvent::Type::kNone) {
				break;
			}
			if (event.type == ChannelEvent::Type::kChannelClosed) {
				LOG(WARNING) << "[" << name() << "] Channel reopened after close: " << event.text;
			}
		}
	} catch (const ConnectionError& e) {
		LOG(ERROR) << "[" << name() << "] Connection lost: " << e.what();
		state_ = ConnectionState::kFailed;
	}
}

} // namespace MqBridge
