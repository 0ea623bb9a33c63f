#include "rabbit_connection.h"

#include <rabbitmq-c/tcp.h>

#include <glog/logging.h>

#include "common/config.h"
#include "common/errors.h"

namespace MqBridge {

namespace {

amqp_bytes_t ToAmqpBytes(const std::string& s) {
	amqp_bytes_t bytes;
	bytes.len = s.size();
	bytes.bytes = const_cast<char*>(s.data());
	return bytes;
}

struct timeval ToTimeval(int ms) {
	struct timeval tv;
	tv.tv_sec = ms / 1000;
	tv.tv_usec = (ms % 1000) * 1000;
	return tv;
}

} // namespace

AmqpHeaderTable::AmqpHeaderTable(std::vector<Header> headers)
	: headers_(std::move(headers)) {
	entries_.reserve(headers_.size());
	for (const auto& header : headers_) {
		amqp_table_entry_t entry;
		entry.key = ToAmqpBytes(header.name);
		switch (header.value.kind) {
			case HeaderValue::Kind::kNull:
				entry.value.kind = AMQP_FIELD_KIND_VOID;
				break;
			case HeaderValue::Kind::kText:
				entry.value.kind = AMQP_FIELD_KIND_UTF8;
				entry.value.value.bytes = ToAmqpBytes(header.value.bytes);
				break;
			case HeaderValue::Kind::kBytes:
				entry.value.kind = AMQP_FIELD_KIND_BYTES;
				entry.value.value.bytes = ToAmqpBytes(header.value.bytes);
				break;
			case HeaderValue::Kind::kInt32:
				entry.value.kind = AMQP_FIELD_KIND_I32;
				entry.value.value.i32 = static_cast<int32_t>(header.value.number);
				break;
			case HeaderValue::Kind::kInt64:
				entry.value.kind = AMQP_FIELD_KIND_I64;
				entry.value.value.i64 = header.value.number;
				break;
		}
		entries_.push_back(entry);
	}
}

amqp_table_t AmqpHeaderTable::table() const {
	amqp_table_t table;
	table.num_entries = static_cast<int>(entries_.size());
	table.entries = entries_.empty() ? nullptr : const_cast<amqp_table_entry_t*>(entries_.data());
	return table;
}

std::vector<Header> HeadersFromAmqpTable(const amqp_table_t& table) {
	std::vector<Header> headers;
	for (int i = 0; i < table.num_entries; ++i) {
		const amqp_table_entry_t& entry = table.entries[i];
		const std::string name = BytesToString(entry.key);
		const amqp_field_value_t& v = entry.value;
		switch (v.kind) {
			case AMQP_FIELD_KIND_UTF8:
				headers.push_back({name, HeaderValue::Text(BytesToString(v.value.bytes))});
				break;
			case AMQP_FIELD_KIND_BYTES:
				headers.push_back({name, HeaderValue::Bytes(BytesToString(v.value.bytes))});
				break;
			case AMQP_FIELD_KIND_BOOLEAN:
				headers.push_back({name, HeaderValue::Text(v.value.boolean ? "true" : "false")});
				break;
			case AMQP_FIELD_KIND_I8:
				headers.push_back({name, HeaderValue::Int32(v.value.i8)});
				break;
			case AMQP_FIELD_KIND_U8:
				headers.push_back({name, HeaderValue::Int32(v.value.u8)});
				break;
			case AMQP_FIELD_KIND_I16:
				headers.push_back({name, HeaderValue::Int32(v.value.i16)});
				break;
			case AMQP_FIELD_KIND_U16:
				headers.push_back({name, HeaderValue::Int32(v.value.u16)});
				break;
			case AMQP_FIELD_KIND_I32:
				headers.push_back({name, HeaderValue::Int32(v.value.i32)});
				break;
			case AMQP_FIELD_KIND_U32:
				headers.push_back({name, HeaderValue::Int64(v.value.u32)});
				break;
			case AMQP_FIELD_KIND_I64:
				headers.push_back({name, HeaderValue::Int64(v.value.i64)});
				break;
			case AMQP_FIELD_KIND_U64:
			case AMQP_FIELD_KIND_TIMESTAMP:
				headers.push_back({name, HeaderValue::Int64(static_cast<int64_t>(v.value.u64))});
				break;
			case AMQP_FIELD_KIND_VOID:
				headers.push_back({name, HeaderValue::Null()});
				break;
			default:
				VLOG(1) << "[RabbitMQ] Dropping header " << name << " of unsupported kind " << v.kind;
				break;
		}
	}
	return headers;
}

std::string BytesToString(amqp_bytes_t bytes) {
	if (bytes.bytes == nullptr || bytes.len == 0) {
		return std::string();
	}
	return std::string(static_cast<const char*>(bytes.bytes), bytes.len);
}

std::string DescribeReply(const amqp_rpc_reply_t& reply) {
	switch (reply.reply_type) {
		case AMQP_RESPONSE_NORMAL:
			return "ok";
		case AMQP_RESPONSE_NONE:
			return "missing RPC reply type";
		case AMQP_RESPONSE_LIBRARY_EXCEPTION:
			return amqp_error_string2(reply.library_error);
		case AMQP_RESPONSE_SERVER_EXCEPTION:
			if (reply.reply.id == AMQP_CONNECTION_CLOSE_METHOD && reply.reply.decoded != nullptr) {
				auto* m = static_cast<const amqp_connection_close_t*>(reply.reply.decoded);
				return "server connection error " + std::to_string(m->reply_code) + ", message: " +
					BytesToString(m->reply_text);
			}
			if (reply.reply.id == AMQP_CHANNEL_CLOSE_METHOD && reply.reply.decoded != nullptr) {
				auto* m = static_cast<const amqp_channel_close_t*>(reply.reply.decoded);
				return "server channel error " + std::to_string(m->reply_code) + ", message: " +
					BytesToString(m->reply_text);
			}
			return "unknown server error, method id " + std::to_string(reply.reply.id);
	}
	return "unknown reply type";
}

std::string ResolveQueueName(const absl::flat_hash_map<std::string, std::string>& consumer_queues,
		const std::string& consumer_tag, const std::string& exchange,
		const std::string& routing_key, bool* resolved) {
	*resolved = true;
	auto it = consumer_queues.find(consumer_tag);
	if (it != consumer_queues.end()) {
		return it->second;
	}
	// The default exchange routes by queue name.
	if (exchange.empty() && !routing_key.empty()) {
		return routing_key;
	}
	*resolved = false;
	return consumer_tag.empty() ? "unknown" : consumer_tag;
}

RabbitConnection::RabbitConnection(RabbitOptions options)
	: options_(std::move(options)) {}

RabbitConnection::~RabbitConnection() {
	Close();
}

void RabbitConnection::Open() {
	Teardown();
	failed_exchanges_.clear();
	failed_queues_.clear();

	conn_ = amqp_new_connection();
	if (conn_ == nullptr) {
		throw ConnectionError("Cannot allocate AMQP connection");
	}
	amqp_socket_t* socket = amqp_tcp_socket_new(conn_);
	if (socket == nullptr) {
		Teardown();
		throw ConnectionError("Cannot create AMQP TCP socket");
	}

	struct timeval connect_timeout = ToTimeval(kRabbitSocketTimeoutMs);
	int rc = amqp_socket_open_noblock(socket, options_.host.c_str(), options_.port, &connect_timeout);
	if (rc != AMQP_STATUS_OK) {
		Teardown();
		throw ConnectionError("Cannot reach RabbitMQ at " + options_.host + ":" +
				std::to_string(options_.port) + ": " + amqp_error_string2(rc));
	}

	amqp_rpc_reply_t reply = amqp_login(conn_, options_.vhost.c_str(), 0, AMQP_DEFAULT_FRAME_SIZE,
			options_.heartbeat_sec, AMQP_SASL_METHOD_PLAIN,
			options_.username.c_str(), options_.password.c_str());
	if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
		std::string why = DescribeReply(reply);
		Teardown();
		throw ConnectionError("Login to vhost " + options_.vhost + " failed: " + why);
	}

	// Blocked connections surface as RPC timeouts.
	struct timeval rpc_timeout = ToTimeval(options_.blocked_timeout_sec * 1000);
	rc = amqp_set_rpc_timeout(conn_, &rpc_timeout);
	if (rc != AMQP_STATUS_OK) {
		LOG(WARNING) << "[" << options_.component << "] Cannot set RPC timeout: " << amqp_error_string2(rc);
	}

	OpenChannel();
	LOG(INFO) << "[" << options_.component << "] Connected to RabbitMQ at " << options_.host << ":"
		<< options_.port << " vhost " << options_.vhost;
}

void RabbitConnection::OpenChannel() {
	amqp_channel_open(conn_, kChannel);
	amqp_rpc_reply_t reply = amqp_get_rpc_reply(conn_);
	if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
		std::string why = DescribeReply(reply);
		Teardown();
		throw ConnectionError("channel.open failed: " + why);
	}
	if (channel_setup_) {
		channel_setup_();
	}
}

void RabbitConnection::Close() {
	if (conn_ == nullptr) {
		return;
	}
	amqp_rpc_reply_t reply = amqp_channel_close(conn_, kChannel, AMQP_REPLY_SUCCESS);
	if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
		VLOG(1) << "[" << options_.component << "] channel.close: " << DescribeReply(reply);
	} else {
		reply = amqp_connection_close(conn_, AMQP_REPLY_SUCCESS);
		if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
			VLOG(1) << "[" << options_.component << "] connection.close: " << DescribeReply(reply);
		}
	}
	Teardown();
}

void RabbitConnection::Teardown() {
	if (conn_ == nullptr) {
		return;
	}
	int rc = amqp_destroy_connection(conn_);
	if (rc != AMQP_STATUS_OK) {
		VLOG(1) << "[" << options_.component << "] destroy: " << amqp_error_string2(rc);
	}
	conn_ = nullptr;
}

void RabbitConnection::CheckStatus(int rc, const std::string& context) {
	if (rc >= AMQP_STATUS_OK) {
		return;
	}
	std::string why = amqp_error_string2(rc);
	Teardown();
	throw ConnectionError(context + ": " + why);
}

void RabbitConnection::AnswerChannelClose() {
	amqp_channel_close_ok_t close_ok = {};
	CheckStatus(amqp_send_method(conn_, kChannel, AMQP_CHANNEL_CLOSE_OK_METHOD, &close_ok),
			"channel.close-ok");
}

void RabbitConnection::AnswerConnectionClose() {
	amqp_connection_close_ok_t close_ok = {};
	int rc = amqp_send_method(conn_, 0, AMQP_CONNECTION_CLOSE_OK_METHOD, &close_ok);
	if (rc != AMQP_STATUS_OK) {
		VLOG(1) << "[" << options_.component << "] connection.close-ok: " << amqp_error_string2(rc);
	}
}

bool RabbitConnection::CheckRpc(const std::string& context, std::string* error) {
	if (conn_ == nullptr) {
		throw ConnectionError(context + ": not connected");
	}
	amqp_rpc_reply_t reply = amqp_get_rpc_reply(conn_);
	if (reply.reply_type == AMQP_RESPONSE_NORMAL) {
		return true;
	}

	std::string why = DescribeReply(reply);
	if (reply.reply_type == AMQP_RESPONSE_SERVER_EXCEPTION &&
			reply.reply.id == AMQP_CHANNEL_CLOSE_METHOD) {
		if (error != nullptr) {
			*error = why;
		}
		AnswerChannelClose();
		OpenChannel();
		return false;
	}
	if (reply.reply_type == AMQP_RESPONSE_SERVER_EXCEPTION &&
			reply.reply.id == AMQP_CONNECTION_CLOSE_METHOD) {
		AnswerConnectionClose();
	}
	Teardown();
	throw ConnectionError(context + ": " + why);
}

ChannelEvent RabbitConnection::WaitEvent(struct timeval* timeout) {
	if (conn_ == nullptr) {
		throw ConnectionError("RabbitMQ connection is not open");
	}
	amqp_frame_t frame;
	int rc = amqp_simple_wait_frame_noblock(conn_, &frame, timeout);
	ChannelEvent event;
	if (rc == AMQP_STATUS_TIMEOUT) {
		return event;
	}
	CheckStatus(rc, "wait for frame");

	event.type = ChannelEvent::Type::kOther;
	if (frame.frame_type != AMQP_FRAME_METHOD) {
		return event;
	}

	void* decoded = frame.payload.method.decoded;
	switch (frame.payload.method.id) {
		case AMQP_BASIC_ACK_METHOD: {
			auto* ack = static_cast<amqp_basic_ack_t*>(decoded);
			event.type = ChannelEvent::Type::kAck;
			event.delivery_tag = ack->delivery_tag;
			event.multiple = ack->multiple != 0;
			break;
		}
		case AMQP_BASIC_NACK_METHOD: {
			auto* nack = static_cast<amqp_basic_nack_t*>(decoded);
			event.type = ChannelEvent::Type::kNack;
			event.delivery_tag = nack->delivery_tag;
			event.multiple = nack->multiple != 0;
			break;
		}
		case AMQP_BASIC_RETURN_METHOD: {
			auto* ret = static_cast<amqp_basic_return_t*>(decoded);
			event.type = ChannelEvent::Type::kReturn;
			event.reply_code = ret->reply_code;
			event.text = BytesToString(ret->reply_text);
			// The returned content follows the method and must be drained.
			amqp_message_t message;
			amqp_rpc_reply_t reply = amqp_read_message(conn_, frame.channel, &message, 0);
			if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
				std::string why = DescribeReply(reply);
				Teardown();
				throw ConnectionError("reading returned message: " + why);
			}
			amqp_destroy_message(&message);
			break;
		}
		case AMQP_BASIC_CANCEL_METHOD: {
			auto* cancel = static_cast<amqp_basic_cancel_t*>(decoded);
			event.type = ChannelEvent::Type::kConsumerCancelled;
			event.text = BytesToString(cancel->consumer_tag);
			break;
		}
		case AMQP_CHANNEL_CLOSE_METHOD: {
			auto* close = static_cast<amqp_channel_close_t*>(decoded);
			event.type = ChannelEvent::Type::kChannelClosed;
			event.reply_code = close->reply_code;
			event.text = BytesToString(close->reply_text);
			LOG(WARNING) << "[" << options_.component << "] Broker closed channel: " << event.reply_code
				<< " " << event.text;
			AnswerChannelClose();
			OpenChannel();
			break;
		}
		case AMQP_CONNECTION_CLOSE_METHOD: {
			auto* close = static_cast<amqp_connection_close_t*>(decoded);
			std::string why = std::to_string(close->reply_code) + " " + BytesToString(close->reply_text);
			AnswerConnectionClose();
			Teardown();
			throw ConnectionError("Broker closed the connection: " + why);
		}
		default:
			VLOG(1) << "[" << options_.component << "] Ignoring method 0x" << std::hex
				<< frame.payload.method.id;
			break;
	}
	return event;
}

void RabbitConnection::DeclareTopology(const Topology& topology) {
	LOG(INFO) << "[" << options_.component << "] Setting up RabbitMQ topology";
	std::string error;

	for (const auto& exchange : topology.exchanges) {
		amqp_exchange_declare(conn_, kChannel, ToAmqpBytes(exchange.name), ToAmqpBytes(exchange.kind),
				0, 1, 0, 0, amqp_empty_table);
		if (CheckRpc("exchange.declare " + exchange.name, &error)) {
			LOG(INFO) << "[" << options_.component << "] Declared exchange: " << exchange.name
				<< " (type: " << exchange.kind << ")";
		} else {
			LOG(ERROR) << "[" << options_.component << "] Failed to declare exchange " << exchange.name
				<< ": " << error;
			failed_exchanges_.insert(exchange.name);
		}
	}

	for (const auto& queue : topology.queues) {
		amqp_queue_declare(conn_, kChannel, ToAmqpBytes(queue), 0, 1, 0, 0, amqp_empty_table);
		if (CheckRpc("queue.declare " + queue, &error)) {
			LOG(INFO) << "[" << options_.component << "] Declared queue: " << queue;
		} else {
			LOG(ERROR) << "[" << options_.component << "] Failed to declare queue " << queue << ": " << error;
			failed_queues_.insert(queue);
		}
	}

	for (const auto& binding : topology.bindings) {
		if (IsQueueUnavailable(binding.queue) || IsExchangeUnavailable(binding.exchange)) {
			LOG(WARNING) << "[" << options_.component << "] Skipping binding " << binding.queue << " <- "
				<< binding.exchange << ": declaration failed";
			continue;
		}
		amqp_queue_bind(conn_, kChannel, ToAmqpBytes(binding.queue), ToAmqpBytes(binding.exchange),
				ToAmqpBytes(binding.routing_key), amqp_empty_table);
		if (CheckRpc("queue.bind " + binding.queue, &error)) {
			LOG(INFO) << "[" << options_.component << "] Bound queue " << binding.queue << " to exchange "
				<< binding.exchange << " with routing key " << binding.routing_key;
		} else {
			LOG(ERROR) << "[" << options_.component << "] Failed to bind queue " << binding.queue << ": "
				<< error;
		}
	}
}

} // namespace MqBridge
