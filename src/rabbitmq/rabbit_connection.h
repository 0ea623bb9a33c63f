#ifndef MQBRIDGE_SRC_RABBITMQ_RABBIT_CONNECTION_H_
#define MQBRIDGE_SRC_RABBITMQ_RABBIT_CONNECTION_H_

#include <sys/time.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <rabbitmq-c/amqp.h>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"

#include "replication/mapping_table.h"
#include "replication/message.h"

namespace MqBridge {

struct RabbitOptions {
	std::string component = "RabbitMQ";
	std::string host = "rabbitmq";
	int port = 5672;
	std::string username = "user";
	std::string password = "password";
	std::string vhost = "/";
	int heartbeat_sec = 600;
	int blocked_timeout_sec = 300;
	int prefetch = 0;  // 0 = no basic.qos
	const std::atomic<bool>* stop = nullptr;
};

/**
 * AMQP field table built from message headers. Entries point into the
 * object's own copy of the headers, so the table is valid for the
 * lifetime of this object.
 */
class AmqpHeaderTable {
public:
	explicit AmqpHeaderTable(std::vector<Header> headers);
	AmqpHeaderTable(const AmqpHeaderTable&) = delete;
	AmqpHeaderTable& operator=(const AmqpHeaderTable&) = delete;

	amqp_table_t table() const;

private:
	std::vector<Header> headers_;
	std::vector<amqp_table_entry_t> entries_;
};

// Converts a received field table. Kinds without a counterpart are skipped.
std::vector<Header> HeadersFromAmqpTable(const amqp_table_t& table);

std::string BytesToString(amqp_bytes_t bytes);

// Human readable text of a failed RPC reply.
std::string DescribeReply(const amqp_rpc_reply_t& reply);

/**
 * Logical queue of a delivery. Tries the consumer-tag table, then the
 * routing key of a default-exchange delivery, then the consumer tag
 * itself; `resolved` is false only in the last case.
 */
std::string ResolveQueueName(const absl::flat_hash_map<std::string, std::string>& consumer_queues,
		const std::string& consumer_tag, const std::string& exchange,
		const std::string& routing_key, bool* resolved);

// Asynchronous method received on the channel.
struct ChannelEvent {
	enum class Type {
		kNone,               // nothing arrived before the timeout
		kAck,                // publisher confirm
		kNack,
		kReturn,
		kChannelClosed,      // already answered and reopened
		kConsumerCancelled,
		kOther,
	};
	Type type = Type::kNone;
	uint64_t delivery_tag = 0;
	bool multiple = false;
	uint16_t reply_code = 0;
	std::string text;
};

/**
 * One blocking rabbitmq-c connection using channel 1. Tracks which
 * exchanges and queues failed to declare so that publishing to them can
 * be refused instead of closing the channel again.
 */
class RabbitConnection {
public:
	static const amqp_channel_t kChannel = 1;

	explicit RabbitConnection(RabbitOptions options);
	~RabbitConnection();

	RabbitConnection(const RabbitConnection&) = delete;
	RabbitConnection& operator=(const RabbitConnection&) = delete;

	// Runs after every channel open, e.g. confirm.select or basic.qos.
	void SetChannelSetup(std::function<void()> setup) { channel_setup_ = std::move(setup); }

	// One attempt. Throws ConnectionError.
	void Open();

	// Closes politely if possible; never throws.
	void Close();

	bool is_open() const { return conn_ != nullptr; }
	amqp_connection_state_t handle() const { return conn_; }
	const RabbitOptions& options() const { return options_; }

	/**
	 * Declares exchanges, queues and bindings. A rejected item is logged
	 * and skipped and its name remembered.
	 */
	void DeclareTopology(const Topology& topology);

	bool IsExchangeUnavailable(const std::string& exchange) const {
		return failed_exchanges_.contains(exchange);
	}
	bool IsQueueUnavailable(const std::string& queue) const {
		return failed_queues_.contains(queue);
	}

	/**
	 * Checks the reply of the last synchronous RPC. Returns false with
	 * `error` set when the broker closed the channel (the channel is
	 * reopened before returning). Throws ConnectionError on
	 * connection-level failures.
	 */
	bool CheckRpc(const std::string& context, std::string* error);

	/**
	 * Waits for the next method frame on the connection. A null `timeout`
	 * blocks. Throws ConnectionError when the socket fails or the broker
	 * closes the connection.
	 */
	ChannelEvent WaitEvent(struct timeval* timeout);

	// Throws ConnectionError when rc reports a socket level failure.
	void CheckStatus(int rc, const std::string& context);

private:
	void OpenChannel();
	void AnswerChannelClose();
	void AnswerConnectionClose();
	void Teardown();

	const RabbitOptions options_;
	amqp_connection_state_t conn_ = nullptr;
	std::function<void()> channel_setup_;
	absl::flat_hash_set<std::string> failed_exchanges_;
	absl::flat_hash_set<std::string> failed_queues_;
};

} // namespace MqBridge

#endif // MQBRIDGE_SRC_RABBITMQ_RABBIT_CONNECTION_H_
