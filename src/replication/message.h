#ifndef MQBRIDGE_SRC_REPLICATION_MESSAGE_H_
#define MQBRIDGE_SRC_REPLICATION_MESSAGE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace MqBridge {

enum class BrokerKind { kKafka, kRabbitMQ };

/**
 * Where a message was read from. Only the block matching `broker` is
 * meaningful.
 */
struct OriginCoordinates {
	BrokerKind broker = BrokerKind::kKafka;

	struct Kafka {
		std::string topic;
		int32_t partition = 0;
		int64_t offset = 0;
	} kafka;

	struct RabbitMQ {
		std::string queue;          // logical queue after resolution
		uint64_t delivery_tag = 0;
		std::string exchange;       // empty for the default exchange
		std::string routing_key;
		std::string consumer_tag;
	} rabbitmq;
};

// Typed header value; Kafka headers only carry bytes, AMQP field tables
// keep the type.
struct HeaderValue {
	enum class Kind { kNull, kText, kBytes, kInt32, kInt64 };

	Kind kind = Kind::kNull;
	std::string bytes;
	int64_t number = 0;

	static HeaderValue Null() { return HeaderValue(); }
	static HeaderValue Text(std::string text) {
		HeaderValue v;
		v.kind = Kind::kText;
		v.bytes = std::move(text);
		return v;
	}
	static HeaderValue Bytes(std::string raw) {
		HeaderValue v;
		v.kind = Kind::kBytes;
		v.bytes = std::move(raw);
		return v;
	}
	static HeaderValue Int32(int32_t n) {
		HeaderValue v;
		v.kind = Kind::kInt32;
		v.number = n;
		return v;
	}
	static HeaderValue Int64(int64_t n) {
		HeaderValue v;
		v.kind = Kind::kInt64;
		v.number = n;
		return v;
	}

	// Wire form for brokers whose headers are plain bytes.
	std::string ToBytes() const;

	bool operator==(const HeaderValue& other) const {
		return kind == other.kind && bytes == other.bytes && number == other.number;
	}
};

struct Header {
	std::string name;
	HeaderValue value;
};

/**
 * A message under replication. The byte payload is authoritative; text
 * decoding only serves logging.
 */
struct InFlightMessage {
	std::string source;                 // topic or logical queue name
	std::string payload;
	std::optional<std::string> key;
	std::vector<Header> headers;        // forwarded on the log-to-log leg
	OriginCoordinates origin;
};

struct Destination {
	std::string topic;        // Kafka destination
	std::string exchange;     // RabbitMQ destination, empty = default exchange
	std::string routing_key;
};

struct OutboundMessage {
	Destination destination;
	std::string payload;
	std::optional<std::string> key;
	std::vector<Header> headers;
	// Copied into logs and provenance headers.
	std::string replication_id;
};

// Returns the text when `bytes` is valid UTF-8.
std::optional<std::string> DecodeUtf8(const std::string& bytes);

// "topic:partition:offset" or "queue:delivery-tag"
std::string DescribeOrigin(const OriginCoordinates& origin);

// "<prefix>:" followed by DescribeOrigin(). Deterministic for a given origin.
std::string MakeDedupId(const std::string& prefix, const OriginCoordinates& origin);

std::string DescribeDestination(const Destination& destination);

} // namespace MqBridge

#endif // MQBRIDGE_SRC_REPLICATION_MESSAGE_H_
