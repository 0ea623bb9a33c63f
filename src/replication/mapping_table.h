#ifndef MQBRIDGE_SRC_REPLICATION_MAPPING_TABLE_H_
#define MQBRIDGE_SRC_REPLICATION_MAPPING_TABLE_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "direction.h"
#include "message.h"

namespace MqBridge {

/**
 * One route. `source` is the topic (K2R, S2T, T2S) or the queue (R2K)
 * the message was consumed from.
 */
struct ReplicationMapping {
	std::string source;
	Destination destination;
	std::string exchange_type = "topic";
	std::string queue;        // RabbitMQ queue named by the route, may be empty
	std::string binding_key;  // routing key used to bind `queue` to the exchange
};

struct ExchangeSpec {
	std::string name;
	std::string kind;
};

struct QueueBinding {
	std::string queue;
	std::string exchange;
	std::string routing_key;
};

// RabbitMQ objects the routes refer to, in first-seen order.
struct Topology {
	std::vector<ExchangeSpec> exchanges;
	std::vector<std::string> queues;
	std::vector<QueueBinding> bindings;

	bool empty() const { return exchanges.empty() && queues.empty(); }
};

/**
 * Immutable route table built once at startup. Construction throws
 * ConfigurationError when the input is malformed, empty, or names the
 * same source twice.
 */
class MappingTable {
public:
	// REPLICATION_MAPPINGS: JSON list of kafkaTopic/rabbitmq* objects.
	static MappingTable FromReplicationMappings(Direction direction, const std::string& json);

	// TOPIC_MAPPING: JSON object source topic -> destination topic.
	static MappingTable FromTopicMapping(Direction direction, const std::string& json);

	// nullptr when no route exists for `source`.
	const ReplicationMapping* Resolve(const std::string& source) const;

	// Topics to assign (Kafka source) or queues to subscribe (RabbitMQ source).
	std::vector<std::string> SourceIdentifiers() const;

	Topology GetTopology() const;

	size_t size() const { return mappings_.size(); }
	const std::vector<ReplicationMapping>& mappings() const { return mappings_; }
	Direction direction() const { return direction_; }

private:
	explicit MappingTable(Direction direction) : direction_(direction) {}

	void Add(ReplicationMapping mapping);
	void RequireNonEmpty() const;

	Direction direction_;
	std::vector<ReplicationMapping> mappings_;
	absl::flat_hash_map<std::string, size_t> index_;
};

} // namespace MqBridge

#endif // MQBRIDGE_SRC_REPLICATION_MAPPING_TABLE_H_
