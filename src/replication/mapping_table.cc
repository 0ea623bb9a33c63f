#include "mapping_table.h"

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "absl/container/flat_hash_set.h"

#include "common/errors.h"

namespace MqBridge {

namespace {

YAML::Node ParseJson(const std::string& json, const char* what) {
	try {
		return YAML::Load(json);
	} catch (const YAML::Exception& e) {
		throw ConfigurationError(std::string(what) + " is not valid JSON: " + e.what());
	}
}

// Missing and null fields read as empty.
std::string StringField(const YAML::Node& entry, const char* field) {
	const YAML::Node value = entry[field];
	if (!value || value.IsNull()) {
		return std::string();
	}
	if (!value.IsScalar()) {
		throw ConfigurationError(std::string("Mapping field '") + field + "' must be a string");
	}
	return value.as<std::string>();
}

} // namespace

MappingTable MappingTable::FromReplicationMappings(Direction direction, const std::string& json) {
	if (direction != Direction::kKafkaToRabbit && direction != Direction::kRabbitToKafka) {
		throw ConfigurationError(std::string("REPLICATION_MAPPINGS does not apply to direction ") +
				DirectionTag(direction));
	}
	const YAML::Node root = ParseJson(json, "REPLICATION_MAPPINGS");
	if (!root.IsSequence()) {
		throw ConfigurationError("REPLICATION_MAPPINGS must be a JSON array");
	}

	MappingTable table(direction);
	size_t position = 0;
	for (const auto& entry : root) {
		++position;
		if (!entry.IsMap()) {
			throw ConfigurationError("Mapping " + std::to_string(position) + " must be a JSON object");
		}

		ReplicationMapping mapping;
		const std::string kafka_topic = StringField(entry, "kafkaTopic");
		const std::string exchange_type = StringField(entry, "rabbitmqExchangeType");
		mapping.queue = StringField(entry, "rabbitmqQueue");
		mapping.binding_key = StringField(entry, "rabbitmqRoutingKey");
		if (!exchange_type.empty()) {
			mapping.exchange_type = exchange_type;
		}

		if (kafka_topic.empty()) {
			throw ConfigurationError("Mapping " + std::to_string(position) + " has no kafkaTopic");
		}

		if (direction == Direction::kKafkaToRabbit) {
			mapping.source = kafka_topic;
			mapping.destination.exchange = StringField(entry, "rabbitmqExchange");
			// Without an exchange the default exchange routes by queue name.
			mapping.destination.routing_key =
				mapping.destination.exchange.empty() ? mapping.queue : mapping.binding_key;
			if (mapping.destination.exchange.empty() && mapping.queue.empty()) {
				throw ConfigurationError("Mapping " + std::to_string(position) +
						" names neither rabbitmqExchange nor rabbitmqQueue");
			}
		} else {
			if (mapping.queue.empty()) {
				LOG(WARNING) << "[MappingTable] Skipping mapping " << position
					<< " for topic " << kafka_topic << ": no rabbitmqQueue to consume from";
				continue;
			}
			mapping.source = mapping.queue;
			mapping.destination.topic = kafka_topic;
		}
		table.Add(std::move(mapping));
	}

	table.RequireNonEmpty();
	LOG(INFO) << "[MappingTable] Loaded " << table.size() << " replication mappings for "
		<< DirectionTag(direction);
	for (const auto& mapping : table.mappings_) {
		LOG(INFO) << "[MappingTable]   " << mapping.source << " -> "
			<< DescribeDestination(mapping.destination);
	}
	return table;
}

MappingTable MappingTable::FromTopicMapping(Direction direction, const std::string& json) {
	if (!IsLogToLog(direction)) {
		throw ConfigurationError(std::string("TOPIC_MAPPING does not apply to direction ") +
				DirectionTag(direction));
	}
	const YAML::Node root = ParseJson(json, "TOPIC_MAPPING");
	if (!root.IsMap()) {
		throw ConfigurationError("TOPIC_MAPPING must be a JSON object");
	}

	MappingTable table(direction);
	for (const auto& entry : root) {
		if (!entry.first.IsScalar() || !entry.second.IsScalar()) {
			throw ConfigurationError("TOPIC_MAPPING entries must map a topic name to a topic name");
		}
		ReplicationMapping mapping;
		mapping.source = entry.first.as<std::string>();
		mapping.destination.topic = entry.second.as<std::string>();
		if (mapping.source.empty() || mapping.destination.topic.empty()) {
			throw ConfigurationError("TOPIC_MAPPING contains an empty topic name");
		}
		table.Add(std::move(mapping));
	}

	table.RequireNonEmpty();
	LOG(INFO) << "[MappingTable] Loaded " << table.size() << " topic mappings for "
		<< DirectionTag(direction);
	return table;
}

void MappingTable::Add(ReplicationMapping mapping) {
	auto inserted = index_.emplace(mapping.source, mappings_.size());
	if (!inserted.second) {
		throw ConfigurationError("Duplicate mapping for source '" + mapping.source + "'");
	}
	mappings_.push_back(std::move(mapping));
}

void MappingTable::RequireNonEmpty() const {
	if (mappings_.empty()) {
		throw ConfigurationError(std::string("No mappings configured for replication direction ") +
				DirectionTag(direction_));
	}
}

const ReplicationMapping* MappingTable::Resolve(const std::string& source) const {
	auto it = index_.find(source);
	if (it == index_.end()) {
		return nullptr;
	}
	return &mappings_[it->second];
}

std::vector<std::string> MappingTable::SourceIdentifiers() const {
	std::vector<std::string> sources;
	sources.reserve(mappings_.size());
	for (const auto& mapping : mappings_) {
		sources.push_back(mapping.source);
	}
	return sources;
}

Topology MappingTable::GetTopology() const {
	Topology topology;
	absl::flat_hash_set<std::string> seen_exchanges;
	absl::flat_hash_set<std::string> seen_queues;

	for (const auto& mapping : mappings_) {
		if (direction_ == Direction::kKafkaToRabbit) {
			const std::string& exchange = mapping.destination.exchange;
			if (!exchange.empty() && seen_exchanges.insert(exchange).second) {
				topology.exchanges.push_back({exchange, mapping.exchange_type});
			}
			if (!mapping.queue.empty()) {
				if (seen_queues.insert(mapping.queue).second) {
					topology.queues.push_back(mapping.queue);
				}
				if (!exchange.empty() && !mapping.binding_key.empty()) {
					topology.bindings.push_back({mapping.queue, exchange, mapping.binding_key});
				}
			}
		} else if (direction_ == Direction::kRabbitToKafka) {
			// Consumed queues only; R2K publishes nothing to RabbitMQ.
			if (seen_queues.insert(mapping.queue).second) {
				topology.queues.push_back(mapping.queue);
			}
		}
	}
	return topology;
}

} // namespace MqBridge
