#include "adapter_factory.h"

#include "common/errors.h"
#include "kafka/kafka_sink.h"
#include "kafka/kafka_source.h"
#include "rabbitmq/rabbit_sink.h"
#include "rabbitmq/rabbit_source.h"

namespace MqBridge {

namespace {

RabbitOptions MakeRabbitOptions(const MqBridgeConfig& config, const std::string& component,
		const std::atomic<bool>* stop) {
	RabbitOptions options;
	options.component = component;
	options.host = config.rabbitmq.host.get();
	options.port = config.rabbitmq.port.get();
	options.username = config.rabbitmq.username.get();
	options.password = config.rabbitmq.password.get();
	options.vhost = config.rabbitmq.vhost.get();
	options.heartbeat_sec = config.rabbitmq.heartbeat_sec.get();
	options.blocked_timeout_sec = config.rabbitmq.blocked_timeout_sec.get();
	options.prefetch = config.rabbitmq.prefetch.get();
	options.stop = stop;
	return options;
}

KafkaSourceOptions MakeKafkaSourceOptions(const MqBridgeConfig& config, const std::string& servers,
		const MappingTable& mappings, const std::atomic<bool>* stop) {
	KafkaSourceOptions options;
	options.bootstrap_servers = servers;
	options.topics = mappings.SourceIdentifiers();
	options.consumer_group = config.kafka.consumer_group.get();
	options.assign_all_partitions = config.kafka.assign_all_partitions.get();
	options.max_poll_records = config.kafka.max_poll_records.get();
	options.stop = stop;
	return options;
}

KafkaSinkOptions MakeKafkaSinkOptions(const std::string& servers, const std::atomic<bool>* stop) {
	KafkaSinkOptions options;
	options.bootstrap_servers = servers;
	options.stop = stop;
	return options;
}

} // namespace

MappingTable BuildMappingTable(Direction direction, const MqBridgeConfig& config) {
	if (IsLogToLog(direction)) {
		return MappingTable::FromTopicMapping(direction, config.replication.topic_mapping.get());
	}
	return MappingTable::FromReplicationMappings(direction, config.replication.mappings.get());
}

AdapterPair CreateAdapters(Direction direction, const MqBridgeConfig& config,
		const MappingTable& mappings, const std::atomic<bool>* stop) {
	AdapterPair pair;
	switch (direction) {
		case Direction::kKafkaToRabbit:
			pair.source = std::make_unique<KafkaSource>(MakeKafkaSourceOptions(
						config, config.kafka.bootstrap_servers.get(), mappings, stop));
			pair.sink = std::make_unique<RabbitSink>(MakeRabbitOptions(config, "RabbitSink", stop),
					mappings.GetTopology());
			break;
		case Direction::kRabbitToKafka:
			pair.source = std::make_unique<RabbitSource>(MakeRabbitOptions(config, "RabbitSource", stop),
					mappings.SourceIdentifiers(), mappings.GetTopology());
			pair.sink = std::make_unique<KafkaSink>(MakeKafkaSinkOptions(
						config.kafka.bootstrap_servers.get(), stop));
			break;
		case Direction::kSourceToTarget:
			pair.source = std::make_unique<KafkaSource>(MakeKafkaSourceOptions(
						config, config.kafka.source_bootstrap_servers.get(), mappings, stop));
			pair.sink = std::make_unique<KafkaSink>(MakeKafkaSinkOptions(
						config.kafka.target_bootstrap_servers.get(), stop));
			break;
		case Direction::kTargetToSource:
			pair.source = std::make_unique<KafkaSource>(MakeKafkaSourceOptions(
						config, config.kafka.target_bootstrap_servers.get(), mappings, stop));
			pair.sink = std::make_unique<KafkaSink>(MakeKafkaSinkOptions(
						config.kafka.source_bootstrap_servers.get(), stop));
			break;
	}
	if (!pair.source || !pair.sink) {
		throw ConfigurationError(std::string("No adapters for direction ") + DirectionTag(direction));
	}
	return pair;
}

SupervisorOptions BuildSupervisorOptions(Direction direction, const MqBridgeConfig& config) {
	SupervisorOptions options;
	options.direction_tag = DirectionTag(direction);
	options.dedup_prefix = DedupPrefix(direction);
	auto policy = ParseDeliveryFailurePolicy(config.replication.delivery_failure_policy.get());
	if (!policy) {
		throw ConfigurationError("Unknown delivery failure policy '" +
				config.replication.delivery_failure_policy.get() + "'");
	}
	options.failure_policy = *policy;
	options.heartbeat_interval_sec = config.replication.heartbeat_interval_sec.get();
	options.max_empty_polls = config.replication.max_empty_polls.get();
	return options;
}

} // namespace MqBridge
