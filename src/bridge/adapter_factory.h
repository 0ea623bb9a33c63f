#ifndef MQBRIDGE_SRC_BRIDGE_ADAPTER_FACTORY_H_
#define MQBRIDGE_SRC_BRIDGE_ADAPTER_FACTORY_H_

#include <atomic>
#include <memory>

#include "common/configuration.h"
#include "replication/direction.h"
#include "replication/interfaces.h"
#include "replication/mapping_table.h"
#include "replication/supervisor.h"

namespace MqBridge {

struct AdapterPair {
	std::unique_ptr<MessageSource> source;
	std::unique_ptr<MessageSink> sink;
};

// Parses the route table that applies to `direction`. Throws ConfigurationError.
MappingTable BuildMappingTable(Direction direction, const MqBridgeConfig& config);

/**
 * Builds the concrete (source, sink) pair for `direction`; nothing is
 * connected yet. T2S consumes from the target cluster and produces to
 * the source cluster.
 */
AdapterPair CreateAdapters(Direction direction, const MqBridgeConfig& config,
		const MappingTable& mappings, const std::atomic<bool>* stop);

SupervisorOptions BuildSupervisorOptions(Direction direction, const MqBridgeConfig& config);

} // namespace MqBridge

#endif // MQBRIDGE_SRC_BRIDGE_ADAPTER_FACTORY_H_
