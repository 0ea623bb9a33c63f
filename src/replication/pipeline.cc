#include "pipeline.h"

#include <glog/logging.h>

#include "common/errors.h"

namespace MqBridge {

namespace {

const char* const kReplicatorIdHeader = "replicator_id";

bool IsKafkaProvenanceHeader(const std::string& name) {
	return name == "kafka_topic" || name == "kafka_partition" || name == "kafka_offset" ||
		name == "kafka_key" || name == kReplicatorIdHeader;
}

} // namespace

std::optional<DeliveryFailurePolicy> ParseDeliveryFailurePolicy(const std::string& name) {
	if (name == "leave") return DeliveryFailurePolicy::kLeave;
	if (name == "requeue") return DeliveryFailurePolicy::kRequeue;
	if (name == "discard") return DeliveryFailurePolicy::kDiscard;
	return std::nullopt;
}

const char* ProcessResultName(ProcessResult result) {
	switch (result) {
		case ProcessResult::kReplicated: return "replicated";
		case ProcessResult::kDuplicate: return "duplicate";
		case ProcessResult::kRouteNotFound: return "route-not-found";
		case ProcessResult::kDeliveryFailed: return "delivery-failed";
	}
	return "unknown";
}

ReplicationPipeline::ReplicationPipeline(std::string dedup_prefix, const MappingTable& mappings,
		MessageSource& source, MessageSink& sink, Stats& stats,
		DeliveryFailurePolicy failure_policy, size_t dedup_capacity, size_t dedup_evict_batch)
	: dedup_prefix_(std::move(dedup_prefix)),
	  mappings_(mappings),
	  source_(source),
	  sink_(sink),
	  stats_(stats),
	  failure_policy_(failure_policy),
	  dedup_window_(dedup_capacity, dedup_evict_batch) {}

bool ReplicationPipeline::ShouldLogMessage(uint64_t n) {
	return n <= 10 || n % 100 == 0;
}

ProcessResult ReplicationPipeline::Process(const InFlightMessage& message) {
	// 1. Route
	const ReplicationMapping* mapping = mappings_.Resolve(message.source);
	if (mapping == nullptr) {
		return DropUnroutable(message, "No mapping found for source: " + message.source);
	}

	// 2. Deduplicate
	const std::string id = MakeDedupId(dedup_prefix_, message.origin);
	if (dedup_window_.Contains(id)) {
		VLOG(1) << "[Pipeline] Duplicate " << id << ", acknowledging without publish";
		source_.Acknowledge(message);
		return ProcessResult::kDuplicate;
	}

	// 3. Account and build
	stats_.RecordMessage();
	const uint64_t n = stats_.messages_processed();

	if (!DecodeUtf8(message.payload)) {
		VLOG(1) << "[Pipeline] Payload of " << id << " is not valid UTF-8, forwarding raw bytes";
	}
	OutboundMessage outbound = BuildOutbound(message, *mapping, id);

	if (ShouldLogMessage(n)) {
		LOG(INFO) << "[MSG #" << n << "] Replicating " << DescribeOrigin(message.origin)
			<< " -> " << DescribeDestination(outbound.destination);
	}

	// 4. Publish
	try {
		sink_.Publish(outbound);
	} catch (const RouteNotFoundError& e) {
		return DropUnroutable(message, e.what());
	} catch (const DeliveryError& e) {
		stats_.RecordError();
		LOG(ERROR) << "[MSG #" << n << "] Failed to replicate " << id << " to "
			<< DescribeDestination(outbound.destination) << ": " << e.what();
		ApplyFailurePolicy(message);
		return ProcessResult::kDeliveryFailed;
	} catch (const ConnectionError& e) {
		stats_.RecordError();
		LOG(ERROR) << "[MSG #" << n << "] Lost destination while replicating " << id << ": " << e.what();
		ApplyFailurePolicy(message);
		return ProcessResult::kDeliveryFailed;
	}

	// 5. Confirm
	source_.Acknowledge(message);
	dedup_window_.Insert(id);
	if (left_unacknowledged_ > 0) {
		replicated_since_leave_ = true;
	}
	VLOG(2) << "[Pipeline] Replicated " << id;
	return ProcessResult::kReplicated;
}

ProcessResult ReplicationPipeline::DropUnroutable(const InFlightMessage& message,
		const std::string& reason) {
	LOG(WARNING) << "[Pipeline] " << reason << " (" << DescribeOrigin(message.origin)
		<< "), dropping message";
	source_.Reject(message, false);
	return ProcessResult::kRouteNotFound;
}

void ReplicationPipeline::ApplyFailurePolicy(const InFlightMessage& message) {
	switch (failure_policy_) {
		case DeliveryFailurePolicy::kLeave:
			++left_unacknowledged_;
			replicated_since_leave_ = false;
			break;
		case DeliveryFailurePolicy::kRequeue:
			source_.Reject(message, true);
			break;
		case DeliveryFailurePolicy::kDiscard:
			source_.Reject(message, false);
			break;
	}
}

OutboundMessage ReplicationPipeline::BuildOutbound(const InFlightMessage& message,
		const ReplicationMapping& mapping, const std::string& replication_id) const {
	OutboundMessage out;
	out.destination = mapping.destination;
	out.payload = message.payload;
	out.key = message.key;
	out.replication_id = replication_id;

	if (message.origin.broker == BrokerKind::kKafka) {
		const auto& origin = message.origin.kafka;
		for (const auto& header : message.headers) {
			if (!IsKafkaProvenanceHeader(header.name)) {
				out.headers.push_back(header);
			}
		}
		out.headers.push_back({"kafka_topic", HeaderValue::Text(origin.topic)});
		out.headers.push_back({"kafka_partition", HeaderValue::Int32(origin.partition)});
		out.headers.push_back({"kafka_offset", HeaderValue::Int64(origin.offset)});
		// The queue leg has no record key; carry it as a header instead.
		if (out.destination.topic.empty()) {
			HeaderValue key = HeaderValue::Null();
			if (message.key) {
				key = DecodeUtf8(*message.key) ? HeaderValue::Text(*message.key)
					: HeaderValue::Bytes(*message.key);
			}
			out.headers.push_back({"kafka_key", key});
		}
	} else {
		const auto& origin = message.origin.rabbitmq;
		out.headers.push_back({"rabbitmq_queue", HeaderValue::Text(origin.queue)});
		out.headers.push_back({"rabbitmq_exchange", HeaderValue::Text(origin.exchange)});
		out.headers.push_back({"rabbitmq_routing_key", HeaderValue::Text(origin.routing_key)});
	}
	out.headers.push_back({kReplicatorIdHeader, HeaderValue::Text(replication_id)});
	return out;
}

} // namespace MqBridge
