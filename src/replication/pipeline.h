#ifndef MQBRIDGE_SRC_REPLICATION_PIPELINE_H_
#define MQBRIDGE_SRC_REPLICATION_PIPELINE_H_

#include <optional>
#include <string>

#include "common/stats.h"
#include "dedup_window.h"
#include "interfaces.h"
#include "mapping_table.h"

namespace MqBridge {

// What happens to a source message whose cross-publish failed.
enum class DeliveryFailurePolicy {
	kLeave,    // stay unacknowledged until the channel is recycled
	kRequeue,  // nack with requeue
	kDiscard,  // nack without requeue
};

std::optional<DeliveryFailurePolicy> ParseDeliveryFailurePolicy(const std::string& name);

enum class ProcessResult { kReplicated, kDuplicate, kRouteNotFound, kDeliveryFailed };

const char* ProcessResultName(ProcessResult result);

/**
 * Per-message replication: route lookup, deduplication, cross-publish
 * and source acknowledgment. The same code serves every direction; only
 * the dedup prefix and the adapters differ.
 *
 * The source is acknowledged strictly after the sink confirmed, and the
 * dedup id is recorded only after that, so a failed publish can be
 * replayed by the broker.
 */
class ReplicationPipeline {
	public:
		ReplicationPipeline(std::string dedup_prefix, const MappingTable& mappings,
				MessageSource& source, MessageSink& sink, Stats& stats,
				DeliveryFailurePolicy failure_policy = DeliveryFailurePolicy::kLeave,
				size_t dedup_capacity = kDedupWindowCapacity,
				size_t dedup_evict_batch = kDedupWindowEvictBatch);

		ProcessResult Process(const InFlightMessage& message);

		// Provenance headers and destination for a routed message.
		OutboundMessage BuildOutbound(const InFlightMessage& message,
				const ReplicationMapping& mapping, const std::string& replication_id) const;

		const DedupWindow& dedup_window() const { return dedup_window_; }

		// Deliveries left unsettled under kLeave since the last clear.
		size_t left_unacknowledged() const { return left_unacknowledged_; }
		// Whether a publish succeeded after the most recent left delivery.
		bool replicated_since_leave() const { return replicated_since_leave_; }
		void ClearLeftUnacknowledged() {
			left_unacknowledged_ = 0;
			replicated_since_leave_ = false;
		}

	private:
		ProcessResult DropUnroutable(const InFlightMessage& message, const std::string& reason);
		void ApplyFailurePolicy(const InFlightMessage& message);
		static bool ShouldLogMessage(uint64_t n);

		const std::string dedup_prefix_;
		const MappingTable& mappings_;
		MessageSource& source_;
		MessageSink& sink_;
		Stats& stats_;
		const DeliveryFailurePolicy failure_policy_;
		DedupWindow dedup_window_;
		size_t left_unacknowledged_ = 0;
		bool replicated_since_leave_ = false;
};

} // namespace MqBridge

#endif // MQBRIDGE_SRC_REPLICATION_PIPELINE_H_
