#ifndef MQBRIDGE_SRC_REPLICATION_SUPERVISOR_H_
#define MQBRIDGE_SRC_REPLICATION_SUPERVISOR_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "common/stats.h"
#include "interfaces.h"
#include "mapping_table.h"
#include "pipeline.h"

namespace MqBridge {

enum class SupervisorState { kStarting, kRunning, kDraining, kStopped };

const char* SupervisorStateName(SupervisorState state);

// Lines of one heartbeat report, without the surrounding banner.
std::vector<std::string> FormatHeartbeat(const std::string& direction_tag,
		const StatsSnapshot& snapshot, const std::vector<PartitionLag>& lag);

struct SupervisorOptions {
	std::string direction_tag = "K2R";
	std::string dedup_prefix = "k2r";
	DeliveryFailurePolicy failure_policy = DeliveryFailurePolicy::kLeave;
	int heartbeat_interval_sec = kHeartbeatIntervalSec;
	int max_empty_polls = kMaxEmptyPolls;
	int poll_timeout_ms = -1;  // -1 uses the source's own slice
	int error_pause_ms = kIterationErrorPauseMs;
	int flush_timeout_ms = kProducerFlushTimeoutMs;
};

/**
 * Owns both adapters of one direction and drives
 * Starting -> Running -> Draining -> Stopped.
 *
 * Run() blocks on the calling thread until the shared stop flag is set
 * and returns the process exit code.
 */
class Supervisor {
	public:
		Supervisor(SupervisorOptions options, const MappingTable& mappings,
				std::unique_ptr<MessageSource> source, std::unique_ptr<MessageSink> sink,
				Stats& stats, std::atomic<bool>& stop);

		int Run();

		// Same effect as SIGTERM; observed at the next iteration boundary.
		void RequestShutdown() { stop_.store(true); }

		SupervisorState state() const { return state_.load(); }

		void LogHeartbeat();

	private:
		void RunIteration();
		void OnEmptyPoll();
		void RecoverFailedAdapters();
		void MaybeRecycleSource(bool idle);
		void ReconnectSource();
		void MaybeHeartbeat();
		void Drain();

		const SupervisorOptions options_;
		std::unique_ptr<MessageSource> source_;
		std::unique_ptr<MessageSink> sink_;
		Stats& stats_;
		std::atomic<bool>& stop_;
		ReplicationPipeline pipeline_;

		std::atomic<SupervisorState> state_{SupervisorState::kStarting};
		int empty_polls_ = 0;
		std::chrono::steady_clock::time_point last_heartbeat_;
};

} // namespace MqBridge

#endif // MQBRIDGE_SRC_REPLICATION_SUPERVISOR_H_
