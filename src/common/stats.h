#ifndef MQBRIDGE_SRC_COMMON_STATS_H_
#define MQBRIDGE_SRC_COMMON_STATS_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace MqBridge {

struct StatsSnapshot {
	uint64_t messages_processed = 0;
	uint64_t errors = 0;
	double uptime_sec = 0.0;
	// Seconds since the last replicated message; empty if none yet.
	std::optional<double> since_last_message_sec;
	double average_rate = 0.0;  // messages per second over the uptime
};

/**
 * Process-wide counters. Written only from the supervisor thread, read
 * lock-free from the health thread. Never reset.
 */
class Stats {
	public:
		Stats();

		void RecordMessage();
		void RecordError();

		uint64_t messages_processed() const {
			return messages_processed_.load(std::memory_order_relaxed);
		}
		uint64_t errors() const {
			return errors_.load(std::memory_order_relaxed);
		}

		StatsSnapshot Snapshot() const;

	private:
		static int64_t NowMs();

		std::atomic<uint64_t> messages_processed_{0};
		std::atomic<uint64_t> errors_{0};
		// Steady-clock milliseconds; 0 means never.
		std::atomic<int64_t> last_message_ms_{0};
		const int64_t start_ms_;
};

} // namespace MqBridge

#endif // MQBRIDGE_SRC_COMMON_STATS_H_
