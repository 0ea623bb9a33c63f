#include "stats.h"

namespace MqBridge {

Stats::Stats() : start_ms_(NowMs()) {}

int64_t Stats::NowMs() {
	return std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now().time_since_epoch()).count();
}

void Stats::RecordMessage() {
	messages_processed_.fetch_add(1, std::memory_order_relaxed);
	// 0 is reserved for "never"
	int64_t now = NowMs();
	last_message_ms_.store(now > 0 ? now : 1, std::memory_order_relaxed);
}

void Stats::RecordError() {
	errors_.fetch_add(1, std::memory_order_relaxed);
}

StatsSnapshot Stats::Snapshot() const {
	StatsSnapshot snapshot;
	int64_t now = NowMs();
	snapshot.messages_processed = messages_processed_.load(std::memory_order_relaxed);
	snapshot.errors = errors_.load(std::memory_order_relaxed);
	snapshot.uptime_sec = static_cast<double>(now - start_ms_) / 1000.0;

	int64_t last = last_message_ms_.load(std::memory_order_relaxed);
	if (last != 0) {
		snapshot.since_last_message_sec = static_cast<double>(now - last) / 1000.0;
	}
	if (snapshot.messages_processed > 0 && snapshot.uptime_sec > 0.0) {
		snapshot.average_rate = static_cast<double>(snapshot.messages_processed) / snapshot.uptime_sec;
	}
	return snapshot;
}

} // namespace MqBridge
